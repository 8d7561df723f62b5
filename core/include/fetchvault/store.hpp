/**
 * fetchvault - Versioned on-disk store with named record collections and
 * exact-match secondary indices.
 */
#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "fetchvault/errors.hpp"
#include "fetchvault/records.hpp"

namespace fetchvault
{

    namespace index
    {
        inline constexpr std::string_view kBySource = "by-source";
        inline constexpr std::string_view kByIdentity = "by-identity";
        inline constexpr std::string_view kByJob = "by-job";
        inline constexpr std::string_view kByStatus = "by-status";
        inline constexpr std::string_view kByDefault = "by-default";
        inline constexpr std::string_view kByName = "by-name";
    } // namespace index

    namespace detail
    {
        // Throws StoreError(StoreUnavailable) when the file is missing or not valid JSON.
        nlohmann::json read_document(const std::filesystem::path &path);

        // Replaces the file via a temporary sibling and rename. Throws StoreError(IoError).
        void write_document(const std::filesystem::path &path, const nlohmann::json &document);
    } // namespace detail

    template <typename Record>
    class Collection
    {
    public:
        using KeyFn = std::function<std::optional<std::string>(const Record &)>;

        struct Index
        {
            std::string name;
            KeyFn key;
        };

        Collection(std::string name, std::filesystem::path file, std::vector<Index> indices)
            : name_(std::move(name)), file_(std::move(file)), indices_(std::move(indices))
        {
        }

        const std::string &name() const noexcept { return name_; }

        const std::filesystem::path &file() const noexcept { return file_; }

        void load()
        {
            const auto document = detail::read_document(file_);
            if (!document.is_array())
            {
                throw StoreError(ErrorCode::StoreUnavailable, "collection '" + name_ + "' is not an array");
            }
            std::map<std::string, Record> records;
            for (const auto &item : document)
            {
                try
                {
                    auto record = item.template get<Record>();
                    records[record.id] = std::move(record);
                }
                catch (const nlohmann::json::exception &ex)
                {
                    throw StoreError(ErrorCode::StoreUnavailable,
                                     "collection '" + name_ + "' holds a malformed record: " + ex.what());
                }
                catch (const std::invalid_argument &ex)
                {
                    throw StoreError(ErrorCode::StoreUnavailable,
                                     "collection '" + name_ + "' holds a malformed record: " + ex.what());
                }
            }
            rebuild(std::move(records));
        }

        std::optional<Record> find(const std::string &id) const
        {
            const auto it = records_.find(id);
            if (it == records_.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        Record get(const std::string &id) const
        {
            auto record = find(id);
            if (!record)
            {
                throw StoreError(ErrorCode::NotFound, "no record '" + id + "' in " + name_);
            }
            return std::move(*record);
        }

        std::vector<Record> get_all() const
        {
            std::vector<Record> result;
            result.reserve(records_.size());
            for (const auto &[id, record] : records_)
            {
                result.push_back(record);
            }
            return result;
        }

        std::vector<Record> get_all_by_index(std::string_view index_name, std::string_view value) const
        {
            const auto index_it = indexes_.find(index_name);
            if (index_it == indexes_.end())
            {
                throw StoreError(ErrorCode::InvalidArgument,
                                 "collection '" + name_ + "' has no index '" + std::string(index_name) + "'");
            }
            std::vector<Record> result;
            const auto [first, last] = index_it->second.equal_range(std::string(value));
            for (auto it = first; it != last; ++it)
            {
                result.push_back(records_.at(it->second));
            }
            return result;
        }

        void put(const Record &record)
        {
            put_many({record});
        }

        // All records land in one durable write.
        void put_many(const std::vector<Record> &records)
        {
            auto next = records_;
            for (const auto &record : records)
            {
                if (record.id.empty())
                {
                    throw StoreError(ErrorCode::InvalidArgument, "cannot store a record without id in " + name_);
                }
                next[record.id] = record;
            }
            commit(std::move(next));
        }

        // Returns false when the id was not present.
        bool remove(const std::string &id)
        {
            if (!records_.contains(id))
            {
                return false;
            }
            auto next = records_;
            next.erase(id);
            commit(std::move(next));
            return true;
        }

        void clear()
        {
            commit({});
        }

        std::size_t size() const noexcept { return records_.size(); }

    private:
        void commit(std::map<std::string, Record> next)
        {
            nlohmann::json document = nlohmann::json::array();
            for (const auto &[id, record] : next)
            {
                document.push_back(record);
            }
            detail::write_document(file_, document);
            rebuild(std::move(next));
        }

        void rebuild(std::map<std::string, Record> records)
        {
            records_ = std::move(records);
            indexes_.clear();
            for (const auto &index : indices_)
            {
                auto &entries = indexes_[index.name];
                for (const auto &[id, record] : records_)
                {
                    if (auto key = index.key(record))
                    {
                        entries.emplace(std::move(*key), id);
                    }
                }
            }
        }

        std::string name_;
        std::filesystem::path file_;
        std::vector<Index> indices_;
        std::map<std::string, Record> records_;
        std::map<std::string, std::multimap<std::string, std::string>, std::less<>> indexes_;
    };

    class Store
    {
    public:
        static constexpr int kSchemaVersion = 3;

        explicit Store(std::filesystem::path root);

        Store(const Store &) = delete;
        Store &operator=(const Store &) = delete;

        // Creates or upgrades the on-disk layout on first call; later calls return immediately.
        Store &open();

        bool is_open() const noexcept { return open_; }

        int schema_version() const noexcept { return schema_version_; }

        const std::filesystem::path &root() const noexcept { return root_; }

        std::filesystem::path blob_path(const std::string &id) const;

        Collection<HistoryRecord> &history();
        Collection<QueueItem> &queue();
        Collection<PartialTransfer> &partials();
        Collection<NamingTemplate> &templates();
        Collection<LibraryCollection> &collections();
        Collection<Tag> &tags();

    private:
        int read_schema_version() const;
        void write_schema_version(int version) const;
        void migrate(int from_version, int to_version);
        void load_collections();

        std::filesystem::path root_;
        bool open_{false};
        int schema_version_{0};

        Collection<HistoryRecord> history_;
        Collection<QueueItem> queue_;
        Collection<PartialTransfer> partials_;
        Collection<NamingTemplate> templates_;
        Collection<LibraryCollection> collections_;
        Collection<Tag> tags_;
    };

} // namespace fetchvault
