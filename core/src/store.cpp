#include "fetchvault/store.hpp"

#include <array>
#include <fstream>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

#include <spdlog/spdlog.h>

#include "fetchvault/crypto.hpp"

namespace fetchvault
{

    namespace
    {
        constexpr auto kSchemaFile = "schema.json";
        constexpr auto kHistoryFile = "history.json";
        constexpr auto kQueueFile = "queue.json";
        constexpr auto kPartialsFile = "partials.json";
        constexpr auto kTemplatesFile = "templates.json";
        constexpr auto kCollectionsFile = "collections.json";
        constexpr auto kTagsFile = "tags.json";
        constexpr auto kBlobDir = "partials";

        void ensure_document(const std::filesystem::path &path, const nlohmann::json &initial)
        {
            if (!std::filesystem::exists(path))
            {
                detail::write_document(path, initial);
            }
        }

        nlohmann::json seed_templates()
        {
            const std::array<NamingTemplate, 3> presets{{
                {"default", "Default", "{title}", true},
                {"detailed", "Detailed", "{title} - {channel} [{quality}]", false},
                {"dated", "With Date", "{title} ({date})", false},
            }};
            nlohmann::json document = nlohmann::json::array();
            for (const auto &preset : presets)
            {
                document.push_back(preset);
            }
            return document;
        }

        void create_base_collections(const std::filesystem::path &root)
        {
            ensure_document(root / kHistoryFile, nlohmann::json::array());
            ensure_document(root / kQueueFile, nlohmann::json::array());
            ensure_document(root / kTemplatesFile, seed_templates());
        }

        // Version 1 wrote "downloading" for a running job; anything else unknown cannot be mapped safely.
        void add_partials_and_rename_statuses(const std::filesystem::path &root)
        {
            ensure_document(root / kPartialsFile, nlohmann::json::array());
            std::filesystem::create_directories(root / kBlobDir);

            auto queue = detail::read_document(root / kQueueFile);
            if (!queue.is_array())
            {
                throw StoreError(ErrorCode::StoreUnavailable, "queue collection is not an array");
            }
            bool changed = false;
            for (auto &item : queue)
            {
                const auto status = item.value("status", std::string{});
                if (status == "downloading")
                {
                    item["status"] = to_string(JobStatus::Active);
                    changed = true;
                }
                else if (!job_status_from_string(status))
                {
                    throw StoreError(ErrorCode::StoreUnavailable,
                                     "queue record '" + item.value("id", std::string{}) +
                                         "' has unknown status '" + status + "'");
                }
            }
            if (changed)
            {
                detail::write_document(root / kQueueFile, queue);
            }
        }

        void add_library_collections(const std::filesystem::path &root)
        {
            ensure_document(root / kCollectionsFile, nlohmann::json::array());
            ensure_document(root / kTagsFile, nlohmann::json::array());
        }

        struct MigrationStep
        {
            int version;
            std::string_view description;
            void (*apply)(const std::filesystem::path &root);
        };

        constexpr std::array<MigrationStep, 3> kMigrations{{
            {1, "history, queue and naming templates", &create_base_collections},
            {2, "resume checkpoints", &add_partials_and_rename_statuses},
            {3, "library collections and tags", &add_library_collections},
        }};

        // Flushes a file or directory to stable storage. Returns false on failure.
        bool sync_to_disk(const std::filesystem::path &path, bool directory)
        {
#ifdef _WIN32
            (void)path;
            (void)directory;
            return true;
#else
            const int fd = ::open(path.c_str(), directory ? O_RDONLY | O_DIRECTORY : O_RDONLY);
            if (fd < 0)
            {
                return false;
            }
            const bool synced = ::fsync(fd) == 0;
            ::close(fd);
            return synced;
#endif
        }

        template <typename Record>
        typename Collection<Record>::Index make_index(std::string_view name,
                                                      typename Collection<Record>::KeyFn key)
        {
            return {std::string(name), std::move(key)};
        }

    } // namespace

    namespace detail
    {

        nlohmann::json read_document(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw StoreError(ErrorCode::StoreUnavailable, "cannot read " + path.string());
            }
            try
            {
                return nlohmann::json::parse(in);
            }
            catch (const nlohmann::json::parse_error &ex)
            {
                throw StoreError(ErrorCode::StoreUnavailable, "corrupt document " + path.string() + ": " + ex.what());
            }
        }

        void write_document(const std::filesystem::path &path, const nlohmann::json &document)
        {
            auto temp = path;
            temp += ".tmp";
            {
                std::ofstream out(temp, std::ios::trunc);
                if (!out.is_open())
                {
                    throw StoreError(ErrorCode::IoError, "cannot write " + temp.string());
                }
                out << document.dump(2);
                out.flush();
                if (!out)
                {
                    out.close();
                    std::error_code ignored;
                    std::filesystem::remove(temp, ignored);
                    throw StoreError(ErrorCode::IoError, "short write to " + temp.string());
                }
            }
            if (!sync_to_disk(temp, false))
            {
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                throw StoreError(ErrorCode::IoError, "cannot sync " + temp.string());
            }
            std::error_code ec;
            std::filesystem::rename(temp, path, ec);
            if (ec)
            {
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                throw StoreError(ErrorCode::IoError, "cannot replace " + path.string() + ": " + ec.message());
            }
            // The rename itself lives in the directory entry.
            const auto directory = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
            if (!sync_to_disk(directory, true))
            {
                spdlog::warn("Could not sync directory {} after replacing {}", directory.string(), path.filename().string());
            }
        }

    } // namespace detail

    Store::Store(std::filesystem::path root)
        : root_(std::move(root)),
          history_("history", root_ / kHistoryFile,
                   {make_index<HistoryRecord>(index::kBySource, [](const HistoryRecord &r)
                                              { return std::optional<std::string>(r.source_id); }),
                    make_index<HistoryRecord>(index::kByIdentity, [](const HistoryRecord &r)
                                              { return std::optional<std::string>(identity_key(r.source_id, r.quality, r.format)); }),
                    make_index<HistoryRecord>(index::kByJob, [](const HistoryRecord &r)
                                              { return r.job_id; })}),
          queue_("queue", root_ / kQueueFile,
                 {make_index<QueueItem>(index::kByStatus, [](const QueueItem &r)
                                        { return std::optional<std::string>(to_string(r.status)); }),
                  make_index<QueueItem>(index::kBySource, [](const QueueItem &r)
                                        { return std::optional<std::string>(r.source_id); })}),
          partials_("partials", root_ / kPartialsFile,
                    {make_index<PartialTransfer>(index::kBySource, [](const PartialTransfer &r)
                                                 { return std::optional<std::string>(r.source_id); })}),
          templates_("templates", root_ / kTemplatesFile,
                     {make_index<NamingTemplate>(index::kByDefault, [](const NamingTemplate &r)
                                                 { return r.is_default ? std::optional<std::string>("true") : std::nullopt; })}),
          collections_("collections", root_ / kCollectionsFile,
                       {make_index<LibraryCollection>(index::kByName, [](const LibraryCollection &r)
                                                      { return std::optional<std::string>(r.name); })}),
          tags_("tags", root_ / kTagsFile,
                {make_index<Tag>(index::kByName, [](const Tag &r)
                                 { return std::optional<std::string>(r.name); })})
    {
    }

    Store &Store::open()
    {
        if (open_)
        {
            return *this;
        }
        try
        {
            std::filesystem::create_directories(root_);
            const auto on_disk = read_schema_version();
            if (on_disk > kSchemaVersion)
            {
                throw StoreError(ErrorCode::StoreUnavailable,
                                 "store schema version " + std::to_string(on_disk) +
                                     " is newer than supported version " + std::to_string(kSchemaVersion));
            }
            if (on_disk < kSchemaVersion)
            {
                migrate(on_disk, kSchemaVersion);
            }
            std::filesystem::create_directories(root_ / kBlobDir);
            load_collections();
        }
        catch (const StoreError &ex)
        {
            spdlog::error("Store at {} unavailable: {}", root_.string(), ex.what());
            if (ex.code() == ErrorCode::StoreUnavailable)
            {
                throw;
            }
            throw StoreError(ErrorCode::StoreUnavailable, ex.what());
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            spdlog::error("Store at {} unavailable: {}", root_.string(), ex.what());
            throw StoreError(ErrorCode::StoreUnavailable, ex.what());
        }
        schema_version_ = kSchemaVersion;
        open_ = true;
        spdlog::info("Opened store {} (schema v{})", root_.string(), schema_version_);
        return *this;
    }

    std::filesystem::path Store::blob_path(const std::string &id) const
    {
        return root_ / kBlobDir / (crypto::hash_text(id) + ".part");
    }

    Collection<HistoryRecord> &Store::history()
    {
        open();
        return history_;
    }

    Collection<QueueItem> &Store::queue()
    {
        open();
        return queue_;
    }

    Collection<PartialTransfer> &Store::partials()
    {
        open();
        return partials_;
    }

    Collection<NamingTemplate> &Store::templates()
    {
        open();
        return templates_;
    }

    Collection<LibraryCollection> &Store::collections()
    {
        open();
        return collections_;
    }

    Collection<Tag> &Store::tags()
    {
        open();
        return tags_;
    }

    int Store::read_schema_version() const
    {
        const auto path = root_ / kSchemaFile;
        if (!std::filesystem::exists(path))
        {
            return 0;
        }
        const auto document = detail::read_document(path);
        if (!document.is_object() || !document.contains("version") || !document["version"].is_number_integer())
        {
            throw StoreError(ErrorCode::StoreUnavailable, "schema file has no integer version");
        }
        return document["version"].get<int>();
    }

    void Store::write_schema_version(int version) const
    {
        detail::write_document(root_ / kSchemaFile, nlohmann::json{{"version", version}});
    }

    void Store::migrate(int from_version, int to_version)
    {
        for (const auto &step : kMigrations)
        {
            if (step.version <= from_version || step.version > to_version)
            {
                continue;
            }
            spdlog::info("Migrating store {} to v{}: {}", root_.string(), step.version, step.description);
            step.apply(root_);
            write_schema_version(step.version);
        }
    }

    void Store::load_collections()
    {
        history_.load();
        queue_.load();
        partials_.load();
        templates_.load();
        collections_.load();
        tags_.load();
    }

} // namespace fetchvault
