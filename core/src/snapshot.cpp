#include "fetchvault/snapshot.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "fetchvault/records.hpp"
#include "fetchvault/time_utils.hpp"

namespace fetchvault
{

    namespace
    {

        template <typename Record>
        nlohmann::json export_collection(Collection<Record> &collection)
        {
            nlohmann::json items = nlohmann::json::array();
            for (const auto &record : collection.get_all())
            {
                items.push_back(record);
            }
            return items;
        }

        template <typename Record>
        std::vector<Record> parse_records(const nlohmann::json &data, const char *key, std::size_t &skipped)
        {
            std::vector<Record> records;
            const auto it = data.find(key);
            if (it == data.end() || it->is_null())
            {
                return records;
            }
            if (!it->is_array())
            {
                spdlog::warn("Snapshot section '{}' is not a list; ignoring it", key);
                ++skipped;
                return records;
            }
            for (const auto &item : *it)
            {
                try
                {
                    records.push_back(item.get<Record>());
                }
                catch (const nlohmann::json::exception &ex)
                {
                    spdlog::warn("Skipping malformed {} record: {}", key, ex.what());
                    ++skipped;
                }
                catch (const std::invalid_argument &ex)
                {
                    spdlog::warn("Skipping malformed {} record: {}", key, ex.what());
                    ++skipped;
                }
            }
            return records;
        }

        // Keeps at most one default: the last imported default wins, otherwise the store's stays.
        std::vector<NamingTemplate> merge_templates(Collection<NamingTemplate> &existing,
                                                    std::vector<NamingTemplate> incoming)
        {
            std::string winner;
            for (const auto &naming : incoming)
            {
                if (naming.is_default)
                {
                    winner = naming.id;
                }
            }
            if (winner.empty())
            {
                return incoming;
            }
            for (auto &naming : incoming)
            {
                naming.is_default = naming.id == winner;
            }
            for (auto naming : existing.get_all())
            {
                const bool replaced = std::any_of(incoming.begin(), incoming.end(), [&](const NamingTemplate &other)
                                                  { return other.id == naming.id; });
                if (naming.is_default && !replaced)
                {
                    naming.is_default = false;
                    incoming.push_back(std::move(naming));
                }
            }
            return incoming;
        }

    } // namespace

    std::string export_snapshot(Store &store)
    {
        nlohmann::json document = {
            {"exportedAt", iso_datetime(now())},
            {"version", Store::kSchemaVersion},
            {"data",
             {
                 {"history", export_collection(store.history())},
                 {"collections", export_collection(store.collections())},
                 {"tags", export_collection(store.tags())},
                 {"templates", export_collection(store.templates())},
             }},
        };
        spdlog::info("Exported {} history, {} collections, {} tags, {} templates", store.history().size(),
                     store.collections().size(), store.tags().size(), store.templates().size());
        return document.dump(2);
    }

    ImportCounts import_snapshot(Store &store, std::string_view document)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(document);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw StoreError(ErrorCode::InvalidPayload, std::string("snapshot is not valid JSON: ") + ex.what());
        }
        if (!json.is_object() || !json.contains("data") || !json["data"].is_object())
        {
            throw StoreError(ErrorCode::InvalidPayload, "snapshot has no data section");
        }
        const auto version = json.value("version", 0);
        if (version > Store::kSchemaVersion)
        {
            spdlog::warn("Snapshot was written by schema v{}; importing known sections only", version);
        }

        const auto &data = json["data"];
        ImportCounts counts{};
        auto history = parse_records<HistoryRecord>(data, "history", counts.skipped);
        auto collections = parse_records<LibraryCollection>(data, "collections", counts.skipped);
        auto tags = parse_records<Tag>(data, "tags", counts.skipped);
        auto templates = parse_records<NamingTemplate>(data, "templates", counts.skipped);

        counts.history = history.size();
        counts.collections = collections.size();
        counts.tags = tags.size();
        counts.templates = templates.size();

        if (!collections.empty())
        {
            store.collections().put_many(collections);
        }
        if (!tags.empty())
        {
            store.tags().put_many(tags);
        }
        if (!history.empty())
        {
            store.history().put_many(history);
        }
        if (!templates.empty())
        {
            store.templates().put_many(merge_templates(store.templates(), std::move(templates)));
        }
        spdlog::info("Imported {} history, {} collections, {} tags, {} templates ({} skipped)", counts.history,
                     counts.collections, counts.tags, counts.templates, counts.skipped);
        return counts;
    }

} // namespace fetchvault
