#include "fetchvault/records.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace fetchvault
{

    namespace
    {

        struct JobStatusMapping
        {
            JobStatus status;
            std::string_view label;
        };

        constexpr std::array<JobStatusMapping, 5> kJobStatusMappings{{
            {JobStatus::Pending, "pending"},
            {JobStatus::Active, "active"},
            {JobStatus::Paused, "paused"},
            {JobStatus::Completed, "completed"},
            {JobStatus::Failed, "failed"},
        }};

        struct MediaKindMapping
        {
            MediaKind kind;
            std::string_view label;
        };

        constexpr std::array<MediaKindMapping, 4> kMediaKindMappings{{
            {MediaKind::Video, "video"},
            {MediaKind::Audio, "audio"},
            {MediaKind::Caption, "caption"},
            {MediaKind::Thumbnail, "thumbnail"},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> read_optional(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return std::nullopt;
            }
            return it->get<T>();
        }

        Timestamp read_timestamp(const nlohmann::json &json, const char *key)
        {
            return from_millis(json.value(key, std::int64_t{0}));
        }

        JobStatus read_status(const nlohmann::json &json)
        {
            const auto label = json.at("status").get<std::string>();
            const auto status = job_status_from_string(label);
            if (!status)
            {
                throw std::invalid_argument("unknown job status: " + label);
            }
            return *status;
        }

        MediaKind read_kind(const nlohmann::json &json)
        {
            const auto label = json.value("kind", std::string{"video"});
            const auto kind = media_kind_from_string(label);
            if (!kind)
            {
                throw std::invalid_argument("unknown media kind: " + label);
            }
            return *kind;
        }

        std::string read_id(const nlohmann::json &json)
        {
            auto id = json.at("id").get<std::string>();
            if (id.empty())
            {
                throw std::invalid_argument("record id must not be empty");
            }
            return id;
        }

    } // namespace

    std::string_view to_string(JobStatus status) noexcept
    {
        for (const auto &mapping : kJobStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<JobStatus> job_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kJobStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(MediaKind kind) noexcept
    {
        for (const auto &mapping : kMediaKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MediaKind> media_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMediaKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string identity_key(std::string_view source_id, std::string_view quality, std::string_view format)
    {
        // Length-prefixed fields: "x|y","z" and "x","y|z" stay distinct.
        std::string key;
        for (const auto field : {source_id, quality, format})
        {
            key.append(std::to_string(field.size())).append(1, ':').append(field).append(1, ';');
        }
        return key;
    }

    void to_json(nlohmann::json &json, const HistoryRecord &record)
    {
        json = {
            {"id", record.id},
            {"sourceId", record.source_id},
            {"title", record.title},
            {"thumbnailRef", record.thumbnail_ref},
            {"quality", record.quality},
            {"format", record.format},
            {"completedAt", to_millis(record.completed_at)},
        };
        put_optional(json, "channel", record.channel);
        put_optional(json, "duration", record.duration);
        put_optional(json, "sizeBytes", record.size_bytes);
        put_optional(json, "jobId", record.job_id);
    }

    void from_json(const nlohmann::json &json, HistoryRecord &record)
    {
        record.id = read_id(json);
        record.source_id = json.at("sourceId").get<std::string>();
        record.title = json.value("title", std::string{});
        record.thumbnail_ref = json.value("thumbnailRef", std::string{});
        record.quality = json.value("quality", std::string{});
        record.format = json.value("format", std::string{});
        record.channel = read_optional<std::string>(json, "channel");
        record.duration = read_optional<std::string>(json, "duration");
        record.completed_at = read_timestamp(json, "completedAt");
        record.size_bytes = read_optional<std::uint64_t>(json, "sizeBytes");
        record.job_id = read_optional<std::string>(json, "jobId");
    }

    void to_json(nlohmann::json &json, const QueueItem &item)
    {
        json = {
            {"id", item.id},
            {"sourceId", item.source_id},
            {"sourceRef", item.source_ref},
            {"title", item.title},
            {"thumbnailRef", item.thumbnail_ref},
            {"quality", item.quality},
            {"format", item.format},
            {"kind", to_string(item.kind)},
            {"status", to_string(item.status)},
            {"progressPct", item.progress_pct},
            {"downloadedBytes", item.downloaded_bytes},
            {"transferFormatId", item.transfer_format_id},
            {"enqueuedAt", to_millis(item.enqueued_at)},
        };
        put_optional(json, "channel", item.channel);
        put_optional(json, "duration", item.duration);
        put_optional(json, "totalBytes", item.total_bytes);
        put_optional(json, "error", item.error);
    }

    void from_json(const nlohmann::json &json, QueueItem &item)
    {
        item.id = read_id(json);
        item.source_id = json.at("sourceId").get<std::string>();
        item.source_ref = json.value("sourceRef", std::string{});
        item.title = json.value("title", std::string{});
        item.thumbnail_ref = json.value("thumbnailRef", std::string{});
        item.channel = read_optional<std::string>(json, "channel");
        item.duration = read_optional<std::string>(json, "duration");
        item.quality = json.value("quality", std::string{});
        item.format = json.value("format", std::string{});
        item.kind = read_kind(json);
        item.status = read_status(json);
        item.progress_pct = json.value("progressPct", 0.0);
        item.downloaded_bytes = json.value("downloadedBytes", std::uint64_t{0});
        item.total_bytes = read_optional<std::uint64_t>(json, "totalBytes");
        item.transfer_format_id = json.value("transferFormatId", std::string{});
        item.enqueued_at = read_timestamp(json, "enqueuedAt");
        item.error = read_optional<std::string>(json, "error");
    }

    void to_json(nlohmann::json &json, const ChunkRange &chunk)
    {
        json = {
            {"offset", chunk.offset},
            {"length", chunk.length},
            {"digest", chunk.digest},
        };
    }

    void from_json(const nlohmann::json &json, ChunkRange &chunk)
    {
        chunk.offset = json.at("offset").get<std::uint64_t>();
        chunk.length = json.at("length").get<std::uint64_t>();
        chunk.digest = json.at("digest").get<std::string>();
    }

    void to_json(nlohmann::json &json, const PartialTransfer &partial)
    {
        json = {
            {"id", partial.id},
            {"sourceId", partial.source_id},
            {"title", partial.title},
            {"quality", partial.quality},
            {"format", partial.format},
            {"transferFormatId", partial.transfer_format_id},
            {"kind", to_string(partial.kind)},
            {"downloadedBytes", partial.downloaded_bytes},
            {"chunks", partial.chunks},
            {"lastUpdated", to_millis(partial.last_updated)},
        };
        put_optional(json, "totalBytes", partial.total_bytes);
    }

    void from_json(const nlohmann::json &json, PartialTransfer &partial)
    {
        partial.id = read_id(json);
        partial.source_id = json.at("sourceId").get<std::string>();
        partial.title = json.value("title", std::string{});
        partial.quality = json.value("quality", std::string{});
        partial.format = json.value("format", std::string{});
        partial.transfer_format_id = json.value("transferFormatId", std::string{});
        partial.kind = read_kind(json);
        partial.downloaded_bytes = json.value("downloadedBytes", std::uint64_t{0});
        partial.total_bytes = read_optional<std::uint64_t>(json, "totalBytes");
        partial.chunks.clear();
        if (const auto it = json.find("chunks"); it != json.end())
        {
            partial.chunks = it->get<std::vector<ChunkRange>>();
        }
        partial.last_updated = read_timestamp(json, "lastUpdated");
    }

    bool chunks_contiguous(const PartialTransfer &partial) noexcept
    {
        std::uint64_t expected = 0;
        for (const auto &chunk : partial.chunks)
        {
            if (chunk.offset != expected || chunk.length == 0)
            {
                return false;
            }
            expected += chunk.length;
        }
        return expected == partial.downloaded_bytes;
    }

    void to_json(nlohmann::json &json, const NamingTemplate &naming)
    {
        json = {
            {"id", naming.id},
            {"name", naming.name},
            {"template", naming.pattern},
            {"isDefault", naming.is_default},
        };
    }

    void from_json(const nlohmann::json &json, NamingTemplate &naming)
    {
        naming.id = read_id(json);
        naming.name = json.value("name", std::string{});
        naming.pattern = json.at("template").get<std::string>();
        naming.is_default = json.value("isDefault", false);
    }

    void to_json(nlohmann::json &json, const LibraryCollection &collection)
    {
        json = {
            {"id", collection.id},
            {"name", collection.name},
            {"createdAt", to_millis(collection.created_at)},
            {"updatedAt", to_millis(collection.updated_at)},
            {"itemCount", collection.item_count},
        };
        put_optional(json, "description", collection.description);
        put_optional(json, "color", collection.color);
    }

    void from_json(const nlohmann::json &json, LibraryCollection &collection)
    {
        collection.id = read_id(json);
        collection.name = json.at("name").get<std::string>();
        collection.description = read_optional<std::string>(json, "description");
        collection.color = read_optional<std::string>(json, "color");
        collection.created_at = read_timestamp(json, "createdAt");
        collection.updated_at = read_timestamp(json, "updatedAt");
        collection.item_count = json.value("itemCount", std::uint64_t{0});
    }

    void to_json(nlohmann::json &json, const Tag &tag)
    {
        json = {
            {"id", tag.id},
            {"name", tag.name},
            {"itemCount", tag.item_count},
        };
        put_optional(json, "color", tag.color);
    }

    void from_json(const nlohmann::json &json, Tag &tag)
    {
        tag.id = read_id(json);
        tag.name = json.at("name").get<std::string>();
        tag.color = read_optional<std::string>(json, "color");
        tag.item_count = json.value("itemCount", std::uint64_t{0});
    }

} // namespace fetchvault
