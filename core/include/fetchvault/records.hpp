/**
 * fetchvault - Record types held by the persistent store and their JSON
 * serialization.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "fetchvault/time_utils.hpp"

namespace fetchvault
{

    enum class JobStatus : std::uint8_t
    {
        Pending,
        Active,
        Paused,
        Completed,
        Failed
    };

    std::string_view to_string(JobStatus status) noexcept;
    std::optional<JobStatus> job_status_from_string(std::string_view value) noexcept;

    enum class MediaKind : std::uint8_t
    {
        Video,
        Audio,
        Caption,
        Thumbnail
    };

    std::string_view to_string(MediaKind kind) noexcept;
    std::optional<MediaKind> media_kind_from_string(std::string_view value) noexcept;

    struct HistoryRecord
    {
        std::string id;
        std::string source_id;
        std::string title;
        std::string thumbnail_ref;
        std::string quality;
        std::string format;
        std::optional<std::string> channel{};
        std::optional<std::string> duration{};
        Timestamp completed_at{};
        std::optional<std::uint64_t> size_bytes{};
        std::optional<std::string> job_id{};
    };

    void to_json(nlohmann::json &json, const HistoryRecord &record);
    void from_json(const nlohmann::json &json, HistoryRecord &record);

    // Key used for duplicate detection: one acquisition per source, quality and format.
    std::string identity_key(std::string_view source_id, std::string_view quality, std::string_view format);

    struct QueueItem
    {
        std::string id;
        std::string source_id;
        std::string source_ref;
        std::string title;
        std::string thumbnail_ref;
        std::optional<std::string> channel{};
        std::optional<std::string> duration{};
        std::string quality;
        std::string format;
        MediaKind kind{MediaKind::Video};
        JobStatus status{JobStatus::Pending};
        double progress_pct{};
        std::uint64_t downloaded_bytes{};
        std::optional<std::uint64_t> total_bytes{};
        std::string transfer_format_id;
        Timestamp enqueued_at{};
        std::optional<std::string> error{};
    };

    void to_json(nlohmann::json &json, const QueueItem &item);
    void from_json(const nlohmann::json &json, QueueItem &item);

    struct ChunkRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
        std::string digest;
    };

    void to_json(nlohmann::json &json, const ChunkRange &chunk);
    void from_json(const nlohmann::json &json, ChunkRange &chunk);

    struct PartialTransfer
    {
        std::string id;
        std::string source_id;
        std::string title;
        std::string quality;
        std::string format;
        std::string transfer_format_id;
        MediaKind kind{MediaKind::Video};
        std::uint64_t downloaded_bytes{};
        std::optional<std::uint64_t> total_bytes{};
        std::vector<ChunkRange> chunks;
        Timestamp last_updated{};
    };

    void to_json(nlohmann::json &json, const PartialTransfer &partial);
    void from_json(const nlohmann::json &json, PartialTransfer &partial);

    // True when the chunk list starts at zero, has no gaps and sums to downloaded_bytes.
    bool chunks_contiguous(const PartialTransfer &partial) noexcept;

    struct NamingTemplate
    {
        std::string id;
        std::string name;
        std::string pattern;
        bool is_default{};
    };

    void to_json(nlohmann::json &json, const NamingTemplate &naming);
    void from_json(const nlohmann::json &json, NamingTemplate &naming);

    struct LibraryCollection
    {
        std::string id;
        std::string name;
        std::optional<std::string> description{};
        std::optional<std::string> color{};
        Timestamp created_at{};
        Timestamp updated_at{};
        std::uint64_t item_count{};
    };

    void to_json(nlohmann::json &json, const LibraryCollection &collection);
    void from_json(const nlohmann::json &json, LibraryCollection &collection);

    struct Tag
    {
        std::string id;
        std::string name;
        std::optional<std::string> color{};
        std::uint64_t item_count{};
    };

    void to_json(nlohmann::json &json, const Tag &tag);
    void from_json(const nlohmann::json &json, Tag &tag);

} // namespace fetchvault
