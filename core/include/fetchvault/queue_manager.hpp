/**
 * fetchvault - Job lifecycle over the queue collection.
 *
 *   pending --start--> active --interrupt--> paused --resume--> active
 *   active --complete--> (history)        any live state --fail--> failed
 *   failed --retry--> pending
 *
 * Completion writes history, then drops the checkpoint and the queue row.
 * A "completed" row still present on read is a leftover of an interrupted
 * completion and is finished by reconcile(): history always wins.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "fetchvault/history.hpp"
#include "fetchvault/records.hpp"
#include "fetchvault/resume_tracker.hpp"
#include "fetchvault/store.hpp"

namespace fetchvault
{

    struct JobRequest
    {
        std::string source_id;
        std::string source_ref;
        std::string title;
        std::string thumbnail_ref;
        std::optional<std::string> channel{};
        std::optional<std::string> duration{};
        std::string quality;
        std::string format;
        MediaKind kind{MediaKind::Video};
        std::string transfer_format_id;
    };

    class QueueManager
    {
    public:
        QueueManager(Store &store, ResumeTracker &tracker);

        // Throws DuplicateJob when history already holds the same source, quality and format.
        std::string enqueue(const JobRequest &job, bool force = false);

        // pending -> active. Returns the byte offset to start from.
        std::uint64_t start(const std::string &id);

        // paused -> active. Returns the byte offset recorded by the last checkpoint.
        std::uint64_t resume(const std::string &id);

        // Returns false (and changes nothing) unless the job is active.
        bool update_progress(const std::string &id, std::uint64_t downloaded_bytes,
                             std::optional<std::uint64_t> total_bytes = std::nullopt);

        void report_chunk(const std::string &id, std::uint64_t offset, std::span<const std::byte> data,
                          std::optional<std::uint64_t> total_bytes = std::nullopt);

        void mark_interrupted(const std::string &id);
        void mark_completed(const std::string &id);
        void mark_failed(const std::string &id, const std::string &error);
        void retry(const std::string &id);
        void cancel(const std::string &id);

        QueueItem get(const std::string &id) const;
        std::vector<QueueItem> items();
        std::vector<QueueItem> list_by_status(JobStatus status);

        // Finishes lingering completed rows. Returns how many were cleaned up.
        std::size_t reconcile();

    private:
        void finish_completion(const QueueItem &item);
        void set_downloaded(QueueItem &item, std::uint64_t downloaded_bytes) const;
        Timestamp next_enqueue_time();

        Store &store_;
        ResumeTracker &tracker_;
        History history_;
        Timestamp last_enqueued_{};
    };

} // namespace fetchvault
