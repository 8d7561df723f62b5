#include "fetchvault/queue_manager.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "fetchvault/crypto.hpp"

namespace fetchvault
{

    namespace
    {
        StoreError invalid_transition(const QueueItem &item, std::string_view action)
        {
            return StoreError(ErrorCode::InvalidState, "cannot " + std::string(action) + " job " + item.id +
                                                           " while " + std::string(to_string(item.status)));
        }

        void sort_by_enqueue_time(std::vector<QueueItem> &items)
        {
            std::sort(items.begin(), items.end(), [](const QueueItem &lhs, const QueueItem &rhs)
                      { return lhs.enqueued_at != rhs.enqueued_at ? lhs.enqueued_at < rhs.enqueued_at
                                                                  : lhs.id < rhs.id; });
        }
    } // namespace

    QueueManager::QueueManager(Store &store, ResumeTracker &tracker)
        : store_(store), tracker_(tracker), history_(store)
    {
    }

    std::string QueueManager::enqueue(const JobRequest &job, bool force)
    {
        if (job.source_id.empty())
        {
            throw StoreError(ErrorCode::InvalidArgument, "job needs a source id");
        }
        if (!force)
        {
            // A completed row not yet promoted already counts as history.
            reconcile();
            if (const auto duplicate = history_.find_duplicate(job.source_id, job.quality, job.format))
            {
                throw StoreError(ErrorCode::DuplicateJob,
                                 job.source_id + " (" + job.quality + " " + job.format + ") was already acquired as " +
                                     duplicate->id);
            }
        }

        QueueItem item{};
        item.id = crypto::random_id("queue");
        item.source_id = job.source_id;
        item.source_ref = job.source_ref;
        item.title = job.title;
        item.thumbnail_ref = job.thumbnail_ref;
        item.channel = job.channel;
        item.duration = job.duration;
        item.quality = job.quality;
        item.format = job.format;
        item.kind = job.kind;
        item.status = JobStatus::Pending;
        item.transfer_format_id = job.transfer_format_id;
        item.enqueued_at = next_enqueue_time();
        store_.queue().put(item);
        spdlog::info("Enqueued {} as {}{}", job.source_id, item.id, force ? " (forced)" : "");
        return item.id;
    }

    std::uint64_t QueueManager::start(const std::string &id)
    {
        auto item = get(id);
        if (item.status == JobStatus::Active)
        {
            return item.downloaded_bytes;
        }
        if (item.status != JobStatus::Pending)
        {
            throw invalid_transition(item, "start");
        }
        const auto offset = tracker_.resume_offset(id);
        set_downloaded(item, offset);
        item.status = JobStatus::Active;
        store_.queue().put(item);
        spdlog::info("Started {} at offset {}", id, offset);
        return offset;
    }

    std::uint64_t QueueManager::resume(const std::string &id)
    {
        auto item = get(id);
        if (item.status == JobStatus::Active)
        {
            return item.downloaded_bytes;
        }
        if (item.status != JobStatus::Paused)
        {
            throw invalid_transition(item, "resume");
        }
        const auto offset = tracker_.resume_offset(id);
        set_downloaded(item, offset);
        item.status = JobStatus::Active;
        store_.queue().put(item);
        spdlog::info("Resumed {} at offset {}", id, offset);
        return offset;
    }

    bool QueueManager::update_progress(const std::string &id, std::uint64_t downloaded_bytes,
                                       std::optional<std::uint64_t> total_bytes)
    {
        auto item = get(id);
        if (item.status != JobStatus::Active)
        {
            return false;
        }
        if (total_bytes)
        {
            item.total_bytes = total_bytes;
        }
        if (item.total_bytes && downloaded_bytes > *item.total_bytes)
        {
            throw StoreError(ErrorCode::InvalidArgument,
                             "progress for " + id + " reports " + std::to_string(downloaded_bytes) + " of " +
                                 std::to_string(*item.total_bytes) + " bytes");
        }
        set_downloaded(item, downloaded_bytes);
        store_.queue().put(item);
        return true;
    }

    void QueueManager::report_chunk(const std::string &id, std::uint64_t offset, std::span<const std::byte> data,
                                    std::optional<std::uint64_t> total_bytes)
    {
        const auto item = get(id);
        if (item.status != JobStatus::Active)
        {
            throw invalid_transition(item, "accept data for");
        }
        const auto state = tracker_.checkpoint(id, offset, data, total_bytes ? total_bytes : item.total_bytes);
        update_progress(id, state.downloaded_bytes, state.total_bytes);
    }

    void QueueManager::mark_interrupted(const std::string &id)
    {
        auto item = get(id);
        if (item.status == JobStatus::Paused)
        {
            return;
        }
        if (item.status != JobStatus::Active)
        {
            throw invalid_transition(item, "interrupt");
        }
        tracker_.record_interruption(item);
        item.status = JobStatus::Paused;
        store_.queue().put(item);
        spdlog::info("Paused {} at {} bytes", id, item.downloaded_bytes);
    }

    void QueueManager::mark_completed(const std::string &id)
    {
        auto item = store_.queue().find(id);
        if (!item)
        {
            spdlog::debug("Completion for {} ignored: job is no longer queued", id);
            return;
        }
        if (item->status != JobStatus::Completed)
        {
            if (item->status != JobStatus::Active)
            {
                throw invalid_transition(*item, "complete");
            }
            if (item->total_bytes && item->downloaded_bytes != *item->total_bytes)
            {
                throw StoreError(ErrorCode::InvalidState,
                                 "job " + id + " has " + std::to_string(item->downloaded_bytes) + " of " +
                                     std::to_string(*item->total_bytes) + " bytes");
            }
            item->status = JobStatus::Completed;
            item->progress_pct = 100.0;
            store_.queue().put(*item);
        }
        finish_completion(*item);
    }

    void QueueManager::mark_failed(const std::string &id, const std::string &error)
    {
        auto item = get(id);
        if (item.status == JobStatus::Completed)
        {
            throw invalid_transition(item, "fail");
        }
        item.status = JobStatus::Failed;
        item.error = error;
        store_.queue().put(item);
        spdlog::warn("Job {} failed: {}", id, error);
    }

    void QueueManager::retry(const std::string &id)
    {
        auto item = get(id);
        if (item.status == JobStatus::Pending)
        {
            return;
        }
        if (item.status != JobStatus::Failed)
        {
            throw invalid_transition(item, "retry");
        }
        item.status = JobStatus::Pending;
        item.error.reset();
        store_.queue().put(item);
        spdlog::info("Job {} queued for retry", id);
    }

    void QueueManager::cancel(const std::string &id)
    {
        const auto item = store_.queue().find(id);
        if (item && item->status == JobStatus::Completed)
        {
            spdlog::warn("Cancel of {} ignored: the job already completed", id);
            finish_completion(*item);
            return;
        }
        tracker_.invalidate(id);
        if (item)
        {
            store_.queue().remove(id);
            spdlog::info("Cancelled {}", id);
        }
    }

    QueueItem QueueManager::get(const std::string &id) const
    {
        return store_.queue().get(id);
    }

    std::vector<QueueItem> QueueManager::items()
    {
        reconcile();
        auto all = store_.queue().get_all();
        sort_by_enqueue_time(all);
        return all;
    }

    std::vector<QueueItem> QueueManager::list_by_status(JobStatus status)
    {
        reconcile();
        auto matches = store_.queue().get_all_by_index(index::kByStatus, to_string(status));
        sort_by_enqueue_time(matches);
        return matches;
    }

    std::size_t QueueManager::reconcile()
    {
        const auto stale = store_.queue().get_all_by_index(index::kByStatus, to_string(JobStatus::Completed));
        for (const auto &item : stale)
        {
            spdlog::warn("Finishing interrupted completion of {}", item.id);
            finish_completion(item);
        }
        return stale.size();
    }

    void QueueManager::finish_completion(const QueueItem &item)
    {
        if (!history_.find_by_job(item.id))
        {
            history_.add(item);
        }
        tracker_.discard(item.id);
        store_.queue().remove(item.id);
        spdlog::info("Completed {}", item.id);
    }

    void QueueManager::set_downloaded(QueueItem &item, std::uint64_t downloaded_bytes) const
    {
        item.downloaded_bytes = downloaded_bytes;
        if (item.total_bytes)
        {
            item.progress_pct = *item.total_bytes == 0
                                    ? 100.0
                                    : static_cast<double>(downloaded_bytes) * 100.0 / static_cast<double>(*item.total_bytes);
        }
        else if (downloaded_bytes == 0)
        {
            item.progress_pct = 0.0;
        }
    }

    Timestamp QueueManager::next_enqueue_time()
    {
        auto stamp = std::chrono::time_point_cast<std::chrono::milliseconds>(now());
        if (stamp <= last_enqueued_)
        {
            stamp = std::chrono::time_point_cast<std::chrono::milliseconds>(last_enqueued_) + std::chrono::milliseconds{1};
        }
        last_enqueued_ = stamp;
        return stamp;
    }

} // namespace fetchvault
