#include <cassert>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "fetchvault/errors.hpp"
#include "fetchvault/history.hpp"
#include "fetchvault/queue_manager.hpp"
#include "fetchvault/resume_tracker.hpp"
#include "fetchvault/store.hpp"

using namespace fetchvault;

namespace
{

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / ("fetchvault_queue_" + name);
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        return root;
    }

    std::vector<std::byte> make_bytes(std::size_t count, std::uint8_t seed)
    {
        std::vector<std::byte> bytes(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            bytes[i] = static_cast<std::byte>((seed + i) & 0xFF);
        }
        return bytes;
    }

    JobRequest sample_job(const std::string &source, const std::string &quality = "720p")
    {
        JobRequest job{};
        job.source_id = source;
        job.source_ref = "https://media.example/watch?v=" + source;
        job.title = "Video " + source;
        job.quality = quality;
        job.format = "mp4";
        job.kind = MediaKind::Video;
        job.transfer_format_id = "22";
        return job;
    }

    template <typename Fn>
    bool throws_code(ErrorCode code, Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const StoreError &ex)
        {
            return ex.code() == code;
        }
        return false;
    }

    void test_enqueue_orders_by_time()
    {
        const auto root = fresh_root("order");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);

        const auto first = queue.enqueue(sample_job("a"));
        const auto second = queue.enqueue(sample_job("b"));
        const auto third = queue.enqueue(sample_job("c"));
        assert(first != second && second != third);

        const auto items = queue.items();
        assert(items.size() == 3);
        assert(items[0].id == first);
        assert(items[1].id == second);
        assert(items[2].id == third);
        assert(items[0].enqueued_at < items[1].enqueued_at);
        for (const auto &item : items)
        {
            assert(item.status == JobStatus::Pending);
            assert(item.progress_pct == 0.0);
            assert(!item.error);
        }

        queue.start(second);
        const auto pending = queue.list_by_status(JobStatus::Pending);
        assert(pending.size() == 2);
        assert(pending[0].id == first);
        assert(pending[1].id == third);
        assert(queue.list_by_status(JobStatus::Active).front().id == second);

        std::filesystem::remove_all(root);
    }

    void test_duplicate_after_completion()
    {
        const auto root = fresh_root("duplicate");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);

        const auto id = queue.enqueue(sample_job("abc"));
        queue.start(id);
        queue.mark_completed(id);

        assert(throws_code(ErrorCode::DuplicateJob, [&]
                           { queue.enqueue(sample_job("abc")); }));
        assert(queue.items().empty());

        const auto other_quality = queue.enqueue(sample_job("abc", "1080p"));
        const auto forced = queue.enqueue(sample_job("abc"), true);
        assert(queue.get(other_quality).status == JobStatus::Pending);
        assert(queue.get(forced).status == JobStatus::Pending);

        std::filesystem::remove_all(root);
    }

    void test_interrupt_resume_complete_scenario()
    {
        const auto root = fresh_root("scenario");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);
        History history(store);

        const auto id = queue.enqueue(sample_job("abc"));
        assert(queue.start(id) == 0);

        const auto head = make_bytes(1000, 1);
        queue.report_chunk(id, 0, head, 3000);
        queue.mark_interrupted(id);
        assert(queue.get(id).status == JobStatus::Paused);
        assert(tracker.resume_offset(id) == 1000);

        // Progress reports are ignored while paused.
        assert(!queue.update_progress(id, 2000));
        assert(queue.get(id).downloaded_bytes == 1000);

        assert(queue.resume(id) == 1000);
        assert(queue.get(id).status == JobStatus::Active);

        queue.report_chunk(id, 1000, make_bytes(500, 7));
        assert(throws_code(ErrorCode::OutOfOrderChunk, [&]
                           { queue.report_chunk(id, 900, make_bytes(100, 9)); }));
        assert(tracker.resume_offset(id) == 1500);

        auto item = queue.get(id);
        assert(item.downloaded_bytes == 1500);
        assert(item.total_bytes == 3000u);
        assert(item.progress_pct == 50.0);

        queue.report_chunk(id, 1500, make_bytes(1500, 3));
        queue.mark_completed(id);

        assert(queue.items().empty());
        assert(!store.queue().find(id));
        assert(!tracker.find(id));
        assert(!std::filesystem::exists(store.blob_path(id)));
        const auto record = history.find_by_job(id);
        assert(record);
        assert(record->source_id == "abc");
        assert(record->quality == "720p");
        assert(record->size_bytes == 3000u);

        queue.mark_completed(id);
        assert(history.for_source("abc").size() == 1);

        std::filesystem::remove_all(root);
    }

    void test_progress_rules()
    {
        const auto root = fresh_root("progress");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);

        const auto id = queue.enqueue(sample_job("p"));
        assert(!queue.update_progress(id, 10, 100));
        assert(queue.get(id).downloaded_bytes == 0);
        assert(!queue.get(id).total_bytes);

        queue.start(id);
        assert(queue.update_progress(id, 50, 200));
        assert(queue.get(id).progress_pct == 25.0);
        assert(throws_code(ErrorCode::InvalidArgument, [&]
                           { queue.update_progress(id, 300); }));
        assert(queue.get(id).downloaded_bytes == 50);

        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.mark_completed(id); }));
        assert(queue.get(id).status == JobStatus::Active);

        assert(throws_code(ErrorCode::NotFound, [&]
                           { queue.update_progress("queue-missing", 1); }));

        std::filesystem::remove_all(root);
    }

    void test_illegal_transitions()
    {
        const auto root = fresh_root("transitions");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);

        const auto id = queue.enqueue(sample_job("t"));
        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.mark_interrupted(id); }));
        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.resume(id); }));
        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.mark_completed(id); }));
        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.report_chunk(id, 0, make_bytes(4, 0)); }));

        queue.start(id);
        queue.mark_interrupted(id);
        queue.mark_interrupted(id);
        assert(queue.get(id).status == JobStatus::Paused);
        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.start(id); }));

        std::filesystem::remove_all(root);
    }

    void test_fail_and_retry_keeps_checkpoint()
    {
        const auto root = fresh_root("retry");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);

        const auto id = queue.enqueue(sample_job("r"));
        queue.start(id);
        queue.report_chunk(id, 0, make_bytes(100, 5));
        queue.mark_failed(id, "quota exceeded");

        auto item = queue.get(id);
        assert(item.status == JobStatus::Failed);
        assert(item.error == "quota exceeded");
        assert(queue.list_by_status(JobStatus::Failed).size() == 1);
        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.resume(id); }));

        queue.mark_failed(id, "access revoked");
        assert(queue.get(id).error == "access revoked");

        queue.retry(id);
        item = queue.get(id);
        assert(item.status == JobStatus::Pending);
        assert(!item.error);
        queue.retry(id);

        assert(queue.start(id) == 100);
        assert(queue.get(id).downloaded_bytes == 100);
        assert(throws_code(ErrorCode::InvalidState, [&]
                           { queue.retry(id); }));

        assert(throws_code(ErrorCode::NotFound, [&]
                           { queue.mark_failed("queue-missing", "gone"); }));

        std::filesystem::remove_all(root);
    }

    void test_cancel_leaves_no_trace()
    {
        const auto root = fresh_root("cancel");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);

        const auto id = queue.enqueue(sample_job("c"));
        queue.start(id);
        queue.report_chunk(id, 0, make_bytes(64, 2));
        queue.mark_interrupted(id);
        assert(std::filesystem::exists(store.blob_path(id)));

        queue.cancel(id);
        assert(!store.queue().find(id));
        assert(!tracker.find(id));
        assert(!std::filesystem::exists(store.blob_path(id)));
        assert(tracker.resume_offset(id) == 0);
        queue.cancel(id);

        std::filesystem::remove_all(root);
    }

    void test_stale_completed_rows_yield_to_history()
    {
        const auto root = fresh_root("stale");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);
        History history(store);

        // History written, queue row left behind.
        const auto promoted = queue.enqueue(sample_job("s1"));
        queue.start(promoted);
        auto item = queue.get(promoted);
        item.status = JobStatus::Completed;
        store.queue().put(item);
        history.add(item);

        // Queue row marked completed, history never written.
        const auto unpromoted = queue.enqueue(sample_job("s2"));
        queue.start(unpromoted);
        item = queue.get(unpromoted);
        item.status = JobStatus::Completed;
        store.queue().put(item);

        assert(queue.items().empty());
        assert(history.for_source("s1").size() == 1);
        assert(history.find_by_job(unpromoted));
        assert(queue.reconcile() == 0);

        // A second completion call on the already-finished job is harmless.
        queue.mark_completed(promoted);
        assert(history.for_source("s1").size() == 1);

        std::filesystem::remove_all(root);
    }

    void test_unpromoted_completion_blocks_duplicate()
    {
        const auto root = fresh_root("unpromoted");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);
        History history(store);

        const auto id = queue.enqueue(sample_job("abc"));
        queue.start(id);
        auto item = queue.get(id);
        item.status = JobStatus::Completed;
        store.queue().put(item);

        assert(throws_code(ErrorCode::DuplicateJob, [&]
                           { queue.enqueue(sample_job("abc")); }));
        assert(history.for_source("abc").size() == 1);
        assert(history.find_by_job(id));
        assert(queue.items().empty());

        std::filesystem::remove_all(root);
    }

    void test_cancel_of_completed_row_keeps_history()
    {
        const auto root = fresh_root("cancel_completed");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);
        History history(store);

        const auto id = queue.enqueue(sample_job("done"));
        queue.start(id);
        queue.report_chunk(id, 0, make_bytes(32, 4), 32);
        auto item = queue.get(id);
        item.status = JobStatus::Completed;
        store.queue().put(item);

        queue.cancel(id);
        assert(!store.queue().find(id));
        assert(!tracker.find(id));
        const auto record = history.find_by_job(id);
        assert(record);
        assert(record->size_bytes == 32u);

        std::filesystem::remove_all(root);
    }

    void test_separator_in_fields_is_not_a_duplicate()
    {
        const auto root = fresh_root("separator");
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);

        const auto first = queue.enqueue(sample_job("x|y", "z"));
        queue.start(first);
        queue.mark_completed(first);

        const auto second = queue.enqueue(sample_job("x", "y|z"));
        assert(queue.get(second).status == JobStatus::Pending);
        assert(throws_code(ErrorCode::DuplicateJob, [&]
                           { queue.enqueue(sample_job("x|y", "z")); }));

        std::filesystem::remove_all(root);
    }

    void test_queue_survives_reopen()
    {
        const auto root = fresh_root("reopen");
        std::string id;
        {
            Store store(root);
            ResumeTracker tracker(store);
            QueueManager queue(store, tracker);
            id = queue.enqueue(sample_job("z"));
            queue.start(id);
            queue.report_chunk(id, 0, make_bytes(256, 11), 1024);
            queue.mark_interrupted(id);
        }
        Store store(root);
        ResumeTracker tracker(store);
        QueueManager queue(store, tracker);
        assert(queue.get(id).status == JobStatus::Paused);
        assert(queue.resume(id) == 256);
        assert(queue.get(id).progress_pct == 25.0);

        std::filesystem::remove_all(root);
    }

} // namespace

void run_queue_tests()
{
    test_enqueue_orders_by_time();
    test_duplicate_after_completion();
    test_interrupt_resume_complete_scenario();
    test_progress_rules();
    test_illegal_transitions();
    test_fail_and_retry_keeps_checkpoint();
    test_cancel_leaves_no_trace();
    test_stale_completed_rows_yield_to_history();
    test_queue_survives_reopen();
    test_unpromoted_completion_blocks_duplicate();
    test_cancel_of_completed_row_keeps_history();
    test_separator_in_fields_is_not_a_duplicate();
}
