#include "fetchvault/history.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "fetchvault/crypto.hpp"

namespace fetchvault
{

    History::History(Store &store)
        : store_(store)
    {
    }

    HistoryRecord History::add(const QueueItem &item)
    {
        HistoryRecord record{};
        record.id = crypto::random_id("history");
        record.source_id = item.source_id;
        record.title = item.title;
        record.thumbnail_ref = item.thumbnail_ref;
        record.quality = item.quality;
        record.format = item.format;
        record.channel = item.channel;
        record.duration = item.duration;
        record.completed_at = now();
        record.size_bytes = item.total_bytes ? item.total_bytes : std::optional<std::uint64_t>(item.downloaded_bytes);
        record.job_id = item.id;
        store_.history().put(record);
        spdlog::info("Recorded {} ({} {}) in history as {}", item.source_id, item.quality, item.format, record.id);
        return record;
    }

    std::vector<HistoryRecord> History::recent(std::size_t limit) const
    {
        auto records = store_.history().get_all();
        std::sort(records.begin(), records.end(), [](const HistoryRecord &lhs, const HistoryRecord &rhs)
                  { return lhs.completed_at != rhs.completed_at ? lhs.completed_at > rhs.completed_at
                                                                : lhs.id < rhs.id; });
        if (records.size() > limit)
        {
            records.resize(limit);
        }
        return records;
    }

    std::vector<HistoryRecord> History::for_source(const std::string &source_id) const
    {
        return store_.history().get_all_by_index(index::kBySource, source_id);
    }

    std::optional<HistoryRecord> History::find_duplicate(const std::string &source_id, const std::string &quality,
                                                         const std::string &format) const
    {
        auto matches = store_.history().get_all_by_index(index::kByIdentity, identity_key(source_id, quality, format));
        if (matches.empty())
        {
            return std::nullopt;
        }
        return std::move(matches.front());
    }

    std::optional<HistoryRecord> History::find_by_job(const std::string &job_id) const
    {
        auto matches = store_.history().get_all_by_index(index::kByJob, job_id);
        if (matches.empty())
        {
            return std::nullopt;
        }
        return std::move(matches.front());
    }

    bool History::remove(const std::string &id)
    {
        return store_.history().remove(id);
    }

    void History::clear()
    {
        store_.history().clear();
    }

} // namespace fetchvault
