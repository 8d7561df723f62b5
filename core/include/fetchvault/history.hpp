#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "fetchvault/records.hpp"
#include "fetchvault/store.hpp"

namespace fetchvault
{

    // Completed acquisitions, used for duplicate detection.
    class History
    {
    public:
        explicit History(Store &store);

        HistoryRecord add(const QueueItem &item);

        std::vector<HistoryRecord> recent(std::size_t limit = 50) const;
        std::vector<HistoryRecord> for_source(const std::string &source_id) const;

        std::optional<HistoryRecord> find_duplicate(const std::string &source_id, const std::string &quality,
                                                    const std::string &format) const;
        std::optional<HistoryRecord> find_by_job(const std::string &job_id) const;

        bool remove(const std::string &id);
        void clear();

    private:
        Store &store_;
    };

} // namespace fetchvault
