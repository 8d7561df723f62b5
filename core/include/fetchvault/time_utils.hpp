#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fetchvault
{

    using Timestamp = std::chrono::system_clock::time_point;

    Timestamp now();

    std::int64_t to_millis(Timestamp value);
    Timestamp from_millis(std::int64_t millis);

    // "YYYY-MM-DD" in UTC.
    std::string iso_date(Timestamp value);

    // "YYYY-MM-DDTHH:MM:SSZ" in UTC.
    std::string iso_datetime(Timestamp value);

} // namespace fetchvault
