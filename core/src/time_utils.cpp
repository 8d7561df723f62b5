#include "fetchvault/time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace fetchvault
{

    Timestamp now()
    {
        return std::chrono::system_clock::now();
    }

    std::int64_t to_millis(Timestamp value)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    Timestamp from_millis(std::int64_t millis)
    {
        return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{millis})};
    }

    std::string iso_date(Timestamp value)
    {
        const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(value)};
        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
            << std::setw(2) << static_cast<unsigned>(ymd.day());
        return oss.str();
    }

    std::string iso_datetime(Timestamp value)
    {
        const auto day = std::chrono::floor<std::chrono::days>(value);
        const std::chrono::hh_mm_ss time{std::chrono::floor<std::chrono::seconds>(value - day)};
        std::ostringstream oss;
        oss << iso_date(value) << 'T' << std::setfill('0')
            << std::setw(2) << time.hours().count() << ':'
            << std::setw(2) << time.minutes().count() << ':'
            << std::setw(2) << time.seconds().count() << 'Z';
        return oss.str();
    }

} // namespace fetchvault
