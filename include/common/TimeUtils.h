#pragma once

#include <string>

#include "common/Types.h"

namespace ninetofive {
namespace utils {

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

// Wall-clock breakdown of a timestamp after a fixed UTC offset is applied
struct LocalDateTime {
    long long day_number = 0;   // days since 1970-01-01
    int day_of_week = 4;        // 0 = Sunday ... 6 = Saturday
    int minute_of_day = 0;      // 0 .. 1439
};

class TimeUtils {
public:
    static constexpr long long MS_PER_MINUTE = 60LL * 1000LL;
    static constexpr long long MS_PER_HOUR = 60LL * MS_PER_MINUTE;
    static constexpr long long MS_PER_DAY = 24LL * MS_PER_HOUR;

    static long long daysFromCivil(int year, int month, int day);
    static CivilDate civilFromDays(long long day_number);

    static LocalDateTime toLocal(TimestampMs timestamp_ms, int utc_offset_minutes);

    // "YYYY-MM-DD" -> day number. Throws std::invalid_argument on malformed input.
    static long long parseDate(const std::string& text);
    static std::string formatDate(long long day_number);

    // ISO-8601 UTC ("2025-12-01T00:00:00.000Z", "2025-12-01T00:00:00Z", "2025-12-01")
    // or a plain epoch number (seconds or milliseconds). Throws std::invalid_argument.
    static TimestampMs parseTimestamp(const std::string& text);

    // "YYYY-MM-DD HH:MM" in UTC
    static std::string formatTimestamp(TimestampMs timestamp_ms);

    // Epoch seconds are promoted to milliseconds
    static TimestampMs toMsTimestamp(long long ts);

    static double hoursBetween(TimestampMs from_ms, TimestampMs to_ms) {
        return static_cast<double>(to_ms - from_ms) / static_cast<double>(MS_PER_HOUR);
    }
};

} // namespace utils
} // namespace ninetofive
