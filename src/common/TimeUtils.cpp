#include "common/TimeUtils.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ninetofive {
namespace utils {

namespace {
long long floorDiv(long long value, long long divisor) {
    long long q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

bool allDigits(const std::string& s, size_t begin, size_t end) {
    if (begin >= end || end > s.size()) {
        return false;
    }
    for (size_t i = begin; i < end; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

int toInt(const std::string& s, size_t begin, size_t len) {
    return std::stoi(s.substr(begin, len));
}

std::string trimCopy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}
} // namespace

long long TimeUtils::daysFromCivil(int year, int month, int day) {
    const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month > 2) ? (month - 3) : (month + 9);
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate TimeUtils::civilFromDays(long long day_number) {
    const long long z = day_number + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;

    CivilDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

LocalDateTime TimeUtils::toLocal(TimestampMs timestamp_ms, int utc_offset_minutes) {
    const long long local_ms = timestamp_ms + static_cast<long long>(utc_offset_minutes) * MS_PER_MINUTE;

    LocalDateTime out;
    out.day_number = floorDiv(local_ms, MS_PER_DAY);
    const long long ms_into_day = local_ms - out.day_number * MS_PER_DAY;
    out.minute_of_day = static_cast<int>(ms_into_day / MS_PER_MINUTE);
    // 1970-01-01 was a Thursday
    out.day_of_week = static_cast<int>(((out.day_number % 7) + 11) % 7);
    return out;
}

long long TimeUtils::parseDate(const std::string& text) {
    const std::string s = trimCopy(text);
    if (s.size() != 10 || s[4] != '-' || s[7] != '-' ||
        !allDigits(s, 0, 4) || !allDigits(s, 5, 7) || !allDigits(s, 8, 10)) {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
    }

    const int year = toInt(s, 0, 4);
    const int month = toInt(s, 5, 2);
    const int day = toInt(s, 8, 2);
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        throw std::invalid_argument("Invalid date: " + text);
    }

    const long long day_number = daysFromCivil(year, month, day);
    const CivilDate check = civilFromDays(day_number);
    if (check.year != year || check.month != month || check.day != day) {
        throw std::invalid_argument("Invalid calendar date: " + text);
    }
    return day_number;
}

std::string TimeUtils::formatDate(long long day_number) {
    const CivilDate date = civilFromDays(day_number);
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << date.year << "-"
        << std::setw(2) << date.month << "-"
        << std::setw(2) << date.day;
    return oss.str();
}

TimestampMs TimeUtils::parseTimestamp(const std::string& text) {
    const std::string s = trimCopy(text);
    if (s.empty()) {
        throw std::invalid_argument("Empty timestamp");
    }

    const size_t digits_from = (s[0] == '-') ? 1 : 0;
    if (allDigits(s, digits_from, s.size())) {
        return toMsTimestamp(std::stoll(s));
    }

    if (s.size() < 10) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }
    const long long day_number = parseDate(s.substr(0, 10));
    TimestampMs ts = day_number * MS_PER_DAY;
    if (s.size() == 10) {
        return ts;
    }

    // [T ]HH:MM[:SS[.fff]][Z]
    std::string rest = s.substr(10);
    if (rest.front() != 'T' && rest.front() != ' ') {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }
    rest.erase(rest.begin());
    if (!rest.empty() && (rest.back() == 'Z' || rest.back() == 'z')) {
        rest.pop_back();
    }

    if (rest.size() < 5 || rest[2] != ':' || !allDigits(rest, 0, 2) || !allDigits(rest, 3, 5)) {
        throw std::invalid_argument("Invalid timestamp time-of-day: " + text);
    }
    const int hour = toInt(rest, 0, 2);
    const int minute = toInt(rest, 3, 2);
    int second = 0;
    int millis = 0;
    size_t pos = 5;
    if (pos < rest.size()) {
        if (rest[pos] != ':' || !allDigits(rest, pos + 1, pos + 3)) {
            throw std::invalid_argument("Invalid timestamp seconds: " + text);
        }
        second = toInt(rest, pos + 1, 2);
        pos += 3;
    }
    if (pos < rest.size()) {
        if (rest[pos] != '.' || !allDigits(rest, pos + 1, rest.size())) {
            throw std::invalid_argument("Invalid timestamp fraction: " + text);
        }
        std::string fraction = rest.substr(pos + 1, 3);
        while (fraction.size() < 3) {
            fraction.push_back('0');
        }
        millis = std::stoi(fraction);
    }
    if (hour > 23 || minute > 59 || second > 60) {
        throw std::invalid_argument("Timestamp out of range: " + text);
    }

    ts += hour * MS_PER_HOUR + minute * MS_PER_MINUTE + second * 1000LL + millis;
    return ts;
}

std::string TimeUtils::formatTimestamp(TimestampMs timestamp_ms) {
    const LocalDateTime utc = toLocal(timestamp_ms, 0);
    std::ostringstream oss;
    oss << formatDate(utc.day_number) << " "
        << std::setfill('0')
        << std::setw(2) << (utc.minute_of_day / 60) << ":"
        << std::setw(2) << (utc.minute_of_day % 60);
    return oss.str();
}

TimestampMs TimeUtils::toMsTimestamp(long long ts) {
    // Anything below 1e12 cannot be a millisecond timestamp after 2001
    if (ts > 0 && ts < 1000000000000LL) {
        return ts * 1000LL;
    }
    return ts;
}

} // namespace utils
} // namespace ninetofive
