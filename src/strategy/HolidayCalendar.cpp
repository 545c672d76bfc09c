#include "strategy/HolidayCalendar.h"
#include "common/TimeUtils.h"

#include <utility>

namespace ninetofive {
namespace strategy {

HolidayCalendar::HolidayCalendar(std::set<long long> day_numbers)
    : days_(std::move(day_numbers)) {}

HolidayCalendar HolidayCalendar::fromDateStrings(const std::vector<std::string>& dates) {
    std::set<long long> days;
    for (const auto& date : dates) {
        days.insert(utils::TimeUtils::parseDate(date));
    }
    return HolidayCalendar(std::move(days));
}

HolidayCalendar HolidayCalendar::usMarketDefaults() {
    static const std::vector<std::string> kDates = {
        "2025-12-25",
        "2026-01-01",
        "2026-01-19",
        "2026-02-16",
        "2026-04-03",
        "2026-05-25",
        "2026-06-19",
        "2026-07-06",
        "2026-09-07",
        "2026-11-26",
        "2026-12-25"
    };
    return fromDateStrings(kDates);
}

bool HolidayCalendar::containsDate(const std::string& date) const {
    return contains(utils::TimeUtils::parseDate(date));
}

std::vector<std::string> HolidayCalendar::toDateStrings() const {
    std::vector<std::string> out;
    out.reserve(days_.size());
    for (long long day : days_) {
        out.push_back(utils::TimeUtils::formatDate(day));
    }
    return out;
}

} // namespace strategy
} // namespace ninetofive
