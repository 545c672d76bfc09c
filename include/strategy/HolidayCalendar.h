#pragma once

#include <set>
#include <string>
#include <vector>

namespace ninetofive {
namespace strategy {

// Immutable set of calendar dates on which the market is treated as closed.
// Dates are stored as days since 1970-01-01.
class HolidayCalendar {
public:
    HolidayCalendar() = default;
    explicit HolidayCalendar(std::set<long long> day_numbers);

    // Throws std::invalid_argument for a malformed date string
    static HolidayCalendar fromDateStrings(const std::vector<std::string>& dates);

    // US market holidays from late 2025 through 2026
    static HolidayCalendar usMarketDefaults();

    bool contains(long long day_number) const {
        return days_.count(day_number) > 0;
    }
    bool containsDate(const std::string& date) const;

    size_t size() const { return days_.size(); }
    bool empty() const { return days_.empty(); }
    std::vector<std::string> toDateStrings() const;

private:
    std::set<long long> days_;
};

} // namespace strategy
} // namespace ninetofive
