#include "backtest/SyntheticData.h"
#include "common/TimeUtils.h"
#include "strategy/ZoneClassifier.h"

#include <random>

namespace ninetofive {
namespace backtest {

std::vector<PricePoint> SyntheticData::generateNineToFive(int days,
                                                          TimestampMs start_ms,
                                                          double base_price,
                                                          unsigned int seed) {
    std::vector<PricePoint> out;
    if (days <= 0) {
        return out;
    }

    const long long step_ms = CANDLE_MINUTES * utils::TimeUtils::MS_PER_MINUTE;
    const long long candle_count = static_cast<long long>(days) * 24 * 60 / CANDLE_MINUTES;
    out.reserve(static_cast<size_t>(candle_count));

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    double last_price = base_price;
    for (long long i = 0; i < candle_count; ++i) {
        const TimestampMs ts = start_ms + i * step_ms;
        const auto local = utils::TimeUtils::toLocal(ts, strategy::ZoneClassifier::LOCAL_UTC_OFFSET_MINUTES);
        const int local_hour = local.minute_of_day / 60;

        double move = 0.0;
        if (strategy::ZoneClassifier::isWeekend(local.day_of_week)) {
            move = (unit(rng) - 0.4) * 0.001;
        } else if (local_hour >= 9 && local_hour < 16) {
            move = (unit(rng) - 0.6) * 0.002;
        } else {
            move = (unit(rng) - 0.3) * 0.002;
        }

        const double price = last_price * (1.0 + move);
        const double volatility = price * 0.001;
        const double open = price - volatility * unit(rng);
        const double high = price + volatility * unit(rng);
        const double low = price - volatility * unit(rng);

        out.emplace_back(ts, price, high, low, open);
        last_price = price;
    }
    return out;
}

} // namespace backtest
} // namespace ninetofive
