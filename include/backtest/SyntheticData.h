#pragma once

#include <vector>

#include "common/Types.h"

namespace ninetofive {
namespace backtest {

class SyntheticData {
public:
    static constexpr int CANDLE_MINUTES = 5;

    // 5-minute candles mimicking the session pattern: weekday prices drift down
    // during 09:00-16:00 local and up overnight, weekends drift slightly up.
    // Same seed, same series.
    static std::vector<PricePoint> generateNineToFive(int days,
                                                      TimestampMs start_ms,
                                                      double base_price,
                                                      unsigned int seed);
};

} // namespace backtest
} // namespace ninetofive
