#pragma once

#include <string>
#include <vector>
#include <optional>

namespace ninetofive {

using Price = double;
using TimestampMs = long long;

// Trading direction. Also used as the zone a timestamp belongs to.
enum class Side { LONG, SHORT };
using Zone = Side;

enum class ExitReason {
    ZONE_FLIP,
    PROFIT_TARGET,
    TP_BELOW_ENTRY,
    TP_TRAILING_STOP,
    TP_TIME_EXIT,
    BACKTEST_END
};

// Raw OHLCV candle as delivered by the market-data source
struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Simulation input; price is the candle close
struct PricePoint {
    TimestampMs timestamp;
    Price price;
    Price high;
    Price low;
    Price open;

    PricePoint() : timestamp(0), price(0), high(0), low(0), open(0) {}

    PricePoint(TimestampMs t, Price p, Price h, Price l, Price o)
        : timestamp(t), price(p), high(h), low(l), open(o) {}
};

inline const char* sideToString(Side side) {
    return (side == Side::LONG) ? "long" : "short";
}

inline const char* exitReasonToString(ExitReason reason) {
    switch (reason) {
        case ExitReason::ZONE_FLIP: return "zone-flip";
        case ExitReason::PROFIT_TARGET: return "profit-target";
        case ExitReason::TP_BELOW_ENTRY: return "tp-below-entry";
        case ExitReason::TP_TRAILING_STOP: return "tp-trailing-stop";
        case ExitReason::TP_TIME_EXIT: return "tp-time-exit";
        case ExitReason::BACKTEST_END: return "backtest-end";
    }
    return "unknown";
}

inline std::optional<ExitReason> exitReasonFromString(const std::string& value) {
    if (value == "zone-flip") return ExitReason::ZONE_FLIP;
    if (value == "profit-target") return ExitReason::PROFIT_TARGET;
    if (value == "tp-below-entry") return ExitReason::TP_BELOW_ENTRY;
    if (value == "tp-trailing-stop") return ExitReason::TP_TRAILING_STOP;
    if (value == "tp-time-exit") return ExitReason::TP_TIME_EXIT;
    if (value == "backtest-end") return ExitReason::BACKTEST_END;
    return std::nullopt;
}

} // namespace ninetofive
