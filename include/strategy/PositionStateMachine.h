#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace ninetofive {
namespace strategy {

struct FlatState {};

struct OpenState {
    Side side = Side::LONG;
    Price entry_price = 0.0;
    TimestampMs entry_time = 0;
};

// Long position past its profit target, trailing the peak high
struct TpZoneState {
    OpenState position;
    Price peak_price = 0.0;
};

using PositionState = std::variant<FlatState, OpenState, TpZoneState>;

struct PositionExit {
    Side side = Side::LONG;
    Price entry_price = 0.0;
    TimestampMs entry_time = 0;
    Price exit_price = 0.0;
    TimestampMs exit_time = 0;
    ExitReason reason = ExitReason::BACKTEST_END;
};

struct PositionTransitionInput {
    PricePoint candle;
    Zone zone = Zone::LONG;
    std::optional<Zone> previous_zone;  // empty on the first candle
};

struct PositionTransitionResult {
    PositionState next;
    std::vector<PositionExit> exits;    // in closing order, at most two per candle
};

class PositionStateMachine {
public:
    // Conservative fill assumed when a TP-zone candle trades below entry
    static constexpr double BELOW_ENTRY_EXIT_FACTOR = 0.999;

    // One pass per candle: zone flip, then TP-zone exits or profit target.
    static PositionTransitionResult transition(const PositionState& state,
                                               const PositionTransitionInput& input,
                                               const ZoneConfig& config);

    // Close whatever is open at the last candle's close
    static std::optional<PositionExit> finalize(const PositionState& state, const PricePoint& last_candle);

    static bool isFlat(const PositionState& state) {
        return std::holds_alternative<FlatState>(state);
    }
    static bool isInTpZone(const PositionState& state) {
        return std::holds_alternative<TpZoneState>(state);
    }

    // Entry details of an open position, nullptr when flat
    static const OpenState* openPosition(const PositionState& state);
};

} // namespace strategy
} // namespace ninetofive
