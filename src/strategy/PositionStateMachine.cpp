#include "strategy/PositionStateMachine.h"
#include "strategy/ZoneClassifier.h"

namespace ninetofive {
namespace strategy {

namespace {
PositionExit makeExit(const OpenState& position, Price exit_price, TimestampMs exit_time, ExitReason reason) {
    PositionExit exit;
    exit.side = position.side;
    exit.entry_price = position.entry_price;
    exit.entry_time = position.entry_time;
    exit.exit_price = exit_price;
    exit.exit_time = exit_time;
    exit.reason = reason;
    return exit;
}

// Checked in priority order: below entry, trailing stop, time exit.
// Uses the candle low as the worst case.
std::optional<PositionExit> evaluateTpZone(TpZoneState& tp, const PricePoint& candle, const ZoneConfig& config) {
    if (candle.high > tp.peak_price) {
        tp.peak_price = candle.high;
    }

    const OpenState& position = tp.position;
    if (candle.low < position.entry_price) {
        return makeExit(position,
                        position.entry_price * PositionStateMachine::BELOW_ENTRY_EXIT_FACTOR,
                        candle.timestamp,
                        ExitReason::TP_BELOW_ENTRY);
    }

    const double drop_from_peak_pct = (tp.peak_price > 0.0)
        ? ((tp.peak_price - candle.low) / tp.peak_price) * 100.0
        : 0.0;
    if (drop_from_peak_pct >= config.tp_zone_trailing_stop_pct) {
        return makeExit(position,
                        tp.peak_price * (1.0 - config.tp_zone_trailing_stop_pct / 100.0),
                        candle.timestamp,
                        ExitReason::TP_TRAILING_STOP);
    }

    const double hours_until_short = ZoneClassifier::hoursUntilShortZone(candle.timestamp, config);
    if (hours_until_short <= config.tp_zone_hours_threshold) {
        return makeExit(position, candle.price, candle.timestamp, ExitReason::TP_TIME_EXIT);
    }
    return std::nullopt;
}

// Fills at the theoretical target price, not the touched high/low.
void evaluateProfitTarget(const OpenState& position,
                          const PricePoint& candle,
                          const ZoneConfig& config,
                          PositionTransitionResult& result) {
    const bool is_long = (position.side == Side::LONG);
    const Price best_price = is_long ? candle.high : candle.low;
    if (profitPct(position.entry_price, best_price, position.side) < config.profit_target_pct) {
        return;
    }

    const Price target_price = is_long
        ? position.entry_price * (1.0 + config.profit_target_pct / 100.0)
        : position.entry_price * (1.0 - config.profit_target_pct / 100.0);

    if (is_long) {
        const double hours_until_short = ZoneClassifier::hoursUntilShortZone(candle.timestamp, config);
        if (hours_until_short > config.tp_zone_hours_threshold) {
            result.next = TpZoneState{position, best_price};
            return;
        }
    }

    result.exits.push_back(makeExit(position, target_price, candle.timestamp, ExitReason::PROFIT_TARGET));
    result.next = FlatState{};
}
} // namespace

PositionTransitionResult PositionStateMachine::transition(const PositionState& state,
                                                          const PositionTransitionInput& input,
                                                          const ZoneConfig& config) {
    PositionTransitionResult result;
    result.next = state;
    const PricePoint& candle = input.candle;

    // 1. Zone flip: close at the close price and reverse into the new zone
    if (input.previous_zone.has_value() && *input.previous_zone != input.zone) {
        if (const OpenState* open = openPosition(result.next)) {
            result.exits.push_back(makeExit(*open, candle.price, candle.timestamp, ExitReason::ZONE_FLIP));
        }

        OpenState reversed;
        reversed.side = input.zone;
        reversed.entry_price = candle.price;
        reversed.entry_time = candle.timestamp;
        result.next = reversed;
    }

    // 2. TP zone, or 3. profit target
    if (auto* tp = std::get_if<TpZoneState>(&result.next)) {
        if (auto exit = evaluateTpZone(*tp, candle, config)) {
            result.exits.push_back(*exit);
            result.next = FlatState{};
        }
    } else if (const auto* open = std::get_if<OpenState>(&result.next)) {
        const OpenState position = *open;
        evaluateProfitTarget(position, candle, config, result);
    }

    return result;
}

std::optional<PositionExit> PositionStateMachine::finalize(const PositionState& state, const PricePoint& last_candle) {
    const OpenState* open = openPosition(state);
    if (open == nullptr) {
        return std::nullopt;
    }
    return makeExit(*open, last_candle.price, last_candle.timestamp, ExitReason::BACKTEST_END);
}

const OpenState* PositionStateMachine::openPosition(const PositionState& state) {
    if (const auto* open = std::get_if<OpenState>(&state)) {
        return open;
    }
    if (const auto* tp = std::get_if<TpZoneState>(&state)) {
        return &tp->position;
    }
    return nullptr;
}

} // namespace strategy
} // namespace ninetofive
