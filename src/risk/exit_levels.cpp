// ============================================================================
// VIGIL - Exit Levels Implementation
// ============================================================================

#include "vigil/risk/exit_levels.hpp"

namespace vigil::risk {

Price calculate_stop_loss(Price entry_price, PositionSide side, double percent) {
    const double pct = percent / 100.0;
    const double entry = entry_price.to_double();

    if (side == PositionSide::Long) {
        return Price::from_double(entry * (1.0 - pct));
    }
    return Price::from_double(entry * (1.0 + pct));
}

Price calculate_take_profit(Price entry_price, PositionSide side, double percent) {
    if (percent <= 0.0) {
        return Price{0};
    }

    const double pct = percent / 100.0;
    const double entry = entry_price.to_double();

    if (side == PositionSide::Long) {
        return Price::from_double(entry * (1.0 + pct));
    }
    return Price::from_double(entry * (1.0 - pct));
}

Price calculate_trailing_stop(Price watermark, Price current_stop, PositionSide side,
                              double percent) {
    const double pct = percent / 100.0;
    const double mark = watermark.to_double();

    if (side == PositionSide::Long) {
        const Price new_stop = Price::from_double(mark * (1.0 - pct));
        return new_stop > current_stop ? new_stop : current_stop;
    }
    const Price new_stop = Price::from_double(mark * (1.0 + pct));
    return new_stop < current_stop ? new_stop : current_stop;
}

ExitLevels initial_exit_levels(Price entry_price, PositionSide side, const ExitParameters& params) {
    ExitLevels levels;
    levels.stop_loss = calculate_stop_loss(entry_price, side, params.stop_loss_percent);
    levels.take_profit = calculate_take_profit(entry_price, side, params.take_profit_percent);
    levels.watermark = entry_price;
    levels.trailing_stop = levels.stop_loss;
    levels.trailing_active = false;
    return levels;
}

CloseReason evaluate_exit(ExitLevels& levels, Price entry_price, PositionSide side,
                          const ExitParameters& params, Price mark) {
    const bool is_long = side == PositionSide::Long;

    // 1. Stop-loss has priority over every other exit
    if (is_long ? mark <= levels.stop_loss : mark >= levels.stop_loss) {
        return CloseReason::StopLoss;
    }

    // 2. Take-profit
    if (params.take_profit_enabled() && levels.take_profit.is_valid() &&
        (is_long ? mark >= levels.take_profit : mark <= levels.take_profit)) {
        return CloseReason::TakeProfit;
    }

    if (!params.trailing_enabled()) {
        return CloseReason::None;
    }

    // 3. Watermark and trailing stop
    if (is_long ? mark > levels.watermark : mark < levels.watermark) {
        levels.watermark = mark;
    }

    if (!levels.trailing_active) {
        const double activation = params.trailing_activation_percent / 100.0;
        const double entry = entry_price.to_double();
        const Price activation_price =
            Price::from_double(is_long ? entry * (1.0 + activation) : entry * (1.0 - activation));
        levels.trailing_active = is_long ? levels.watermark >= activation_price
                                         : levels.watermark <= activation_price;
    }

    if (!levels.trailing_active) {
        return CloseReason::None;
    }

    levels.trailing_stop = calculate_trailing_stop(levels.watermark, levels.trailing_stop, side,
                                                   params.trailing_stop_percent);

    if (is_long ? mark <= levels.trailing_stop : mark >= levels.trailing_stop) {
        return CloseReason::TrailingStop;
    }
    return CloseReason::None;
}

double calculate_pnl(PositionSide side, Price entry_price, Price exit_price, Quantity size) {
    const double diff = exit_price.to_double() - entry_price.to_double();
    const double signed_diff = side == PositionSide::Long ? diff : -diff;
    return signed_diff * size.to_double();
}

double calculate_pnl_percent(PositionSide side, Price entry_price, Price exit_price) {
    const double entry = entry_price.to_double();
    if (entry <= 0.0) return 0.0;

    const double diff = (exit_price.to_double() - entry) / entry * 100.0;
    return side == PositionSide::Long ? diff : -diff;
}

}  // namespace vigil::risk
