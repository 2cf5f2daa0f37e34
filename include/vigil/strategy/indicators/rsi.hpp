#pragma once
// ============================================================================
// VIGIL - RSI (Relative Strength Index)
// ============================================================================
// Wilder's RSI: the first Period changes seed plain averages, later changes
// are smoothed with weight 1/Period. Range 0-100, 50 until ready.
// ============================================================================

#include "vigil/strategy/indicators/indicator_base.hpp"

namespace vigil::strategy {

template <size_t Period = 14>
class RSI : public IndicatorBase<RSI<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    void update_impl(double price) {
        const size_t change_index = this->samples();  // 0 for the very first close
        if (change_index == 0) {
            prev_close_ = price;
            return;
        }

        const double change = price - prev_close_;
        prev_close_ = price;
        const double gain = change > 0.0 ? change : 0.0;
        const double loss = change < 0.0 ? -change : 0.0;

        if (change_index < Period) {
            // Still summing the seed window
            avg_gain_ += gain;
            avg_loss_ += loss;
        } else if (change_index == Period) {
            avg_gain_ = (avg_gain_ + gain) / Period;
            avg_loss_ = (avg_loss_ + loss) / Period;
        } else {
            avg_gain_ = (avg_gain_ * (Period - 1) + gain) / Period;
            avg_loss_ = (avg_loss_ * (Period - 1) + loss) / Period;
        }
    }

    [[nodiscard]] double value_impl() const {
        if (!this->is_ready()) return 50.0;
        if (avg_loss_ == 0.0) {
            return avg_gain_ == 0.0 ? 50.0 : 100.0;
        }
        return 100.0 - 100.0 / (1.0 + avg_gain_ / avg_loss_);
    }

    /// Period changes need Period + 1 closes
    [[nodiscard]] constexpr size_t warmup_impl() const { return Period + 1; }

    void reset_impl() {
        prev_close_ = 0.0;
        avg_gain_ = 0.0;
        avg_loss_ = 0.0;
    }

    [[nodiscard]] bool is_overbought(double threshold) const {
        return this->is_ready() && value_impl() >= threshold;
    }

    [[nodiscard]] bool is_oversold(double threshold) const {
        return this->is_ready() && value_impl() <= threshold;
    }

private:
    double prev_close_ = 0.0;
    double avg_gain_ = 0.0;
    double avg_loss_ = 0.0;
};

using RSI14 = RSI<14>;
using RSI7 = RSI<7>;

}  // namespace vigil::strategy
