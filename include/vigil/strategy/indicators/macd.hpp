#pragma once
// ============================================================================
// VIGIL - MACD (Moving Average Convergence Divergence)
// ============================================================================
// line = EMA(Fast) - EMA(Slow), signal = EMA(Signal) of the line,
// histogram = line - signal. The line starts once the slow EMA is seeded.
// ============================================================================

#include "vigil/strategy/indicators/indicator_base.hpp"
#include "vigil/strategy/indicators/moving_average.hpp"

namespace vigil::strategy {

template <size_t FastPeriod = 12, size_t SlowPeriod = 26, size_t SignalPeriod = 9>
class MACD : public IndicatorBase<MACD<FastPeriod, SlowPeriod, SignalPeriod>> {
public:
    static_assert(FastPeriod < SlowPeriod, "Fast period must be less than slow period");

    void update_impl(double price) {
        fast_.update(price);
        slow_.update(price);
        if (!slow_.is_ready()) {
            return;
        }
        line_ = fast_.value() - slow_.value();
        signal_.update(line_);
        prev_histogram_ = histogram_;
        histogram_ = line_ - signal_.value();
    }

    [[nodiscard]] double value_impl() const { return line_; }
    [[nodiscard]] constexpr size_t warmup_impl() const { return SlowPeriod + SignalPeriod; }

    void reset_impl() {
        fast_.reset();
        slow_.reset();
        signal_.reset();
        line_ = 0.0;
        histogram_ = 0.0;
        prev_histogram_ = 0.0;
    }

    [[nodiscard]] double signal_line() const { return signal_.value(); }
    [[nodiscard]] double histogram() const { return histogram_; }
    [[nodiscard]] double previous_histogram() const { return prev_histogram_; }

    /// Histogram went from <= 0 to > 0 on the latest close
    [[nodiscard]] bool crossed_above_zero() const {
        return this->is_ready() && prev_histogram_ <= 0.0 && histogram_ > 0.0;
    }

    /// Histogram went from >= 0 to < 0 on the latest close
    [[nodiscard]] bool crossed_below_zero() const {
        return this->is_ready() && prev_histogram_ >= 0.0 && histogram_ < 0.0;
    }

private:
    EMA<FastPeriod> fast_;
    EMA<SlowPeriod> slow_;
    EMA<SignalPeriod> signal_;

    double line_ = 0.0;
    double histogram_ = 0.0;
    double prev_histogram_ = 0.0;
};

using MACD_12_26_9 = MACD<12, 26, 9>;

}  // namespace vigil::strategy
