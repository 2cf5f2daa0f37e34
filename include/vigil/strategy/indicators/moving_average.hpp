#pragma once
// ============================================================================
// VIGIL - Moving Averages
// ============================================================================
// EMA (seeded by the running mean of its first Period closes) and SMA
// ============================================================================

#include "vigil/strategy/indicators/indicator_base.hpp"
#include "vigil/strategy/indicators/rolling_window.hpp"

namespace vigil::strategy {

template <size_t Period>
class EMA : public IndicatorBase<EMA<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    static constexpr double ALPHA = 2.0 / (Period + 1);

    void update_impl(double price) {
        const size_t seen = this->samples();
        if (seen < Period) {
            seed_sum_ += price;
            ema_ = seed_sum_ / static_cast<double>(seen + 1);
        } else {
            ema_ += (price - ema_) * ALPHA;
        }
    }

    [[nodiscard]] double value_impl() const { return ema_; }
    [[nodiscard]] constexpr size_t warmup_impl() const { return Period; }

    void reset_impl() {
        ema_ = 0.0;
        seed_sum_ = 0.0;
    }

private:
    double ema_ = 0.0;
    double seed_sum_ = 0.0;
};

template <size_t Period>
class SMA : public IndicatorBase<SMA<Period>> {
public:
    void update_impl(double price) { window_.push(price); }

    [[nodiscard]] double value_impl() const { return window_.mean(); }
    [[nodiscard]] constexpr size_t warmup_impl() const { return Period; }

    void reset_impl() { window_.clear(); }

private:
    RollingWindow<Period> window_;
};

using EMA5 = EMA<5>;
using EMA13 = EMA<13>;

}  // namespace vigil::strategy
