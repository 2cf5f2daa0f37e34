#pragma once
// ============================================================================
// VIGIL - Indicator Base Class
// ============================================================================
// CRTP base for the streaming indicators behind the strategies
// The base counts samples and derives readiness from the indicator's warmup;
// indicators consume closes oldest first, one update per candle
// ============================================================================

#include <concepts>
#include <cstddef>
#include <span>

namespace vigil::strategy {

template <typename T>
concept Indicator = requires(T indicator, double value) {
    { indicator.update(value) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.warmup() } -> std::convertible_to<size_t>;
    { indicator.reset() } -> std::same_as<void>;
};

/// Derived supplies update_impl(double), value_impl(), warmup_impl() and
/// reset_impl(). Inside update_impl, samples() still excludes the new value.
template <typename Derived>
class IndicatorBase {
public:
    void update(double value) {
        derived().update_impl(value);
        ++samples_;
    }

    [[nodiscard]] double value() const { return derived().value_impl(); }

    [[nodiscard]] bool is_ready() const { return samples_ >= derived().warmup_impl(); }

    /// Samples required before is_ready()
    [[nodiscard]] size_t warmup() const { return derived().warmup_impl(); }

    [[nodiscard]] size_t samples() const noexcept { return samples_; }

    void reset() {
        samples_ = 0;
        derived().reset_impl();
    }

protected:
    IndicatorBase() = default;
    ~IndicatorBase() = default;

private:
    Derived& derived() { return static_cast<Derived&>(*this); }
    const Derived& derived() const { return static_cast<const Derived&>(*this); }

    size_t samples_ = 0;
};

template <Indicator T>
void feed(T& indicator, std::span<const double> series) {
    for (double value : series) {
        indicator.update(value);
    }
}

}  // namespace vigil::strategy
