#pragma once
// ============================================================================
// VIGIL - Rolling Window
// ============================================================================
// Fixed-capacity ring over the most recent values with a running sum
// ============================================================================

#include <array>
#include <cstddef>
#include <optional>

namespace vigil::strategy {

template <size_t Capacity>
class RollingWindow {
public:
    static_assert(Capacity > 0, "Capacity must be positive");

    /// Returns the value pushed out when the window was already full
    std::optional<double> push(double value) {
        std::optional<double> evicted;
        if (size_ == Capacity) {
            evicted = slots_[next_];
            sum_ -= *evicted;
        } else {
            ++size_;
        }
        slots_[next_] = value;
        sum_ += value;
        next_ = (next_ + 1) % Capacity;
        return evicted;
    }

    /// back(0) is the newest value; out-of-range ages read as 0
    [[nodiscard]] double back(size_t age) const {
        if (age >= size_) return 0.0;
        return slots_[(next_ + Capacity - 1 - age) % Capacity];
    }

    [[nodiscard]] double sum() const noexcept { return sum_; }

    [[nodiscard]] double mean() const noexcept {
        return size_ == 0 ? 0.0 : sum_ / static_cast<double>(size_);
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool full() const noexcept { return size_ == Capacity; }

    void clear() noexcept {
        size_ = 0;
        next_ = 0;
        sum_ = 0.0;
    }

private:
    std::array<double, Capacity> slots_{};
    size_t size_ = 0;
    size_t next_ = 0;
    double sum_ = 0.0;
};

}  // namespace vigil::strategy
