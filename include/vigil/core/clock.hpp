#pragma once
// ============================================================================
// VIGIL - Clock
// ============================================================================
// Injectable time source so schedules and cooldowns can run on simulated time
// ============================================================================

#include "vigil/core/types.hpp"

#include <atomic>

namespace vigil {

class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public IClock {
public:
    [[nodiscard]] Timestamp now() const override { return ::vigil::now(); }
};

/// Clock that only moves when told to
class ManualClock final : public IClock {
public:
    explicit ManualClock(Timestamp start = Timestamp{}) : now_ns_(start.time_since_epoch().count()) {}

    [[nodiscard]] Timestamp now() const override {
        return Timestamp{Duration{now_ns_.load(std::memory_order_acquire)}};
    }

    void set(Timestamp ts) { now_ns_.store(ts.time_since_epoch().count(), std::memory_order_release); }

    void advance(Duration d) { now_ns_.fetch_add(d.count(), std::memory_order_acq_rel); }

private:
    std::atomic<int64_t> now_ns_;
};

}  // namespace vigil
