#pragma once
// ============================================================================
// VIGIL - Position Book
// ============================================================================
// Shared registry of positions, one entry per coin at most
// Admission is serialized per coin (coin locks) while the global position
// cap is enforced with an atomic slot counter, so different coins never
// wait on each other
// ============================================================================

#include "vigil/core/types.hpp"
#include "vigil/order/position.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace vigil::order {

class PositionBook {
public:
    PositionBook() = default;

    PositionBook(const PositionBook&) = delete;
    PositionBook& operator=(const PositionBook&) = delete;

    /// Serializes admission and removal for one coin
    [[nodiscard]] std::unique_lock<std::mutex> lock_coin(const Symbol& coin);

    /// Atomically take one of `max_positions` slots; false when all are taken
    [[nodiscard]] bool try_reserve_slot(int max_positions);

    void release_slot();

    [[nodiscard]] int slots_in_use() const noexcept {
        return slots_.load(std::memory_order_acquire);
    }

    // The following mutate membership; callers hold lock_coin(coin)

    [[nodiscard]] TrackedPositionPtr insert(Position position);

    bool erase(const Symbol& coin);

    // Readers

    [[nodiscard]] TrackedPositionPtr find(const Symbol& coin) const;

    [[nodiscard]] std::vector<TrackedPositionPtr> all() const;

    [[nodiscard]] size_t size() const;

    /// Next id for a new position
    [[nodiscard]] uint64_t next_id() noexcept {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    mutable std::mutex locks_mutex_;
    std::unordered_map<Symbol, std::unique_ptr<std::mutex>> coin_locks_;

    mutable std::shared_mutex positions_mutex_;
    std::unordered_map<Symbol, TrackedPositionPtr> positions_;

    std::atomic<int> slots_{0};
    std::atomic<uint64_t> next_id_{1};
};

}  // namespace vigil::order
