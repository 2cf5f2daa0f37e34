// ============================================================================
// VIGIL - Position Book Implementation
// ============================================================================

#include "vigil/order/position_book.hpp"

namespace vigil::order {

std::unique_lock<std::mutex> PositionBook::lock_coin(const Symbol& coin) {
    std::mutex* coin_mutex = nullptr;
    {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        auto& slot = coin_locks_[coin];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        coin_mutex = slot.get();
    }
    // Coin mutexes are never erased, so the pointer outlives the registry lock
    return std::unique_lock<std::mutex>(*coin_mutex);
}

bool PositionBook::try_reserve_slot(int max_positions) {
    int current = slots_.load(std::memory_order_acquire);
    while (current < max_positions) {
        if (slots_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void PositionBook::release_slot() {
    int current = slots_.load(std::memory_order_acquire);
    while (current > 0) {
        if (slots_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
            return;
        }
    }
}

TrackedPositionPtr PositionBook::insert(Position position) {
    const Symbol coin = position.coin;
    auto tracked = std::make_shared<TrackedPosition>(std::move(position));

    std::unique_lock<std::shared_mutex> lock(positions_mutex_);
    positions_[coin] = tracked;
    return tracked;
}

bool PositionBook::erase(const Symbol& coin) {
    std::unique_lock<std::shared_mutex> lock(positions_mutex_);
    return positions_.erase(coin) > 0;
}

TrackedPositionPtr PositionBook::find(const Symbol& coin) const {
    std::shared_lock<std::shared_mutex> lock(positions_mutex_);
    auto it = positions_.find(coin);
    return it == positions_.end() ? nullptr : it->second;
}

std::vector<TrackedPositionPtr> PositionBook::all() const {
    std::shared_lock<std::shared_mutex> lock(positions_mutex_);
    std::vector<TrackedPositionPtr> result;
    result.reserve(positions_.size());
    for (const auto& [coin, tracked] : positions_) {
        result.push_back(tracked);
    }
    return result;
}

size_t PositionBook::size() const {
    std::shared_lock<std::shared_mutex> lock(positions_mutex_);
    return positions_.size();
}

}  // namespace vigil::order
