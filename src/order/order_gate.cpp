// ============================================================================
// VIGIL - Order Gate Implementation
// ============================================================================

#include "vigil/order/order_gate.hpp"

#include "vigil/core/errors.hpp"
#include "vigil/utils/logger.hpp"

#include <boost/asio/post.hpp>

#include <chrono>

namespace vigil::order {

namespace {

constexpr int64_t MS_PER_DAY = 86'400'000LL;

/// Available balance below the configured notional
class InsufficientBalance : public TransientExchangeError {
public:
    using TransientExchangeError::TransientExchangeError;
};

}  // namespace

OrderGate::OrderGate(PositionLifecycleManager& lifecycle,
                     std::shared_ptr<exchange::IExchangeClient> exchange,
                     risk::RiskConfigStore& risk, TimedCaller& caller,
                     std::shared_ptr<sink::IStateSink> sink, const IClock& clock)
    : lifecycle_(lifecycle),
      exchange_(std::move(exchange)),
      risk_(risk),
      caller_(caller),
      sink_(sink ? std::move(sink) : std::make_shared<sink::NullStateSink>()),
      clock_(clock) {}

OrderGate::~OrderGate() {
    stop();
}

// ============================================================================
// Admission
// ============================================================================

AdmissionResult OrderGate::submit(const Signal& signal) {
    SCOPED_TIMER("order_gate.submit");
    const Timestamp now = clock_.now();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        const int64_t day = to_epoch_ms(now) / MS_PER_DAY;
        if (day != stats_day_) {
            stats_day_ = day;
            stats_.trades_today = 0;
            stats_.trades_today_by_coin.clear();
        }
        ++stats_.received;
    }

    // 1. Contract, HOLD and strength
    if (auto violation = validate_signal(signal)) {
        return reject(signal, AdmissionDecision::RejectedInvalid, *violation);
    }
    if (signal.is_hold()) {
        return reject(signal, AdmissionDecision::RejectedHold, "HOLD is never admitted");
    }

    const auto risk = risk_.current();
    if (signal.strength < risk->min_signal_strength) {
        return reject(signal, AdmissionDecision::RejectedWeak,
                      fmt::format("strength {:.2f} below minimum {:.2f}", signal.strength,
                                  risk->min_signal_strength));
    }

    const Symbol coin = signal.coin;
    const PositionSide side = signal.position_side();
    auto& book = lifecycle_.book();

    // Reserve under the coin lock
    TrackedPositionPtr tracked;
    Position placeholder;
    {
        auto coin_guard = book.lock_coin(coin);

        // 2. Duplicate
        if (auto existing = book.find(coin)) {
            return reject(signal, AdmissionDecision::RejectedDuplicate,
                          fmt::format("position already {}",
                                      to_string(existing->snapshot().status)));
        }

        // 3. Capacity
        if (!book.try_reserve_slot(risk->max_positions)) {
            return reject(signal, AdmissionDecision::RejectedMaxPositions,
                          fmt::format("max_positions {} reached", risk->max_positions));
        }

        if (risk->cooldown_seconds > 0) {
            std::lock_guard<std::mutex> lock(cooldown_mutex_);
            auto it = last_open_.find(coin);
            if (it != last_open_.end() && now - it->second < std::chrono::seconds(risk->cooldown_seconds)) {
                const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::seconds(risk->cooldown_seconds) - (now - it->second));
                book.release_slot();
                return reject(signal, AdmissionDecision::RejectedCooldown,
                              fmt::format("cooldown active for {} more s", remaining.count()));
            }
        }

        if (side == PositionSide::Short && !risk->allow_short) {
            book.release_slot();
            return reject(signal, AdmissionDecision::RejectedShortDisabled, "short selling disabled");
        }

        // 4. Placeholder
        placeholder.id = book.next_id();
        placeholder.coin = coin;
        placeholder.side = side;
        placeholder.source = signal.source;
        placeholder.signal_strength = signal.strength;
        placeholder.exit_params = risk::ExitParameters::from(*risk);
        placeholder.status = PositionStatus::Opening;
        placeholder.opened_at = now;
        tracked = book.insert(placeholder);
    }

    sink::publish_safely("position update", [&] { sink_->publish_position_update(placeholder); });

    // Exchange calls, outside every lock
    exchange::OrderFill fill;
    Quantity size;
    try {
        const Price mark = caller_.call(
            "get_mark_price", [exchange = exchange_, coin] { return exchange->get_mark_price(coin); });
        if (!mark.is_valid()) {
            throw TransientExchangeError("no valid mark price for " + coin.str());
        }

        size = Quantity::from_notional(risk->position_size, mark.to_double());
        if (!size.is_valid()) {
            throw TransientExchangeError(fmt::format(
                "position size {} rounds to zero at price {:.8f}", risk->position_size, mark.to_double()));
        }

        if (risk->check_balance) {
            const auto account = caller_.call(
                "get_account_state", [exchange = exchange_] { return exchange->get_account_state(); });
            if (account.available_balance < risk->position_size) {
                throw InsufficientBalance(fmt::format("available balance {:.2f} below {:.2f}",
                                                      account.available_balance, risk->position_size));
            }
        }

        const Side order_side = opening_side(side);
        fill = caller_.call("place_order", [exchange = exchange_, coin, order_side, size] {
            return exchange->place_order(coin, order_side, size);
        });
        if (!fill.entry_price.is_valid()) {
            throw TransientExchangeError("order for " + coin.str() + " filled without a price");
        }
    } catch (const InsufficientBalance& e) {
        abandon(tracked, e.what());
        return reject(signal, AdmissionDecision::RejectedInsufficientBalance, e.what());
    } catch (const std::exception& e) {
        abandon(tracked, e.what());
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.exchange_failures;
        }
        sink::publish_safely("error", [&] {
            sink_->publish_error("place_order " + coin.str(), e.what());
        });
        return reject(signal, AdmissionDecision::ExchangeFailed, e.what());
    }

    // 5. Confirm under the coin lock
    Position opened;
    {
        auto coin_guard = book.lock_coin(coin);
        std::lock_guard<std::mutex> lock(tracked->mutex);
        auto& pos = tracked->position;
        pos.order_id = fill.order_id;
        pos.entry_price = fill.entry_price;
        pos.size = fill.filled_size.is_valid() ? fill.filled_size : size;
        if (fill.filled_at.time_since_epoch().count() != 0) {
            pos.opened_at = fill.filled_at;
        }
        pos.levels = risk::initial_exit_levels(pos.entry_price, pos.side, pos.exit_params);
        pos.last_mark_price = pos.entry_price;
        pos.status = PositionStatus::Open;
        opened = pos;
    }

    record_admission(coin);
    lifecycle_.adopt(tracked);

    LOG_INFO("Admitted {} -> {} {} {:.5f} @ {:.8f} (order {})", describe(signal), coin.view(),
             to_string(opened.side), opened.size.to_double(), opened.entry_price.to_double(),
             opened.order_id);

    AdmissionResult result;
    result.decision = AdmissionDecision::Admitted;
    result.position = std::move(opened);
    return result;
}

AdmissionResult OrderGate::reject(const Signal& signal, AdmissionDecision decision,
                                  std::string reason) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.rejected;
    }

    if (decision == AdmissionDecision::RejectedInvalid) {
        LOG_WARN("Dropping invalid signal from {}: {}",
                 signal.source.empty() ? std::string("<unknown>") : signal.source, reason);
    } else if (decision == AdmissionDecision::ExchangeFailed) {
        LOG_ERROR("Opening {} for {} failed: {}", signal.coin.view(), signal.source, reason);
    } else {
        LOG_DEBUG("{} {}: {}", describe(signal), to_string(decision), reason);
    }

    AdmissionResult result;
    result.decision = decision;
    result.reason = std::move(reason);
    return result;
}

void OrderGate::abandon(const TrackedPositionPtr& tracked, const std::string& error) {
    Position failed;
    {
        auto& book = lifecycle_.book();
        const Symbol coin = tracked->snapshot().coin;
        auto coin_guard = book.lock_coin(coin);
        {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            tracked->position.status = PositionStatus::Failed;
            tracked->position.last_error = error;
            failed = tracked->position;
        }
        if (book.find(coin) == tracked) {
            book.erase(coin);
        }
        book.release_slot();
    }

    sink::publish_safely("position update", [&] { sink_->publish_position_update(failed); });
}

void OrderGate::record_admission(const Symbol& coin) {
    {
        std::lock_guard<std::mutex> lock(cooldown_mutex_);
        last_open_[coin] = clock_.now();
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.admitted;
    ++stats_.trades_today;
    ++stats_.trades_today_by_coin[coin.str()];
}

// ============================================================================
// Queue Consumer
// ============================================================================

void OrderGate::start(SignalQueue& queue, boost::asio::thread_pool& workers) {
    if (consumer_.joinable()) {
        return;
    }
    running_.store(true, std::memory_order_release);
    consumer_ = std::thread([this, &queue, &workers] { consume(queue, workers); });
}

void OrderGate::stop() {
    running_.store(false, std::memory_order_release);
    if (consumer_.joinable()) {
        consumer_.join();
    }
    wait_idle();
}

void OrderGate::wait_idle() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

void OrderGate::consume(SignalQueue& queue, boost::asio::thread_pool& workers) {
    LOG_INFO("Order gate consuming signals");

    while (running_.load(std::memory_order_acquire)) {
        auto next = queue.pop_for(std::chrono::milliseconds(100));
        if (!next) {
            continue;
        }

        auto& strand =
            strands_.try_emplace(next->source, boost::asio::make_strand(workers)).first->second;
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            ++in_flight_;
        }

        boost::asio::post(strand, [this, signal = std::move(*next)] {
            try {
                submit(signal);
            } catch (const std::exception& e) {
                LOG_ERROR("Admission of {} failed unexpectedly: {}", describe(signal), e.what());
            }
            {
                std::lock_guard<std::mutex> lock(idle_mutex_);
                --in_flight_;
            }
            idle_cv_.notify_all();
        });
    }

    LOG_INFO("Order gate stopped");
}

GateStats OrderGate::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace vigil::order
