// ============================================================================
// VIGIL - Rate Limiter Implementation
// ============================================================================

#include "vigil/network/rate_limiter.hpp"

#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace vigil::network {

struct RateLimiter::Impl {
    using Clock = std::chrono::steady_clock;

    int max_requests_;
    std::chrono::milliseconds window_;
    std::deque<Clock::time_point> requests_;
    mutable std::mutex mutex_;

    Impl(int max_requests, std::chrono::milliseconds window)
        : max_requests_(max_requests), window_(window) {}

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        cleanup_old_requests(now);

        if (static_cast<int>(requests_.size()) >= max_requests_) {
            return false;
        }

        requests_.push_back(now);
        return true;
    }

    void acquire() {
        for (;;) {
            Clock::duration wait;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto now = Clock::now();
                cleanup_old_requests(now);

                if (static_cast<int>(requests_.size()) < max_requests_) {
                    requests_.push_back(now);
                    return;
                }
                wait = requests_.front() + window_ - now;
            }
            // Sleep exactly until the oldest permit expires
            std::this_thread::sleep_for(wait);
        }
    }

    bool acquire_for(std::chrono::milliseconds max_wait) {
        const auto deadline = Clock::now() + max_wait;
        for (;;) {
            Clock::duration wait;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto now = Clock::now();
                cleanup_old_requests(now);

                if (static_cast<int>(requests_.size()) < max_requests_) {
                    requests_.push_back(now);
                    return true;
                }
                wait = requests_.front() + window_ - now;
                if (now + wait > deadline) {
                    return false;
                }
            }
            std::this_thread::sleep_for(wait);
        }
    }

    int remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto cutoff = Clock::now() - window_;
        int active = 0;
        for (const auto& t : requests_) {
            if (t > cutoff) ++active;
        }
        return max_requests_ - active;
    }

    std::chrono::milliseconds time_until_reset() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::chrono::milliseconds(0);
        }

        const auto reset_time = requests_.front() + window_;
        const auto now = Clock::now();
        if (reset_time <= now) {
            return std::chrono::milliseconds(0);
        }

        return std::chrono::duration_cast<std::chrono::milliseconds>(reset_time - now);
    }

private:
    void cleanup_old_requests(Clock::time_point now) {
        const auto cutoff = now - window_;
        while (!requests_.empty() && requests_.front() <= cutoff) {
            requests_.pop_front();
        }
    }
};

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window) {
    if (max_requests < 1) {
        throw std::invalid_argument("RateLimiter needs at least one request per window");
    }
    impl_ = std::make_unique<Impl>(max_requests, window);
}

RateLimiter::~RateLimiter() = default;

std::unique_ptr<RateLimiter> RateLimiter::min_interval(std::chrono::milliseconds interval) {
    return std::make_unique<RateLimiter>(1, interval);
}

bool RateLimiter::try_acquire() {
    return impl_->try_acquire();
}

void RateLimiter::acquire() {
    impl_->acquire();
}

bool RateLimiter::acquire_for(std::chrono::milliseconds max_wait) {
    return impl_->acquire_for(max_wait);
}

int RateLimiter::remaining() const {
    return impl_->remaining();
}

std::chrono::milliseconds RateLimiter::time_until_reset() const {
    return impl_->time_until_reset();
}

}  // namespace vigil::network
