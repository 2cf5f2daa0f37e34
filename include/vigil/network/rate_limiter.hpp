#pragma once
// ============================================================================
// VIGIL - Rate Limiter
// ============================================================================
// Sliding-window limiter: at most `max_requests` permits per `window`
// A minimum spacing between requests is the one-permit-per-window case
// ============================================================================

#include <chrono>
#include <memory>

namespace vigil::network {

class RateLimiter {
public:
    RateLimiter(int max_requests, std::chrono::milliseconds window);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// At most one request every `interval`
    [[nodiscard]] static std::unique_ptr<RateLimiter> min_interval(std::chrono::milliseconds interval);

    /// Try to acquire a permit. Returns true if allowed.
    [[nodiscard]] bool try_acquire();

    /// Wait until a permit is available, then acquire.
    void acquire();

    /// Acquire if a permit frees up within `max_wait`; returns false without
    /// sleeping when the next permit is further away than that.
    [[nodiscard]] bool acquire_for(std::chrono::milliseconds max_wait);

    /// Remaining permits in the current window
    [[nodiscard]] int remaining() const;

    /// Time until the oldest permit leaves the window
    [[nodiscard]] std::chrono::milliseconds time_until_reset() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace vigil::network
