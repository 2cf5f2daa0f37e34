#pragma once
// ============================================================================
// VIGIL - Risk Configuration
// ============================================================================
// Process-wide, read-only snapshot consumed by the order gate and the
// lifecycle manager. A reload replaces the whole snapshot; fields are never
// mutated in place.
// ============================================================================

#include <memory>
#include <mutex>
#include <optional>

namespace vigil::risk {

// ============================================================================
// Risk Parameters (percent units: 0.6 means 0.6 %)
// ============================================================================

struct RiskConfig {
    // Admission
    int max_positions = 10;
    double position_size = 20.0;            // Quote-currency notional per position
    double min_signal_strength = 0.75;
    int cooldown_seconds = 300;             // Per coin, after a successful open
    bool check_balance = true;
    bool allow_short = true;

    // Exits
    double stop_loss_percent = 2.2;
    double take_profit_percent = 10.12;     // 0 disables take-profit
    double trailing_stop_percent = 0.2;     // 0 disables the trailing stop
    std::optional<double> trailing_activation_percent;  // Defaults to trailing_stop_percent

    /// Throws ConfigurationError describing the first invalid field
    void validate() const;

    /// Profit (percent of entry) the watermark must reach before trailing engages
    [[nodiscard]] double effective_trailing_activation() const {
        return trailing_activation_percent.value_or(trailing_stop_percent);
    }
};

// ============================================================================
// Snapshot Store
// ============================================================================

class RiskConfigStore {
public:
    using Snapshot = std::shared_ptr<const RiskConfig>;

    /// Validates before accepting; throws ConfigurationError
    explicit RiskConfigStore(const RiskConfig& initial);

    [[nodiscard]] Snapshot current() const;

    /// Validate and swap atomically; on failure the previous snapshot stays active
    void reload(const RiskConfig& next);

private:
    mutable std::mutex mutex_;
    Snapshot current_;
};

}  // namespace vigil::risk
