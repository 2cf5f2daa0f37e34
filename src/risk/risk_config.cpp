// ============================================================================
// VIGIL - Risk Configuration Implementation
// ============================================================================

#include "vigil/risk/risk_config.hpp"

#include "vigil/core/errors.hpp"

#include <cmath>
#include <string>

namespace vigil::risk {

namespace {

void require_percent(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigurationError(std::string(name) + " must be a non-negative number, got " +
                                 std::to_string(value));
    }
}

}  // namespace

void RiskConfig::validate() const {
    if (max_positions < 1) {
        throw ConfigurationError("max_positions must be at least 1, got " +
                                 std::to_string(max_positions));
    }
    if (!std::isfinite(position_size) || position_size <= 0.0) {
        throw ConfigurationError("position_size must be positive, got " +
                                 std::to_string(position_size));
    }
    if (!std::isfinite(min_signal_strength) || min_signal_strength < 0.0 ||
        min_signal_strength > 1.0) {
        throw ConfigurationError("min_signal_strength must be within [0, 1], got " +
                                 std::to_string(min_signal_strength));
    }
    if (cooldown_seconds < 0) {
        throw ConfigurationError("cooldown_seconds must be non-negative");
    }

    require_percent("stop_loss_percent", stop_loss_percent);
    require_percent("take_profit_percent", take_profit_percent);
    require_percent("trailing_stop_percent", trailing_stop_percent);
    if (trailing_activation_percent) {
        require_percent("trailing_activation_percent", *trailing_activation_percent);
    }

    if (stop_loss_percent == 0.0 || stop_loss_percent >= 100.0) {
        throw ConfigurationError("stop_loss_percent must be within (0, 100), got " +
                                 std::to_string(stop_loss_percent));
    }
    if (trailing_stop_percent >= 100.0) {
        throw ConfigurationError("trailing_stop_percent must be below 100");
    }
}

RiskConfigStore::RiskConfigStore(const RiskConfig& initial) {
    initial.validate();
    current_ = std::make_shared<const RiskConfig>(initial);
}

RiskConfigStore::Snapshot RiskConfigStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void RiskConfigStore::reload(const RiskConfig& next) {
    next.validate();
    auto snapshot = std::make_shared<const RiskConfig>(next);
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(snapshot);
}

}  // namespace vigil::risk
