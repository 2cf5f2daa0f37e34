// ============================================================================
// VIGIL - Signal Implementation
// ============================================================================

#include "vigil/signal/signal.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace vigil {

std::optional<std::string> validate_signal(const Signal& signal) {
    const auto raw_action = static_cast<uint8_t>(signal.action);
    if (raw_action > static_cast<uint8_t>(Action::Hold)) {
        return "action outside {BUY, SELL, HOLD}: " + std::to_string(raw_action);
    }
    if (signal.coin.empty()) {
        return std::string("empty coin");
    }
    if (signal.source.empty()) {
        return std::string("empty source");
    }
    if (!std::isfinite(signal.strength) || signal.strength < 0.0 || signal.strength > 1.0) {
        std::ostringstream ss;
        ss << "strength outside [0, 1]: " << signal.strength;
        return ss.str();
    }
    if (signal.action == Action::Hold && signal.strength != 0.0) {
        return std::string("HOLD signal with non-zero strength");
    }
    if (signal.action != Action::Hold && signal.strength == 0.0) {
        return std::string("non-HOLD signal with zero strength");
    }
    return std::nullopt;
}

std::string describe(const Signal& signal) {
    std::ostringstream ss;
    ss << signal.source << ": " << to_string(signal.action) << ' ' << signal.coin.view()
       << " (strength: " << std::fixed << std::setprecision(2) << signal.strength << ')';
    return ss.str();
}

std::string to_string(const MetaValue& value) {
    struct Visitor {
        std::string operator()(double v) const {
            std::ostringstream ss;
            ss << v;
            return ss.str();
        }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(const std::string& v) const { return v; }
    };
    return std::visit(Visitor{}, value);
}

Signal make_hold(const Symbol& coin, std::string_view source, Timestamp ts) {
    Signal signal;
    signal.coin = coin;
    signal.action = Action::Hold;
    signal.strength = 0.0;
    signal.timestamp = ts;
    signal.source = std::string(source);
    return signal;
}

}  // namespace vigil
