#pragma once
// ============================================================================
// VIGIL - Strategy Contract
// ============================================================================
// A signal source: given a coin, produce a recommendation or no opinion
// Implementations may block on market data and may throw; the scheduler
// catches everything at its boundary
// ============================================================================

#include "vigil/core/types.hpp"
#include "vigil/signal/signal.hpp"

#include <optional>
#include <string>

namespace vigil::strategy {

class IStrategy {
public:
    virtual ~IStrategy() = default;

    /// Unique id, used as Signal::source ("rsi_5min")
    [[nodiscard]] virtual const std::string& name() const = 0;

    /// nullopt = no opinion (e.g. not enough data)
    [[nodiscard]] virtual std::optional<Signal> generate(const Symbol& coin) = 0;
};

}  // namespace vigil::strategy
