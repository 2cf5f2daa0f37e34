#pragma once
// ============================================================================
// VIGIL - Application Configuration
// ============================================================================
// YAML-backed session configuration; every key has a default
// ============================================================================

#include "vigil/core/types.hpp"
#include "vigil/exchange/paper_exchange.hpp"
#include "vigil/risk/risk_config.hpp"
#include "vigil/utils/logger.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::app {

struct SessionConfig {
    bool execute_orders = false;        // false = monitoring only, signals are not admitted
    std::chrono::milliseconds scheduler_tick{1000};
    std::chrono::milliseconds monitor_interval{3000};
    std::chrono::milliseconds call_timeout{10000};
    size_t worker_threads = 4;      // Strategy invocations and admissions
    size_t monitor_threads = 2;     // Position checks only
    size_t io_threads = 4;          // Timed exchange and market data calls
    size_t signal_queue_capacity = 256;
    int max_close_retries = 5;
};

struct MarketConfig {
    std::string quote_asset = "USDT";
    std::string base_url = "https://api.binance.com";
    std::chrono::milliseconds min_request_interval{500};
};

/// One enumerated strategy; unused parameters are ignored by that strategy type
struct StrategyConfig {
    std::string name;
    bool enabled = true;
    std::chrono::seconds interval{60};

    double oversold = 30.0;
    double overbought = 70.0;
    double volume_multiplier = 1.5;
    double long_offset_percent = -1.0;
    double tolerance_percent = 2.0;
};

struct AppConfig {
    utils::LogConfig logging;
    SessionConfig session;
    risk::RiskConfig risk;
    MarketConfig market;
    exchange::PaperExchangeConfig paper;
    std::vector<Symbol> coins;
    std::vector<StrategyConfig> strategies;

    /// Throws ConfigurationError
    void validate() const;
};

/// Names accepted under `strategies:`
[[nodiscard]] const std::vector<std::string_view>& known_strategies();

/// Built-in defaults: every strategy listed with its default interval
[[nodiscard]] AppConfig default_config();

/// Throws ConfigurationError on unreadable files, bad YAML or invalid values
[[nodiscard]] AppConfig load_config(const std::string& path);

[[nodiscard]] AppConfig parse_config(const std::string& yaml_text);

}  // namespace vigil::app
