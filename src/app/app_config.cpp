// ============================================================================
// VIGIL - Application Configuration Loader
// ============================================================================

#include "vigil/app/app_config.hpp"

#include "vigil/core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>

namespace vigil::app {

namespace {

struct StrategyDefaults {
    std::string_view name;
    int interval_seconds;
    bool enabled;
};

constexpr StrategyDefaults STRATEGY_DEFAULTS[] = {
    {"rsi_1min", 60, true},
    {"rsi_5min", 300, true},
    {"rsi_1h", 3600, true},
    {"rsi_4h", 14400, true},
    {"sma_5min", 300, true},
    {"macd_15min", 900, false},
    {"scalping_1min", 60, true},
    {"range_24h_low", 1800, false},
};

template <typename T>
T read(const YAML::Node& node, const char* key, const T& fallback) {
    if (!node || !node[key]) {
        return fallback;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

std::chrono::milliseconds read_ms(const YAML::Node& node, const char* key,
                                  std::chrono::milliseconds fallback) {
    const auto value = read<int64_t>(node, key, fallback.count());
    if (value <= 0) {
        throw ConfigurationError(std::string(key) + " must be positive");
    }
    return std::chrono::milliseconds(value);
}

void parse_logging(const YAML::Node& node, utils::LogConfig& config) {
    if (!node) return;
    if (node["level"]) {
        config.level = utils::parse_log_level(read<std::string>(node, "level", "info"));
    }
    config.log_file = read<std::string>(node, "file", config.log_file);
    config.async = read<bool>(node, "async", config.async);
    config.pattern = read<std::string>(node, "pattern", config.pattern);
    config.max_file_size_mb = read<size_t>(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files = read<size_t>(node, "max_files", config.max_files);
}

void parse_session(const YAML::Node& node, SessionConfig& config) {
    if (!node) return;
    config.execute_orders = read<bool>(node, "execute_orders", config.execute_orders);
    config.scheduler_tick = read_ms(node, "scheduler_tick_ms", config.scheduler_tick);
    config.monitor_interval = read_ms(node, "monitor_interval_ms", config.monitor_interval);
    config.call_timeout = read_ms(node, "call_timeout_ms", config.call_timeout);
    config.worker_threads = read<size_t>(node, "worker_threads", config.worker_threads);
    config.monitor_threads = read<size_t>(node, "monitor_threads", config.monitor_threads);
    config.io_threads = read<size_t>(node, "io_threads", config.io_threads);
    config.signal_queue_capacity =
        read<size_t>(node, "signal_queue_capacity", config.signal_queue_capacity);
    config.max_close_retries = read<int>(node, "max_close_retries", config.max_close_retries);
}

void parse_risk(const YAML::Node& node, risk::RiskConfig& config) {
    if (!node) return;
    config.max_positions = read<int>(node, "max_positions", config.max_positions);
    config.position_size = read<double>(node, "position_size", config.position_size);
    config.min_signal_strength = read<double>(node, "min_signal_strength", config.min_signal_strength);
    config.cooldown_seconds = read<int>(node, "cooldown_seconds", config.cooldown_seconds);
    config.check_balance = read<bool>(node, "check_balance", config.check_balance);
    config.allow_short = read<bool>(node, "allow_short", config.allow_short);
    config.stop_loss_percent = read<double>(node, "stop_loss_percent", config.stop_loss_percent);
    config.take_profit_percent = read<double>(node, "take_profit_percent", config.take_profit_percent);
    config.trailing_stop_percent =
        read<double>(node, "trailing_stop_percent", config.trailing_stop_percent);
    if (node["trailing_activation_percent"]) {
        config.trailing_activation_percent =
            read<double>(node, "trailing_activation_percent", 0.0);
    }
}

void parse_market(const YAML::Node& node, MarketConfig& config) {
    if (!node) return;
    config.quote_asset = read<std::string>(node, "quote_asset", config.quote_asset);
    config.base_url = read<std::string>(node, "base_url", config.base_url);
    config.min_request_interval =
        read_ms(node, "min_request_interval_ms", config.min_request_interval);
}

void parse_strategy(const YAML::Node& node, StrategyConfig& config) {
    if (!node || node.IsNull()) return;
    if (!node.IsMap()) {
        throw ConfigurationError("strategy '" + config.name + "' must be a mapping");
    }
    config.enabled = read<bool>(node, "enabled", config.enabled);
    const auto interval = read<int64_t>(node, "interval", config.interval.count());
    if (interval <= 0) {
        throw ConfigurationError("strategy '" + config.name + "': interval must be positive");
    }
    config.interval = std::chrono::seconds(interval);
    config.oversold = read<double>(node, "oversold", config.oversold);
    config.overbought = read<double>(node, "overbought", config.overbought);
    config.volume_multiplier = read<double>(node, "volume_multiplier", config.volume_multiplier);
    config.long_offset_percent =
        read<double>(node, "long_offset_percent", config.long_offset_percent);
    config.tolerance_percent = read<double>(node, "tolerance_percent", config.tolerance_percent);
}

AppConfig from_yaml(const YAML::Node& root) {
    AppConfig config = default_config();
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("configuration root must be a mapping");
    }

    parse_logging(root["logging"], config.logging);
    parse_session(root["session"], config.session);
    parse_risk(root["risk"], config.risk);
    parse_market(root["market"], config.market);
    if (root["paper"]) {
        config.paper.initial_balance =
            read<double>(root["paper"], "initial_balance", config.paper.initial_balance);
        config.paper.fee_percent = read<double>(root["paper"], "fee_percent", config.paper.fee_percent);
    }

    if (const auto coins = root["coins"]) {
        if (!coins.IsSequence()) {
            throw ConfigurationError("coins must be a list");
        }
        config.coins.clear();
        for (const auto& coin : coins) {
            if (!coin.IsScalar()) {
                throw ConfigurationError("coins must contain plain symbols");
            }
            config.coins.emplace_back(coin.Scalar());
        }
    }

    if (const auto strategies = root["strategies"]) {
        if (!strategies.IsMap()) {
            throw ConfigurationError("strategies must be a mapping of name to settings");
        }
        for (const auto& item : strategies) {
            const auto name = item.first.as<std::string>();
            auto it = std::find_if(config.strategies.begin(), config.strategies.end(),
                                   [&](const StrategyConfig& s) { return s.name == name; });
            if (it == config.strategies.end()) {
                throw ConfigurationError("unknown strategy '" + name + "'");
            }
            parse_strategy(item.second, *it);
        }
    }

    config.validate();
    return config;
}

}  // namespace

const std::vector<std::string_view>& known_strategies() {
    static const std::vector<std::string_view> names = [] {
        std::vector<std::string_view> result;
        for (const auto& d : STRATEGY_DEFAULTS) {
            result.push_back(d.name);
        }
        return result;
    }();
    return names;
}

AppConfig default_config() {
    AppConfig config;
    config.coins = {Symbol("BTC"), Symbol("ETH")};
    for (const auto& d : STRATEGY_DEFAULTS) {
        StrategyConfig strategy;
        strategy.name = std::string(d.name);
        strategy.enabled = d.enabled;
        strategy.interval = std::chrono::seconds(d.interval_seconds);
        config.strategies.push_back(std::move(strategy));
    }
    return config;
}

void AppConfig::validate() const {
    risk.validate();

    if (session.worker_threads == 0 || session.monitor_threads == 0 || session.io_threads == 0) {
        throw ConfigurationError("worker_threads, monitor_threads and io_threads must be at least 1");
    }
    if (session.signal_queue_capacity == 0) {
        throw ConfigurationError("signal_queue_capacity must be at least 1");
    }
    if (session.max_close_retries < 1) {
        throw ConfigurationError("max_close_retries must be at least 1");
    }
    if (paper.initial_balance < 0.0) {
        throw ConfigurationError("paper.initial_balance must be non-negative");
    }
    if (market.quote_asset.empty()) {
        throw ConfigurationError("market.quote_asset must not be empty");
    }

    std::set<std::string> seen;
    for (const auto& coin : coins) {
        if (coin.empty()) {
            throw ConfigurationError("empty coin in coins list");
        }
        if (!seen.insert(coin.str()).second) {
            throw ConfigurationError("duplicate coin '" + coin.str() + "'");
        }
    }
}

AppConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("cannot read config file " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("malformed YAML in " + path + ": " + e.what());
    }
    return from_yaml(root);
}

AppConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("malformed YAML: ") + e.what());
    }
    return from_yaml(root);
}

}  // namespace vigil::app
