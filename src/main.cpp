// ============================================================================
// VIGIL - Command Line Entry Point
// ============================================================================
// Paper-trading session over live public market data:
//
//   [Scheduler] --Signal--> [Order Gate] --Position--> [Lifecycle Manager]
//        │                                                   │
//   strategies x coins                               PaperExchange fills
//        └──────────────► [State Sink] ◄─────────────────────┘
// ============================================================================

#include "vigil/app/app_config.hpp"
#include "vigil/app/trading_session.hpp"
#include "vigil/core/errors.hpp"
#include "vigil/exchange/binance_market_data.hpp"
#include "vigil/exchange/paper_exchange.hpp"
#include "vigil/network/rest_client.hpp"
#include "vigil/sink/state_sink.hpp"
#include "vigil/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int) {
        g_running = false;
    }

    struct Options {
        std::string config_path = "config/vigil.yaml";
        bool execute = false;
        std::optional<std::chrono::seconds> duration;
    };

    void print_usage() {
        std::cout << "Usage: vigil [--config <file>] [--execute] [--duration <seconds>]\n"
                  << "  --config    YAML configuration (default config/vigil.yaml)\n"
                  << "  --execute   admit signals and trade on the paper exchange\n"
                  << "  --duration  stop after this many seconds (default: until SIGINT)\n";
    }

    std::optional<Options> parse_args(int argc, char* argv[]) {
        Options options;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                options.config_path = argv[++i];
            } else if (arg == "--execute") {
                options.execute = true;
            } else if (arg == "--duration" && i + 1 < argc) {
                const long seconds = std::stol(argv[++i]);
                if (seconds <= 0) {
                    throw std::invalid_argument("--duration must be positive");
                }
                options.duration = std::chrono::seconds(seconds);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                throw std::invalid_argument("unknown argument: " + arg);
            }
        }
        return options;
    }

    void print_summary(const vigil::app::SessionStatus& status,
                       const vigil::exchange::PaperExchange& paper,
                       const vigil::sink::SinkSnapshot& snapshot) {
        std::cout << "\n========== SESSION SUMMARY ==========\n"
                  << std::fixed << std::setprecision(4)
                  << "Mode:              " << (status.executing ? "paper trading" : "monitoring") << "\n"
                  << "Strategy runs:     " << status.scheduler.dispatched
                  << " (failures " << status.scheduler.failures
                  << ", overlap skips " << status.scheduler.overlap_skips << ")\n"
                  << "Signals:           " << status.scheduler.signals
                  << " (holds " << status.scheduler.holds
                  << ", dropped " << status.dropped_signals << ")\n"
                  << "Admitted:          " << status.gate.admitted
                  << " / " << status.gate.received << "\n"
                  << "Closed trades:     " << status.lifecycle.closed_trades
                  << " (win rate " << status.lifecycle.win_rate() * 100.0 << "%)\n"
                  << "Realized P&L:      " << status.lifecycle.realized_pnl << "\n"
                  << "Unrealized P&L:    " << status.lifecycle.unrealized_pnl << "\n"
                  << "Paper P&L:         " << paper.realized_pnl() << "\n"
                  << "Open positions:    " << status.lifecycle.open_positions << "\n"
                  << "Failed positions:  " << status.lifecycle.failed_positions << "\n"
                  << "Call timeouts:     " << status.call_timeouts << "\n";

        for (const auto& trade : snapshot.trades) {
            std::cout << "  " << trade.coin.view() << " " << vigil::to_string(trade.side)
                      << " " << trade.entry_price.to_double() << " -> " << trade.exit_price.to_double()
                      << " " << vigil::risk::to_string(trade.reason)
                      << " pnl=" << trade.pnl << "\n";
        }
        std::cout << "=====================================\n";
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        auto options = parse_args(argc, argv);
        if (!options) {
            return 0;
        }

        std::cout << "[INFO] Loading config from: " << options->config_path << "\n";
        auto config = vigil::app::load_config(options->config_path);
        if (options->execute) {
            config.session.execute_orders = true;
        }

        vigil::utils::Logger::initialize(config.logging);

        vigil::network::RestClientConfig rest_config;
        rest_config.base_url = config.market.base_url;
        rest_config.request_timeout =
            std::chrono::duration_cast<std::chrono::milliseconds>(config.session.call_timeout);
        auto rest = std::make_shared<vigil::network::RestClient>(rest_config);
        auto market = std::make_shared<vigil::exchange::BinanceMarketData>(rest, config.market.quote_asset);
        auto paper = std::make_shared<vigil::exchange::PaperExchange>(config.paper, market);
        auto sink = std::make_shared<vigil::sink::LoggingStateSink>();

        vigil::app::SessionDependencies deps;
        deps.market = {market, market};
        deps.exchange = paper;
        deps.sink = sink;

        vigil::app::TradingSession session(config, std::move(deps));
        session.start();

        const auto started = std::chrono::steady_clock::now();
        while (g_running) {
            if (options->duration && std::chrono::steady_clock::now() - started >= *options->duration) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        session.stop();
        sink->drain();
        print_summary(session.status(), *paper, sink->snapshot());
        sink->stop();
    } catch (const vigil::ConfigurationError& e) {
        std::cerr << "[CRITICAL] Configuration error: " << e.what() << "\n";
        vigil::utils::Logger::shutdown();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[CRITICAL] Fatal error: " << e.what() << "\n";
        vigil::utils::Logger::shutdown();
        return 1;
    }

    vigil::utils::Logger::shutdown();
    return 0;
}
