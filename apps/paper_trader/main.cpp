// apps/paper_trader/main.cpp
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "papertrade/core/logger.hpp"
#include "papertrade/core/state_manager.hpp"
#include "papertrade/data/csv_price_loader.hpp"
#include "papertrade/data/market_data_feed.hpp"
#include "papertrade/engine/engine_config.hpp"
#include "papertrade/engine/paper_trading_engine.hpp"

using namespace papertrade;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <config.json> [--duration SECONDS] [--status-interval SECONDS]" << std::endl;
    std::cerr << "Example: " << program << " config/paper_trader.json --duration 3600"
              << std::endl;
}

Result<void> load_market_data(const EngineConfig& config, ReplayMarketDataFeed& feed) {
    for (const auto& [timeframe, path] : config.historical_data) {
        auto samples = CsvPriceLoader::load(path, timeframe);
        if (samples.is_error()) {
            return forward_error<void>(samples);
        }
        auto loaded = feed.load_history(samples.value());
        if (loaded.is_error()) {
            return loaded;
        }
        INFO("Loaded " << samples.value().size() << " " << timeframe_to_string(timeframe)
                       << " samples from " << path);
    }

    if (!config.live_data_file.empty()) {
        auto samples = CsvPriceLoader::load(config.live_data_file, config.decision_loop.timeframe);
        if (samples.is_error()) {
            return forward_error<void>(samples);
        }
        auto pushed = feed.push_all(samples.value());
        if (pushed.is_error()) {
            return pushed;
        }
        INFO("Queued " << samples.value().size() << " live samples from "
                       << config.live_data_file);
    }
    return Result<void>();
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path = argv[1];
    double duration_sec = 0.0;  // 0 runs until interrupted
    double status_interval_sec = 60.0;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--duration" || arg == "--status-interval") && i + 1 < argc) {
            try {
                double value = std::stod(argv[++i]);
                if (arg == "--duration") {
                    duration_sec = value;
                } else {
                    status_interval_sec = value;
                }
            } catch (const std::exception&) {
                std::cerr << "Invalid value for " << arg << ": " << argv[i] << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else {
            std::cerr << "Invalid argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    EngineConfig config;
    auto config_result = config.load_from_file(config_path);
    if (config_result.is_error()) {
        std::cerr << "Invalid configuration: " << config_result.error()->to_string() << std::endl;
        return 2;
    }

    try {
        Logger::instance().initialize(config.logger);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }
    Logger::register_component("PaperTrader");
    INFO("Starting paper trader for " << config.symbol << " with " << config_path);

    auto feed = std::make_shared<ReplayMarketDataFeed>(config.symbol);
    auto data_result = load_market_data(config, *feed);
    if (data_result.is_error()) {
        ERROR("Failed to load market data: " << data_result.error()->to_string());
        return 1;
    }

    PaperTradingEngine engine(config, feed);
    auto init_result = engine.initialize();
    if (init_result.is_error()) {
        std::cerr << "Engine initialization failed: " << init_result.error()->to_string()
                  << std::endl;
        return init_result.error()->code() == ErrorCode::INVALID_CONFIGURATION ? 2 : 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto start_result = engine.start();
    if (start_result.is_error()) {
        ERROR("Failed to start engine: " << start_result.error()->to_string());
        return 1;
    }

    const auto started = std::chrono::steady_clock::now();
    auto last_status = started;
    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        const auto now = std::chrono::steady_clock::now();
        const double elapsed = std::chrono::duration<double>(now - started).count();
        if (duration_sec > 0.0 && elapsed >= duration_sec) {
            break;
        }
        if (std::chrono::duration<double>(now - last_status).count() >= status_interval_sec) {
            last_status = now;
            EngineStatus status = engine.status();
            if (!status.healthy) {
                WARN("A component reported an error: " << status.to_json().at("components").dump());
            }
            INFO("Status: " << status.to_json().dump());
        }
    }

    INFO("Shutting down paper trader");
    auto stop_result = engine.stop();
    if (stop_result.is_error()) {
        ERROR("Error while stopping: " << stop_result.error()->to_string());
    }
    StateManager::instance().shutdown();

    std::cout << engine.status().to_json().dump(2) << std::endl;
    return stop_result.is_ok() ? 0 : 1;
}
