// src/engine/paper_trading_engine.cpp
#include "papertrade/engine/paper_trading_engine.hpp"
#include <algorithm>
#include <stdexcept>
#include "papertrade/core/logger.hpp"
#include "papertrade/core/state_manager.hpp"

namespace papertrade {

nlohmann::json EngineStatus::to_json() const {
    nlohmann::json j;
    j["running"] = running;
    j["equity"] = equity;
    j["cash"] = portfolio.cash;
    j["starting_balance"] = portfolio.starting_balance;
    j["open_position"] = !portfolio.is_flat();
    if (portfolio.open_position) {
        const auto& position = *portfolio.open_position;
        j["position"] = {{"direction", direction_to_string(position.order.direction)},
                         {"quantity", position.order.quantity},
                         {"entry_price", position.order.entry_price},
                         {"stop_loss", position.order.stop_loss},
                         {"take_profit", position.order.take_profit},
                         {"unrealized_pnl", position.unrealized_pnl}};
    }
    j["trades"] = portfolio.trades.size();
    j["realized_pnl"] = portfolio.realized_pnl();
    j["active_strategy_id"] = active_strategy_id;
    j["active_score"] = active_score;
    j["last_signal"] = {{"direction", direction_to_string(last_signal.direction)},
                        {"confidence", last_signal.confidence},
                        {"strategy_id", last_signal.strategy_id}};
    j["uptime_ms"] = uptime.count();
    j["counters"] = counters.to_json();
    j["cycles_completed"] = cycles_completed;
    j["skipped_cycles"] = skipped_cycles;
    j["promotions"] = promotions;
    j["risk_profile"] = risk_profile_to_string(risk_profile);
    j["divergence"] = divergence ? divergence->to_json() : nlohmann::json(nullptr);
    j["healthy"] = healthy;
    j["components"] = nlohmann::json::object();
    for (const auto& [id, state] : components) {
        j["components"][id] = state;
    }
    return j;
}

PaperTradingEngine::PaperTradingEngine(EngineConfig config, std::shared_ptr<MarketDataFeed> feed)
    : config_(std::move(config)), feed_(std::move(feed)) {
    if (!feed_) {
        throw std::invalid_argument("PaperTradingEngine requires a market data feed");
    }
    Logger::register_component("PaperTradingEngine");
    component_id_ = "PAPER_TRADING_ENGINE_" + config_.symbol;
    risk_profile_.store(config_.risk_profile);
}

PaperTradingEngine::~PaperTradingEngine() {
    if (running_.load()) {
        auto result = stop();
        if (result.is_error()) {
            ERROR("Error stopping engine during shutdown: " << result.error()->what());
        }
    }
    // Workers reference the shared components; tear them down first
    scheduler_.reset();
    loop_.reset();
    if (initialized_.load()) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            DEBUG("Failed to unregister engine: " << result.error()->what());
        }
    }
}

Result<void> PaperTradingEngine::initialize() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (initialized_.load()) {
        return Result<void>();
    }

    auto valid = config_.validate();
    if (valid.is_error()) {
        FATAL("Invalid engine configuration: " << valid.error()->what());
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, valid.error()->what(),
                                "PaperTradingEngine");
    }
    if (feed_->symbol() != config_.symbol) {
        FATAL("Feed serves " << feed_->symbol() << " but the engine is configured for "
                             << config_.symbol);
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "Feed symbol " + feed_->symbol() + " does not match " +
                                    config_.symbol,
                                "PaperTradingEngine");
    }

    std::optional<EngineState> restored;
    if (!config_.state_file.empty()) {
        StateStore store(config_.state_file);
        if (store.exists()) {
            auto loaded = store.load();
            if (loaded.is_error()) {
                ERROR("Cannot restore state from " << config_.state_file << ": "
                                                   << loaded.error()->what());
                return forward_error<void>(loaded);
            }
            restored = loaded.take_value();
        }
    }

    auto built = build_components(restored);
    if (built.is_error()) {
        return built;
    }

    ComponentInfo info{ComponentType::ENGINE,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {{"equity", ledger_->equity()}},
                       std::nullopt};
    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        ERROR("Failed to register engine with state manager: "
              << register_result.error()->what() << ". Continuing without state management.");
    }

    initialized_.store(true);
    INFO("Paper trading engine initialized for " << config_.symbol << " with profile "
                                                 << risk_profile_to_string(risk_profile_.load())
                                                 << ", equity " << ledger_->equity());
    return Result<void>();
}

Result<void> PaperTradingEngine::build_components(const std::optional<EngineState>& restored) {
    RiskProfile profile = restored ? restored->risk_profile : config_.risk_profile;
    RiskPolicy policy =
        profile == config_.risk_profile ? config_.resolved_policy() : risk_policy_for(profile);
    auto valid = validate_policy(policy);
    if (valid.is_error()) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, valid.error()->what(),
                                "PaperTradingEngine");
    }

    // Old workers go before the state they point at
    scheduler_.reset();
    loop_.reset();

    if (restored) {
        Portfolio portfolio = restored->portfolio;
        portfolio.limits = policy.ledger_limits();
        ledger_ = std::make_shared<PortfolioLedger>(std::move(portfolio));
    } else {
        ledger_ = std::make_shared<PortfolioLedger>(policy.starting_balance, policy.ledger_limits());
    }

    catalog_ = std::make_shared<StrategyCatalog>(config_.catalog_seed);
    std::vector<Strategy> population;
    for (Timeframe tf : config_.scheduler.timeframes) {
        auto defaults = catalog_->default_population(tf);
        population.insert(population.end(), defaults.begin(), defaults.end());
    }

    strategy_slot_ = std::make_shared<ActiveStrategySlot>();
    if (restored && restored->active) {
        catalog_->observe_sequence(restored->active->strategy.discovery_seq);
        strategy_slot_->store(std::make_shared<const ActiveStrategy>(*restored->active));
        INFO("Restored active strategy " << restored->active->strategy.id << " (score "
                                         << restored->active->score << ")");
    } else {
        auto initial = config_.resolved_initial_strategy();
        if (initial.is_error()) {
            return make_error<void>(ErrorCode::INVALID_CONFIGURATION, initial.error()->what(),
                                    "PaperTradingEngine");
        }
        if (initial.value()) {
            // Unscored, so any candidate that clears the threshold replaces it
            auto seeded = std::make_shared<ActiveStrategy>();
            seeded->strategy = *initial.value();
            seeded->score = 0.0;
            seeded->activated_at = std::chrono::system_clock::now();
            catalog_->observe_sequence(seeded->strategy.discovery_seq);
            strategy_slot_->store(seeded);
            INFO("Trading initial strategy " << seeded->strategy.id
                                             << " until the first promotion");
        }
    }

    risk_slot_ = std::make_shared<RiskManagerSlot>(std::make_shared<const RiskManager>(policy));
    risk_profile_.store(profile);

    monitor_ = std::make_shared<PerformanceMonitor>(config_.monitor);

    loop_ = std::make_unique<DecisionLoop>(config_.decision_loop, feed_, ledger_, strategy_slot_,
                                           risk_slot_, monitor_);
    scheduler_ = std::make_unique<OptimizationScheduler>(
        config_.scheduler, feed_, strategy_slot_, risk_slot_, catalog_, std::move(population));

    if (restored) {
        scheduler_->restore(restored->winners, restored->deployments);
        if (restored->window) {
            auto resumed = loop_->restore(*restored->window);
            if (resumed.is_error()) {
                WARN("Saved candle window not used, rebuilding from history: "
                     << resumed.error()->what());
            }
        }
    }
    return Result<void>();
}

Result<void> PaperTradingEngine::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!initialized_.load()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Engine is not initialized",
                                "PaperTradingEngine");
    }
    if (running_.load()) {
        return make_error<void>(ErrorCode::ALREADY_RUNNING, "Engine is already running",
                                "PaperTradingEngine");
    }

    auto scheduler_result = scheduler_->start();
    if (scheduler_result.is_error()) {
        return scheduler_result;
    }
    auto loop_result = loop_->start();
    if (loop_result.is_error()) {
        scheduler_->stop();
        return loop_result;
    }

    running_.store(true);
    auto state_result = StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    if (state_result.is_error()) {
        WARN("Failed to update engine state: " << state_result.error()->what());
    }
    INFO("Paper trading engine started");
    return Result<void>();
}

Result<void> PaperTradingEngine::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!running_.load()) {
        return Result<void>();
    }

    loop_->stop();
    scheduler_->stop();
    running_.store(false);

    auto state_result = StateManager::instance().update_state(component_id_, ComponentState::STOPPED);
    if (state_result.is_error()) {
        WARN("Failed to update engine state: " << state_result.error()->what());
    }

    Portfolio portfolio = ledger_->account_snapshot();
    INFO("Paper trading engine stopped: equity " << portfolio.equity() << ", "
                                                 << portfolio.trades.size() << " trades");

    if (!config_.state_file.empty()) {
        return save_state();
    }
    return Result<void>();
}

EngineStatus PaperTradingEngine::status() const {
    EngineStatus status;
    status.running = running_.load();
    status.risk_profile = risk_profile_.load();

    StateManager& states = StateManager::instance();
    status.healthy = states.is_healthy();
    for (const auto& id : states.get_all_components()) {
        auto info = states.get_state(id);
        if (info.is_ok()) {
            status.components.emplace_back(id, component_state_to_string(info.value().state));
        }
    }
    std::sort(status.components.begin(), status.components.end());

    if (!initialized_.load()) {
        return status;
    }

    status.portfolio = ledger_->account_snapshot();
    status.equity = status.portfolio.equity();
    auto active = strategy_slot_->load();
    if (active) {
        status.active_strategy_id = active->strategy.id;
        status.active_score = active->score;
    }
    status.last_signal = loop_->last_signal();
    status.counters = loop_->counters();
    status.uptime = StateManager::instance().uptime(component_id_);
    status.cycles_completed = scheduler_->cycles_completed();
    status.skipped_cycles = scheduler_->skipped_triggers();
    status.promotions = scheduler_->promotions();
    status.divergence = monitor_->divergence();
    return status;
}

Result<void> PaperTradingEngine::select_risk_profile(RiskProfile profile) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!initialized_.load()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Engine is not initialized",
                                "PaperTradingEngine");
    }

    RiskPolicy policy =
        profile == config_.risk_profile ? config_.resolved_policy() : risk_policy_for(profile);
    auto valid = validate_policy(policy);
    if (valid.is_error()) {
        return valid;
    }

    auto reset = ledger_->reset_balance(policy.starting_balance);
    if (reset.is_ok()) {
        INFO("Starting balance set to " << policy.starting_balance);
    } else {
        INFO("Ledger has history, keeping balance; only risk limits change");
    }
    ledger_->set_limits(policy.ledger_limits());
    risk_slot_->store(std::make_shared<const RiskManager>(policy));
    risk_profile_.store(profile);

    INFO("Risk profile " << risk_profile_to_string(profile) << ": max position "
                         << policy.max_position_fraction * 100 << "%, stop "
                         << policy.stop_loss_pct * 100 << "%, target "
                         << policy.take_profit_pct * 100 << "%, min confidence "
                         << policy.min_confidence);
    return Result<void>();
}

EngineState PaperTradingEngine::capture_state() const {
    EngineState state;
    state.portfolio = ledger_->snapshot();
    auto active = strategy_slot_->load();
    if (active) {
        state.active = *active;
    }
    state.risk_profile = risk_profile_.load();
    state.window = loop_->snapshot();
    state.winners = scheduler_->winners();
    state.deployments = scheduler_->deployments();
    state.saved_at = std::chrono::system_clock::now();
    return state;
}

Result<void> PaperTradingEngine::save_state() const {
    if (!initialized_.load()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Engine is not initialized",
                                "PaperTradingEngine");
    }
    if (config_.state_file.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, "No state_file configured",
                                "PaperTradingEngine");
    }
    auto saved = StateStore(config_.state_file).save(capture_state());
    if (saved.is_error()) {
        ERROR("Failed to save engine state: " << saved.error()->what());
        return saved;
    }
    INFO("Engine state saved to " << config_.state_file);
    return Result<void>();
}

Result<void> PaperTradingEngine::load_state() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (running_.load()) {
        return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                "Stop the engine before loading state", "PaperTradingEngine");
    }
    if (!initialized_.load()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Engine is not initialized",
                                "PaperTradingEngine");
    }
    if (config_.state_file.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, "No state_file configured",
                                "PaperTradingEngine");
    }

    auto loaded = StateStore(config_.state_file).load();
    if (loaded.is_error()) {
        return forward_error<void>(loaded);
    }
    std::optional<EngineState> restored = loaded.take_value();
    return build_components(restored);
}

}  // namespace papertrade
