// src/live/decision_loop.cpp
#include "papertrade/live/decision_loop.hpp"
#include <chrono>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include "papertrade/core/logger.hpp"
#include "papertrade/core/state_manager.hpp"

namespace papertrade {

nlohmann::json DecisionLoopConfig::to_json() const {
    nlohmann::json j;
    j["timeframe"] = timeframe_to_string(timeframe);
    j["tick_interval"] = tick_interval;
    j["lookback"] = lookback;
    j["close_on_opposite_signal"] = close_on_opposite_signal;
    return j;
}

void DecisionLoopConfig::from_json(const nlohmann::json& j) {
    if (j.contains("timeframe")) {
        auto tf = timeframe_from_string(j.at("timeframe").get<std::string>());
        if (tf) {
            timeframe = *tf;
        } else {
            throw std::invalid_argument("Unknown timeframe: " +
                                        j.at("timeframe").get<std::string>());
        }
    }
    if (j.contains("tick_interval"))
        tick_interval = j.at("tick_interval").get<double>();
    if (j.contains("lookback"))
        lookback = j.at("lookback").get<size_t>();
    if (j.contains("close_on_opposite_signal"))
        close_on_opposite_signal = j.at("close_on_opposite_signal").get<bool>();
}

Result<void> DecisionLoopConfig::validate() const {
    if (tick_interval <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "tick_interval must be positive", "DecisionLoopConfig");
    }
    if (lookback < 2) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "lookback must be at least 2 samples", "DecisionLoopConfig");
    }
    return Result<void>();
}

nlohmann::json LoopCounters::to_json() const {
    nlohmann::json j;
    j["ticks"] = ticks;
    j["empty_ticks"] = empty_ticks;
    j["pending_ticks"] = pending_ticks;
    j["evaluations"] = evaluations;
    j["orders"] = orders;
    j["rejections"] = rejections;
    j["exits"] = exits;
    return j;
}

namespace {

nlohmann::json sample_to_json(const PriceSample& sample) {
    return nlohmann::json::array({to_epoch_ms(sample.timestamp), sample.open, sample.high,
                                  sample.low, sample.close, sample.volume});
}

PriceSample sample_from_json(const nlohmann::json& j, Timeframe timeframe) {
    return PriceSample(from_epoch_ms(j.at(0).get<int64_t>()), j.at(1).get<double>(),
                       j.at(2).get<double>(), j.at(3).get<double>(), j.at(4).get<double>(),
                       j.at(5).get<double>(), timeframe);
}

PipelineOptions pipeline_options(const DecisionLoopConfig& config) {
    PipelineOptions options;
    options.window_capacity = config.lookback;
    options.close_on_opposite_signal = config.close_on_opposite_signal;
    options.log_rejections = true;
    return options;
}

}  // namespace

nlohmann::json LoopSnapshot::to_json() const {
    nlohmann::json j;
    j["timeframe"] = timeframe_to_string(timeframe);
    j["samples"] = nlohmann::json::array();
    for (const auto& sample : window) {
        j["samples"].push_back(sample_to_json(sample));
    }
    j["partial"] = partial ? sample_to_json(*partial) : nlohmann::json(nullptr);
    return j;
}

LoopSnapshot LoopSnapshot::from_json(const nlohmann::json& j) {
    LoopSnapshot snapshot;
    const std::string name = j.at("timeframe").get<std::string>();
    auto tf = timeframe_from_string(name);
    if (!tf) {
        throw std::invalid_argument("Unknown timeframe: " + name);
    }
    snapshot.timeframe = *tf;
    for (const auto& sample : j.at("samples")) {
        snapshot.window.push_back(sample_from_json(sample, snapshot.timeframe));
    }
    if (j.contains("partial") && !j.at("partial").is_null()) {
        snapshot.partial = sample_from_json(j.at("partial"), snapshot.timeframe);
    }
    return snapshot;
}

DecisionLoop::DecisionLoop(DecisionLoopConfig config, std::shared_ptr<MarketDataFeed> feed,
                           std::shared_ptr<PortfolioLedger> ledger,
                           std::shared_ptr<ActiveStrategySlot> strategy_slot,
                           std::shared_ptr<RiskManagerSlot> risk_slot,
                           std::shared_ptr<PerformanceMonitor> monitor)
    : config_(std::move(config)),
      feed_(std::move(feed)),
      ledger_(std::move(ledger)),
      strategy_slot_(std::move(strategy_slot)),
      risk_slot_(std::move(risk_slot)),
      monitor_(std::move(monitor)),
      pipeline_(pipeline_options(config_)),
      aggregator_(config_.timeframe, config_.timeframe) {
    if (!feed_ || !ledger_ || !strategy_slot_ || !risk_slot_) {
        throw std::invalid_argument("DecisionLoop requires a feed, ledger and both slots");
    }

    Logger::register_component("DecisionLoop");

    component_id_ = "DECISION_LOOP_" + feed_->symbol() + "_" + timeframe_to_string(config_.timeframe);
    ComponentInfo info{ComponentType::DECISION_LOOP,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {{"ticks", 0.0}},
                       std::nullopt};
    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        ERROR("Failed to register decision loop with state manager: "
              << register_result.error()->what() << ". Continuing without state management.");
    }
}

DecisionLoop::~DecisionLoop() {
    stop();
    auto result = StateManager::instance().unregister_component(component_id_);
    if (result.is_error()) {
        DEBUG("Failed to unregister decision loop: " << result.error()->what());
    }
}

void DecisionLoop::track_activation(const std::shared_ptr<const ActiveStrategy>& active,
                                    const Timestamp& now) {
    if (active == last_active_) {
        return;
    }
    // A rescored copy of the same strategy is not a new activation
    const bool same_strategy =
        active && last_active_ && active->strategy.id == last_active_->strategy.id;
    last_active_ = active;
    if (!active || same_strategy) {
        return;
    }

    const Timeframe target = active->strategy.timeframe;
    if (target != aggregator_.target()) {
        if (CandleAggregator::can_aggregate(config_.timeframe, target)) {
            switch_timeframe(target, now);
        } else {
            ERROR("Cannot build " << timeframe_to_string(target) << " candles from "
                                  << timeframe_to_string(config_.timeframe)
                                  << " samples, " << active->strategy.id
                                  << " will only have its exits managed");
        }
    }
    if (monitor_) {
        monitor_->on_strategy_activated(*active);
    }
    drift_alerted_ = false;
    INFO("Trading strategy " << active->strategy.id << " (score " << active->score << ")");
}

void DecisionLoop::switch_timeframe(Timeframe target, const Timestamp& now) {
    aggregator_.reset(target);
    pipeline_.clear();

    // Only candles that closed before the one now being built
    const Timestamp open_candle = CandleAggregator::bucket_start(now, target);
    auto history =
        feed_->historical_range(target, Timestamp::min(), open_candle - Timestamp::duration(1));
    if (history.is_error()) {
        WARN("No " << timeframe_to_string(target)
                   << " history to warm up on, starting with an empty window: "
                   << history.error()->what());
        return;
    }
    pipeline_.prime(history.value());
    INFO("Trading " << timeframe_to_string(target) << " candles, window warmed up with "
                    << pipeline_.window().size() << " candles");
}

LoopSnapshot DecisionLoop::snapshot() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    LoopSnapshot snapshot;
    snapshot.timeframe = aggregator_.target();
    snapshot.window = pipeline_.window();
    snapshot.partial = aggregator_.partial();
    return snapshot;
}

Result<void> DecisionLoop::restore(const LoopSnapshot& snapshot) {
    if (!CandleAggregator::can_aggregate(config_.timeframe, snapshot.timeframe)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Saved " + timeframe_to_string(snapshot.timeframe) +
                                    " candles cannot be built from " +
                                    timeframe_to_string(config_.timeframe) + " samples",
                                "DecisionLoop");
    }
    std::lock_guard<std::mutex> lock(tick_mutex_);
    aggregator_.restore(snapshot.timeframe, snapshot.partial);
    pipeline_.prime(snapshot.window);
    INFO("Resumed " << timeframe_to_string(snapshot.timeframe) << " candles with "
                    << pipeline_.window().size() << " in the window"
                    << (snapshot.partial ? " and one open" : ""));
    return Result<void>();
}

Timeframe DecisionLoop::candle_timeframe() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    return aggregator_.target();
}

std::optional<StepOutcome> DecisionLoop::tick() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    ++counters_.ticks;

    auto sample = feed_->next_sample(config_.timeframe);
    if (!sample) {
        ++counters_.empty_ticks;
        WARN("No new " << timeframe_to_string(config_.timeframe) << " sample for "
                       << feed_->symbol() << ", skipping tick " << counters_.ticks);
        return std::nullopt;
    }

    // One read of each slot per tick
    auto active = strategy_slot_->load();
    auto risk = risk_slot_->load();
    if (!risk) {
        ERROR("No risk manager installed, skipping tick " << counters_.ticks);
        ++counters_.empty_ticks;
        return std::nullopt;
    }
    if (active) {
        pipeline_.ensure_capacity(
            TradingPipeline::required_capacity(active->strategy, risk->get_policy()));
    }
    track_activation(active, sample->timestamp);

    std::vector<PriceSample> candles = aggregator_.add(*sample);
    if (candles.empty()) {
        ++counters_.pending_ticks;
        return std::nullopt;
    }

    // A strategy whose candles cannot be built here only has its exits managed
    const Strategy* strategy =
        active && active->strategy.timeframe == aggregator_.target() ? &active->strategy : nullptr;

    std::optional<StepOutcome> last;
    for (const auto& candle : candles) {
        StepOutcome outcome = pipeline_.step(candle, strategy, *risk, *ledger_);
        handle_outcome(candle, outcome);
        last = std::move(outcome);
    }

    publish_metrics();
    return last;
}

void DecisionLoop::handle_outcome(const PriceSample& candle, const StepOutcome& outcome) {
    if (outcome.exit) {
        ++counters_.exits;
        INFO("Closed " << direction_to_string(outcome.exit->direction) << " "
                       << outcome.exit->quantity << " @ " << outcome.exit->exit_price << " ("
                       << exit_reason_to_string(outcome.exit->exit_reason)
                       << "), P&L: " << outcome.exit->realized_pnl);
        if (monitor_) {
            monitor_->record_trade(*outcome.exit);
        }
    }
    if (outcome.evaluated) {
        ++counters_.evaluations;
        last_signal_ = outcome.signal;
        TRACE("Signal " << direction_to_string(outcome.signal.direction) << " confidence "
                        << outcome.signal.confidence << " from " << outcome.signal.strategy_id);
    }
    if (outcome.order) {
        ++counters_.orders;
        const Order& order = *outcome.order;
        if (order.action == OrderAction::OPEN) {
            INFO("Opened " << direction_to_string(order.direction) << " " << order.quantity
                           << " @ " << order.entry_price << " (notional " << order.notional
                           << ", SL " << order.stop_loss << ", TP " << order.take_profit << ")");
        } else {
            INFO("Closed position on opposite signal @ " << order.entry_price);
            auto portfolio = ledger_->account_snapshot();
            if (monitor_ && !portfolio.trades.empty()) {
                monitor_->record_trade(portfolio.trades.back());
            }
        }
    }
    if (outcome.rejection) {
        ++counters_.rejections;
    }

    if (monitor_) {
        monitor_->record(candle.timestamp, outcome.equity);
        auto report = monitor_->divergence();
        const bool alert = report && report->alert;
        if (alert && !drift_alerted_) {
            WARN("Live return " << report->live_return << " deviates from backtest "
                                << report->expected_return << " by " << report->deviation);
        }
        drift_alerted_ = alert;
    }
}

void DecisionLoop::publish_metrics() {
    std::unordered_map<std::string, double> metrics{
        {"ticks", static_cast<double>(counters_.ticks)},
        {"empty_ticks", static_cast<double>(counters_.empty_ticks)},
        {"pending_ticks", static_cast<double>(counters_.pending_ticks)},
        {"orders", static_cast<double>(counters_.orders)},
        {"rejections", static_cast<double>(counters_.rejections)},
        {"equity", ledger_->equity()}};
    auto result = StateManager::instance().update_metrics(component_id_, metrics);
    if (result.is_error()) {
        TRACE("Metrics not published: " << result.error()->what());
    }
}

Result<void> DecisionLoop::start() {
    if (running_.exchange(true)) {
        return make_error<void>(ErrorCode::ALREADY_RUNNING, "Decision loop is already running",
                                "DecisionLoop");
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    auto state_result = StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    if (state_result.is_error()) {
        WARN("Failed to update decision loop state: " << state_result.error()->what());
    }

    worker_ = std::thread(&DecisionLoop::run, this);
    INFO("Decision loop started on " << feed_->symbol() << " "
                                     << timeframe_to_string(config_.timeframe) << " every "
                                     << config_.tick_interval << "s");
    return Result<void>();
}

void DecisionLoop::stop() {
    if (!running_.exchange(false)) {
        if (worker_.joinable()) {
            worker_.join();
        }
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    auto state_result = StateManager::instance().update_state(component_id_, ComponentState::STOPPED);
    if (state_result.is_error()) {
        WARN("Failed to update decision loop state: " << state_result.error()->what());
    }
    INFO("Decision loop stopped after " << counters().ticks << " ticks");
}

void DecisionLoop::run() {
    Logger::register_component("DecisionLoop");
    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config_.tick_interval));

    auto next = std::chrono::steady_clock::now();
    while (running_.load()) {
        try {
            tick();
        } catch (const std::exception& e) {
            ERROR("Tick failed: " << e.what());
        }

        next += interval;
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_until(lock, next, [this] { return !running_.load(); });
    }
}

Signal DecisionLoop::last_signal() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    return last_signal_;
}

LoopCounters DecisionLoop::counters() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    return counters_;
}

}  // namespace papertrade
