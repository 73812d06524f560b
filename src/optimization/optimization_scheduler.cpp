// src/optimization/optimization_scheduler.cpp
#include "papertrade/optimization/optimization_scheduler.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <unordered_set>
#include "papertrade/core/logger.hpp"
#include "papertrade/core/state_manager.hpp"
#include "papertrade/core/time_utils.hpp"

namespace papertrade {

namespace {

std::chrono::steady_clock::duration to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

// Clears the in-progress flag however the cycle ends
class CycleGuard {
public:
    explicit CycleGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~CycleGuard() {
        flag_.store(false);
    }

private:
    std::atomic<bool>& flag_;
};

}  // namespace

nlohmann::json SchedulerConfig::to_json() const {
    nlohmann::json j;
    j["optimization_period"] = optimization_period;
    j["discovery_period"] = discovery_period;
    j["promotion_threshold"] = promotion_threshold;
    j["timeframes"] = nlohmann::json::array();
    for (Timeframe tf : timeframes) {
        j["timeframes"].push_back(timeframe_to_string(tf));
    }
    j["backtest_samples"] = backtest_samples;
    j["perturbations_per_strategy"] = perturbations_per_strategy;
    j["history_size"] = history_size;
    j["results_dir"] = results_dir;
    j["optimizer"] = optimizer.to_json();
    return j;
}

void SchedulerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("optimization_period"))
        optimization_period = j.at("optimization_period").get<double>();
    if (j.contains("discovery_period"))
        discovery_period = j.at("discovery_period").get<double>();
    if (j.contains("promotion_threshold"))
        promotion_threshold = j.at("promotion_threshold").get<double>();
    auto parse_timeframe = [](const nlohmann::json& value) {
        auto tf = timeframe_from_string(value.get<std::string>());
        if (!tf) {
            throw std::invalid_argument("Unknown timeframe: " + value.get<std::string>());
        }
        return *tf;
    };
    if (j.contains("timeframes")) {
        timeframes.clear();
        for (const auto& value : j.at("timeframes")) {
            timeframes.push_back(parse_timeframe(value));
        }
    } else if (j.contains("timeframe")) {
        timeframes = {parse_timeframe(j.at("timeframe"))};
    }
    if (j.contains("backtest_samples"))
        backtest_samples = j.at("backtest_samples").get<size_t>();
    if (j.contains("perturbations_per_strategy"))
        perturbations_per_strategy = j.at("perturbations_per_strategy").get<size_t>();
    if (j.contains("history_size"))
        history_size = j.at("history_size").get<size_t>();
    if (j.contains("results_dir"))
        results_dir = j.at("results_dir").get<std::string>();
    if (j.contains("optimizer"))
        optimizer.from_json(j.at("optimizer"));
}

Result<void> SchedulerConfig::validate() const {
    if (optimization_period <= 0.0 || discovery_period <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "Scheduler periods must be positive", "SchedulerConfig");
    }
    if (promotion_threshold < 0.0 || promotion_threshold > 1.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "promotion_threshold must be within [0, 1]", "SchedulerConfig");
    }
    if (timeframes.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "At least one timeframe is required", "SchedulerConfig");
    }
    for (size_t i = 0; i < timeframes.size(); ++i) {
        if (std::find(timeframes.begin(), timeframes.begin() + static_cast<std::ptrdiff_t>(i),
                      timeframes[i]) != timeframes.begin() + static_cast<std::ptrdiff_t>(i)) {
            return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                    "Duplicate timeframe " + timeframe_to_string(timeframes[i]),
                                    "SchedulerConfig");
        }
    }
    if (history_size == 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "history_size must be at least 1", "SchedulerConfig");
    }
    return optimizer.validate();
}

nlohmann::json CycleReport::to_json() const {
    nlohmann::json j;
    j["cycle"] = cycle;
    j["discovery"] = discovery;
    j["started_at"] = core::format_timestamp(started_at);
    j["duration_ms"] = duration_ms;
    j["samples"] = samples;
    j["timeframes"] = nlohmann::json::array();
    for (Timeframe tf : timeframes) {
        j["timeframes"].push_back(timeframe_to_string(tf));
    }
    j["evaluated"] = evaluated;
    j["failed"] = failed;
    j["winners"] = nlohmann::json::array();
    for (const auto& [id, score] : winners) {
        j["winners"].push_back({{"strategy_id", id}, {"score", score}});
    }
    j["promoted_id"] = promoted_id ? nlohmann::json(*promoted_id) : nlohmann::json(nullptr);
    j["active_id"] = active_id;
    j["active_score"] = active_score;
    return j;
}

nlohmann::json DeploymentRecord::to_json() const {
    nlohmann::json j;
    j["strategy_id"] = strategy_id;
    j["score"] = score;
    j["replaced_id"] = replaced_id;
    j["replaced_score"] = replaced_score;
    j["deployed_at"] = to_epoch_ms(deployed_at);
    return j;
}

DeploymentRecord DeploymentRecord::from_json(const nlohmann::json& j) {
    DeploymentRecord record;
    record.strategy_id = j.at("strategy_id").get<std::string>();
    record.score = j.at("score").get<double>();
    record.replaced_id = j.value("replaced_id", std::string());
    record.replaced_score = j.value("replaced_score", 0.0);
    record.deployed_at = from_epoch_ms(j.at("deployed_at").get<int64_t>());
    return record;
}

OptimizationScheduler::OptimizationScheduler(SchedulerConfig config,
                                             std::shared_ptr<MarketDataFeed> feed,
                                             std::shared_ptr<ActiveStrategySlot> strategy_slot,
                                             std::shared_ptr<RiskManagerSlot> risk_slot,
                                             std::shared_ptr<StrategyCatalog> catalog,
                                             std::vector<Strategy> base_population)
    : config_(std::move(config)),
      feed_(std::move(feed)),
      strategy_slot_(std::move(strategy_slot)),
      risk_slot_(std::move(risk_slot)),
      catalog_(std::move(catalog)),
      base_population_(std::move(base_population)) {
    if (!feed_ || !strategy_slot_ || !risk_slot_) {
        throw std::invalid_argument("OptimizationScheduler requires a feed and both slots");
    }

    Logger::register_component("OptimizationScheduler");

    component_id_ = "OPTIMIZATION_SCHEDULER_" + feed_->symbol();
    ComponentInfo info{ComponentType::OPTIMIZATION_SCHEDULER,
                       ComponentState::INITIALIZED,
                       component_id_,
                       "",
                       std::chrono::system_clock::now(),
                       {{"population", static_cast<double>(base_population_.size())}},
                       std::nullopt};
    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        ERROR("Failed to register optimization scheduler with state manager: "
              << register_result.error()->what() << ". Continuing without state management.");
    }
}

OptimizationScheduler::~OptimizationScheduler() {
    stop();
    auto result = StateManager::instance().unregister_component(component_id_);
    if (result.is_error()) {
        DEBUG("Failed to unregister optimization scheduler: " << result.error()->what());
    }
}

Result<CycleReport> OptimizationScheduler::run_cycle(bool discovery) {
    bool idle = false;
    if (!cycle_running_.compare_exchange_strong(idle, true)) {
        skipped_.fetch_add(1);
        WARN("Optimization cycle requested while another is running, skipped ("
             << skipped_.load() << " skipped so far)");
        return make_error<CycleReport>(ErrorCode::CYCLE_IN_PROGRESS,
                                       "An optimization cycle is already running",
                                       "OptimizationScheduler");
    }
    CycleGuard guard(cycle_running_);
    return execute_cycle(discovery);
}

std::vector<Strategy> OptimizationScheduler::build_population(bool discovery) {
    std::vector<Strategy> population;
    std::unordered_set<std::string> ids;
    auto add = [&population, &ids](const Strategy& strategy) {
        if (ids.insert(strategy.id).second) {
            population.push_back(strategy);
        }
    };

    for (const auto& strategy : base_population_) {
        add(strategy);
    }

    std::vector<Strategy> seeds;
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        for (const auto& winner : winners_) {
            seeds.push_back(winner.strategy);
        }
    }
    auto active = strategy_slot_->load();
    if (active) {
        seeds.push_back(active->strategy);
    }
    for (const auto& seed : seeds) {
        add(seed);
    }

    if (discovery && catalog_) {
        size_t before = population.size();
        for (const auto& seed : seeds) {
            for (const auto& variant : catalog_->perturb(seed, config_.perturbations_per_strategy)) {
                add(variant);
            }
        }
        INFO("Discovery added " << (population.size() - before) << " candidate strategies");
    }
    return population;
}

std::shared_ptr<const ActiveStrategy> OptimizationScheduler::refresh_active(
    const OptimizationResult& result) {
    auto active = strategy_slot_->load();
    if (!active) {
        return active;
    }
    const ScoredStrategy* evaluated = result.find(active->strategy.id);
    if (evaluated == nullptr) {
        DEBUG("Active strategy " << active->strategy.id << " was not re-evaluated, keeping score "
                                 << active->score);
        return active;
    }

    auto refreshed = std::make_shared<ActiveStrategy>(*active);
    refreshed->score = evaluated->score;
    refreshed->backtest_curve = evaluated->backtest.equity_curve;
    refreshed->backtest_win_rate = evaluated->backtest.summary.win_rate;

    auto expected = active;
    if (!strategy_slot_->compare_and_swap(expected, refreshed)) {
        WARN("Active strategy changed while refreshing its score, keeping the new one");
        return expected;
    }
    DEBUG("Active strategy " << active->strategy.id << " rescored " << active->score << " -> "
                             << refreshed->score);
    return refreshed;
}

Result<void> OptimizationScheduler::try_promote(const ScoredStrategy& candidate) {
    return try_promote(candidate, strategy_slot_->load());
}

Result<void> OptimizationScheduler::try_promote(const ScoredStrategy& candidate,
                                                std::shared_ptr<const ActiveStrategy> expected) {
    if (expected && expected->strategy.id == candidate.strategy.id) {
        return make_error<void>(ErrorCode::PROMOTION_REJECTED,
                                candidate.strategy.id + " is already active",
                                "OptimizationScheduler");
    }
    if (candidate.score <= config_.promotion_threshold) {
        DEBUG("Not promoting " << candidate.strategy.id << ": score " << candidate.score
                               << " does not exceed threshold " << config_.promotion_threshold);
        return make_error<void>(ErrorCode::PROMOTION_REJECTED,
                                "Score " + std::to_string(candidate.score) +
                                    " does not exceed the promotion threshold",
                                "OptimizationScheduler");
    }
    if (expected) {
        if (candidate.score <= expected->score) {
            DEBUG("Not promoting " << candidate.strategy.id << ": score " << candidate.score
                                   << " does not beat active " << expected->strategy.id << " ("
                                   << expected->score << ")");
            return make_error<void>(ErrorCode::PROMOTION_REJECTED,
                                    "Score " + std::to_string(candidate.score) +
                                        " does not beat the active strategy",
                                    "OptimizationScheduler");
        }
    }

    auto next = std::make_shared<ActiveStrategy>();
    next->strategy = candidate.strategy;
    next->score = candidate.score;
    next->backtest_curve = candidate.backtest.equity_curve;
    next->backtest_win_rate = candidate.backtest.summary.win_rate;
    next->activated_at = std::chrono::system_clock::now();

    auto observed = expected;
    if (!strategy_slot_->compare_and_swap(observed, next)) {
        WARN("Promotion of " << candidate.strategy.id
                             << " lost the race against another update, discarded");
        return make_error<void>(ErrorCode::PROMOTION_REJECTED,
                                "Active strategy changed before promotion",
                                "OptimizationScheduler");
    }

    promotions_.fetch_add(1);
    DeploymentRecord deployment;
    deployment.strategy_id = candidate.strategy.id;
    deployment.score = candidate.score;
    deployment.deployed_at = next->activated_at;
    if (expected) {
        deployment.replaced_id = expected->strategy.id;
        deployment.replaced_score = expected->score;
    }
    record(std::move(deployment));

    if (expected) {
        INFO("Promoted " << candidate.strategy.id << " (score " << candidate.score
                         << ") replacing " << expected->strategy.id << " (score "
                         << expected->score << ")");
    } else {
        INFO("Activated " << candidate.strategy.id << " (score " << candidate.score << ")");
    }
    return Result<void>();
}

Result<CycleReport> OptimizationScheduler::execute_cycle(bool discovery) {
    const auto started = std::chrono::steady_clock::now();

    CycleReport report;
    report.cycle = cycles_.load() + 1;
    report.discovery = discovery;
    report.started_at = std::chrono::system_clock::now();

    RiskPolicy policy;
    auto risk = risk_slot_->load();
    if (risk) {
        policy = risk->get_policy();
    } else {
        WARN("No risk manager installed, backtesting with the default policy");
    }

    std::map<Timeframe, std::vector<PriceSample>> by_timeframe;
    for (Timeframe tf : config_.timeframes) {
        auto range = feed_->historical_range(tf, Timestamp::min(), Timestamp::max());
        if (range.is_error()) {
            WARN("No " << timeframe_to_string(tf) << " history for cycle " << report.cycle
                       << ", skipping timeframe: " << range.error()->what());
            continue;
        }
        std::vector<PriceSample> samples = range.take_value();
        if (config_.backtest_samples > 0 && samples.size() > config_.backtest_samples) {
            samples.erase(samples.begin(),
                          samples.end() - static_cast<std::ptrdiff_t>(config_.backtest_samples));
        }
        report.samples += samples.size();
        report.timeframes.push_back(tf);
        by_timeframe.emplace(tf, std::move(samples));
    }
    if (by_timeframe.empty()) {
        ERROR("Optimization cycle " << report.cycle << " has no history for any timeframe");
        return make_error<CycleReport>(ErrorCode::DATA_NOT_FOUND,
                                       "No history for any configured timeframe",
                                       "OptimizationScheduler");
    }

    std::vector<Strategy> population;
    for (auto& candidate : build_population(discovery)) {
        if (by_timeframe.count(candidate.timeframe) > 0) {
            population.push_back(std::move(candidate));
        }
    }
    INFO("Cycle " << report.cycle << (discovery ? " (discovery)" : "") << ": evaluating "
                  << population.size() << " strategies over " << report.samples
                  << " samples in " << by_timeframe.size() << " timeframes");

    StrategyOptimizer optimizer(config_.optimizer, policy);
    OptimizationResult result = optimizer.run_cycle(population, by_timeframe);
    report.evaluated = result.evaluated;
    report.failed = result.failed;

    auto expected = refresh_active(result);

    std::vector<ScoredStrategy> winners = result.winners();
    for (const auto& winner : winners) {
        report.winners.emplace_back(winner.strategy.id, winner.score);
    }
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        winners_ = winners;
    }

    if (!result.ranked.empty()) {
        const ScoredStrategy& top = result.ranked.front();
        if (!expected || expected->strategy.id != top.strategy.id) {
            auto promoted = try_promote(top, expected);
            if (promoted.is_ok()) {
                report.promoted_id = top.strategy.id;
            }
        }
    }

    auto active = strategy_slot_->load();
    if (active) {
        report.active_id = active->strategy.id;
        report.active_score = active->score;
    }

    report.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - started)
                             .count();
    cycles_.fetch_add(1);
    record(report);
    write_report(report, result);

    auto metrics_result = StateManager::instance().update_metrics(
        component_id_, {{"cycles", static_cast<double>(cycles_.load())},
                        {"skipped", static_cast<double>(skipped_.load())},
                        {"promotions", static_cast<double>(promotions_.load())},
                        {"active_score", report.active_score}});
    if (metrics_result.is_error()) {
        TRACE("Metrics not published: " << metrics_result.error()->what());
    }

    return report;
}

void OptimizationScheduler::record(const CycleReport& report) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    history_.push_back(report);
    while (history_.size() > config_.history_size) {
        history_.pop_front();
    }
}

void OptimizationScheduler::write_report(const CycleReport& report,
                                         const OptimizationResult& result) const {
    if (config_.results_dir.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.results_dir, ec);
    if (ec) {
        WARN("Cannot create results directory " << config_.results_dir << ": " << ec.message());
        return;
    }

    nlohmann::json j = report.to_json();
    j["ranked"] = nlohmann::json::array();
    for (const auto& scored : result.winners()) {
        j["ranked"].push_back(scored.to_json());
    }
    j["failed_ids"] = result.failed_ids;

    std::filesystem::path path = std::filesystem::path(config_.results_dir) /
                                 ("continuous_results_iteration_" +
                                  std::to_string(report.cycle) + ".json");
    std::ofstream file(path);
    if (!file) {
        WARN("Cannot write cycle results to " << path.string());
        return;
    }
    file << j.dump(2);
}

void OptimizationScheduler::record(DeploymentRecord deployment) {
    std::lock_guard<std::mutex> lock(data_mutex_);
    deployments_.push_back(std::move(deployment));
    while (deployments_.size() > config_.history_size) {
        deployments_.pop_front();
    }
}

std::vector<CycleReport> OptimizationScheduler::history() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return std::vector<CycleReport>(history_.begin(), history_.end());
}

std::vector<ScoredStrategy> OptimizationScheduler::winners() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return winners_;
}

std::vector<DeploymentRecord> OptimizationScheduler::deployments() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return std::vector<DeploymentRecord>(deployments_.begin(), deployments_.end());
}

void OptimizationScheduler::restore(std::vector<ScoredStrategy> winners,
                                    std::vector<DeploymentRecord> deployments) {
    if (catalog_) {
        for (const auto& winner : winners) {
            catalog_->observe_sequence(winner.strategy.discovery_seq);
        }
    }
    std::lock_guard<std::mutex> lock(data_mutex_);
    winners_ = std::move(winners);
    deployments_.assign(std::make_move_iterator(deployments.begin()),
                        std::make_move_iterator(deployments.end()));
    while (deployments_.size() > config_.history_size) {
        deployments_.pop_front();
    }
    INFO("Restored " << winners_.size() << " winners and " << deployments_.size()
                     << " deployments");
}

std::vector<Strategy> OptimizationScheduler::population() const {
    std::vector<Strategy> population = base_population_;
    std::lock_guard<std::mutex> lock(data_mutex_);
    for (const auto& winner : winners_) {
        auto same = [&winner](const Strategy& s) { return s.id == winner.strategy.id; };
        if (std::none_of(population.begin(), population.end(), same)) {
            population.push_back(winner.strategy);
        }
    }
    return population;
}

Result<void> OptimizationScheduler::start() {
    if (running_.exchange(true)) {
        return make_error<void>(ErrorCode::ALREADY_RUNNING,
                                "Optimization scheduler is already running",
                                "OptimizationScheduler");
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    auto state_result =
        StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    if (state_result.is_error()) {
        WARN("Failed to update scheduler state: " << state_result.error()->what());
    }

    worker_ = std::thread(&OptimizationScheduler::run, this);
    INFO("Optimization scheduler started: optimization every " << config_.optimization_period
                                                                << "s, discovery every "
                                                                << config_.discovery_period << "s");
    return Result<void>();
}

void OptimizationScheduler::stop() {
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

    auto state_result =
        StateManager::instance().update_state(component_id_, ComponentState::STOPPED);
    if (state_result.is_error()) {
        WARN("Failed to update scheduler state: " << state_result.error()->what());
    }
    INFO("Optimization scheduler stopped after " << cycles_.load() << " cycles");
}

void OptimizationScheduler::run() {
    Logger::register_component("OptimizationScheduler");
    using clock = std::chrono::steady_clock;

    const auto optimization_period = to_duration(config_.optimization_period);
    const auto discovery_period = to_duration(config_.discovery_period);

    // Moves a due trigger past now, counting triggers that fired mid-cycle
    auto advance = [this](clock::time_point& next, clock::duration period, clock::time_point now) {
        next += period;
        while (next <= now) {
            next += period;
            skipped_.fetch_add(1);
        }
    };

    auto run_logged = [this](bool discovery) {
        try {
            auto result = run_cycle(discovery);
            if (result.is_error() && result.error()->code() != ErrorCode::CYCLE_IN_PROGRESS) {
                ERROR("Optimization cycle failed: " << result.error()->to_string());
            }
        } catch (const std::exception& e) {
            ERROR("Optimization cycle threw: " << e.what());
        }
    };

    run_logged(false);

    auto now = clock::now();
    auto next_optimization = now + optimization_period;
    auto next_discovery = now + discovery_period;

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_until(lock, std::min(next_optimization, next_discovery),
                                [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        now = clock::now();
        const bool discovery_due = now >= next_discovery;
        const bool optimization_due = now >= next_optimization;
        if (!discovery_due && !optimization_due) {
            continue;
        }

        run_logged(discovery_due);

        now = clock::now();
        if (discovery_due) {
            advance(next_discovery, discovery_period, now);
        }
        if (optimization_due) {
            advance(next_optimization, optimization_period, now);
        }
    }
}

}  // namespace papertrade
