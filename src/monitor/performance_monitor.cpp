// src/monitor/performance_monitor.cpp
#include "papertrade/monitor/performance_monitor.hpp"
#include <algorithm>
#include <cmath>
#include "papertrade/core/logger.hpp"

namespace papertrade {

namespace {

// Keeps the normalized deviation finite when the backtest expected ~0%
constexpr double MIN_EXPECTED_MAGNITUDE = 0.01;

// Equity at a time, interpolated between curve points and clamped at the ends
double equity_at(const std::vector<EquityPoint>& curve, const Timestamp& ts) {
    if (ts <= curve.front().first) {
        return curve.front().second;
    }
    if (ts >= curve.back().first) {
        return curve.back().second;
    }
    auto after = std::lower_bound(
        curve.begin(), curve.end(), ts,
        [](const EquityPoint& point, const Timestamp& t) { return point.first < t; });
    auto before = after - 1;
    const double span = std::chrono::duration<double>(after->first - before->first).count();
    if (span <= 0.0) {
        return after->second;
    }
    const double weight = std::chrono::duration<double>(ts - before->first).count() / span;
    return before->second + (after->second - before->second) * weight;
}

}  // namespace

nlohmann::json MonitorConfig::to_json() const {
    nlohmann::json j;
    j["alert_threshold"] = alert_threshold;
    j["max_samples"] = max_samples;
    return j;
}

void MonitorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("alert_threshold"))
        alert_threshold = j.at("alert_threshold").get<double>();
    if (j.contains("max_samples"))
        max_samples = j.at("max_samples").get<size_t>();
}

Result<void> MonitorConfig::validate() const {
    if (alert_threshold <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "alert_threshold must be positive", "MonitorConfig");
    }
    if (max_samples < 2) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                "max_samples must be at least 2", "MonitorConfig");
    }
    return Result<void>();
}

nlohmann::json DivergenceReport::to_json() const {
    nlohmann::json j;
    j["strategy_id"] = strategy_id;
    j["samples"] = samples;
    j["live_return"] = live_return;
    j["expected_return"] = expected_return;
    j["deviation"] = deviation;
    j["normalized_deviation"] = normalized_deviation;
    j["live_win_rate"] = live_win_rate;
    j["expected_win_rate"] = expected_win_rate;
    j["accuracy_score"] = accuracy_score;
    j["confidence_level"] = confidence_level;
    j["alert"] = alert;
    j["as_of"] = to_epoch_ms(as_of);
    return j;
}

PerformanceMonitor::PerformanceMonitor(MonitorConfig config) : config_(std::move(config)) {}

std::string PerformanceMonitor::confidence_for(double accuracy_score) {
    if (accuracy_score >= 0.7)
        return "HIGH";
    if (accuracy_score >= 0.5)
        return "MEDIUM";
    return "LOW";
}

void PerformanceMonitor::on_strategy_activated(const ActiveStrategy& active) {
    std::lock_guard<std::mutex> lock(mutex_);
    strategy_id_ = active.strategy.id;
    backtest_curve_ = active.backtest_curve;
    expected_win_rate_ = active.backtest_win_rate;
    live_curve_.clear();
    live_trades_ = 0;
    live_wins_ = 0;
}

void PerformanceMonitor::record(const Timestamp& ts, double equity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (strategy_id_.empty()) {
        return;
    }
    // Keep the first point: returns are measured from activation
    if (live_curve_.size() >= config_.max_samples) {
        live_curve_.erase(live_curve_.begin() + 1);
    }
    live_curve_.emplace_back(ts, equity);
}

void PerformanceMonitor::record_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (strategy_id_.empty()) {
        return;
    }
    ++live_trades_;
    if (trade.is_win()) {
        ++live_wins_;
    }
}

size_t PerformanceMonitor::sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_curve_.size();
}

std::optional<DivergenceReport> PerformanceMonitor::divergence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (strategy_id_.empty() || live_curve_.size() < 2 || live_curve_.front().second <= 0.0) {
        return std::nullopt;
    }

    DivergenceReport report;
    report.strategy_id = strategy_id_;
    report.samples = live_curve_.size();
    report.as_of = live_curve_.back().first;
    report.live_return = live_curve_.back().second / live_curve_.front().second - 1.0;

    if (backtest_curve_.size() >= 2 && backtest_curve_.front().second > 0.0) {
        const auto elapsed = live_curve_.back().first - live_curve_.front().first;
        const double expected = equity_at(backtest_curve_, backtest_curve_.front().first + elapsed);
        report.expected_return = expected / backtest_curve_.front().second - 1.0;
    }

    report.deviation = report.live_return - report.expected_return;
    report.normalized_deviation =
        std::abs(report.deviation) /
        std::max(std::abs(report.expected_return), MIN_EXPECTED_MAGNITUDE);

    report.expected_win_rate = expected_win_rate_;
    const double return_accuracy = 1.0 - std::min(1.0, report.normalized_deviation);
    if (live_trades_ > 0) {
        report.live_win_rate = static_cast<double>(live_wins_) / live_trades_;
        const double win_rate_accuracy =
            1.0 - std::abs(report.live_win_rate - report.expected_win_rate);
        report.accuracy_score = (return_accuracy + win_rate_accuracy) / 2.0;
    } else {
        report.accuracy_score = return_accuracy;
    }
    report.confidence_level = confidence_for(report.accuracy_score);
    report.alert = std::abs(report.deviation) > config_.alert_threshold;

    return report;
}

}  // namespace papertrade
