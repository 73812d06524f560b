// src/risk/risk_manager.cpp
#include "papertrade/risk/risk_manager.hpp"
#include <cmath>
#include <stdexcept>
#include "papertrade/core/logger.hpp"
#include "papertrade/strategy/signal_evaluator.hpp"

namespace papertrade {

std::string risk_profile_to_string(RiskProfile profile) {
    switch (profile) {
        case RiskProfile::CONSERVATIVE:
            return "CONSERVATIVE";
        case RiskProfile::AGGRESSIVE:
            return "AGGRESSIVE";
        case RiskProfile::LEARNING:
            return "LEARNING";
        default:
            return "DEFAULT";
    }
}

std::optional<RiskProfile> risk_profile_from_string(const std::string& s) {
    if (s == "DEFAULT")
        return RiskProfile::DEFAULT;
    if (s == "CONSERVATIVE")
        return RiskProfile::CONSERVATIVE;
    if (s == "AGGRESSIVE")
        return RiskProfile::AGGRESSIVE;
    if (s == "LEARNING")
        return RiskProfile::LEARNING;
    return std::nullopt;
}

nlohmann::json RiskPolicy::to_json() const {
    nlohmann::json j;
    j["starting_balance"] = starting_balance;
    j["max_position_fraction"] = max_position_fraction;
    j["min_confidence"] = min_confidence;
    j["confidence_scale"] = confidence_scale;
    j["stop_mode"] = stop_mode == StopMode::ATR ? "ATR" : "PERCENT";
    j["stop_loss_pct"] = stop_loss_pct;
    j["take_profit_pct"] = take_profit_pct;
    j["atr_period"] = atr_period;
    j["atr_stop_multiple"] = atr_stop_multiple;
    j["atr_target_multiple"] = atr_target_multiple;
    j["fee_rate"] = fee_rate;
    j["min_trade_notional"] = min_trade_notional;
    j["max_concurrent_positions"] = max_concurrent_positions;
    j["max_daily_trades"] = max_daily_trades;
    j["max_drawdown_alert"] = max_drawdown_alert;
    return j;
}

void RiskPolicy::from_json(const nlohmann::json& j) {
    if (j.contains("starting_balance"))
        starting_balance = j.at("starting_balance").get<double>();
    if (j.contains("max_position_fraction"))
        max_position_fraction = j.at("max_position_fraction").get<double>();
    if (j.contains("min_confidence"))
        min_confidence = j.at("min_confidence").get<double>();
    if (j.contains("confidence_scale"))
        confidence_scale = j.at("confidence_scale").get<double>();
    if (j.contains("stop_mode")) {
        const std::string mode = j.at("stop_mode").get<std::string>();
        if (mode == "ATR") {
            stop_mode = StopMode::ATR;
        } else if (mode == "PERCENT") {
            stop_mode = StopMode::PERCENT;
        } else {
            throw std::invalid_argument("Unknown stop_mode: " + mode);
        }
    }
    if (j.contains("stop_loss_pct"))
        stop_loss_pct = j.at("stop_loss_pct").get<double>();
    if (j.contains("take_profit_pct"))
        take_profit_pct = j.at("take_profit_pct").get<double>();
    if (j.contains("atr_period"))
        atr_period = j.at("atr_period").get<int>();
    if (j.contains("atr_stop_multiple"))
        atr_stop_multiple = j.at("atr_stop_multiple").get<double>();
    if (j.contains("atr_target_multiple"))
        atr_target_multiple = j.at("atr_target_multiple").get<double>();
    if (j.contains("fee_rate"))
        fee_rate = j.at("fee_rate").get<double>();
    if (j.contains("min_trade_notional"))
        min_trade_notional = j.at("min_trade_notional").get<double>();
    if (j.contains("max_concurrent_positions"))
        max_concurrent_positions = j.at("max_concurrent_positions").get<int>();
    if (j.contains("max_daily_trades"))
        max_daily_trades = j.at("max_daily_trades").get<int>();
    if (j.contains("max_drawdown_alert"))
        max_drawdown_alert = j.at("max_drawdown_alert").get<double>();
}

Result<void> RiskPolicy::validate() const {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION, message, "RiskPolicy");
    };

    if (starting_balance <= 0.0)
        return invalid("starting_balance must be positive");
    if (max_position_fraction <= 0.0 || max_position_fraction > 1.0)
        return invalid("max_position_fraction must be in (0, 1]");
    if (min_confidence < 0.0 || min_confidence > 1.0)
        return invalid("min_confidence must be in [0, 1]");
    if (confidence_scale <= 0.0)
        return invalid("confidence_scale must be positive");
    if (stop_mode == StopMode::PERCENT) {
        if (stop_loss_pct <= 0.0 || stop_loss_pct >= 1.0)
            return invalid("stop_loss_pct must be in (0, 1)");
        if (take_profit_pct <= 0.0)
            return invalid("take_profit_pct must be positive");
    } else {
        if (atr_period < 1)
            return invalid("atr_period must be positive");
        if (atr_stop_multiple <= 0.0 || atr_target_multiple <= 0.0)
            return invalid("ATR multiples must be positive");
    }
    if (fee_rate < 0.0 || fee_rate >= 0.1)
        return invalid("fee_rate must be in [0, 0.1)");
    if (min_trade_notional < 0.0)
        return invalid("min_trade_notional must be non-negative");
    if (max_concurrent_positions != 1)
        return invalid("only one concurrent position is supported");
    if (max_daily_trades < 0)
        return invalid("max_daily_trades must be non-negative");
    return Result<void>();
}

RiskPolicy risk_policy_for(RiskProfile profile) {
    RiskPolicy policy;
    switch (profile) {
        case RiskProfile::CONSERVATIVE:
            policy.starting_balance = 200000.0;
            policy.max_position_fraction = 0.10;
            policy.min_confidence = 0.8;
            policy.stop_loss_pct = 0.015;
            policy.take_profit_pct = 0.03;
            policy.max_daily_trades = 50;
            break;
        case RiskProfile::AGGRESSIVE:
            policy.starting_balance = 500000.0;
            policy.max_position_fraction = 0.30;
            policy.min_confidence = 0.6;
            policy.stop_loss_pct = 0.03;
            policy.take_profit_pct = 0.06;
            policy.min_trade_notional = 500.0;
            policy.max_daily_trades = 500;
            break;
        case RiskProfile::LEARNING:
            policy.max_position_fraction = 0.15;
            policy.min_confidence = 0.25;
            break;
        case RiskProfile::DEFAULT:
            break;
    }
    return policy;
}

Result<void> validate_policy(const RiskPolicy& policy) {
    return policy.validate();
}

RiskManager::RiskManager(RiskPolicy policy) : policy_(std::move(policy)) {}

int RiskManager::entries_on_day(const Portfolio& portfolio, const Timestamp& ts) const {
    using days = std::chrono::duration<int64_t, std::ratio<86400>>;
    auto day_of = [](const Timestamp& t) {
        return std::chrono::duration_cast<days>(t.time_since_epoch()).count();
    };

    const auto today = day_of(ts);
    int count = 0;
    for (auto it = portfolio.trades.rbegin(); it != portfolio.trades.rend(); ++it) {
        if (day_of(it->entry_time) != today) {
            break;
        }
        ++count;
    }
    if (portfolio.open_position && day_of(portfolio.open_position->order.opened_at) == today) {
        ++count;
    }
    return count;
}

Result<std::pair<Price, Price>> RiskManager::calculate_stops(
    Direction direction, Price entry, const std::vector<PriceSample>& window) const {
    double stop_distance = 0.0;
    double target_distance = 0.0;

    if (policy_.stop_mode == StopMode::ATR) {
        auto atr = indicators::atr(window, policy_.atr_period);
        if (!atr) {
            return make_error<std::pair<Price, Price>>(
                ErrorCode::INSUFFICIENT_DATA,
                "Need " + std::to_string(policy_.atr_period + 1) + " samples for ATR stops",
                "RiskManager");
        }
        stop_distance = *atr * policy_.atr_stop_multiple;
        target_distance = *atr * policy_.atr_target_multiple;
    } else {
        stop_distance = entry * policy_.stop_loss_pct;
        target_distance = entry * policy_.take_profit_pct;
    }

    const double sign = direction_sign(direction);
    const Price stop = entry - sign * stop_distance;
    const Price target = entry + sign * target_distance;

    const bool wrong_side = direction == Direction::LONG ? (stop >= entry || target <= entry)
                                                         : (stop <= entry || target >= entry);
    if (stop <= 0.0 || target <= 0.0 || wrong_side || !std::isfinite(stop) ||
        !std::isfinite(target)) {
        return make_error<std::pair<Price, Price>>(
            ErrorCode::INVALID_STOP_PLACEMENT,
            "Stop " + std::to_string(stop) + " / target " + std::to_string(target) +
                " invalid for " + direction_to_string(direction) + " entry at " +
                std::to_string(entry),
            "RiskManager");
    }
    return std::make_pair(stop, target);
}

Result<Order> RiskManager::evaluate(const Signal& signal, const Portfolio& portfolio,
                                    const std::vector<PriceSample>& window) const {
    if (signal.is_flat()) {
        return make_error<Order>(ErrorCode::INVALID_SIGNAL, "Flat signal carries no order",
                                 "RiskManager");
    }
    if (window.empty()) {
        return make_error<Order>(ErrorCode::INSUFFICIENT_DATA, "No price to size against",
                                 "RiskManager");
    }

    const Price price = window.back().close;

    if (signal.intent == SignalIntent::CLOSE) {
        if (!portfolio.open_position) {
            return make_error<Order>(ErrorCode::INVALID_SIGNAL, "Close signal while flat",
                                     "RiskManager");
        }
        Order order;
        order.action = OrderAction::CLOSE;
        order.direction = portfolio.open_position->order.direction;
        order.entry_price = price;
        order.opened_at = signal.timestamp;
        order.strategy_id = signal.strategy_id;
        return order;
    }

    if (signal.confidence < policy_.min_confidence) {
        return make_error<Order>(ErrorCode::CONFIDENCE_BELOW_THRESHOLD,
                                 "Confidence " + std::to_string(signal.confidence) + " below " +
                                     std::to_string(policy_.min_confidence),
                                 "RiskManager");
    }

    const int open_positions = portfolio.open_position ? 1 : 0;
    if (open_positions >= policy_.max_concurrent_positions) {
        return make_error<Order>(ErrorCode::POSITION_ALREADY_OPEN,
                                 "Maximum concurrent positions reached", "RiskManager");
    }

    if (policy_.max_daily_trades > 0 &&
        entries_on_day(portfolio, signal.timestamp) >= policy_.max_daily_trades) {
        return make_error<Order>(ErrorCode::POSITION_LIMIT_EXCEEDED,
                                 "Daily trade limit of " +
                                     std::to_string(policy_.max_daily_trades) + " reached",
                                 "RiskManager");
    }

    const double equity = portfolio.equity();
    const double fraction =
        std::min(policy_.max_position_fraction, signal.confidence * policy_.confidence_scale);
    const double notional = fraction * equity;
    if (notional < policy_.min_trade_notional || notional <= 0.0) {
        return make_error<Order>(ErrorCode::POSITION_LIMIT_EXCEEDED,
                                 "Notional " + std::to_string(notional) +
                                     " below minimum trade size",
                                 "RiskManager");
    }

    auto stops = calculate_stops(signal.direction, price, window);
    if (stops.is_error()) {
        return forward_error<Order>(stops);
    }

    Order order;
    order.action = OrderAction::OPEN;
    order.direction = signal.direction;
    order.size_fraction = fraction;
    order.notional = notional;
    order.quantity = notional / price;
    order.stop_loss = stops.value().first;
    order.take_profit = stops.value().second;
    order.entry_price = price;
    order.opened_at = signal.timestamp;
    order.strategy_id = signal.strategy_id;

    DEBUG("Sized " << direction_to_string(order.direction) << " fraction=" << fraction
                   << " notional=" << notional << " conf=" << signal.confidence);
    return order;
}

}  // namespace papertrade
