// src/portfolio/portfolio_ledger.cpp
#include "papertrade/portfolio/portfolio_ledger.hpp"
#include <cmath>
#include "papertrade/core/logger.hpp"

namespace papertrade {

namespace {

// Tolerance for notional limit checks against floating point sizing
constexpr double LIMIT_EPSILON = 1e-9;

nlohmann::json order_to_json(const Order& order) {
    nlohmann::json j;
    j["action"] = order.action == OrderAction::OPEN ? "OPEN" : "CLOSE";
    j["direction"] = direction_to_string(order.direction);
    j["size_fraction"] = order.size_fraction;
    j["notional"] = order.notional;
    j["quantity"] = order.quantity;
    j["stop_loss"] = order.stop_loss;
    j["take_profit"] = order.take_profit;
    j["entry_price"] = order.entry_price;
    j["opened_at"] = to_epoch_ms(order.opened_at);
    j["strategy_id"] = order.strategy_id;
    return j;
}

Order order_from_json(const nlohmann::json& j) {
    Order order;
    order.action = j.value("action", std::string("OPEN")) == "CLOSE" ? OrderAction::CLOSE
                                                                     : OrderAction::OPEN;
    order.direction = direction_from_string(j.at("direction").get<std::string>());
    order.size_fraction = j.value("size_fraction", 0.0);
    order.notional = j.at("notional").get<double>();
    order.quantity = j.at("quantity").get<double>();
    order.stop_loss = j.at("stop_loss").get<double>();
    order.take_profit = j.at("take_profit").get<double>();
    order.entry_price = j.at("entry_price").get<double>();
    order.opened_at = from_epoch_ms(j.at("opened_at").get<int64_t>());
    order.strategy_id = j.value("strategy_id", std::string());
    return order;
}

nlohmann::json trade_to_json(const Trade& trade) {
    nlohmann::json j;
    j["direction"] = direction_to_string(trade.direction);
    j["entry_price"] = trade.entry_price;
    j["exit_price"] = trade.exit_price;
    j["entry_time"] = to_epoch_ms(trade.entry_time);
    j["exit_time"] = to_epoch_ms(trade.exit_time);
    j["size_fraction"] = trade.size_fraction;
    j["notional"] = trade.notional;
    j["quantity"] = trade.quantity;
    j["realized_pnl"] = trade.realized_pnl;
    j["fees"] = trade.fees;
    j["strategy_id"] = trade.strategy_id;
    j["exit_reason"] = exit_reason_to_string(trade.exit_reason);
    return j;
}

Trade trade_from_json(const nlohmann::json& j) {
    Trade trade;
    trade.direction = direction_from_string(j.at("direction").get<std::string>());
    trade.entry_price = j.at("entry_price").get<double>();
    trade.exit_price = j.at("exit_price").get<double>();
    trade.entry_time = from_epoch_ms(j.at("entry_time").get<int64_t>());
    trade.exit_time = from_epoch_ms(j.at("exit_time").get<int64_t>());
    trade.size_fraction = j.value("size_fraction", 0.0);
    trade.notional = j.value("notional", 0.0);
    trade.quantity = j.at("quantity").get<double>();
    trade.realized_pnl = j.at("realized_pnl").get<double>();
    trade.fees = j.value("fees", 0.0);
    trade.strategy_id = j.value("strategy_id", std::string());
    trade.exit_reason = exit_reason_from_string(j.value("exit_reason", std::string("MANUAL")));
    return trade;
}

bool stops_on_correct_side(const Order& order) {
    if (order.stop_loss <= 0.0 || order.take_profit <= 0.0) {
        return false;
    }
    if (order.direction == Direction::LONG) {
        return order.stop_loss < order.entry_price && order.take_profit > order.entry_price;
    }
    return order.stop_loss > order.entry_price && order.take_profit < order.entry_price;
}

}  // namespace

double Portfolio::realized_pnl() const {
    double total = 0.0;
    for (const auto& trade : trades) {
        total += trade.realized_pnl;
    }
    return total;
}

nlohmann::json portfolio_to_json(const Portfolio& portfolio) {
    nlohmann::json j;
    j["starting_balance"] = portfolio.starting_balance;
    j["cash"] = portfolio.cash;

    if (portfolio.open_position) {
        nlohmann::json pos;
        pos["order"] = order_to_json(portfolio.open_position->order);
        pos["entry_fee"] = portfolio.open_position->entry_fee;
        pos["last_price"] = portfolio.open_position->last_price;
        pos["unrealized_pnl"] = portfolio.open_position->unrealized_pnl;
        j["open_position"] = pos;
    } else {
        j["open_position"] = nullptr;
    }

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : portfolio.trades) {
        j["trades"].push_back(trade_to_json(trade));
    }

    j["equity_curve"] = nlohmann::json::array();
    for (const auto& [ts, value] : portfolio.equity_curve) {
        j["equity_curve"].push_back({to_epoch_ms(ts), value});
    }

    j["limits"] = {{"max_position_fraction", portfolio.limits.max_position_fraction},
                   {"fee_rate", portfolio.limits.fee_rate},
                   {"max_equity_points", portfolio.limits.max_equity_points}};
    return j;
}

Result<Portfolio> portfolio_from_json(const nlohmann::json& j) {
    Portfolio portfolio;
    try {
        portfolio.starting_balance = j.at("starting_balance").get<double>();
        portfolio.cash = j.at("cash").get<double>();

        if (j.contains("open_position") && !j.at("open_position").is_null()) {
            const auto& pos = j.at("open_position");
            Position position;
            position.order = order_from_json(pos.at("order"));
            position.entry_fee = pos.value("entry_fee", 0.0);
            position.last_price = pos.value("last_price", position.order.entry_price);
            position.unrealized_pnl = pos.value("unrealized_pnl", 0.0);
            portfolio.open_position = position;
        }

        if (j.contains("trades")) {
            for (const auto& t : j.at("trades")) {
                portfolio.trades.push_back(trade_from_json(t));
            }
        }

        if (j.contains("equity_curve")) {
            for (const auto& point : j.at("equity_curve")) {
                portfolio.equity_curve.emplace_back(from_epoch_ms(point.at(0).get<int64_t>()),
                                                    point.at(1).get<double>());
            }
        }

        if (j.contains("limits")) {
            const auto& limits = j.at("limits");
            portfolio.limits.max_position_fraction =
                limits.value("max_position_fraction", portfolio.limits.max_position_fraction);
            portfolio.limits.fee_rate = limits.value("fee_rate", portfolio.limits.fee_rate);
            portfolio.limits.max_equity_points =
                limits.value("max_equity_points", portfolio.limits.max_equity_points);
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<Portfolio>(ErrorCode::JSON_PARSE_ERROR,
                                     std::string("Malformed portfolio: ") + e.what(),
                                     "PortfolioLedger");
    }

    if (portfolio.starting_balance <= 0.0 || portfolio.cash < 0.0) {
        return make_error<Portfolio>(ErrorCode::INVALID_DATA,
                                     "Portfolio balances must be non-negative",
                                     "PortfolioLedger");
    }
    return portfolio;
}

PortfolioLedger::PortfolioLedger(double starting_balance, LedgerLimits limits) {
    portfolio_.starting_balance = starting_balance;
    portfolio_.cash = starting_balance;
    portfolio_.limits = limits;
}

PortfolioLedger::PortfolioLedger(Portfolio portfolio) : portfolio_(std::move(portfolio)) {}

Result<void> PortfolioLedger::apply_order(const Order& order) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (order.action == OrderAction::CLOSE) {
        if (!portfolio_.open_position) {
            return make_error<void>(ErrorCode::NO_OPEN_POSITION, "No open position to close",
                                    "PortfolioLedger");
        }
        if (order.entry_price <= 0.0) {
            return make_error<void>(ErrorCode::INVALID_ORDER, "Close order requires a price",
                                    "PortfolioLedger");
        }
        auto closed = close_position_unsafe(order.entry_price, order.opened_at,
                                            ExitReason::SIGNAL_CLOSE);
        if (closed.is_error()) {
            return forward_error<void>(closed);
        }
        return Result<void>();
    }

    if (portfolio_.open_position) {
        return make_error<void>(ErrorCode::POSITION_ALREADY_OPEN,
                                "A position is already open for " +
                                    portfolio_.open_position->order.strategy_id,
                                "PortfolioLedger");
    }

    if (order.direction == Direction::FLAT || order.entry_price <= 0.0 || order.notional <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ORDER,
                                "Open order needs a direction, a price and a positive notional",
                                "PortfolioLedger");
    }

    if (!stops_on_correct_side(order)) {
        return make_error<void>(ErrorCode::INVALID_STOP_PLACEMENT,
                                "Stop-loss or take-profit on the wrong side of entry",
                                "PortfolioLedger");
    }

    const double equity = portfolio_.equity();
    const double max_notional = portfolio_.limits.max_position_fraction * equity;
    if (order.notional > max_notional * (1.0 + LIMIT_EPSILON)) {
        return make_error<void>(ErrorCode::POSITION_LIMIT_EXCEEDED,
                                "Notional " + std::to_string(order.notional) +
                                    " exceeds limit " + std::to_string(max_notional),
                                "PortfolioLedger");
    }

    const double fee = order.notional * portfolio_.limits.fee_rate;
    if (order.notional + fee > equity * (1.0 + LIMIT_EPSILON)) {
        return make_error<void>(ErrorCode::INSUFFICIENT_FUNDS,
                                "Notional " + std::to_string(order.notional) +
                                    " exceeds equity " + std::to_string(equity),
                                "PortfolioLedger");
    }

    Position position;
    position.order = order;
    if (position.order.quantity <= 0.0) {
        position.order.quantity = order.notional / order.entry_price;
    }
    position.entry_fee = fee;
    position.last_price = order.entry_price;

    portfolio_.cash -= fee;
    portfolio_.open_position = position;
    ++mutations_;

    DEBUG("Opened " << direction_to_string(order.direction) << " " << position.order.quantity
                    << " @ " << order.entry_price << " notional=" << order.notional
                    << " SL=" << order.stop_loss << " TP=" << order.take_profit << " ["
                    << order.strategy_id << "]");
    return Result<void>();
}

Result<Trade> PortfolioLedger::close_position_unsafe(Price price, const Timestamp& ts,
                                                     ExitReason reason) {
    if (!portfolio_.open_position) {
        return make_error<Trade>(ErrorCode::NO_OPEN_POSITION, "No open position to close",
                                 "PortfolioLedger");
    }

    const Position& position = *portfolio_.open_position;
    const Order& order = position.order;

    double gross = direction_sign(order.direction) * (price - order.entry_price) * order.quantity;
    const double exit_fee = price * order.quantity * portfolio_.limits.fee_rate;

    portfolio_.cash += gross - exit_fee;
    if (portfolio_.cash < 0.0) {
        // Losses beyond the account are absorbed by the liquidation
        WARN("Account liquidated, loss capped at remaining cash");
        gross -= portfolio_.cash;
        portfolio_.cash = 0.0;
    }

    Trade trade;
    trade.direction = order.direction;
    trade.entry_price = order.entry_price;
    trade.exit_price = price;
    trade.entry_time = order.opened_at;
    trade.exit_time = ts;
    trade.size_fraction = order.size_fraction;
    trade.notional = order.notional;
    trade.quantity = order.quantity;
    trade.fees = position.entry_fee + exit_fee;
    trade.realized_pnl = gross - trade.fees;
    trade.strategy_id = order.strategy_id;
    trade.exit_reason = reason;

    portfolio_.trades.push_back(trade);
    portfolio_.open_position.reset();
    ++mutations_;

    DEBUG("Closed " << direction_to_string(trade.direction) << " @ " << price << " ("
                    << exit_reason_to_string(reason) << ") pnl=" << trade.realized_pnl
                    << " cash=" << portfolio_.cash);
    return trade;
}

Result<Trade> PortfolioLedger::close_position(Price price, const Timestamp& ts, ExitReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (price <= 0.0) {
        return make_error<Trade>(ErrorCode::INVALID_ARGUMENT, "Close price must be positive",
                                 "PortfolioLedger");
    }
    return close_position_unsafe(price, ts, reason);
}

std::optional<Trade> PortfolioLedger::check_exits(Price price, const Timestamp& ts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!portfolio_.open_position) {
        return std::nullopt;
    }

    const Order& order = portfolio_.open_position->order;
    std::optional<ExitReason> reason;
    if (order.direction == Direction::LONG) {
        if (price <= order.stop_loss) {
            reason = ExitReason::STOP_LOSS;
        } else if (price >= order.take_profit) {
            reason = ExitReason::TAKE_PROFIT;
        }
    } else {
        if (price >= order.stop_loss) {
            reason = ExitReason::STOP_LOSS;
        } else if (price <= order.take_profit) {
            reason = ExitReason::TAKE_PROFIT;
        }
    }

    if (!reason) {
        return std::nullopt;
    }

    auto closed = close_position_unsafe(price, ts, *reason);
    if (closed.is_error()) {
        ERROR("Exit failed: " << closed.error()->what());
        return std::nullopt;
    }
    return closed.take_value();
}

void PortfolioLedger::mark_to_market(Price price, const Timestamp& ts) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (portfolio_.open_position && price > 0.0) {
        Position& position = *portfolio_.open_position;
        position.last_price = price;
        position.unrealized_pnl = direction_sign(position.order.direction) *
                                  (price - position.order.entry_price) * position.order.quantity;

        if (portfolio_.equity() <= 0.0) {
            WARN("Equity exhausted at " << price << ", liquidating position");
            auto closed = close_position_unsafe(price, ts, ExitReason::MANUAL);
            if (closed.is_error()) {
                ERROR("Liquidation failed: " << closed.error()->what());
            }
        }
    }

    append_equity_point_unsafe(ts);
    ++mutations_;
}

void PortfolioLedger::append_equity_point_unsafe(const Timestamp& ts) {
    auto& curve = portfolio_.equity_curve;
    curve.emplace_back(ts, portfolio_.equity());

    const size_t cap = portfolio_.limits.max_equity_points;
    if (cap > 0 && curve.size() > cap) {
        curve.erase(curve.begin(), curve.begin() + static_cast<std::ptrdiff_t>(curve.size() - cap));
    }
}

Portfolio PortfolioLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return portfolio_;
}

Portfolio PortfolioLedger::account_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Portfolio account;
    account.starting_balance = portfolio_.starting_balance;
    account.cash = portfolio_.cash;
    account.open_position = portfolio_.open_position;
    account.trades = portfolio_.trades;
    account.limits = portfolio_.limits;
    return account;
}

std::optional<Position> PortfolioLedger::open_position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return portfolio_.open_position;
}

double PortfolioLedger::equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return portfolio_.equity();
}

bool PortfolioLedger::is_flat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return portfolio_.is_flat();
}

size_t PortfolioLedger::trade_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return portfolio_.trades.size();
}

void PortfolioLedger::set_limits(const LedgerLimits& limits) {
    std::lock_guard<std::mutex> lock(mutex_);
    portfolio_.limits = limits;
}

Result<void> PortfolioLedger::reset_balance(double starting_balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (portfolio_.has_history()) {
        return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                "Cannot reset balance of a ledger with trading history",
                                "PortfolioLedger");
    }
    if (starting_balance <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Starting balance must be positive",
                                "PortfolioLedger");
    }
    portfolio_.starting_balance = starting_balance;
    portfolio_.cash = starting_balance;
    portfolio_.equity_curve.clear();
    return Result<void>();
}

uint64_t PortfolioLedger::mutation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mutations_;
}

}  // namespace papertrade
