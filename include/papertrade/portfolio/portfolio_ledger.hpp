// include/papertrade/portfolio/portfolio_ledger.hpp
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"

namespace papertrade {

/**
 * @brief The single open position and its running valuation
 */
struct Position {
    Order order;
    double entry_fee{0.0};
    Price last_price{0.0};
    double unrealized_pnl{0.0};
};

/**
 * @brief Limits the ledger enforces on its own, independent of sizing
 */
struct LedgerLimits {
    double max_position_fraction{1.0};
    double fee_rate{0.0};
    size_t max_equity_points{0};  // 0 keeps the whole curve
};

/**
 * @brief Virtual account state
 *
 * Margin-style accounting: equity = cash + unrealized P&L, and cash only
 * moves by realized P&L and fees.
 */
struct Portfolio {
    double starting_balance{100000.0};
    double cash{100000.0};
    std::optional<Position> open_position;
    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    LedgerLimits limits;

    double unrealized_pnl() const {
        return open_position ? open_position->unrealized_pnl : 0.0;
    }

    double equity() const {
        return cash + unrealized_pnl();
    }

    bool is_flat() const {
        return !open_position.has_value();
    }

    bool has_history() const {
        return open_position.has_value() || !trades.empty();
    }

    double realized_pnl() const;
};

nlohmann::json portfolio_to_json(const Portfolio& portfolio);
Result<Portfolio> portfolio_from_json(const nlohmann::json& j);

/**
 * @brief Owner of the Portfolio and the only code that mutates it
 *
 * Position state machine: Flat -> Open on an OPEN order, Open -> Flat on
 * a CLOSE order, a stop/target hit in check_exits() or close_position().
 * All methods are thread-safe; readers take a snapshot copy.
 */
class PortfolioLedger {
public:
    explicit PortfolioLedger(double starting_balance = 100000.0, LedgerLimits limits = {});
    explicit PortfolioLedger(Portfolio portfolio);

    /**
     * @brief Apply a sized order
     * @return POSITION_ALREADY_OPEN, NO_OPEN_POSITION, INVALID_ORDER,
     * POSITION_LIMIT_EXCEEDED or INSUFFICIENT_FUNDS on rejection; the
     * portfolio is unchanged when an error is returned
     */
    Result<void> apply_order(const Order& order);

    /**
     * @brief Revalue the open position and append an equity curve point
     */
    void mark_to_market(Price price, const Timestamp& ts);

    /**
     * @brief Close the open position if the price reached its stop or target
     * @return The closed trade, nullopt if flat or nothing was hit
     */
    std::optional<Trade> check_exits(Price price, const Timestamp& ts);

    /**
     * @brief Close the open position at the given price
     * @return NO_OPEN_POSITION when flat
     */
    Result<Trade> close_position(Price price, const Timestamp& ts, ExitReason reason);

    Portfolio snapshot() const;

    /**
     * @brief Snapshot without the equity curve, for per-sample decisions
     */
    Portfolio account_snapshot() const;

    std::optional<Position> open_position() const;
    double equity() const;
    bool is_flat() const;
    size_t trade_count() const;

    /**
     * @brief Change limits without touching balances or history
     */
    void set_limits(const LedgerLimits& limits);

    /**
     * @brief Start over with a fresh balance
     * @return INVALID_STATE_TRANSITION once the ledger has any history
     */
    Result<void> reset_balance(double starting_balance);

    /**
     * @brief Total number of state changes applied so far
     * Orders, exits and marks each count as one
     */
    uint64_t mutation_count() const;

private:
    Result<Trade> close_position_unsafe(Price price, const Timestamp& ts, ExitReason reason);
    void append_equity_point_unsafe(const Timestamp& ts);

    Portfolio portfolio_;
    uint64_t mutations_{0};
    mutable std::mutex mutex_;
};

}  // namespace papertrade
