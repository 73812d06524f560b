// include/papertrade/risk/risk_manager.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "papertrade/core/config_base.hpp"
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/portfolio/portfolio_ledger.hpp"

namespace papertrade {

/**
 * @brief Named presets selectable at runtime
 */
enum class RiskProfile { DEFAULT, CONSERVATIVE, AGGRESSIVE, LEARNING };

std::string risk_profile_to_string(RiskProfile profile);
std::optional<RiskProfile> risk_profile_from_string(const std::string& s);

/**
 * @brief How stop-loss and take-profit distances are derived
 */
enum class StopMode { PERCENT, ATR };

/**
 * @brief Risk limits and sizing rules applied to every entry
 */
struct RiskPolicy : public ConfigBase {
    double starting_balance{100000.0};     // applied only to a ledger without history
    double max_position_fraction{0.20};    // of equity per position
    double min_confidence{0.2};            // signals below are rejected
    double confidence_scale{1.0};          // size = min(max_fraction, conf * scale)
    StopMode stop_mode{StopMode::PERCENT};
    double stop_loss_pct{0.02};
    double take_profit_pct{0.04};
    int atr_period{14};
    double atr_stop_multiple{2.0};
    double atr_target_multiple{4.0};
    double fee_rate{0.0};                  // fraction of notional per fill
    double min_trade_notional{100.0};
    int max_concurrent_positions{1};
    int max_daily_trades{200};             // entries per UTC day, 0 disables
    double max_drawdown_alert{0.15};       // drawdown that raises a warning

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Reject unusable limits with INVALID_CONFIGURATION
     */
    Result<void> validate() const override;

    LedgerLimits ledger_limits() const {
        LedgerLimits limits;
        limits.max_position_fraction = max_position_fraction;
        limits.fee_rate = fee_rate;
        return limits;
    }
};

/**
 * @brief Preset policy for a profile
 */
RiskPolicy risk_policy_for(RiskProfile profile);

/**
 * @brief Validate a policy before it goes live
 * The only configuration check that is fatal at startup
 */
Result<void> validate_policy(const RiskPolicy& policy);

/**
 * @brief Turns a directional signal into a bounded order or a typed rejection
 *
 * Stateless apart from its policy; the caller passes the portfolio
 * snapshot and the market window the signal was computed on.
 */
class RiskManager {
public:
    explicit RiskManager(RiskPolicy policy);

    /**
     * @brief Size and bound an order for a signal
     * @param signal Non-flat signal, ENTRY or CLOSE intent
     * @param portfolio Snapshot of the account the order would apply to
     * @param window Recent samples, newest last; the newest close is the entry price
     * @return Order, or INVALID_SIGNAL, CONFIDENCE_BELOW_THRESHOLD,
     * POSITION_ALREADY_OPEN, POSITION_LIMIT_EXCEEDED, INVALID_STOP_PLACEMENT,
     * INSUFFICIENT_DATA
     */
    Result<Order> evaluate(const Signal& signal, const Portfolio& portfolio,
                           const std::vector<PriceSample>& window) const;

    /**
     * @brief Stop and target for an entry at price
     * @return INVALID_STOP_PLACEMENT if either level is non-positive or on
     * the wrong side of entry; INSUFFICIENT_DATA when ATR cannot be computed
     */
    Result<std::pair<Price, Price>> calculate_stops(Direction direction, Price entry,
                                                    const std::vector<PriceSample>& window) const;

    const RiskPolicy& get_policy() const {
        return policy_;
    }

private:
    int entries_on_day(const Portfolio& portfolio, const Timestamp& ts) const;

    RiskPolicy policy_;
};

}  // namespace papertrade
