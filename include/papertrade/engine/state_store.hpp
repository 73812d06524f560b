// include/papertrade/engine/state_store.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"
#include "papertrade/live/active_strategy_slot.hpp"
#include "papertrade/live/decision_loop.hpp"
#include "papertrade/optimization/optimization_scheduler.hpp"
#include "papertrade/portfolio/portfolio_ledger.hpp"
#include "papertrade/risk/risk_manager.hpp"

namespace papertrade {

/**
 * @brief Everything needed to resume trading after a restart
 */
struct EngineState {
    Portfolio portfolio;
    std::optional<ActiveStrategy> active;
    RiskProfile risk_profile{RiskProfile::DEFAULT};
    std::optional<LoopSnapshot> window;  // candles the live loop was trading on
    std::vector<ScoredStrategy> winners;  // strategy, score and summary only
    std::vector<DeploymentRecord> deployments;
    Timestamp saved_at;
};

nlohmann::json engine_state_to_json(const EngineState& state);
Result<EngineState> engine_state_from_json(const nlohmann::json& j);

/**
 * @brief JSON file persistence of EngineState
 * Writes go to a temporary file first and replace the target by rename,
 * so a crash mid-save leaves the previous state intact.
 */
class StateStore {
public:
    explicit StateStore(std::string path);

    Result<void> save(const EngineState& state) const;

    /**
     * @return FILE_NOT_FOUND when nothing was saved yet, JSON_PARSE_ERROR
     * or INVALID_DATA for a damaged file
     */
    Result<EngineState> load() const;

    bool exists() const;

    const std::string& path() const {
        return path_;
    }

private:
    std::string path_;
};

}  // namespace papertrade
