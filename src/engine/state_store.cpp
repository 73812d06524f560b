// src/engine/state_store.cpp
#include "papertrade/engine/state_store.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include "papertrade/core/logger.hpp"

namespace papertrade {

namespace {

nlohmann::json active_to_json(const ActiveStrategy& active) {
    nlohmann::json j;
    j["strategy"] = strategy_to_json(active.strategy);
    j["score"] = active.score;
    j["backtest_win_rate"] = active.backtest_win_rate;
    j["activated_at"] = to_epoch_ms(active.activated_at);
    nlohmann::json curve = nlohmann::json::array();
    for (const auto& [ts, equity] : active.backtest_curve) {
        curve.push_back({to_epoch_ms(ts), equity});
    }
    j["backtest_curve"] = curve;
    return j;
}

Result<ActiveStrategy> active_from_json(const nlohmann::json& j) {
    if (!j.contains("strategy")) {
        return make_error<ActiveStrategy>(ErrorCode::INVALID_DATA,
                                          "Active strategy entry has no strategy", "StateStore");
    }
    auto strategy = strategy_from_json(j.at("strategy"));
    if (strategy.is_error()) {
        return forward_error<ActiveStrategy>(strategy);
    }

    ActiveStrategy active;
    active.strategy = strategy.take_value();
    active.score = j.value("score", 0.0);
    active.backtest_win_rate = j.value("backtest_win_rate", 0.0);
    active.activated_at = from_epoch_ms(j.value("activated_at", int64_t{0}));
    if (j.contains("backtest_curve")) {
        for (const auto& point : j.at("backtest_curve")) {
            active.backtest_curve.emplace_back(from_epoch_ms(point.at(0).get<int64_t>()),
                                               point.at(1).get<double>());
        }
    }
    return active;
}

nlohmann::json winner_to_json(const ScoredStrategy& winner) {
    nlohmann::json j;
    j["strategy"] = strategy_to_json(winner.strategy);
    j["score"] = winner.score;
    j["win_rate"] = winner.backtest.summary.win_rate;
    j["max_drawdown"] = winner.backtest.summary.max_drawdown;
    j["total_return"] = winner.backtest.summary.total_return;
    return j;
}

Result<ScoredStrategy> winner_from_json(const nlohmann::json& j) {
    auto strategy = strategy_from_json(j.at("strategy"));
    if (strategy.is_error()) {
        return forward_error<ScoredStrategy>(strategy);
    }
    ScoredStrategy winner;
    winner.strategy = strategy.take_value();
    winner.score = j.at("score").get<double>();
    winner.backtest.strategy_id = winner.strategy.id;
    winner.backtest.summary.win_rate = j.value("win_rate", 0.0);
    winner.backtest.summary.max_drawdown = j.value("max_drawdown", 0.0);
    winner.backtest.summary.total_return = j.value("total_return", 0.0);
    return winner;
}

}  // namespace

nlohmann::json engine_state_to_json(const EngineState& state) {
    nlohmann::json j;
    j["version"] = 2;
    j["saved_at"] = to_epoch_ms(state.saved_at);
    j["risk_profile"] = risk_profile_to_string(state.risk_profile);
    j["portfolio"] = portfolio_to_json(state.portfolio);
    j["active_strategy"] = state.active ? active_to_json(*state.active) : nlohmann::json(nullptr);
    j["window"] = state.window ? state.window->to_json() : nlohmann::json(nullptr);
    j["winners"] = nlohmann::json::array();
    for (const auto& winner : state.winners) {
        j["winners"].push_back(winner_to_json(winner));
    }
    j["deployments"] = nlohmann::json::array();
    for (const auto& deployment : state.deployments) {
        j["deployments"].push_back(deployment.to_json());
    }
    return j;
}

Result<EngineState> engine_state_from_json(const nlohmann::json& j) {
    EngineState state;
    try {
        if (!j.contains("portfolio")) {
            return make_error<EngineState>(ErrorCode::INVALID_DATA, "State has no portfolio",
                                           "StateStore");
        }
        auto portfolio = portfolio_from_json(j.at("portfolio"));
        if (portfolio.is_error()) {
            return forward_error<EngineState>(portfolio);
        }
        state.portfolio = portfolio.take_value();

        if (j.contains("risk_profile")) {
            auto profile = risk_profile_from_string(j.at("risk_profile").get<std::string>());
            if (!profile) {
                return make_error<EngineState>(ErrorCode::INVALID_DATA,
                                               "Unknown risk profile in state", "StateStore");
            }
            state.risk_profile = *profile;
        }

        if (j.contains("active_strategy") && !j.at("active_strategy").is_null()) {
            auto active = active_from_json(j.at("active_strategy"));
            if (active.is_error()) {
                return forward_error<EngineState>(active);
            }
            state.active = active.take_value();
        }

        // Files written before version 2 carry none of the following
        if (j.contains("window") && !j.at("window").is_null()) {
            state.window = LoopSnapshot::from_json(j.at("window"));
        }
        if (j.contains("winners")) {
            for (const auto& entry : j.at("winners")) {
                auto winner = winner_from_json(entry);
                if (winner.is_error()) {
                    return forward_error<EngineState>(winner);
                }
                state.winners.push_back(winner.take_value());
            }
        }
        if (j.contains("deployments")) {
            for (const auto& entry : j.at("deployments")) {
                state.deployments.push_back(DeploymentRecord::from_json(entry));
            }
        }

        state.saved_at = from_epoch_ms(j.value("saved_at", int64_t{0}));
    } catch (const nlohmann::json::exception& e) {
        return make_error<EngineState>(ErrorCode::JSON_PARSE_ERROR,
                                       std::string("Malformed engine state: ") + e.what(),
                                       "StateStore");
    } catch (const std::invalid_argument& e) {
        return make_error<EngineState>(ErrorCode::INVALID_DATA,
                                       std::string("Invalid engine state: ") + e.what(),
                                       "StateStore");
    }
    return state;
}

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

bool StateStore::exists() const {
    return std::filesystem::exists(path_);
}

Result<void> StateStore::save(const EngineState& state) const {
    std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot create state directory " +
                                        target.parent_path().string() + ": " + ec.message(),
                                    "StateStore");
        }
    }

    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open state file for writing: " + temp.string(),
                                    "StateStore");
        }
        file << engine_state_to_json(state).dump(2);
        if (!file) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to write state file: " + temp.string(), "StateStore");
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to replace state file " + path_ + ": " + ec.message(),
                                "StateStore");
    }
    DEBUG("Saved engine state to " << path_);
    return Result<void>();
}

Result<EngineState> StateStore::load() const {
    if (!exists()) {
        return make_error<EngineState>(ErrorCode::FILE_NOT_FOUND, "No saved state at " + path_,
                                       "StateStore");
    }
    std::ifstream file(path_);
    if (!file.is_open()) {
        return make_error<EngineState>(ErrorCode::FILE_IO_ERROR,
                                       "Failed to open state file: " + path_, "StateStore");
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        return make_error<EngineState>(ErrorCode::JSON_PARSE_ERROR,
                                       "Malformed state file " + path_ + ": " + e.what(),
                                       "StateStore");
    }
    return engine_state_from_json(j);
}

}  // namespace papertrade
