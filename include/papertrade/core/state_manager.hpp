// include/papertrade/core/state_manager.hpp
#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "papertrade/core/error.hpp"
#include "papertrade/core/types.hpp"

namespace papertrade {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType { ENGINE, DECISION_LOOP, OPTIMIZATION_SCHEDULER };

std::string component_state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
    std::optional<std::chrono::steady_clock::time_point> running_since;
};

/**
 * @brief Process-wide registry of component lifecycle states
 *
 * Transitions are validated: INITIALIZED -> RUNNING -> {PAUSED, STOPPED},
 * STOPPED -> INITIALIZED, any -> ERR_STATE.
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    /**
     * @brief Time the component has spent in RUNNING since its last start
     * @return Zero if the component is unknown or not running
     */
    std::chrono::milliseconds uptime(const std::string& component_id) const;

    /**
     * @brief True when at least one component is registered and none is in ERR_STATE
     */
    bool is_healthy() const;
    std::vector<std::string> get_all_components() const;

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::recursive_mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

    /**
     * @brief Move every running or paused component to STOPPED
     * Called once at process exit, after the owners had their chance to stop
     */
    void shutdown();

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<void> validate_transition(ComponentState current_state, ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace papertrade
