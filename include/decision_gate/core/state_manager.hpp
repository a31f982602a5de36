// include/decision_gate/core/state_manager.hpp
#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>
#include "decision_gate/core/error.hpp"
#include "decision_gate/core/types.hpp"

namespace decision_gate {

/**
 * Lifecycle of a registered component:
 *
 *   INITIALIZED -> RUNNING <-> PAUSED
 *   any live state -> STOPPED | ERR_STATE
 *   STOPPED | ERR_STATE -> INITIALIZED
 */
enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType {
    REGIME_CLASSIFIER,
    FACT_VALIDATOR,
    SCHEMA_GATE,
    RISK_GATE,
    DECISION_PIPELINE
};

std::string component_state_to_string(ComponentState state);
std::string component_type_to_string(ComponentType type);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;  // set only in ERR_STATE
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of component lifecycle state and published counters
 *
 * Pipelines register on construction and publish their metrics after each evaluation.
 * All methods are thread-safe.
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager manager;
        return manager;
    }

    /// INVALID_ARGUMENT for an empty or duplicate id
    Result<void> register_component(const ComponentInfo& info);

    /// DATA_NOT_FOUND for an unknown id, likewise for the other lookups below
    Result<void> unregister_component(const std::string& component_id);

    Result<ComponentInfo> get_state(const std::string& component_id) const;

    /**
     * @brief Move a component to a new lifecycle state
     * @param error_message Kept only when new_state is ERR_STATE
     * @return INVALID_ARGUMENT naming both states when the move is not allowed
     */
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    /// Replaces the component's metrics wholesale
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);

    static bool is_transition_allowed(ComponentState from, ComponentState to);

    /// True when at least one component is registered and none is paused, stopped or failed
    bool is_healthy() const;

    std::vector<std::string> get_all_components() const;

    /// {"healthy": bool, "components": {id: {type, state, error, metrics}}}
    nlohmann::json to_json() const;

    static void reset_instance() {
        auto& manager = instance();
        std::lock_guard<std::mutex> lock(manager.mutex_);
        manager.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    bool is_healthy_unsafe() const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

}  // namespace decision_gate
