// src/core/state_manager.cpp
#include "decision_gate/core/state_manager.hpp"
#include <algorithm>
#include <utility>

namespace decision_gate {

namespace {

constexpr const char* kComponent = "StateManager";

using Transition = std::pair<ComponentState, ComponentState>;

const std::vector<Transition>& allowed_transitions() {
    static const std::vector<Transition> table = {
        {ComponentState::INITIALIZED, ComponentState::RUNNING},
        {ComponentState::INITIALIZED, ComponentState::ERR_STATE},
        {ComponentState::INITIALIZED, ComponentState::STOPPED},
        {ComponentState::RUNNING, ComponentState::PAUSED},
        {ComponentState::RUNNING, ComponentState::STOPPED},
        {ComponentState::RUNNING, ComponentState::ERR_STATE},
        {ComponentState::PAUSED, ComponentState::RUNNING},
        {ComponentState::PAUSED, ComponentState::STOPPED},
        {ComponentState::PAUSED, ComponentState::ERR_STATE},
        {ComponentState::ERR_STATE, ComponentState::INITIALIZED},
        {ComponentState::ERR_STATE, ComponentState::STOPPED},
        {ComponentState::STOPPED, ComponentState::INITIALIZED},
    };
    return table;
}

template <typename T>
Result<T> not_found(const std::string& component_id) {
    return make_error<T>(ErrorCode::DATA_NOT_FOUND,
                         "No component registered as '" + component_id + "'", kComponent);
}

}  // namespace

std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::PAUSED:
            return "PAUSED";
        case ComponentState::ERR_STATE:
            return "ERROR";
        case ComponentState::STOPPED:
            return "STOPPED";
    }
    return "UNKNOWN";
}

std::string component_type_to_string(ComponentType type) {
    switch (type) {
        case ComponentType::REGIME_CLASSIFIER:
            return "REGIME_CLASSIFIER";
        case ComponentType::FACT_VALIDATOR:
            return "FACT_VALIDATOR";
        case ComponentType::SCHEMA_GATE:
            return "SCHEMA_GATE";
        case ComponentType::RISK_GATE:
            return "RISK_GATE";
        case ComponentType::DECISION_PIPELINE:
            return "DECISION_PIPELINE";
    }
    return "UNKNOWN";
}

bool StateManager::is_transition_allowed(ComponentState from, ComponentState to) {
    const auto& table = allowed_transitions();
    return std::find(table.begin(), table.end(), Transition{from, to}) != table.end();
}

Result<void> StateManager::register_component(const ComponentInfo& info) {
    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component id is empty",
                                kComponent);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!components_.emplace(info.id, info).second) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component '" + info.id + "' is already registered", kComponent);
    }
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.erase(component_id) == 0) {
        return not_found<void>(component_id);
    }
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return not_found<ComponentInfo>(component_id);
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return not_found<void>(component_id);
    }

    ComponentInfo& info = it->second;
    if (!is_transition_allowed(info.state, new_state)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component '" + component_id + "' cannot move from " +
                                    component_state_to_string(info.state) + " to " +
                                    component_state_to_string(new_state),
                                kComponent);
    }

    info.state = new_state;
    info.error_message = new_state == ComponentState::ERR_STATE ? error_message : "";
    info.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> StateManager::update_metrics(const std::string& component_id,
                                          const std::unordered_map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return not_found<void>(component_id);
    }

    it->second.metrics = metrics;
    it->second.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

bool StateManager::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_healthy_unsafe();
}

bool StateManager::is_healthy_unsafe() const {
    if (components_.empty())
        return false;

    return std::all_of(components_.begin(), components_.end(), [](const auto& entry) {
        const ComponentState state = entry.second.state;
        return state == ComponentState::INITIALIZED || state == ComponentState::RUNNING;
    });
}

std::vector<std::string> StateManager::get_all_components() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(components_.size());
    for (const auto& [id, info] : components_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

nlohmann::json StateManager::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json components = nlohmann::json::object();
    for (const auto& [id, info] : components_) {
        nlohmann::json entry = {{"type", component_type_to_string(info.type)},
                                {"state", component_state_to_string(info.state)},
                                {"metrics", info.metrics}};
        if (!info.error_message.empty()) {
            entry["error"] = info.error_message;
        }
        components[id] = std::move(entry);
    }

    return {{"healthy", is_healthy_unsafe()}, {"components", std::move(components)}};
}

}  // namespace decision_gate
