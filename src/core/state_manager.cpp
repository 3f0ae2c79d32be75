// src/core/state_manager.cpp
#include "copy_ngin/core/state_manager.hpp"
#include <algorithm>
#include "copy_ngin/core/logger.hpp"

namespace copy_ngin {

namespace {

Result<void> not_found(const std::string& component_id) {
    return make_error<void>(ErrorCode::DATA_NOT_FOUND, "Component not found: " + component_id,
                            "StateManager");
}

}  // namespace

const char* state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::ERR_STATE:
            return "ERR_STATE";
        case ComponentState::STOPPED:
            return "STOPPED";
    }
    return "UNKNOWN";
}

Result<void> StateManager::register_component(const ComponentInfo& info) {
    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component ID cannot be empty",
                                "StateManager");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!components_.emplace(info.id, info).second) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component already registered: " + info.id, "StateManager");
    }
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.erase(component_id) == 0) {
        return not_found(component_id);
    }
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<ComponentInfo>(ErrorCode::DATA_NOT_FOUND,
                                         "Component not found: " + component_id, "StateManager");
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return not_found(component_id);
    }

    ComponentInfo& info = it->second;
    if (!is_valid_transition(info.state, new_state)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                std::string("Invalid state transition for ") + component_id +
                                    ": " + state_to_string(info.state) + " -> " +
                                    state_to_string(new_state),
                                "StateManager");
    }

    DEBUG(component_id << ": " << state_to_string(info.state) << " -> "
                       << state_to_string(new_state));
    info.state = new_state;
    info.last_update = std::chrono::system_clock::now();
    info.error_message = new_state == ComponentState::ERR_STATE ? error_message : "";
    return Result<void>();
}

Result<void> StateManager::update_metrics(
    const std::string& component_id, const std::unordered_map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return not_found(component_id);
    }

    for (const auto& [name, value] : metrics) {
        it->second.metrics[name] = value;
    }
    it->second.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

bool StateManager::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.empty()) {
        return false;
    }
    return std::none_of(components_.begin(), components_.end(), [](const auto& entry) {
        return entry.second.state == ComponentState::ERR_STATE;
    });
}

std::vector<std::string> StateManager::get_all_components() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(components_.size());
    for (const auto& [id, _] : components_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool StateManager::is_valid_transition(ComponentState from, ComponentState to) {
    switch (from) {
        case ComponentState::INITIALIZED:
            return to == ComponentState::RUNNING || to == ComponentState::STOPPED ||
                   to == ComponentState::ERR_STATE;
        case ComponentState::RUNNING:
            return to == ComponentState::STOPPED || to == ComponentState::ERR_STATE;
        case ComponentState::ERR_STATE:
            return to == ComponentState::INITIALIZED || to == ComponentState::STOPPED;
        case ComponentState::STOPPED:
            return to == ComponentState::INITIALIZED || to == ComponentState::RUNNING;
    }
    return false;
}

}  // namespace copy_ngin
