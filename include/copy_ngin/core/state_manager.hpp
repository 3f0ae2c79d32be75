// include/copy_ngin/core/state_manager.hpp
#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {

enum class ComponentState { INITIALIZED, RUNNING, ERR_STATE, STOPPED };

enum class ComponentType { COPY_SESSION_MANAGER, BACKTEST_ENGINE };

const char* state_to_string(ComponentState state);

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Process-wide registry of long-running component states
 *
 * Allowed transitions: INITIALIZED -> RUNNING | STOPPED | ERR_STATE,
 * RUNNING -> STOPPED | ERR_STATE, ERR_STATE -> INITIALIZED | STOPPED,
 * STOPPED -> INITIALIZED | RUNNING. Unknown ids yield DATA_NOT_FOUND.
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<ComponentInfo> get_state(const std::string& component_id) const;

    /**
     * @brief Move a component to a new state
     * @param error_message Kept only when entering ERR_STATE
     */
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");

    /**
     * @brief Merge metric values into the component's metrics
     *
     * Keys not mentioned keep their previous value.
     */
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);

    /**
     * @brief True when at least one component is registered and none is in ERR_STATE
     */
    bool is_healthy() const;

    std::vector<std::string> get_all_components() const;

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    static bool is_valid_transition(ComponentState from, ComponentState to);

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

}  // namespace copy_ngin
