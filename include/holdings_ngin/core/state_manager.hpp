//===== state_manager.hpp =====
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "holdings_ngin/core/error.hpp"
#include "holdings_ngin/core/types.hpp"

namespace holdings_ngin {

enum class ComponentState { INITIALIZED, RUNNING, PAUSED, ERR_STATE, STOPPED };

enum class ComponentType { CLASSIFICATION_STORE, PIPELINE };

struct ComponentInfo {
    ComponentType type;
    ComponentState state;
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Registry of running components and their lifecycle state
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
     * @brief Generate an id unique within this process, e.g. "PIPELINE_3"
     */
    static std::string next_component_id(const std::string& prefix);

    static void reset_instance() {
        auto& inst = instance();
        std::unique_lock<std::recursive_mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<void> validate_transition(ComponentState current_state, ComponentState new_state) const;

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::recursive_mutex mutex_;
};
}  // namespace holdings_ngin
