#include "workload_types.h"

std::string toString(ComponentState state) {
    switch (state) {
        case ComponentState::Pending: return "pending";
        case ComponentState::Deployed: return "deployed";
        case ComponentState::Failed: return "failed";
        case ComponentState::Removing: return "removing";
        case ComponentState::Unknown: break;
    }
    return "unknown";
}

ComponentState componentStateFromString(const std::string& value) {
    if (value == "pending") return ComponentState::Pending;
    if (value == "deployed") return ComponentState::Deployed;
    if (value == "failed") return ComponentState::Failed;
    if (value == "removing") return ComponentState::Removing;
    return ComponentState::Unknown;
}

std::string toString(DatabaseEventType type) {
    switch (type) {
        case DatabaseEventType::Added: return "ADDED";
        case DatabaseEventType::Deleted: return "DELETED";
        case DatabaseEventType::Changed: return "CHANGED";
    }
    return "UNKNOWN";
}

void to_json(nlohmann::json& j, const ComponentStatus& status) {
    j = nlohmann::json{
        {"state", toString(status.state)},
        {"message", status.message},
        {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(
                          status.timestamp.time_since_epoch()).count()}
    };
}

void from_json(const nlohmann::json& j, ComponentStatus& status) {
    status.state = componentStateFromString(j.value("state", "unknown"));
    status.message = j.value("message", "");
    status.timestamp = std::chrono::system_clock::time_point(
        std::chrono::seconds(j.value("timestamp", static_cast<int64_t>(0))));
}

void to_json(nlohmann::json& j, const WorkloadState& state) {
    j = nlohmann::json{
        {"app_id", state.app_id},
        {"app_version", state.app_version},
        {"state", state.state},
        {"deployment", state.deployment_base64},
        {"deployment_hash", state.deployment_hash}
    };
}

void from_json(const nlohmann::json& j, WorkloadState& state) {
    state.app_id = j.value("app_id", "");
    state.app_version = j.value("app_version", "");
    state.state = j.value("state", "");
    state.deployment_base64 = j.value("deployment", "");
    state.deployment_hash = j.value("deployment_hash", "");
}

void to_json(nlohmann::json& j, const Deployment& deployment) {
    j = nlohmann::json::object();
    j["app_id"] = deployment.app_id;
    if (deployment.desired_state) {
        j["desired_state"] = *deployment.desired_state;
    }
    if (deployment.current_state) {
        j["current_state"] = *deployment.current_state;
    }
    j["component_statuses"] = deployment.component_statuses;
}

void from_json(const nlohmann::json& j, Deployment& deployment) {
    deployment.app_id = j.value("app_id", "");
    deployment.desired_state.reset();
    deployment.current_state.reset();
    if (j.contains("desired_state")) {
        deployment.desired_state = j.at("desired_state").get<WorkloadState>();
    }
    if (j.contains("current_state")) {
        deployment.current_state = j.at("current_state").get<WorkloadState>();
    }
    deployment.component_statuses.clear();
    if (j.contains("component_statuses")) {
        deployment.component_statuses =
            j.at("component_statuses").get<std::map<std::string, ComponentStatus>>();
    }
}
