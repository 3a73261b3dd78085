#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Free-form profile tag ("helm.v3", "compose", ...) selecting a strategy
using DeploymentProfileType = std::string;

enum class ComponentState {
    Unknown,
    Pending,
    Deployed,
    Failed,
    Removing
};

std::string toString(ComponentState state);
ComponentState componentStateFromString(const std::string& value);

struct ComponentStatus {
    ComponentState state = ComponentState::Unknown;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

// A workload as the state store records it. The deployment descriptor is kept
// as base64-encoded JSON along with its SHA-256 hash.
struct WorkloadState {
    std::string app_id;
    std::string app_version;
    std::string state;
    std::string deployment_base64;
    std::string deployment_hash;
};

struct Deployment {
    std::string app_id;
    std::optional<WorkloadState> desired_state;
    std::optional<WorkloadState> current_state;
    std::map<std::string, ComponentStatus> component_statuses;
};

// One named unit of a deployment profile
struct ComponentSpec {
    std::string name;
    DeploymentProfileType type;
    nlohmann::json properties;
};

// Normalized descriptor produced by the profile decoder
struct DeploymentSpec {
    std::string id;
    std::string name;
    DeploymentProfileType profile_type;
    std::vector<ComponentSpec> components;
    nlohmann::json parameters;
};

enum class DatabaseEventType {
    Added,
    Deleted,
    Changed
};

std::string toString(DatabaseEventType type);

struct DatabaseEvent {
    DatabaseEventType type;
    Deployment deployment;
    std::chrono::system_clock::time_point timestamp;
};

// Serialization used by the store dump
void to_json(nlohmann::json& j, const ComponentStatus& status);
void from_json(const nlohmann::json& j, ComponentStatus& status);
void to_json(nlohmann::json& j, const WorkloadState& state);
void from_json(const nlohmann::json& j, WorkloadState& state);
void to_json(nlohmann::json& j, const Deployment& deployment);
void from_json(const nlohmann::json& j, Deployment& deployment);
