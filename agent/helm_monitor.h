#pragma once

#include <chrono>
#include "helm_client.h"
#include "monitor.h"
#include "state_store.h"

enum class HealthClass {
    Healthy,
    Unhealthy,
    Unknown
};

std::string toString(HealthClass health);

// deployed -> healthy; failed, uninstalling and pending-* -> unhealthy;
// anything else -> unknown
HealthClass classifyHelmHealth(const std::string& helm_status);

ComponentState componentStateFromHelm(const std::string& helm_status);

class HelmMonitor : public WorkloadMonitor {
public:
    static constexpr const char* kType = "helm.v3";

    HelmMonitor(HelmClient& client,
                AgentStateStore& store,
                std::chrono::milliseconds poll_interval = std::chrono::seconds(30));

    DeploymentProfileType getType() const override { return kType; }

    void watch(const CancelToken& token, TaskGroup& tasks, const std::string& app_id) override;
    void stopWatching(const std::string& app_id) override;
    ComponentStatus getStatus(const std::string& app_id, const std::string& component_name) override;

    std::chrono::milliseconds pollInterval() const { return poll_interval_; }

private:
    HelmClient& client_;
    AgentStateStore& store_;
    std::chrono::milliseconds poll_interval_;

    void monitorLoop(const CancelToken& token, const std::string& app_id, const std::string& component_name);
};
