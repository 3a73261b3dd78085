#pragma once

#include "monitor.h"

// Placeholder strategy for compose workloads: watching is not available
// and status queries report unknown.
class ComposeMonitor : public WorkloadMonitor {
public:
    static constexpr const char* kType = "compose";

    DeploymentProfileType getType() const override { return kType; }

    void watch(const CancelToken& token, TaskGroup& tasks, const std::string& app_id) override;
    void stopWatching(const std::string& app_id) override;
    ComponentStatus getStatus(const std::string& app_id, const std::string& component_name) override;
};
