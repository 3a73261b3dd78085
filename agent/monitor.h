#pragma once

#include <string>
#include "task_group.h"
#include "workload_types.h"

// One implementation per deployment profile type. Each monitor runs its own
// polling tasks and writes component health into the state store.
class WorkloadMonitor {
public:
    virtual ~WorkloadMonitor() = default;

    virtual DeploymentProfileType getType() const = 0;

    // Schedules supervision of every component and returns immediately.
    // Spawned tasks run on `tasks` until `token` is cancelled.
    virtual void watch(const CancelToken& token, TaskGroup& tasks, const std::string& app_id) = 0;

    virtual void stopWatching(const std::string& app_id) = 0;

    // An empty component name selects the first component of the profile
    virtual ComponentStatus getStatus(const std::string& app_id, const std::string& component_name) = 0;
};
