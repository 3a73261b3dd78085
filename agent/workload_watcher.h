#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "monitor.h"
#include "state_store.h"
#include "strategy_registry.h"
#include "task_group.h"

// Keeps one supervised polling watch per workload in step with the state
// store: Added events start (or supersede) a watch, Deleted events stop it.
class WorkloadWatcher : public DatabaseSubscriber {
public:
    WorkloadWatcher(AgentStateStore& store, StrategyRegistry<WorkloadMonitor> monitors);
    ~WorkloadWatcher() override;

    WorkloadWatcher(const WorkloadWatcher&) = delete;
    WorkloadWatcher& operator=(const WorkloadWatcher&) = delete;

    // Lifecycle
    void start();
    // Cancels every watch and returns once all polling tasks have exited
    void stop();
    bool isStarted() const { return started_; }

    // Watch management
    void startWatching(const WorkloadState& app);
    void stopWatching(const std::string& app_id);

    // On-demand status, independent of the polling cadence
    ComponentStatus getDeploymentStatus(const std::string& app_id);

    // DatabaseSubscriber
    std::string getSubscriberId() const override { return "workload-watcher"; }
    void onDatabaseEvent(const DatabaseEvent& event) override;

    // Introspection
    bool isWatching(const std::string& app_id) const;
    size_t activeWatchCount() const;
    size_t runningTaskCount() const;
    std::vector<std::string> availableMonitorTypes() const;

private:
    struct ActiveWatch {
        uint64_t generation = 0;
        CancelSource cancel;
        DeploymentProfileType monitor_type;
    };

    AgentStateStore& store_;
    StrategyRegistry<WorkloadMonitor> monitors_;

    // Guarded by watches_mutex_; never held across a blocking call
    mutable std::mutex watches_mutex_;
    std::map<std::string, ActiveWatch> active_watches_;
    uint64_t next_generation_;

    TaskGroup tasks_;
    std::atomic<bool> started_;

    // Cancels and removes every registered watch
    std::map<std::string, ActiveWatch> cancelAll();
};
