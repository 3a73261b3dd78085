#pragma once

#include <atomic>
#include <string>
#include <vector>
#include "deployer.h"
#include "memory_state_store.h"
#include "strategy_registry.h"

// Applies desired state through the deployer registered for the workload's
// profile type and records the applied state as current state.
class WorkloadManager : public DatabaseSubscriber {
public:
    WorkloadManager(MemoryStateStore& store, StrategyRegistry<WorkloadDeployer> deployers);
    ~WorkloadManager() override;

    WorkloadManager(const WorkloadManager&) = delete;
    WorkloadManager& operator=(const WorkloadManager&) = delete;

    void start();
    void stop();
    bool isStarted() const { return started_; }

    // Explicit triggers, also used by the event handler
    void deploy(const WorkloadState& app);
    void update(const WorkloadState& app);
    void remove(const std::string& app_id);

    // DatabaseSubscriber
    std::string getSubscriberId() const override { return "workload-manager"; }
    void onDatabaseEvent(const DatabaseEvent& event) override;

    std::vector<std::string> availableDeployerTypes() const;

private:
    MemoryStateStore& store_;
    StrategyRegistry<WorkloadDeployer> deployers_;
    std::atomic<bool> started_;

    void recordApplied(WorkloadDeployer& deployer, const WorkloadState& app);
    void removeDeployment(const Deployment& deployment);
};
