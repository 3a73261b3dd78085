#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <vector>
#include <nlohmann/json.hpp>
#include "workload_types.h"

class ConfigManager;
class MemoryStateStore;
class HelmClient;
class WorkloadManager;
class WorkloadWatcher;

struct DesiredStateDiff {
    std::vector<std::string> upserted;
    std::vector<std::string> removed;
    std::vector<std::string> unchanged;
};

// Parses the "workloads" array of a desired state document. The whole
// document is rejected with ValidationError if any entry is malformed.
std::vector<WorkloadState> parseDesiredWorkloads(const nlohmann::json& document);

// Brings the store in line with the document: new or re-hashed workloads are
// upserted, workloads missing from the document are removed.
DesiredStateDiff applyDesiredState(MemoryStateStore& store, const nlohmann::json& document);

class Agent {
public:
    explicit Agent(const std::string& config_path);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_; }

    DesiredStateDiff applyDesiredState(const nlohmann::json& document);

    // Component access
    MemoryStateStore& store() { return *store_; }
    WorkloadManager& workloadManager() { return *workload_manager_; }
    WorkloadWatcher& workloadWatcher() { return *workload_watcher_; }

private:
    // Core components, declared in construction order
    std::unique_ptr<ConfigManager> config_manager_;
    std::unique_ptr<MemoryStateStore> store_;
    std::unique_ptr<HelmClient> helm_client_;
    std::unique_ptr<WorkloadManager> workload_manager_;
    std::unique_ptr<WorkloadWatcher> workload_watcher_;

    std::atomic<bool> running_;
    std::mutex apply_mutex_;

    void resumeRestoredWorkloads();
};
