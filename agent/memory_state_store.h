#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "state_store.h"

// In-memory state store with JSON dump/restore in the data directory.
// Events are queued and delivered by a single publisher thread, so every
// subscriber sees them exactly once and in emission order.
class MemoryStateStore : public AgentStateStore {
public:
    // An empty data_dir disables persistence
    explicit MemoryStateStore(const std::string& data_dir = "");
    ~MemoryStateStore() override;

    // Lifecycle
    void start();
    void stop();
    bool isRunning() const { return running_; }

    // AgentStateStore
    Deployment getDeployment(const std::string& app_id) override;
    void upsertComponentStatus(const std::string& app_id,
                               const std::string& component_name,
                               const ComponentStatus& status) override;
    void subscribe(DatabaseSubscriber* subscriber) override;
    void unsubscribe(const std::string& subscriber_id) override;

    // Desired / current state
    void upsertDesiredState(const WorkloadState& state);
    void setCurrentState(const std::string& app_id, const WorkloadState& state);
    void removeDeployment(const std::string& app_id);

    std::vector<Deployment> listDeployments() const;
    bool hasDeployment(const std::string& app_id) const;
    size_t deploymentCount() const;

    std::string dumpPath() const;

private:
    std::string data_dir_;

    mutable std::mutex data_mutex_;
    std::map<std::string, Deployment> deployments_;

    std::mutex subscribers_mutex_;
    std::vector<DatabaseSubscriber*> subscribers_;

    // Event publishing
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<DatabaseEvent> queue_;
    std::atomic<bool> running_;
    std::thread publisher_thread_;

    // Held while a batch is handed to subscribers so unsubscribe can wait
    // for an in-flight delivery to finish
    std::mutex delivery_mutex_;

    void publishEvent(DatabaseEventType type, const Deployment& deployment);
    void publisherLoop();
    void deliver(const DatabaseEvent& event);

    // Persistence
    void restore();
    void dump();
};
