#pragma once

#include <string>
#include "workload_types.h"

// Receives state store change notifications
class DatabaseSubscriber {
public:
    virtual ~DatabaseSubscriber() = default;

    virtual std::string getSubscriberId() const = 0;

    // Exceptions thrown here are logged by the publisher
    virtual void onDatabaseEvent(const DatabaseEvent& event) = 0;
};

// Desired/current state per workload plus change notifications.
// Implementations are safe to call from any thread.
class AgentStateStore {
public:
    virtual ~AgentStateStore() = default;

    // Throws NotFoundError when the workload is not recorded
    virtual Deployment getDeployment(const std::string& app_id) = 0;

    virtual void upsertComponentStatus(const std::string& app_id,
                                       const std::string& component_name,
                                       const ComponentStatus& status) = 0;

    // The subscriber must outlive its subscription
    virtual void subscribe(DatabaseSubscriber* subscriber) = 0;
    virtual void unsubscribe(const std::string& subscriber_id) = 0;
};
