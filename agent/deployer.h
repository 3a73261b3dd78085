#pragma once

#include <string>
#include "workload_types.h"

// One implementation per deployment profile type. Deployers invoke the
// backend only; persisting the outcome is left to the caller.
class WorkloadDeployer {
public:
    virtual ~WorkloadDeployer() = default;

    virtual DeploymentProfileType getType() const = 0;

    virtual void deploy(const DeploymentSpec& spec) = 0;
    virtual void update(const DeploymentSpec& spec) = 0;

    // Resolves the recorded deployment from the state store
    virtual void remove(const std::string& app_id) = 0;

    // For callers that already hold the deployment, e.g. after it was
    // deleted from the store
    virtual void remove(const Deployment& deployment) = 0;
};
