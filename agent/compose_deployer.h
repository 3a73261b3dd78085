#pragma once

#include "deployer.h"

// Registered so compose workloads resolve to a strategy; every operation
// reports that compose deployment is not available yet.
class ComposeDeployer : public WorkloadDeployer {
public:
    static constexpr const char* kType = "compose";

    DeploymentProfileType getType() const override { return kType; }

    void deploy(const DeploymentSpec& spec) override;
    void update(const DeploymentSpec& spec) override;
    void remove(const std::string& app_id) override;
    void remove(const Deployment& deployment) override;
};
