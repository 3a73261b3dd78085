#pragma once

#include <vector>
#include "deployer.h"
#include "helm_client.h"
#include "state_store.h"

class HelmDeployer : public WorkloadDeployer {
public:
    static constexpr const char* kType = "helm.v3";

    HelmDeployer(HelmClient& client, AgentStateStore& store);

    DeploymentProfileType getType() const override { return kType; }

    void deploy(const DeploymentSpec& spec) override;
    void update(const DeploymentSpec& spec) override;
    void remove(const std::string& app_id) override;
    void remove(const Deployment& deployment) override;

private:
    HelmClient& client_;
    AgentStateStore& store_;

    void validate(const DeploymentSpec& spec) const;
    void rollback(const std::string& app_id, const std::vector<const ComponentSpec*>& installed);
};
