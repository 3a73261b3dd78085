#include "compose_deployer.h"
#include "errors.h"
#include "logging.h"

void ComposeDeployer::deploy(const DeploymentSpec& spec) {
    logInfo("ComposeDeployer", "Deploying Docker Compose workload appId=" + spec.id);
    throw NotImplementedError("docker compose deployment not yet implemented");
}

void ComposeDeployer::update(const DeploymentSpec& spec) {
    logInfo("ComposeDeployer", "Updating Docker Compose workload appId=" + spec.id);
    throw NotImplementedError("docker compose update not yet implemented");
}

void ComposeDeployer::remove(const std::string& app_id) {
    logInfo("ComposeDeployer", "Removing Docker Compose workload appId=" + app_id);
    throw NotImplementedError("docker compose removal not yet implemented");
}

void ComposeDeployer::remove(const Deployment& deployment) {
    remove(deployment.app_id);
}
