#include "helm_deployer.h"
#include "errors.h"
#include "logging.h"
#include "profile_codec.h"
#include "release_name.h"

namespace {

const char* kComponent = "HelmDeployer";

std::string componentNamespace(const ComponentSpec& component) {
    return component.properties.value("namespace", "");
}

} // namespace

HelmDeployer::HelmDeployer(HelmClient& client, AgentStateStore& store)
    : client_(client)
    , store_(store) {
}

void HelmDeployer::deploy(const DeploymentSpec& spec) {
    validate(spec);
    auto values = parameterValues(spec);

    logInfo(kComponent, "Deploying Helm workload appId=" + spec.id +
            " components=" + std::to_string(spec.components.size()));

    std::vector<const ComponentSpec*> installed;
    for (const auto& component : spec.components) {
        std::string release = releaseName(spec.id, component.name);
        try {
            client_.installChart(release,
                                 component.properties.value("repository", ""),
                                 componentNamespace(component),
                                 component.properties.at("revision").get<std::string>(),
                                 component.properties.value("wait", false),
                                 values[component.name]);
        } catch (const std::exception& e) {
            logError(kComponent, "Failed to install release " + release + ": " + e.what());
            BackendError error("deploy", spec.id, std::current_exception());
            rollback(spec.id, installed);
            throw error;
        }
        installed.push_back(&component);
        logInfo(kComponent, "Deployed component " + component.name + " as release " + release);
    }

    logInfo(kComponent, "Successfully deployed Helm workload appId=" + spec.id);
}

void HelmDeployer::update(const DeploymentSpec& spec) {
    validate(spec);
    auto values = parameterValues(spec);

    logInfo(kComponent, "Updating Helm workload appId=" + spec.id);

    for (const auto& component : spec.components) {
        std::string release = releaseName(spec.id, component.name);
        try {
            client_.upgradeChart(release,
                                 component.properties.value("repository", ""),
                                 componentNamespace(component),
                                 values[component.name]);
        } catch (const std::exception& e) {
            logError(kComponent, "Failed to upgrade release " + release + ": " + e.what());
            throw BackendError("update", spec.id, std::current_exception());
        }
    }

    logInfo(kComponent, "Successfully updated Helm workload appId=" + spec.id);
}

void HelmDeployer::remove(const std::string& app_id) {
    if (app_id.empty()) {
        throw ValidationError("app ID is required");
    }

    Deployment deployment;
    try {
        deployment = store_.getDeployment(app_id);
    } catch (const std::exception& e) {
        throw StoreError("failed to get deployment " + app_id + ": " + e.what(), std::current_exception());
    }

    remove(deployment);
}

void HelmDeployer::remove(const Deployment& deployment) {
    if (deployment.app_id.empty()) {
        throw ValidationError("app ID is required");
    }
    if (!deployment.current_state) {
        throw ValidationError("workload " + deployment.app_id + " has no current state to remove");
    }

    DeploymentSpec spec = decodeDeployment(*deployment.current_state);

    logInfo(kComponent, "Removing Helm workload appId=" + deployment.app_id);

    for (const auto& component : spec.components) {
        std::string release = releaseName(deployment.app_id, component.name);
        try {
            client_.uninstallChart(release, componentNamespace(component));
        } catch (const std::exception& e) {
            logError(kComponent, "Failed to uninstall release " + release + ": " + e.what());
            throw BackendError("remove", deployment.app_id, std::current_exception());
        }
    }

    logInfo(kComponent, "Successfully removed Helm workload appId=" + deployment.app_id);
}

// Uninstalls releases of a partially applied deploy, newest first
void HelmDeployer::rollback(const std::string& app_id, const std::vector<const ComponentSpec*>& installed) {
    for (auto it = installed.rbegin(); it != installed.rend(); ++it) {
        std::string release = releaseName(app_id, (*it)->name);
        try {
            client_.uninstallChart(release, componentNamespace(**it));
            logInfo(kComponent, "Rolled back release " + release);
        } catch (const std::exception& e) {
            logError(kComponent, "Failed to roll back release " + release + ": " + e.what());
        }
    }
}

void HelmDeployer::validate(const DeploymentSpec& spec) const {
    if (spec.id.empty()) {
        throw ValidationError("app ID is required");
    }
    if (spec.components.empty()) {
        throw ValidationError("no components specified in deployment profile");
    }

    for (const auto& component : spec.components) {
        const auto& props = component.properties;
        if (!props.is_object() || props.value("repository", "").empty()) {
            throw ValidationError("repository is required for helm component " + component.name);
        }
        if (!props.contains("revision") || !props["revision"].is_string()) {
            throw ValidationError("revision is required for helm component " + component.name);
        }
    }
}
