#include "helm_monitor.h"
#include "errors.h"
#include "logging.h"
#include "profile_codec.h"
#include "release_name.h"

namespace {

const char* kComponent = "HelmMonitor";

ComponentStatus unknownStatus(const std::string& message) {
    ComponentStatus status;
    status.state = ComponentState::Unknown;
    status.message = message;
    status.timestamp = std::chrono::system_clock::now();
    return status;
}

} // namespace

std::string toString(HealthClass health) {
    switch (health) {
        case HealthClass::Healthy: return "healthy";
        case HealthClass::Unhealthy: return "unhealthy";
        case HealthClass::Unknown: break;
    }
    return "unknown";
}

HealthClass classifyHelmHealth(const std::string& helm_status) {
    if (helm_status == "deployed") {
        return HealthClass::Healthy;
    }
    if (helm_status == "failed" ||
        helm_status == "uninstalling" ||
        helm_status == "pending-install" ||
        helm_status == "pending-upgrade" ||
        helm_status == "pending-rollback") {
        return HealthClass::Unhealthy;
    }
    return HealthClass::Unknown;
}

ComponentState componentStateFromHelm(const std::string& helm_status) {
    if (helm_status == "deployed") return ComponentState::Deployed;
    if (helm_status == "failed") return ComponentState::Failed;
    if (helm_status == "pending-install" ||
        helm_status == "pending-upgrade" ||
        helm_status == "pending-rollback") return ComponentState::Pending;
    if (helm_status == "uninstalling") return ComponentState::Removing;
    return ComponentState::Unknown;
}

HelmMonitor::HelmMonitor(HelmClient& client, AgentStateStore& store, std::chrono::milliseconds poll_interval)
    : client_(client)
    , store_(store)
    , poll_interval_(poll_interval) {
    if (poll_interval_.count() <= 0) {
        throw ValidationError("poll interval must be positive");
    }
}

void HelmMonitor::watch(const CancelToken& token, TaskGroup& tasks, const std::string& app_id) {
    logInfo(kComponent, "Starting to watch Helm workload appId=" + app_id);

    Deployment deployment;
    try {
        deployment = store_.getDeployment(app_id);
    } catch (const std::exception& e) {
        throw StoreError("failed to get deployment " + app_id + ": " + e.what(), std::current_exception());
    }

    const auto& state = deployment.current_state ? deployment.current_state : deployment.desired_state;
    if (!state) {
        throw ValidationError("workload " + app_id + " has no desired or current state");
    }

    DeploymentSpec spec = decodeDeployment(*state);
    for (const auto& component : spec.components) {
        std::string component_name = component.name;
        tasks.spawn("helm-monitor:" + app_id + "/" + component_name,
                    [this, token, app_id, component_name]() {
                        monitorLoop(token, app_id, component_name);
                    });
        logDebug(kComponent, "Scheduled polling of component " + component_name +
                 " release=" + releaseName(app_id, component_name));
    }
}

void HelmMonitor::stopWatching(const std::string& app_id) {
    // Polling tasks exit when their cancel token fires
    logInfo(kComponent, "Stopping watch for Helm workload appId=" + app_id);
}

ComponentStatus HelmMonitor::getStatus(const std::string& app_id, const std::string& component_name) {
    logDebug(kComponent, "Getting Helm workload status appId=" + app_id + " component=" + component_name);

    Deployment deployment;
    try {
        deployment = store_.getDeployment(app_id);
    } catch (const NotFoundError&) {
        return unknownStatus("no deployment state recorded");
    }

    const auto& state = deployment.current_state ? deployment.current_state : deployment.desired_state;
    if (!state) {
        return unknownStatus("no deployment state recorded");
    }

    DeploymentSpec spec = decodeDeployment(*state);
    if (spec.components.empty()) {
        return unknownStatus("deployment profile has no components");
    }

    const ComponentSpec* target = &spec.components.front();
    if (!component_name.empty()) {
        target = nullptr;
        for (const auto& component : spec.components) {
            if (component.name == component_name) {
                target = &component;
                break;
            }
        }
        if (target == nullptr) {
            throw ValidationError("component " + component_name + " not found in workload " + app_id);
        }
    }

    std::string release = releaseName(app_id, target->name);

    ReleaseStatus release_status;
    try {
        release_status = client_.getReleaseStatus(release, target->properties.value("namespace", ""));
    } catch (const std::exception&) {
        throw BackendError("get status of release " + release, app_id, std::current_exception());
    }

    ComponentStatus status;
    status.state = componentStateFromHelm(release_status.status);
    status.message = "helm status " + release_status.status + " (" +
                     toString(classifyHelmHealth(release_status.status)) + ")";
    status.timestamp = std::chrono::system_clock::now();
    return status;
}

void HelmMonitor::monitorLoop(const CancelToken& token, const std::string& app_id, const std::string& component_name) {
    logDebug(kComponent, "Monitor loop started appId=" + app_id + " component=" + component_name);

    while (!token.waitFor(poll_interval_)) {
        ComponentStatus status;
        try {
            status = getStatus(app_id, component_name);
        } catch (const std::exception& e) {
            logError(kComponent, "Failed to get workload status appId=" + app_id +
                     " component=" + component_name + ": " + e.what());
            continue;
        }

        logDebug(kComponent, "Workload status check appId=" + app_id +
                 " component=" + component_name + " state=" + toString(status.state));

        // A superseded or deleted watch must not write after its cancellation
        bool written = token.runUnlessCancelled([&]() {
            try {
                store_.upsertComponentStatus(app_id, component_name, status);
            } catch (const std::exception& e) {
                logError(kComponent, "Failed to update the status of the workload in store appId=" + app_id +
                         ": " + e.what());
            }
        });
        if (!written) {
            break;
        }
    }

    logDebug(kComponent, "Stopping monitor loop for Helm workload appId=" + app_id + " component=" + component_name);
}
