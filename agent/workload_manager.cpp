#include "workload_manager.h"
#include "errors.h"
#include "logging.h"
#include "profile_codec.h"

namespace {

const char* kComponent = "WorkloadManager";

} // namespace

WorkloadManager::WorkloadManager(MemoryStateStore& store, StrategyRegistry<WorkloadDeployer> deployers)
    : store_(store)
    , deployers_(std::move(deployers))
    , started_(false) {
}

WorkloadManager::~WorkloadManager() {
    if (started_) {
        stop();
    }
}

void WorkloadManager::start() {
    if (started_) {
        logInfo(kComponent, "WorkloadManager is already started");
        return;
    }

    logInfo(kComponent, "Starting WorkloadManager");

    try {
        store_.subscribe(this);
    } catch (const std::exception& e) {
        throw StoreError(std::string("failed to subscribe to database events: ") + e.what(),
                         std::current_exception());
    }

    started_ = true;
    logInfo(kComponent, "WorkloadManager started successfully availableDeployers=" +
            joinTypes(availableDeployerTypes()));
}

void WorkloadManager::stop() {
    if (!started_) {
        logWarn(kComponent, "WorkloadManager not started");
        return;
    }

    logInfo(kComponent, "Stopping WorkloadManager");

    try {
        store_.unsubscribe(getSubscriberId());
    } catch (const std::exception& e) {
        logWarn(kComponent, std::string("Failed to unsubscribe from database events: ") + e.what());
    }

    started_ = false;
    logInfo(kComponent, "WorkloadManager stopped successfully");
}

void WorkloadManager::deploy(const WorkloadState& app) {
    if (app.app_id.empty()) {
        throw ValidationError("app ID is required");
    }

    logInfo(kComponent, "Deploying workload appId=" + app.app_id);

    DeploymentSpec spec = decodeDeployment(app);
    WorkloadDeployer& deployer = deployers_.find(spec.profile_type);
    deployer.deploy(spec);

    recordApplied(deployer, app);
}

void WorkloadManager::update(const WorkloadState& app) {
    if (app.app_id.empty()) {
        throw ValidationError("app ID is required");
    }

    logInfo(kComponent, "Updating workload appId=" + app.app_id);

    DeploymentSpec spec = decodeDeployment(app);
    WorkloadDeployer& deployer = deployers_.find(spec.profile_type);
    deployer.update(spec);

    recordApplied(deployer, app);
}

void WorkloadManager::remove(const std::string& app_id) {
    if (app_id.empty()) {
        throw ValidationError("app ID is required");
    }

    Deployment deployment;
    try {
        deployment = store_.getDeployment(app_id);
    } catch (const std::exception& e) {
        throw StoreError("failed to get deployment " + app_id + ": " + e.what(), std::current_exception());
    }

    removeDeployment(deployment);
}

void WorkloadManager::onDatabaseEvent(const DatabaseEvent& event) {
    logDebug(kComponent, "Received database event type=" + toString(event.type) +
             " appId=" + event.deployment.app_id);

    switch (event.type) {
        case DatabaseEventType::Added:
            if (event.deployment.desired_state) {
                logInfo(kComponent, "Handling new app deployment appId=" + event.deployment.app_id);
                deploy(*event.deployment.desired_state);
            }
            break;
        case DatabaseEventType::Changed:
            if (!event.deployment.desired_state) {
                break;
            }
            // A workload whose first deploy never succeeded has nothing to upgrade
            if (!event.deployment.current_state) {
                logInfo(kComponent, "Handling app update as new deployment appId=" + event.deployment.app_id);
                deploy(*event.deployment.desired_state);
            } else {
                logInfo(kComponent, "Handling app update appId=" + event.deployment.app_id);
                update(*event.deployment.desired_state);
            }
            break;
        case DatabaseEventType::Deleted:
            logInfo(kComponent, "Handling app removal appId=" + event.deployment.app_id);
            removeDeployment(event.deployment);
            break;
    }
}

std::vector<std::string> WorkloadManager::availableDeployerTypes() const {
    return deployers_.types();
}

void WorkloadManager::recordApplied(WorkloadDeployer& deployer, const WorkloadState& app) {
    try {
        store_.setCurrentState(app.app_id, app);
        return;
    } catch (const NotFoundError&) {
        // Removed while the backend call was running; the Deleted event
        // predates this state, so nothing else will tear it down
        logWarn(kComponent, "Workload appId=" + app.app_id + " was removed during deployment, tearing it down");
    }

    Deployment applied;
    applied.app_id = app.app_id;
    applied.current_state = app;
    deployer.remove(applied);
}

void WorkloadManager::removeDeployment(const Deployment& deployment) {
    logInfo(kComponent, "Removing workload appId=" + deployment.app_id);

    // Nothing was applied yet, nothing to tear down
    if (!deployment.current_state) {
        logInfo(kComponent, "Workload appId=" + deployment.app_id + " was never deployed, skipping removal");
        return;
    }

    DeploymentSpec spec = decodeDeployment(*deployment.current_state);
    deployers_.find(spec.profile_type).remove(deployment);
}
