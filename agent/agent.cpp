#include "agent.h"
#include "compose_deployer.h"
#include "compose_monitor.h"
#include "config_manager.h"
#include "errors.h"
#include "helm_client.h"
#include "helm_deployer.h"
#include "helm_monitor.h"
#include "logging.h"
#include "memory_state_store.h"
#include "profile_codec.h"
#include "workload_manager.h"
#include "workload_watcher.h"
#include <set>

namespace {

const char* kComponent = "Agent";
const char* kDefaultWorkloadState = "RUNNING";

} // namespace

std::vector<WorkloadState> parseDesiredWorkloads(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ValidationError("desired state document must be a JSON object");
    }

    std::vector<WorkloadState> workloads;
    if (!document.contains("workloads")) {
        return workloads;
    }

    const auto& entries = document["workloads"];
    if (!entries.is_array()) {
        throw ValidationError("desired state workloads must be an array");
    }

    std::set<std::string> seen;
    for (const auto& entry : entries) {
        if (!entry.is_object()) {
            throw ValidationError("desired state workload must be an object");
        }
        if (!entry.contains("app_id") || !entry["app_id"].is_string() ||
            entry["app_id"].get<std::string>().empty()) {
            throw ValidationError("desired state workload is missing app_id");
        }

        std::string app_id = entry["app_id"].get<std::string>();
        if (!seen.insert(app_id).second) {
            throw ValidationError("duplicate workload in desired state: " + app_id);
        }
        if (!entry.contains("deployment") || !entry["deployment"].is_object()) {
            throw ValidationError("workload " + app_id + " has no deployment descriptor");
        }

        // Reject descriptors no deployer could handle before touching the store
        parseDeploymentDescriptor(entry["deployment"], app_id);

        workloads.push_back(encodeWorkloadState(app_id,
                                                entry.value("app_version", ""),
                                                entry.value("state", kDefaultWorkloadState),
                                                entry["deployment"]));
    }

    return workloads;
}

DesiredStateDiff applyDesiredState(MemoryStateStore& store, const nlohmann::json& document) {
    std::vector<WorkloadState> workloads = parseDesiredWorkloads(document);

    DesiredStateDiff diff;
    std::set<std::string> wanted;

    for (const auto& workload : workloads) {
        wanted.insert(workload.app_id);

        bool changed = true;
        if (store.hasDeployment(workload.app_id)) {
            Deployment existing = store.getDeployment(workload.app_id);
            changed = !existing.desired_state ||
                      existing.desired_state->deployment_hash != workload.deployment_hash ||
                      existing.desired_state->app_version != workload.app_version;
        }

        if (changed) {
            store.upsertDesiredState(workload);
            diff.upserted.push_back(workload.app_id);
        } else {
            diff.unchanged.push_back(workload.app_id);
        }
    }

    for (const auto& deployment : store.listDeployments()) {
        if (wanted.count(deployment.app_id) == 0) {
            store.removeDeployment(deployment.app_id);
            diff.removed.push_back(deployment.app_id);
        }
    }

    return diff;
}

Agent::Agent(const std::string& config_path)
    : running_(false) {

    try {
        config_manager_ = std::make_unique<ConfigManager>(config_path);
        setLogLevel(parseLogLevel(config_manager_->getLogLevel()));

        logInfo(kComponent, "Initializing agent deviceId=" + config_manager_->getDeviceId());

        store_ = std::make_unique<MemoryStateStore>(config_manager_->getDataDir());

        StrategyRegistry<WorkloadDeployer> deployers;
        StrategyRegistry<WorkloadMonitor> monitors;

        if (config_manager_->isHelmEnabled()) {
            HelmCliOptions options;
            options.binary = config_manager_->getHelmBinary();
            options.kubeconfig = config_manager_->getHelmKubeconfig();
            options.default_namespace = config_manager_->getHelmNamespace();
            options.timeout = config_manager_->getHelmTimeout();

            helm_client_ = std::make_unique<HelmCliClient>(options, std::make_shared<ShellCommandRunner>());

            deployers.add(std::make_unique<HelmDeployer>(*helm_client_, *store_));
            monitors.add(std::make_unique<HelmMonitor>(*helm_client_, *store_,
                                                       config_manager_->getMonitorInterval()));
        }

        if (config_manager_->isComposeEnabled()) {
            deployers.add(std::make_unique<ComposeDeployer>());
            monitors.add(std::make_unique<ComposeMonitor>());
        }

        workload_manager_ = std::make_unique<WorkloadManager>(*store_, std::move(deployers));
        workload_watcher_ = std::make_unique<WorkloadWatcher>(*store_, std::move(monitors));

        config_manager_->setDesiredStateCallback([this](const nlohmann::json& document) {
            applyDesiredState(document);
        });

        logInfo(kComponent, "Agent initialized successfully");

    } catch (const std::exception& e) {
        logError(kComponent, "Failed to initialize agent: " + std::string(e.what()));
        throw;
    }
}

Agent::~Agent() {
    stop();
}

void Agent::start() {
    if (running_) {
        logInfo(kComponent, "Agent is already running");
        return;
    }

    logInfo(kComponent, "Starting fleet agent");

    store_->start();
    workload_manager_->start();
    workload_watcher_->start();

    resumeRestoredWorkloads();

    try {
        applyDesiredState(config_manager_->loadDesiredState());
    } catch (const std::exception& e) {
        logError(kComponent, "Initial desired state not applied: " + std::string(e.what()));
    }

    config_manager_->startMonitoring();

    running_ = true;
    logInfo(kComponent, "Agent started successfully");
}

void Agent::stop() {
    if (!running_) {
        return;
    }

    logInfo(kComponent, "Stopping fleet agent");
    running_ = false;

    config_manager_->stopMonitoring();
    workload_watcher_->stop();
    workload_manager_->stop();
    store_->stop();

    logInfo(kComponent, "Agent stopped");
}

DesiredStateDiff Agent::applyDesiredState(const nlohmann::json& document) {
    std::lock_guard<std::mutex> lock(apply_mutex_);

    DesiredStateDiff diff = ::applyDesiredState(*store_, document);
    logInfo(kComponent, "Applied desired state upserted=" + std::to_string(diff.upserted.size()) +
            " removed=" + std::to_string(diff.removed.size()) +
            " unchanged=" + std::to_string(diff.unchanged.size()));
    return diff;
}

void Agent::resumeRestoredWorkloads() {
    for (const auto& deployment : store_->listDeployments()) {
        if (!deployment.desired_state) {
            continue;
        }

        // Desired state that never reached the backend is applied again
        bool applied = deployment.current_state &&
                       deployment.current_state->deployment_hash == deployment.desired_state->deployment_hash;
        try {
            if (!applied) {
                logInfo(kComponent, "Re-applying restored workload appId=" + deployment.app_id);
                if (deployment.current_state) {
                    workload_manager_->update(*deployment.desired_state);
                } else {
                    workload_manager_->deploy(*deployment.desired_state);
                }
            }
            workload_watcher_->startWatching(*deployment.desired_state);
        } catch (const std::exception& e) {
            logError(kComponent, "Failed to resume workload appId=" + deployment.app_id + ": " + e.what());
        }
    }
}
