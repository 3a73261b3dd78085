#include "workload_watcher.h"
#include "errors.h"
#include "logging.h"
#include "profile_codec.h"

namespace {

const char* kComponent = "WorkloadWatcher";

} // namespace

WorkloadWatcher::WorkloadWatcher(AgentStateStore& store, StrategyRegistry<WorkloadMonitor> monitors)
    : store_(store)
    , monitors_(std::move(monitors))
    , next_generation_(0)
    , started_(false) {
}

WorkloadWatcher::~WorkloadWatcher() {
    if (started_) {
        stop();
        return;
    }
    // Watches started explicitly without start()
    cancelAll();
    tasks_.wait();
}

void WorkloadWatcher::start() {
    if (started_) {
        logInfo(kComponent, "WorkloadWatcher is already started");
        return;
    }

    logInfo(kComponent, "Starting WorkloadWatcher");

    try {
        store_.subscribe(this);
    } catch (const std::exception& e) {
        throw StoreError(std::string("failed to subscribe to database events: ") + e.what(),
                         std::current_exception());
    }

    started_ = true;
    logInfo(kComponent, "WorkloadWatcher started successfully availableMonitors=" +
            joinTypes(availableMonitorTypes()));
}

void WorkloadWatcher::stop() {
    if (!started_) {
        logWarn(kComponent, "WorkloadWatcher not started");
        return;
    }

    logInfo(kComponent, "Stopping WorkloadWatcher");

    // Unsubscribe first so no event can start a watch behind our back
    try {
        store_.unsubscribe(getSubscriberId());
    } catch (const std::exception& e) {
        logWarn(kComponent, std::string("Failed to unsubscribe from database events: ") + e.what());
    }

    for (const auto& [app_id, watch] : cancelAll()) {
        try {
            monitors_.find(watch.monitor_type).stopWatching(app_id);
        } catch (const std::exception& e) {
            logWarn(kComponent, "Monitor failed to stop watching appId=" + app_id + ": " + e.what());
        }
    }

    // Join barrier: every polling task observes its token and exits
    tasks_.wait();

    started_ = false;
    logInfo(kComponent, "WorkloadWatcher stopped successfully");
}

void WorkloadWatcher::startWatching(const WorkloadState& app) {
    if (app.app_id.empty()) {
        throw ValidationError("app ID is required");
    }

    logInfo(kComponent, "Starting to watch workload appId=" + app.app_id);

    DeploymentSpec spec = decodeDeployment(app);
    WorkloadMonitor& monitor = monitors_.find(spec.profile_type);

    CancelSource cancel;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        auto existing = active_watches_.find(app.app_id);
        if (existing != active_watches_.end()) {
            logDebug(kComponent, "Superseding active watch appId=" + app.app_id);
            existing->second.cancel.cancel();
            active_watches_.erase(existing);
        }

        generation = ++next_generation_;
        ActiveWatch watch;
        watch.generation = generation;
        watch.cancel = cancel;
        watch.monitor_type = spec.profile_type;
        active_watches_.emplace(app.app_id, watch);
    }

    try {
        monitor.watch(cancel.token(), tasks_, app.app_id);
    } catch (const std::exception& e) {
        logError(kComponent, "Failed to watch workload appId=" + app.app_id + ": " + e.what());
        cancel.cancel();

        std::lock_guard<std::mutex> lock(watches_mutex_);
        auto it = active_watches_.find(app.app_id);
        if (it != active_watches_.end() && it->second.generation == generation) {
            active_watches_.erase(it);
        }
        throw;
    }
}

void WorkloadWatcher::stopWatching(const std::string& app_id) {
    if (app_id.empty()) {
        throw ValidationError("app ID is required");
    }

    logInfo(kComponent, "Stopping watch for workload appId=" + app_id);

    DeploymentProfileType monitor_type;
    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        auto it = active_watches_.find(app_id);
        if (it == active_watches_.end()) {
            logDebug(kComponent, "No active watch found for workload appId=" + app_id);
            return;
        }
        it->second.cancel.cancel();
        monitor_type = it->second.monitor_type;
        active_watches_.erase(it);
    }

    monitors_.find(monitor_type).stopWatching(app_id);
    logDebug(kComponent, "Stopped watching workload appId=" + app_id);
}

ComponentStatus WorkloadWatcher::getDeploymentStatus(const std::string& app_id) {
    if (app_id.empty()) {
        throw ValidationError("app ID is required");
    }

    logDebug(kComponent, "Getting workload status appId=" + app_id);

    Deployment deployment;
    try {
        deployment = store_.getDeployment(app_id);
    } catch (const std::exception& e) {
        throw StoreError("failed to get deployment " + app_id + ": " + e.what(), std::current_exception());
    }

    const auto& state = deployment.current_state ? deployment.current_state : deployment.desired_state;
    if (!state) {
        ComponentStatus status;
        status.message = "no deployment state recorded";
        status.timestamp = std::chrono::system_clock::now();
        return status;
    }

    DeploymentSpec spec = decodeDeployment(*state);
    return monitors_.find(spec.profile_type).getStatus(app_id, "");
}

void WorkloadWatcher::onDatabaseEvent(const DatabaseEvent& event) {
    logDebug(kComponent, "Received database event type=" + toString(event.type) +
             " appId=" + event.deployment.app_id);

    switch (event.type) {
        case DatabaseEventType::Added:
            if (event.deployment.desired_state) {
                logInfo(kComponent, "Starting monitoring for new app appId=" + event.deployment.app_id);
                startWatching(*event.deployment.desired_state);
            }
            break;
        case DatabaseEventType::Deleted:
            logInfo(kComponent, "Stopping monitoring for deleted app appId=" + event.deployment.app_id);
            stopWatching(event.deployment.app_id);
            break;
        default:
            logDebug(kComponent, "Ignoring unhandled event type " + toString(event.type));
            break;
    }
}

std::map<std::string, WorkloadWatcher::ActiveWatch> WorkloadWatcher::cancelAll() {
    std::map<std::string, ActiveWatch> stopped;
    std::lock_guard<std::mutex> lock(watches_mutex_);
    for (auto& [app_id, watch] : active_watches_) {
        logDebug(kComponent, "Stopping watch appId=" + app_id);
        watch.cancel.cancel();
    }
    stopped.swap(active_watches_);
    return stopped;
}

bool WorkloadWatcher::isWatching(const std::string& app_id) const {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    return active_watches_.count(app_id) > 0;
}

size_t WorkloadWatcher::activeWatchCount() const {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    return active_watches_.size();
}

size_t WorkloadWatcher::runningTaskCount() const {
    return tasks_.activeCount();
}

std::vector<std::string> WorkloadWatcher::availableMonitorTypes() const {
    return monitors_.types();
}
