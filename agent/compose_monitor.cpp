#include "compose_monitor.h"
#include "errors.h"
#include "logging.h"

void ComposeMonitor::watch(const CancelToken&, TaskGroup&, const std::string& app_id) {
    logInfo("ComposeMonitor", "Starting to watch Docker Compose workload appId=" + app_id);
    throw NotImplementedError("docker compose monitoring not yet implemented");
}

void ComposeMonitor::stopWatching(const std::string& app_id) {
    logInfo("ComposeMonitor", "Stopping watch for Docker Compose workload appId=" + app_id);
    throw NotImplementedError("docker compose stop watching not yet implemented");
}

ComponentStatus ComposeMonitor::getStatus(const std::string& app_id, const std::string&) {
    logDebug("ComposeMonitor", "Getting Docker Compose workload status appId=" + app_id);

    ComponentStatus status;
    status.state = ComponentState::Unknown;
    status.message = "docker compose status not available";
    status.timestamp = std::chrono::system_clock::now();
    return status;
}
