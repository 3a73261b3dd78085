#include "memory_state_store.h"
#include "errors.h"
#include "logging.h"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

const char* kComponent = "StateStore";

void requireId(const std::string& app_id) {
    if (app_id.empty()) {
        throw ValidationError("workload ID cannot be empty");
    }
}

} // namespace

MemoryStateStore::MemoryStateStore(const std::string& data_dir)
    : data_dir_(data_dir)
    , running_(false) {
}

MemoryStateStore::~MemoryStateStore() {
    try {
        stop();
    } catch (const std::exception& e) {
        logError(kComponent, std::string("Error stopping state store: ") + e.what());
    }
}

void MemoryStateStore::start() {
    if (running_) {
        logInfo(kComponent, "State store is already running");
        return;
    }

    restore();

    running_ = true;
    publisher_thread_ = std::thread(&MemoryStateStore::publisherLoop, this);

    logInfo(kComponent, "State store started with " + std::to_string(deploymentCount()) + " deployments");
}

void MemoryStateStore::stop() {
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();

    if (publisher_thread_.joinable()) {
        publisher_thread_.join();
    }

    dump();
    logInfo(kComponent, "State store stopped");
}

Deployment MemoryStateStore::getDeployment(const std::string& app_id) {
    requireId(app_id);

    std::lock_guard<std::mutex> lock(data_mutex_);
    auto it = deployments_.find(app_id);
    if (it == deployments_.end()) {
        throw NotFoundError("deployment with ID " + app_id + " not found");
    }
    return it->second;
}

void MemoryStateStore::upsertComponentStatus(const std::string& app_id,
                                             const std::string& component_name,
                                             const ComponentStatus& status) {
    requireId(app_id);
    if (component_name.empty()) {
        throw ValidationError("component name cannot be empty");
    }

    std::lock_guard<std::mutex> lock(data_mutex_);
    auto it = deployments_.find(app_id);
    if (it == deployments_.end()) {
        throw NotFoundError("deployment with ID " + app_id + " not found");
    }
    it->second.component_statuses[component_name] = status;
}

void MemoryStateStore::subscribe(DatabaseSubscriber* subscriber) {
    if (subscriber == nullptr) {
        throw ValidationError("subscriber cannot be null");
    }

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    std::string id = subscriber->getSubscriberId();
    for (const auto* existing : subscribers_) {
        if (existing->getSubscriberId() == id) {
            logDebug(kComponent, "Subscriber " + id + " is already registered");
            return;
        }
    }
    subscribers_.push_back(subscriber);
    logDebug(kComponent, "Subscribed " + id);
}

void MemoryStateStore::unsubscribe(const std::string& subscriber_id) {
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                               [&subscriber_id](const DatabaseSubscriber* s) {
                                   return s->getSubscriberId() == subscriber_id;
                               });
        if (it == subscribers_.end()) {
            throw NotFoundError("subscriber with id " + subscriber_id + " not found");
        }
        subscribers_.erase(it);
    }

    // Wait out a delivery in progress unless we are being called from it
    if (std::this_thread::get_id() != publisher_thread_.get_id()) {
        std::lock_guard<std::mutex> barrier(delivery_mutex_);
    }
    logDebug(kComponent, "Unsubscribed " + subscriber_id);
}

void MemoryStateStore::upsertDesiredState(const WorkloadState& state) {
    requireId(state.app_id);

    std::lock_guard<std::mutex> lock(data_mutex_);
    auto it = deployments_.find(state.app_id);
    if (it == deployments_.end()) {
        Deployment deployment;
        deployment.app_id = state.app_id;
        deployment.desired_state = state;
        deployments_[state.app_id] = deployment;
        publishEvent(DatabaseEventType::Added, deployment);
        return;
    }

    it->second.desired_state = state;
    publishEvent(DatabaseEventType::Changed, it->second);
}

void MemoryStateStore::setCurrentState(const std::string& app_id, const WorkloadState& state) {
    requireId(app_id);

    std::lock_guard<std::mutex> lock(data_mutex_);
    auto it = deployments_.find(app_id);
    if (it == deployments_.end()) {
        throw NotFoundError("deployment with ID " + app_id + " not found");
    }
    it->second.current_state = state;
}

void MemoryStateStore::removeDeployment(const std::string& app_id) {
    requireId(app_id);

    std::lock_guard<std::mutex> lock(data_mutex_);
    auto it = deployments_.find(app_id);
    if (it == deployments_.end()) {
        throw NotFoundError("deployment with ID " + app_id + " not found");
    }

    Deployment removed = it->second;
    deployments_.erase(it);
    publishEvent(DatabaseEventType::Deleted, removed);
}

std::vector<Deployment> MemoryStateStore::listDeployments() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    std::vector<Deployment> result;
    result.reserve(deployments_.size());
    for (const auto& [id, deployment] : deployments_) {
        result.push_back(deployment);
    }
    return result;
}

bool MemoryStateStore::hasDeployment(const std::string& app_id) const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return deployments_.count(app_id) > 0;
}

size_t MemoryStateStore::deploymentCount() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return deployments_.size();
}

std::string MemoryStateStore::dumpPath() const {
    if (data_dir_.empty()) {
        return "";
    }
    return (fs::path(data_dir_) / "agent.dump.json").string();
}

// Called with data_mutex_ held so queue order follows mutation order
void MemoryStateStore::publishEvent(DatabaseEventType type, const Deployment& deployment) {
    DatabaseEvent event;
    event.type = type;
    event.deployment = deployment;
    event.timestamp = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

void MemoryStateStore::publisherLoop() {
    logDebug(kComponent, "Event publisher started");

    while (true) {
        std::deque<DatabaseEvent> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
            if (queue_.empty() && !running_) {
                break;
            }
            batch.swap(queue_);
        }

        std::lock_guard<std::mutex> delivery(delivery_mutex_);
        for (const auto& event : batch) {
            deliver(event);
        }
    }

    logDebug(kComponent, "Event publisher stopped");
}

void MemoryStateStore::deliver(const DatabaseEvent& event) {
    std::vector<DatabaseSubscriber*> snapshot;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        snapshot = subscribers_;
    }

    for (auto* subscriber : snapshot) {
        {
            // Skip subscribers removed by an earlier handler in this batch
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            if (std::find(subscribers_.begin(), subscribers_.end(), subscriber) == subscribers_.end()) {
                continue;
            }
        }

        try {
            subscriber->onDatabaseEvent(event);
        } catch (const std::exception& e) {
            logError(kComponent, "Subscriber " + subscriber->getSubscriberId() +
                     " failed to handle " + toString(event.type) + " event for " +
                     event.deployment.app_id + ": " + e.what());
        }
    }
}

void MemoryStateStore::restore() {
    std::string path = dumpPath();
    if (path.empty() || !fs::exists(path)) {
        return;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open state dump: " + path);
    }

    nlohmann::json dump_json = nlohmann::json::parse(file, nullptr, false);
    if (dump_json.is_discarded()) {
        throw std::runtime_error("Failed to parse state dump: " + path);
    }

    std::map<std::string, Deployment> restored;
    for (const auto& entry : dump_json.value("deployments", nlohmann::json::array())) {
        Deployment deployment = entry.get<Deployment>();
        if (!deployment.app_id.empty()) {
            restored[deployment.app_id] = deployment;
        }
    }

    std::lock_guard<std::mutex> lock(data_mutex_);
    deployments_ = std::move(restored);
    logInfo(kComponent, "Restored " + std::to_string(deployments_.size()) + " deployments from " + path);
}

void MemoryStateStore::dump() {
    std::string path = dumpPath();
    if (path.empty()) {
        return;
    }

    try {
        fs::create_directories(fs::path(path).parent_path());

        nlohmann::json dump_json;
        dump_json["deployments"] = listDeployments();

        // Write atomically using temporary file
        std::string temp_path = path + ".tmp";
        {
            std::ofstream file(temp_path);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot create temp state dump: " + temp_path);
            }
            file << dump_json.dump(2);
        }

        fs::rename(temp_path, path);
        logInfo(kComponent, "Saved state dump to " + path);
    } catch (const std::exception& e) {
        logError(kComponent, std::string("Error saving state dump: ") + e.what());
    }
}
