#include "config_manager.h"
#include "errors.h"
#include "logging.h"
#include <filesystem>
#include <fstream>
#include <map>
#include <regex>
#include <sys/inotify.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace {

const char* kComponent = "ConfigManager";

const char* kDefaultDataDir = "/var/lib/fleet-agent";
const char* kDefaultDesiredStateFile = "/etc/fleet-agent/desired.json";

} // namespace

std::chrono::seconds parseFrequency(const std::string& freq) {
    static const std::map<char, int> multipliers = {
        {'s', 1},        // seconds
        {'m', 60},       // minutes
        {'h', 3600},     // hours
        {'d', 86400},    // days
        {'w', 604800}    // weeks
    };

    std::regex freq_regex(R"((\d+)([smhdw]))");
    std::smatch match;

    if (std::regex_match(freq, match, freq_regex)) {
        try {
            int value = std::stoi(match[1].str());
            char unit = match[2].str()[0];

            auto it = multipliers.find(unit);
            if (it != multipliers.end() && value > 0) {
                return std::chrono::seconds(static_cast<long long>(value) * it->second);
            }
        } catch (const std::exception& e) {
            logError(kComponent, "Frequency out of range: " + freq + " (" + e.what() + ")");
        }
    }

    logError(kComponent, "Invalid frequency format: " + freq + ", using default 30s");
    return std::chrono::seconds(30);
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , monitoring_(false)
    , inotify_fd_(-1)
    , dir_watch_fd_(-1) {
    loadConfig();
    validate();
}

ConfigManager::~ConfigManager() {
    stopMonitoring();
}

void ConfigManager::loadConfig() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open agent config: " + config_path_);
    }

    try {
        file >> config_;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("invalid agent config " + config_path_ + ": " + e.what());
    }

    if (!config_.is_object()) {
        throw ValidationError("agent config must be a JSON object: " + config_path_);
    }

    logInfo(kComponent, "Loaded agent config from " + config_path_);
}

void ConfigManager::validate() const {
    if (!config_.contains("device_id") || !config_["device_id"].is_string() ||
        config_["device_id"].get<std::string>().empty()) {
        throw ValidationError("device_id is required");
    }

    if (config_.contains("runtimes") && !config_["runtimes"].is_object()) {
        throw ValidationError("runtimes must be an object");
    }

    if (!isHelmEnabled() && !isComposeEnabled()) {
        throw ValidationError("at least one runtime must be enabled");
    }
}

nlohmann::json ConfigManager::runtime(const std::string& name) const {
    return config_.value("runtimes", nlohmann::json::object()).value(name, nlohmann::json::object());
}

std::string ConfigManager::getDeviceId() const {
    return config_.value("device_id", "");
}

std::string ConfigManager::getDataDir() const {
    return config_.value("data_dir", kDefaultDataDir);
}

std::string ConfigManager::getLogLevel() const {
    return config_.value("log_level", "info");
}

std::chrono::seconds ConfigManager::getMonitorInterval() const {
    return parseFrequency(config_.value("monitor_interval", "30s"));
}

std::string ConfigManager::getDesiredStateFile() const {
    return config_.value("desired_state_file", kDefaultDesiredStateFile);
}

bool ConfigManager::isHelmEnabled() const {
    return runtime("helm").value("enabled", true);
}

std::string ConfigManager::getHelmBinary() const {
    return runtime("helm").value("binary", "helm");
}

std::string ConfigManager::getHelmKubeconfig() const {
    return runtime("helm").value("kubeconfig", "");
}

std::string ConfigManager::getHelmNamespace() const {
    return runtime("helm").value("namespace", "default");
}

std::string ConfigManager::getHelmTimeout() const {
    return runtime("helm").value("timeout", "5m");
}

bool ConfigManager::isComposeEnabled() const {
    return runtime("compose").value("enabled", true);
}

nlohmann::json ConfigManager::loadDesiredState() const {
    std::string path = getDesiredStateFile();
    if (!fs::exists(path)) {
        logInfo(kComponent, "Desired state file not found, using empty document: " + path);
        return nlohmann::json{{"workloads", nlohmann::json::array()}};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open desired state file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("invalid desired state file " + path + ": " + e.what());
    }

    if (!document.is_object()) {
        throw ValidationError("desired state document must be a JSON object");
    }
    if (!document.contains("workloads")) {
        document["workloads"] = nlohmann::json::array();
    } else if (!document["workloads"].is_array()) {
        throw ValidationError("desired state workloads must be an array");
    }

    return document;
}

void ConfigManager::setDesiredStateCallback(DesiredStateCallback callback) {
    desired_state_callback_ = std::move(callback);
}

void ConfigManager::startMonitoring() {
    if (monitoring_) {
        return;
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK);
    if (inotify_fd_ == -1) {
        throw std::runtime_error(std::string("Failed to initialize inotify: ") + strerror(errno));
    }

    // Editors and atomic writers replace the file, so watch its directory
    fs::path dir = fs::path(getDesiredStateFile()).parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    fs::create_directories(dir);

    dir_watch_fd_ = inotify_add_watch(inotify_fd_, dir.c_str(),
                                      IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE);
    if (dir_watch_fd_ == -1) {
        std::string reason = strerror(errno);
        close(inotify_fd_);
        inotify_fd_ = -1;
        throw std::runtime_error("Failed to watch " + dir.string() + ": " + reason);
    }

    monitoring_ = true;
    monitor_thread_ = std::thread(&ConfigManager::monitorLoop, this);

    logInfo(kComponent, "Started monitoring desired state file " + getDesiredStateFile());
}

void ConfigManager::stopMonitoring() {
    if (!monitoring_) {
        return;
    }

    monitoring_ = false;

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    if (inotify_fd_ != -1) {
        close(inotify_fd_);
        inotify_fd_ = -1;
        dir_watch_fd_ = -1;
    }

    logInfo(kComponent, "Stopped monitoring desired state file");
}

void ConfigManager::monitorLoop() {
    const size_t EVENT_SIZE = sizeof(struct inotify_event);
    const size_t BUF_LEN = 1024 * (EVENT_SIZE + 16);
    alignas(struct inotify_event) char buffer[BUF_LEN];

    std::string file_name = fs::path(getDesiredStateFile()).filename().string();

    while (monitoring_) {
        ssize_t length = read(inotify_fd_, buffer, BUF_LEN);

        if (length < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
            logError(kComponent, std::string("Error reading inotify events: ") + strerror(errno));
            break;
        }

        bool changed = false;
        ssize_t i = 0;
        while (i < length) {
            auto* event = reinterpret_cast<struct inotify_event*>(&buffer[i]);
            if (event->wd == dir_watch_fd_ && event->len > 0 && file_name == event->name) {
                changed = true;
            }
            i += EVENT_SIZE + event->len;
        }

        if (changed) {
            logInfo(kComponent, "Desired state file changed");
            handleFileChange();
        }
    }
}

void ConfigManager::handleFileChange() {
    if (!desired_state_callback_) {
        return;
    }

    try {
        desired_state_callback_(loadDesiredState());
    } catch (const std::exception& e) {
        logError(kComponent, std::string("Failed to apply desired state: ") + e.what());
    }
}
