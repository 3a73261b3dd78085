#pragma once

#include <string>
#include <functional>
#include <thread>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

// "30s", "5m", "1h", "2d", "1w"; invalid or zero input logs an error and yields 30s
std::chrono::seconds parseFrequency(const std::string& freq);

class ConfigManager {
public:
    using DesiredStateCallback = std::function<void(const nlohmann::json& desired_state)>;

    explicit ConfigManager(const std::string& config_path);
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // Configuration access
    const nlohmann::json& getConfig() const { return config_; }
    const std::string& getConfigPath() const { return config_path_; }

    std::string getDeviceId() const;
    std::string getDataDir() const;
    std::string getLogLevel() const;
    std::chrono::seconds getMonitorInterval() const;
    std::string getDesiredStateFile() const;

    // Runtimes
    bool isHelmEnabled() const;
    std::string getHelmBinary() const;
    std::string getHelmKubeconfig() const;
    std::string getHelmNamespace() const;
    std::string getHelmTimeout() const;
    bool isComposeEnabled() const;

    // Desired state document; an absent file is an empty document
    nlohmann::json loadDesiredState() const;

    // Monitoring of the desired state file
    void startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const { return monitoring_; }
    void setDesiredStateCallback(DesiredStateCallback callback);

private:
    std::string config_path_;
    nlohmann::json config_;

    // inotify monitoring
    std::atomic<bool> monitoring_;
    std::thread monitor_thread_;
    int inotify_fd_;
    int dir_watch_fd_;
    DesiredStateCallback desired_state_callback_;

    void loadConfig();
    void validate() const;
    nlohmann::json runtime(const std::string& name) const;
    void monitorLoop();
    void handleFileChange();
};
