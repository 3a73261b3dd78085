#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "command_runner.h"

struct ReleaseStatus {
    std::string name;
    std::string namespace_name;
    std::string status;   // "deployed", "failed", "pending-install", ...
    int revision = 0;
    std::string chart;
    std::string updated;
};

// Narrow view of the Helm backend used by the deployer and the monitor
class HelmClient {
public:
    virtual ~HelmClient() = default;

    virtual void installChart(const std::string& release_name,
                              const std::string& chart,
                              const std::string& namespace_name,
                              const std::string& revision,
                              bool wait,
                              const nlohmann::json& values) = 0;

    virtual void upgradeChart(const std::string& release_name,
                              const std::string& chart,
                              const std::string& namespace_name,
                              const nlohmann::json& values) = 0;

    virtual void uninstallChart(const std::string& release_name,
                                const std::string& namespace_name) = 0;

    virtual ReleaseStatus getReleaseStatus(const std::string& release_name,
                                           const std::string& namespace_name) = 0;
};

struct HelmCliOptions {
    std::string binary = "helm";
    std::string kubeconfig;
    std::string default_namespace = "default";
    std::string timeout = "5m";
};

// Drives the helm binary; errors carry the CLI output
class HelmCliClient : public HelmClient {
public:
    HelmCliClient(HelmCliOptions options, std::shared_ptr<CommandRunner> runner);

    void installChart(const std::string& release_name,
                      const std::string& chart,
                      const std::string& namespace_name,
                      const std::string& revision,
                      bool wait,
                      const nlohmann::json& values) override;

    void upgradeChart(const std::string& release_name,
                      const std::string& chart,
                      const std::string& namespace_name,
                      const nlohmann::json& values) override;

    void uninstallChart(const std::string& release_name,
                        const std::string& namespace_name) override;

    ReleaseStatus getReleaseStatus(const std::string& release_name,
                                   const std::string& namespace_name) override;

private:
    HelmCliOptions options_;
    std::shared_ptr<CommandRunner> runner_;

    std::vector<std::string> baseArgs(const std::string& verb, const std::string& namespace_name) const;
    std::string execute(const std::vector<std::string>& args, const std::string& action);
    std::string writeValuesFile(const std::string& release_name, const nlohmann::json& values) const;
};
