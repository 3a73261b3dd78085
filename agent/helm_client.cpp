#include "helm_client.h"
#include "errors.h"
#include "logging.h"
#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

const char* kComponent = "HelmClient";

void validateInput(const std::string& release_name, const std::string& chart) {
    if (release_name.empty()) {
        throw ValidationError("release name cannot be empty");
    }
    if (chart.empty()) {
        throw ValidationError("chart reference cannot be empty");
    }
}

// Removes the values file when the command is done
class ScopedFile {
public:
    explicit ScopedFile(std::string path) : path_(std::move(path)) {}
    ~ScopedFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

HelmCliClient::HelmCliClient(HelmCliOptions options, std::shared_ptr<CommandRunner> runner)
    : options_(std::move(options))
    , runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("command runner is required");
    }
}

void HelmCliClient::installChart(const std::string& release_name,
                                 const std::string& chart,
                                 const std::string& namespace_name,
                                 const std::string& revision,
                                 bool wait,
                                 const nlohmann::json& values) {
    validateInput(release_name, chart);

    ScopedFile values_file(writeValuesFile(release_name, values));

    auto args = baseArgs("install", namespace_name);
    args.push_back(release_name);
    args.push_back(chart);
    args.push_back("--create-namespace");
    args.push_back("-f");
    args.push_back(values_file.path());
    if (!revision.empty()) {
        args.push_back("--version");
        args.push_back(revision);
    }
    if (wait) {
        args.push_back("--wait");
    }
    if (!options_.timeout.empty()) {
        args.push_back("--timeout");
        args.push_back(options_.timeout);
    }

    execute(args, "install chart " + chart + " as " + release_name);
    logInfo(kComponent, "Installed release " + release_name + " from " + chart);
}

void HelmCliClient::upgradeChart(const std::string& release_name,
                                 const std::string& chart,
                                 const std::string& namespace_name,
                                 const nlohmann::json& values) {
    validateInput(release_name, chart);

    ScopedFile values_file(writeValuesFile(release_name, values));

    auto args = baseArgs("upgrade", namespace_name);
    args.push_back(release_name);
    args.push_back(chart);
    args.push_back("--reuse-values");
    args.push_back("-f");
    args.push_back(values_file.path());
    if (!options_.timeout.empty()) {
        args.push_back("--timeout");
        args.push_back(options_.timeout);
    }

    execute(args, "upgrade release " + release_name);
    logInfo(kComponent, "Upgraded release " + release_name);
}

void HelmCliClient::uninstallChart(const std::string& release_name, const std::string& namespace_name) {
    if (release_name.empty()) {
        throw ValidationError("release name cannot be empty");
    }

    auto args = baseArgs("uninstall", namespace_name);
    args.push_back(release_name);

    execute(args, "uninstall release " + release_name);
    logInfo(kComponent, "Uninstalled release " + release_name);
}

ReleaseStatus HelmCliClient::getReleaseStatus(const std::string& release_name, const std::string& namespace_name) {
    if (release_name.empty()) {
        throw ValidationError("release name cannot be empty");
    }

    auto args = baseArgs("status", namespace_name);
    args.push_back(release_name);
    args.push_back("-o");
    args.push_back("json");

    std::string output = execute(args, "get status of release " + release_name);

    // Warnings on stderr may precede the JSON document
    size_t start = output.find('{');
    if (start == std::string::npos) {
        throw std::runtime_error("unexpected helm status output for " + release_name + ": " + output);
    }

    nlohmann::json status_json = nlohmann::json::parse(output.substr(start), nullptr, false);
    if (status_json.is_discarded() || !status_json.is_object()) {
        throw std::runtime_error("unexpected helm status output for " + release_name);
    }

    ReleaseStatus status;
    status.name = status_json.value("name", release_name);
    status.namespace_name = status_json.value("namespace", "");
    status.revision = status_json.value("version", 0);

    const auto info = status_json.value("info", nlohmann::json::object());
    status.status = info.value("status", "unknown");
    status.updated = info.value("last_deployed", "");

    const auto metadata = status_json.value("chart", nlohmann::json::object()).value("metadata", nlohmann::json::object());
    status.chart = metadata.value("name", "") + "-" + metadata.value("version", "");

    return status;
}

std::vector<std::string> HelmCliClient::baseArgs(const std::string& verb, const std::string& namespace_name) const {
    std::vector<std::string> args = {options_.binary, verb};

    std::string ns = namespace_name.empty() ? options_.default_namespace : namespace_name;
    if (!ns.empty()) {
        args.push_back("--namespace");
        args.push_back(ns);
    }
    if (!options_.kubeconfig.empty()) {
        args.push_back("--kubeconfig");
        args.push_back(options_.kubeconfig);
    }
    return args;
}

std::string HelmCliClient::execute(const std::vector<std::string>& args, const std::string& action) {
    logDebug(kComponent, "Running: " + buildCommandLine(args));

    CommandResult result = runner_->run(args);
    if (result.exit_code != 0) {
        throw std::runtime_error("failed to " + action + " (exit " + std::to_string(result.exit_code) + "): " + result.output);
    }
    return result.output;
}

std::string HelmCliClient::writeValuesFile(const std::string& release_name, const nlohmann::json& values) const {
    static std::atomic<unsigned> counter(0);

    fs::path path = fs::temp_directory_path() /
        ("fleet-agent-" + release_name + "-" + std::to_string(++counter) + "-values.json");

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create values file: " + path.string());
    }
    file << (values.is_null() ? nlohmann::json::object() : values).dump(2);

    return path.string();
}
