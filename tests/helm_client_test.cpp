#include <gtest/gtest.h>

#include <algorithm>
#include "command_runner.h"
#include "errors.h"
#include "helm_client.h"

namespace {

class ScriptedRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& args) override {
        invocations.push_back(args);
        return next;
    }

    std::vector<std::vector<std::string>> invocations;
    CommandResult next{0, ""};
};

bool hasFlag(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    auto it = std::find(args.begin(), args.end(), flag);
    return it != args.end() && std::next(it) != args.end() && *std::next(it) == value;
}

} // namespace

class HelmCliClientTest : public ::testing::Test {
protected:
    HelmCliClientTest() : runner_(std::make_shared<ScriptedRunner>()) {
        options_.binary = "/usr/local/bin/helm";
        options_.kubeconfig = "/etc/rancher/k3s/k3s.yaml";
        options_.default_namespace = "apps";
        options_.timeout = "2m";
    }

    HelmCliOptions options_;
    std::shared_ptr<ScriptedRunner> runner_;
};

TEST_F(HelmCliClientTest, InstallBuildsCommandLine) {
    HelmCliClient client(options_, runner_);
    client.installChart("wl-1-c1", "oci://reg/chart", "", "1.2.0", true, {{"replicas", 3}});

    ASSERT_EQ(runner_->invocations.size(), 1u);
    const auto& args = runner_->invocations[0];
    EXPECT_EQ(args[0], "/usr/local/bin/helm");
    EXPECT_EQ(args[1], "install");
    EXPECT_TRUE(hasFlag(args, "--namespace", "apps"));
    EXPECT_TRUE(hasFlag(args, "--kubeconfig", "/etc/rancher/k3s/k3s.yaml"));
    EXPECT_TRUE(hasFlag(args, "--version", "1.2.0"));
    EXPECT_TRUE(hasFlag(args, "--timeout", "2m"));
    EXPECT_NE(std::find(args.begin(), args.end(), "--wait"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "wl-1-c1"), args.end());
}

TEST_F(HelmCliClientTest, ExplicitNamespaceOverridesDefault) {
    HelmCliClient client(options_, runner_);
    client.uninstallChart("wl-1-c1", "edge");

    ASSERT_EQ(runner_->invocations.size(), 1u);
    EXPECT_TRUE(hasFlag(runner_->invocations[0], "--namespace", "edge"));
}

TEST_F(HelmCliClientTest, NonZeroExitCarriesOutput) {
    runner_->next = CommandResult{1, "Error: INSTALLATION FAILED: chart not found"};
    HelmCliClient client(options_, runner_);

    try {
        client.upgradeChart("wl-1-c1", "oci://reg/chart", "", nlohmann::json::object());
        FAIL() << "expected failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("chart not found"), std::string::npos);
    }
}

TEST_F(HelmCliClientTest, ParsesStatusAfterWarnings) {
    runner_->next = CommandResult{0,
        "WARNING: Kubernetes configuration file is group-readable.\n"
        R"({"name":"wl-1-c1","namespace":"apps","version":4,)"
        R"("info":{"status":"pending-upgrade","last_deployed":"2024-05-01T10:00:00Z"},)"
        R"("chart":{"metadata":{"name":"demo","version":"1.2.0"}}})"};
    HelmCliClient client(options_, runner_);

    ReleaseStatus status = client.getReleaseStatus("wl-1-c1", "");

    EXPECT_EQ(status.status, "pending-upgrade");
    EXPECT_EQ(status.revision, 4);
    EXPECT_EQ(status.namespace_name, "apps");
    EXPECT_EQ(status.chart, "demo-1.2.0");
    EXPECT_TRUE(hasFlag(runner_->invocations[0], "-o", "json"));
}

TEST_F(HelmCliClientTest, RejectsEmptyArguments) {
    HelmCliClient client(options_, runner_);
    EXPECT_THROW(client.installChart("", "chart", "", "", false, nullptr), ValidationError);
    EXPECT_THROW(client.upgradeChart("release", "", "", nullptr), ValidationError);
    EXPECT_THROW(client.getReleaseStatus("", ""), ValidationError);
    EXPECT_TRUE(runner_->invocations.empty());
}

TEST(CommandLineTest, QuotesArguments) {
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(buildCommandLine({"helm", "status", "a b"}), "'helm' 'status' 'a b'");
}

TEST(ShellCommandRunnerTest, CapturesOutputAndExitCode) {
    ShellCommandRunner runner;

    CommandResult ok = runner.run({"sh", "-c", "echo hello"});
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_EQ(ok.output, "hello\n");

    CommandResult failed = runner.run({"sh", "-c", "echo oops >&2; exit 3"});
    EXPECT_EQ(failed.exit_code, 3);
    EXPECT_EQ(failed.output, "oops\n");
}
