#include <gtest/gtest.h>

#include "deployer.h"
#include "errors.h"
#include "helm_deployer.h"
#include "memory_state_store.h"
#include "release_name.h"
#include "test_support.h"
#include "workload_manager.h"

using namespace testing_support;

namespace {

class RecordingDeployer : public WorkloadDeployer {
public:
    explicit RecordingDeployer(std::string type) : type_(std::move(type)) {}

    DeploymentProfileType getType() const override { return type_; }

    void deploy(const DeploymentSpec& spec) override {
        record("deploy:" + spec.id);
        if (fail) {
            throw BackendError("deploy", spec.id, std::make_exception_ptr(std::runtime_error("backend down")));
        }
    }

    void update(const DeploymentSpec& spec) override {
        record("update:" + spec.id);
    }

    void remove(const std::string& app_id) override {
        record("remove-by-id:" + app_id);
    }

    void remove(const Deployment& deployment) override {
        record("remove:" + deployment.app_id);
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::atomic<bool> fail{false};

private:
    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    std::string type_;
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

} // namespace

class WorkloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto deployer = std::make_unique<RecordingDeployer>("helm.v3");
        deployer_ = deployer.get();

        StrategyRegistry<WorkloadDeployer> deployers;
        deployers.add(std::move(deployer));

        store_.start();
        manager_ = std::make_unique<WorkloadManager>(store_, std::move(deployers));
    }

    void TearDown() override {
        manager_.reset();
        store_.stop();
    }

    MemoryStateStore store_;
    std::unique_ptr<WorkloadManager> manager_;
    RecordingDeployer* deployer_ = nullptr;
};

TEST_F(WorkloadManagerTest, DeployRecordsCurrentState) {
    WorkloadState state = helmWorkload("wl-1");
    store_.upsertDesiredState(state);

    manager_->deploy(state);

    EXPECT_EQ(deployer_->calls(), std::vector<std::string>{"deploy:wl-1"});
    Deployment deployment = store_.getDeployment("wl-1");
    ASSERT_TRUE(deployment.current_state.has_value());
    EXPECT_EQ(deployment.current_state->deployment_hash, state.deployment_hash);
}

TEST_F(WorkloadManagerTest, FailedDeployLeavesCurrentStateUnset) {
    WorkloadState state = helmWorkload("wl-1");
    store_.upsertDesiredState(state);
    deployer_->fail = true;

    EXPECT_THROW(manager_->deploy(state), BackendError);
    EXPECT_FALSE(store_.getDeployment("wl-1").current_state.has_value());
}

TEST_F(WorkloadManagerTest, UnsupportedProfileIsReported) {
    EXPECT_THROW(manager_->deploy(workloadOfType("wl-1", "compose")), UnsupportedProfileError);
    EXPECT_THROW(manager_->deploy(WorkloadState{}), ValidationError);
    EXPECT_TRUE(deployer_->calls().empty());
}

TEST_F(WorkloadManagerTest, EventsDriveDeployers) {
    manager_->start();

    store_.upsertDesiredState(helmWorkload("wl-1"));
    ASSERT_TRUE(waitUntil([&]() { return store_.getDeployment("wl-1").current_state.has_value(); }));

    store_.upsertDesiredState(helmWorkload("wl-1", {"c1"}, "2.0.0"));
    ASSERT_TRUE(waitUntil([&]() { return deployer_->calls().size() == 2; }));

    store_.removeDeployment("wl-1");
    ASSERT_TRUE(waitUntil([&]() { return deployer_->calls().size() == 3; }));

    EXPECT_EQ(deployer_->calls(), (std::vector<std::string>{"deploy:wl-1", "update:wl-1", "remove:wl-1"}));
    manager_->stop();
}

TEST_F(WorkloadManagerTest, ChangeBeforeFirstDeployIsDeployed) {
    deployer_->fail = true;
    manager_->start();

    store_.upsertDesiredState(helmWorkload("wl-1"));
    ASSERT_TRUE(waitUntil([&]() { return deployer_->calls().size() == 1; }));

    deployer_->fail = false;
    store_.upsertDesiredState(helmWorkload("wl-1", {"c1"}, "2.0.0"));
    ASSERT_TRUE(waitUntil([&]() { return deployer_->calls().size() == 2; }));

    EXPECT_EQ(deployer_->calls()[1], "deploy:wl-1");
    manager_->stop();
}

TEST_F(WorkloadManagerTest, RemovalOfNeverDeployedWorkloadIsSkipped) {
    manager_->start();
    deployer_->fail = true;

    store_.upsertDesiredState(helmWorkload("wl-1"));
    ASSERT_TRUE(waitUntil([&]() { return deployer_->calls().size() == 1; }));
    store_.removeDeployment("wl-1");
    store_.stop();

    EXPECT_EQ(deployer_->calls(), std::vector<std::string>{"deploy:wl-1"});
}

TEST_F(WorkloadManagerTest, ExplicitRemoveResolvesFromStore) {
    WorkloadState state = helmWorkload("wl-1");
    store_.upsertDesiredState(state);
    store_.setCurrentState("wl-1", state);

    manager_->remove("wl-1");
    EXPECT_EQ(deployer_->calls(), std::vector<std::string>{"remove:wl-1"});

    EXPECT_THROW(manager_->remove("missing"), StoreError);
    EXPECT_THROW(manager_->remove(""), ValidationError);
}

class HelmWorkloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        StrategyRegistry<WorkloadDeployer> deployers;
        deployers.add(std::make_unique<HelmDeployer>(client_, store_));

        store_.start();
        manager_ = std::make_unique<WorkloadManager>(store_, std::move(deployers));
        manager_->start();
    }

    void TearDown() override {
        manager_.reset();
        store_.stop();
    }

    FakeHelmClient client_;
    MemoryStateStore store_;
    std::unique_ptr<WorkloadManager> manager_;
};

TEST_F(HelmWorkloadManagerTest, PartialInstallLeavesNoReleaseAfterRemoval) {
    client_.failInstallOf(releaseName("wl-1", "c2"));

    store_.upsertDesiredState(helmWorkload("wl-1", {"c1", "c2"}));
    store_.removeDeployment("wl-1");
    store_.stop();

    EXPECT_EQ(client_.releasesFor("install"), (std::vector<std::string>{"wl-1-c1", "wl-1-c2"}));
    EXPECT_EQ(client_.releasesFor("uninstall"), std::vector<std::string>{"wl-1-c1"});
}

TEST_F(HelmWorkloadManagerTest, ChangeAfterPartialInstallConverges) {
    client_.failInstallOf(releaseName("wl-1", "c2"));
    store_.upsertDesiredState(helmWorkload("wl-1", {"c1", "c2"}));
    ASSERT_TRUE(waitUntil([&]() { return client_.releasesFor("uninstall").size() == 1; }));

    store_.upsertDesiredState(helmWorkload("wl-1", {"c1"}, "2.0.0"));
    ASSERT_TRUE(waitUntil([&]() { return store_.getDeployment("wl-1").current_state.has_value(); }));

    EXPECT_EQ(store_.getDeployment("wl-1").current_state->app_version, "2.0.0");
}

TEST_F(HelmWorkloadManagerTest, RemovalDuringInstallTearsDownRelease) {
    client_.onInstall([this](const std::string&) {
        if (store_.hasDeployment("wl-1")) {
            store_.removeDeployment("wl-1");
        }
    });

    store_.upsertDesiredState(helmWorkload("wl-1", {"c1"}));
    store_.stop();

    EXPECT_FALSE(store_.hasDeployment("wl-1"));
    EXPECT_EQ(client_.releasesFor("install"), std::vector<std::string>{"wl-1-c1"});
    EXPECT_EQ(client_.releasesFor("uninstall"), std::vector<std::string>{"wl-1-c1"});
}

TEST_F(WorkloadManagerTest, RemovalDuringDeployIsTornDown) {
    WorkloadState state = helmWorkload("wl-1");
    store_.upsertDesiredState(state);
    store_.removeDeployment("wl-1");

    manager_->deploy(state);

    EXPECT_EQ(deployer_->calls(), (std::vector<std::string>{"deploy:wl-1", "remove:wl-1"}));
}
