#include <gtest/gtest.h>

#include "errors.h"
#include "helm_monitor.h"
#include "memory_state_store.h"
#include "release_name.h"
#include "test_support.h"

using namespace testing_support;

class HelmMonitorTest : public ::testing::Test {
protected:
    HelmMonitorTest() : monitor_(client_, store_, std::chrono::milliseconds(10)) {}

    void SetUp() override {
        store_.start();
    }

    void TearDown() override {
        cancel_.cancel();
        tasks_.wait();
        store_.stop();
    }

    ComponentState recordedState(const std::string& app_id, const std::string& component) {
        Deployment deployment = store_.getDeployment(app_id);
        auto it = deployment.component_statuses.find(component);
        return it == deployment.component_statuses.end() ? ComponentState::Unknown : it->second.state;
    }

    FakeHelmClient client_;
    MemoryStateStore store_;
    HelmMonitor monitor_;
    CancelSource cancel_;
    TaskGroup tasks_;
};

TEST_F(HelmMonitorTest, PollingRecordsComponentStatus) {
    store_.upsertDesiredState(helmWorkload("wl-1", {"web", "db"}));
    client_.setStatus(releaseName("wl-1", "db"), "failed");

    monitor_.watch(cancel_.token(), tasks_, "wl-1");
    EXPECT_EQ(tasks_.activeCount(), 2u);

    EXPECT_TRUE(waitUntil([&]() {
        return recordedState("wl-1", "web") == ComponentState::Deployed &&
               recordedState("wl-1", "db") == ComponentState::Failed;
    }));

    Deployment deployment = store_.getDeployment("wl-1");
    EXPECT_EQ(deployment.component_statuses["db"].message, "helm status failed (unhealthy)");
}

TEST_F(HelmMonitorTest, PollingSurvivesBackendFailures) {
    store_.upsertDesiredState(helmWorkload("wl-1"));
    client_.failNextStatusCalls(3);

    monitor_.watch(cancel_.token(), tasks_, "wl-1");

    EXPECT_TRUE(waitUntil([&]() { return recordedState("wl-1", "c1") == ComponentState::Deployed; }));
    EXPECT_GE(client_.statusCalls(), 4);
}

TEST_F(HelmMonitorTest, CancellationStopsPolling) {
    store_.upsertDesiredState(helmWorkload("wl-1"));
    monitor_.watch(cancel_.token(), tasks_, "wl-1");

    ASSERT_TRUE(waitUntil([&]() { return client_.statusCalls() > 0; }));
    cancel_.cancel();
    tasks_.wait();

    int calls = client_.statusCalls();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(client_.statusCalls(), calls);
    EXPECT_EQ(tasks_.activeCount(), 0u);
}

TEST_F(HelmMonitorTest, WatchRequiresRecordedDeployment) {
    EXPECT_THROW(monitor_.watch(cancel_.token(), tasks_, "missing"), StoreError);
    EXPECT_EQ(tasks_.activeCount(), 0u);
}

TEST_F(HelmMonitorTest, StatusOfUnknownWorkloadIsUnknown) {
    ComponentStatus status = monitor_.getStatus("missing", "");
    EXPECT_EQ(status.state, ComponentState::Unknown);
    EXPECT_EQ(client_.statusCalls(), 0);
}

TEST_F(HelmMonitorTest, StatusSelectsComponent) {
    store_.upsertDesiredState(helmWorkload("wl-1", {"web", "db"}));
    client_.setStatus(releaseName("wl-1", "web"), "pending-install");
    client_.setStatus(releaseName("wl-1", "db"), "deployed");

    EXPECT_EQ(monitor_.getStatus("wl-1", "").state, ComponentState::Pending);
    EXPECT_EQ(monitor_.getStatus("wl-1", "db").state, ComponentState::Deployed);
    EXPECT_THROW(monitor_.getStatus("wl-1", "cache"), ValidationError);

    client_.failNextStatusCalls(1);
    EXPECT_THROW(monitor_.getStatus("wl-1", "db"), BackendError);
}

TEST(HelmMonitorConstructionTest, RejectsNonPositivePollInterval) {
    FakeHelmClient client;
    MemoryStateStore store;
    EXPECT_THROW({ HelmMonitor monitor(client, store, std::chrono::milliseconds(0)); }, ValidationError);
    EXPECT_THROW({ HelmMonitor monitor(client, store, std::chrono::milliseconds(-5)); }, ValidationError);
}
