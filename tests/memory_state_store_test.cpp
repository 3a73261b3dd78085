#include <gtest/gtest.h>

#include "errors.h"
#include "memory_state_store.h"
#include "test_support.h"

using namespace testing_support;

class MemoryStateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.start();
    }

    void TearDown() override {
        store_.stop();
    }

    MemoryStateStore store_;
};

TEST_F(MemoryStateStoreTest, UpsertEmitsAddedThenChanged) {
    RecordingSubscriber subscriber("recorder");
    store_.subscribe(&subscriber);

    store_.upsertDesiredState(helmWorkload("wl-1", {"c1"}, "1.0.0"));
    store_.upsertDesiredState(helmWorkload("wl-1", {"c1"}, "2.0.0"));

    ASSERT_TRUE(waitUntil([&]() { return subscriber.eventCount() == 2; }));
    auto events = subscriber.events();
    EXPECT_EQ(events[0].type, DatabaseEventType::Added);
    EXPECT_EQ(events[1].type, DatabaseEventType::Changed);
    ASSERT_TRUE(events[1].deployment.desired_state.has_value());
    EXPECT_EQ(events[1].deployment.desired_state->app_version, "2.0.0");

    store_.unsubscribe("recorder");
}

TEST_F(MemoryStateStoreTest, RemoveEmitsDeletedWithLastKnownState) {
    RecordingSubscriber subscriber("recorder");
    store_.subscribe(&subscriber);

    WorkloadState state = helmWorkload("wl-1");
    store_.upsertDesiredState(state);
    store_.setCurrentState("wl-1", state);
    store_.removeDeployment("wl-1");

    ASSERT_TRUE(waitUntil([&]() { return subscriber.eventCount() == 2; }));
    auto events = subscriber.events();
    EXPECT_EQ(events[1].type, DatabaseEventType::Deleted);
    EXPECT_EQ(events[1].deployment.app_id, "wl-1");
    EXPECT_TRUE(events[1].deployment.current_state.has_value());
    EXPECT_FALSE(store_.hasDeployment("wl-1"));

    store_.unsubscribe("recorder");
}

TEST_F(MemoryStateStoreTest, EventsArriveInEmissionOrder) {
    RecordingSubscriber subscriber("recorder");
    store_.subscribe(&subscriber);

    for (int i = 0; i < 20; ++i) {
        store_.upsertDesiredState(helmWorkload("wl-" + std::to_string(i)));
    }

    ASSERT_TRUE(waitUntil([&]() { return subscriber.eventCount() == 20; }));
    auto events = subscriber.events();
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(events[i].deployment.app_id, "wl-" + std::to_string(i));
    }

    store_.unsubscribe("recorder");
}

TEST_F(MemoryStateStoreTest, FailingSubscriberDoesNotStarveOthers) {
    RecordingSubscriber failing("failing");
    RecordingSubscriber healthy("healthy");
    failing.throw_on_event = true;
    store_.subscribe(&failing);
    store_.subscribe(&healthy);

    store_.upsertDesiredState(helmWorkload("wl-1"));

    ASSERT_TRUE(waitUntil([&]() { return healthy.eventCount() == 1; }));
    EXPECT_EQ(failing.eventCount(), 1u);

    store_.unsubscribe("failing");
    store_.unsubscribe("healthy");
}

TEST_F(MemoryStateStoreTest, UnsubscribedSubscriberReceivesNothing) {
    RecordingSubscriber subscriber("recorder");
    store_.subscribe(&subscriber);
    store_.subscribe(&subscriber);
    store_.unsubscribe("recorder");

    store_.upsertDesiredState(helmWorkload("wl-1"));
    store_.stop();

    EXPECT_EQ(subscriber.eventCount(), 0u);
    EXPECT_THROW(store_.unsubscribe("recorder"), NotFoundError);
}

TEST_F(MemoryStateStoreTest, LookupsAndValidation) {
    EXPECT_THROW(store_.getDeployment("missing"), NotFoundError);
    EXPECT_THROW(store_.getDeployment(""), ValidationError);
    EXPECT_THROW(store_.setCurrentState("missing", helmWorkload("missing")), NotFoundError);
    EXPECT_THROW(store_.removeDeployment("missing"), NotFoundError);
    EXPECT_THROW(store_.subscribe(nullptr), ValidationError);

    store_.upsertDesiredState(helmWorkload("wl-1"));

    ComponentStatus status;
    status.state = ComponentState::Deployed;
    status.message = "ok";
    store_.upsertComponentStatus("wl-1", "c1", status);

    Deployment deployment = store_.getDeployment("wl-1");
    ASSERT_EQ(deployment.component_statuses.count("c1"), 1u);
    EXPECT_EQ(deployment.component_statuses["c1"].state, ComponentState::Deployed);
    EXPECT_THROW(store_.upsertComponentStatus("missing", "c1", status), NotFoundError);
    EXPECT_EQ(store_.deploymentCount(), 1u);
}

TEST(MemoryStateStorePersistenceTest, DumpIsRestoredOnStart) {
    TempDir dir;
    WorkloadState desired = helmWorkload("wl-1", {"c1"}, "3.1.0");

    {
        MemoryStateStore store(dir.str());
        store.start();
        store.upsertDesiredState(desired);
        store.setCurrentState("wl-1", desired);

        ComponentStatus status;
        status.state = ComponentState::Failed;
        status.message = "helm status failed (unhealthy)";
        store.upsertComponentStatus("wl-1", "c1", status);
        store.stop();

        EXPECT_TRUE(std::filesystem::exists(store.dumpPath()));
    }

    MemoryStateStore restored(dir.str());
    restored.start();

    Deployment deployment = restored.getDeployment("wl-1");
    ASSERT_TRUE(deployment.desired_state.has_value());
    ASSERT_TRUE(deployment.current_state.has_value());
    EXPECT_EQ(deployment.desired_state->app_version, "3.1.0");
    EXPECT_EQ(deployment.current_state->deployment_hash, desired.deployment_hash);
    EXPECT_EQ(deployment.desired_state->deployment_base64, desired.deployment_base64);
    EXPECT_EQ(deployment.component_statuses["c1"].state, ComponentState::Failed);
    EXPECT_EQ(deployment.component_statuses["c1"].message, "helm status failed (unhealthy)");

    restored.stop();
}
