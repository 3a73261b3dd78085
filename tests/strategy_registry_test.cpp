#include <gtest/gtest.h>

#include "strategy_registry.h"
#include "test_support.h"

using testing_support::FakeMonitor;

TEST(StrategyRegistryTest, FindsRegisteredStrategy) {
    StrategyRegistry<WorkloadMonitor> registry;
    registry.add(std::make_unique<FakeMonitor>("helm.v3"));
    registry.add(std::make_unique<FakeMonitor>("compose"));

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("compose"));
    EXPECT_EQ(registry.find("helm.v3").getType(), "helm.v3");
}

TEST(StrategyRegistryTest, UnknownTypeListsAvailableTypes) {
    StrategyRegistry<WorkloadMonitor> registry;
    registry.add(std::make_unique<FakeMonitor>("helm.v3"));
    registry.add(std::make_unique<FakeMonitor>("compose"));

    try {
        registry.find("nomad");
        FAIL() << "expected UnsupportedProfileError";
    } catch (const UnsupportedProfileError& e) {
        EXPECT_EQ(e.requestedType(), "nomad");
        EXPECT_EQ(e.availableTypes(), (std::vector<std::string>{"compose", "helm.v3"}));
        EXPECT_STREQ(e.what(), "unsupported deployment profile type: nomad (available: [compose, helm.v3])");
    }
}

TEST(StrategyRegistryTest, RejectsDuplicateAndNullStrategies) {
    StrategyRegistry<WorkloadMonitor> registry;
    registry.add(std::make_unique<FakeMonitor>("helm.v3"));

    EXPECT_THROW(registry.add(std::make_unique<FakeMonitor>("helm.v3")), ValidationError);
    EXPECT_THROW(registry.add(nullptr), ValidationError);
    EXPECT_THROW(registry.add(std::make_unique<FakeMonitor>("")), ValidationError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(StrategyRegistryTest, EmptyRegistryReportsNoTypes) {
    StrategyRegistry<WorkloadMonitor> registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_THROW(registry.find("helm.v3"), UnsupportedProfileError);
}
