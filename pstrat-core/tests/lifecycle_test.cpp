#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>

#include "test_fakes.hpp"

using namespace pstrat::core;
using pstrat::testing::EngineFixture;
using pstrat::testing::TestStrategy;

class LifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        fx.gateway.addContract("A", 0.01);
        fx.gateway.addContract("B", 0.01);
    }

    EngineFixture fx;
};

TEST_F(LifecycleTest, FullLifecycleEmitsEveryState) {
    TestStrategy* s = fx.add("s1", {"A", "B"});
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->state(), StrategyState::Created);

    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_EQ(s->state(), StrategyState::Initialized);
    EXPECT_EQ(s->initCalls, 1);
    EXPECT_EQ(fx.gateway.subscriptionCount(), 2u);

    ASSERT_TRUE(fx.engine.startStrategy("s1"));
    EXPECT_EQ(s->state(), StrategyState::Trading);

    ASSERT_TRUE(fx.engine.stopStrategy("s1"));
    EXPECT_EQ(s->state(), StrategyState::Stopped);

    EXPECT_EQ(fx.sink.statesOf("s1"),
              (std::vector<StrategyState>{StrategyState::Created, StrategyState::Initializing,
                                          StrategyState::Initialized, StrategyState::Trading,
                                          StrategyState::Stopped}));
}

TEST_F(LifecycleTest, SecondInitIsIgnored) {
    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_FALSE(fx.initNow("s1"));
    EXPECT_EQ(s->initCalls, 1);
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::InvalidLifecycleTransition));
}

TEST_F(LifecycleTest, StartRequiresInit) {
    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    EXPECT_FALSE(fx.engine.startStrategy("s1"));
    EXPECT_EQ(s->startCalls, 0);
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::InvalidLifecycleTransition));
}

TEST_F(LifecycleTest, StartTwiceIsRejected) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    EXPECT_FALSE(fx.engine.startStrategy("s1"));
    EXPECT_EQ(s->startCalls, 1);
}

TEST_F(LifecycleTest, StopWhenNotTradingIsNoop) {
    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    EXPECT_FALSE(fx.engine.stopStrategy("s1"));
    EXPECT_EQ(s->stopCalls, 0);
    EXPECT_EQ(fx.store.dataSaves, 0);
}

TEST_F(LifecycleTest, InitFaultLeavesStrategyUninitialized) {
    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    s->initAction = [] { throw std::runtime_error("no history"); };

    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_FALSE(s->isInitialized());
    EXPECT_FALSE(s->isInitializing());
    EXPECT_EQ(s->state(), StrategyState::Created);
    EXPECT_EQ(fx.gateway.subscriptionCount(), 0u);
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::StrategyCallbackFault));

    EXPECT_FALSE(fx.engine.startStrategy("s1"));
}

TEST_F(LifecycleTest, FaultInsideHistoryReplayFailsInit) {
    pstrat::testing::FakeHistory db("db");
    db.bars["A"] = {pstrat::testing::makeBar("A", 60, 1.0)};
    fx.engine.setDatabase(&db);

    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    s->initAction = [s] { s->loadBars(1); };
    s->barsAction = [](const BarMap&) { throw std::logic_error("bad bar"); };

    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_FALSE(s->isInitialized());
    EXPECT_EQ(s->faultCount(), 1u);
}

TEST_F(LifecycleTest, StartFaultKeepsStrategyOutOfTrading) {
    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    s->startAction = [] { throw std::runtime_error("refuse"); };
    ASSERT_TRUE(fx.initNow("s1"));

    EXPECT_FALSE(fx.engine.startStrategy("s1"));
    EXPECT_FALSE(s->isTrading());
    EXPECT_FALSE(s->isInitialized());
}

TEST_F(LifecycleTest, StopCancelsWorkingOrdersAndPersistsOnce) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    const auto a = s->buy("A", 1.0, 1);
    const auto b = s->shortSell("A", 2.0, 1);
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    s->setTarget("A", 2);
    s->tickCount = 9;

    ASSERT_TRUE(fx.engine.stopStrategy("s1"));

    ASSERT_EQ(fx.gateway.cancels.size(), 2u);
    EXPECT_EQ(fx.store.dataSaves, 1);
    ASSERT_EQ(fx.store.data.count("s1"), 1u);
    const auto& saved = fx.store.data.at("s1");
    EXPECT_EQ(std::get<std::int64_t>(saved.fields.at("tick_count")), 9);
    EXPECT_EQ(saved.fields.count("initialized"), 0u);
    EXPECT_EQ(saved.fields.count("trading"), 0u);
    EXPECT_EQ(saved.targets.at("A"), 2);

    // cancel confirmations empty the active set
    for (const auto& id : {a[0], b[0]}) {
        fx.engine.processOrder(fx.gateway.orderUpdate(id, OrderStatus::Cancelled));
    }
    EXPECT_EQ(s->orderBook().activeCount(), 0u);

    EXPECT_FALSE(fx.engine.stopStrategy("s1"));
    EXPECT_EQ(fx.store.dataSaves, 1);
}

TEST_F(LifecycleTest, FaultingStopHookStillShutsDown) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    ASSERT_EQ(s->buy("A", 1.0, 1).size(), 1u);
    s->stopAction = [] { throw std::runtime_error("stop failed"); };

    ASSERT_TRUE(fx.engine.stopStrategy("s1"));
    EXPECT_FALSE(s->isTrading());
    EXPECT_EQ(fx.gateway.cancels.size(), 1u);
    EXPECT_EQ(fx.store.dataSaves, 1);
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::StrategyCallbackFault));
}

TEST_F(LifecycleTest, PersistenceFailureIsReported) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    fx.store.failSaves = true;

    ASSERT_TRUE(fx.engine.stopStrategy("s1"));
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::PersistenceFailure));
    EXPECT_EQ(s->state(), StrategyState::Stopped);
}

TEST_F(LifecycleTest, RestartAfterStop) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    ASSERT_TRUE(fx.engine.stopStrategy("s1"));
    ASSERT_TRUE(fx.engine.startStrategy("s1"));
    EXPECT_EQ(s->state(), StrategyState::Trading);
    EXPECT_EQ(s->startCalls, 2);
}

TEST_F(LifecycleTest, WarmRestartRestoresVariablesAndPositions) {
    StrategyData saved{};
    saved.fields["tick_count"] = Value{std::int64_t{7}};
    saved.fields["last_price"] = Value{101.5};
    saved.fields["trading"] = Value{true};
    saved.positions["A"] = 3;
    saved.targets["A"] = 4;
    fx.store.data["s1"] = saved;
    fx.engine.init();

    TestStrategy* s = fx.add("s1", {"A", "B"});
    ASSERT_NE(s, nullptr);
    ASSERT_TRUE(fx.initNow("s1"));

    EXPECT_EQ(s->tickCount, 7);
    EXPECT_DOUBLE_EQ(s->lastPrice, 101.5);
    EXPECT_EQ(s->pos("A"), 3);
    EXPECT_EQ(s->target("A"), 4);
    EXPECT_EQ(s->pos("B"), 0);
    EXPECT_FALSE(s->isTrading());
}

TEST_F(LifecycleTest, InitLoadsRosterWithoutRewritingIt) {
    StrategySetting entry{};
    entry.className = "TestStrategy";
    entry.instruments = {"A"};
    entry.setting["fixed_size"] = Value{std::int64_t{4}};
    fx.store.settings["restored"] = entry;

    StrategySetting broken{};
    broken.className = "Gone";
    broken.instruments = {"A"};
    fx.store.settings["orphan"] = broken;

    fx.engine.init();

    auto* s = dynamic_cast<TestStrategy*>(fx.engine.strategy("restored"));
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->fixedSize, 4);
    EXPECT_EQ(fx.engine.strategy("orphan"), nullptr);
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::UnknownStrategyClass));
    EXPECT_EQ(fx.store.settingsSaves, 0);
}

TEST_F(LifecycleTest, UnreadableStoreIsReported) {
    fx.store.loadOk = false;
    fx.engine.init();
    EXPECT_GE(fx.sink.countCode(ErrorCode::PersistenceFailure), 1);
    EXPECT_TRUE(fx.engine.strategyNames().empty());
}

TEST_F(LifecycleTest, EditIsRejectedWhileTrading) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    EXPECT_FALSE(fx.engine.editStrategy("s1", {{"fixed_size", Value{std::int64_t{9}}}}));
    EXPECT_EQ(s->fixedSize, 1);

    ASSERT_TRUE(fx.engine.stopStrategy("s1"));
    const int savesBefore = fx.store.settingsSaves;
    EXPECT_TRUE(fx.engine.editStrategy("s1", {{"fixed_size", Value{std::int64_t{9}}}}));
    EXPECT_EQ(s->fixedSize, 9);
    EXPECT_EQ(fx.store.settingsSaves, savesBefore + 1);
    EXPECT_EQ(std::get<std::int64_t>(fx.store.settings.at("s1").setting.at("fixed_size")), 9);
}

TEST_F(LifecycleTest, RemoveRequiresStoppedStrategy) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    const auto ids = s->buy("A", 1.0, 1);
    ASSERT_EQ(ids.size(), 1u);
    fx.engine.processOrder(fx.gateway.orderUpdate(ids[0], OrderStatus::AllTraded, 1));

    EXPECT_FALSE(fx.engine.removeStrategy("s1"));
    ASSERT_TRUE(fx.engine.stopStrategy("s1"));
    EXPECT_TRUE(fx.engine.removeStrategy("s1"));

    EXPECT_EQ(fx.engine.strategy("s1"), nullptr);
    EXPECT_EQ(fx.engine.registry().orderBindingCount(), 0u);
    EXPECT_TRUE(fx.engine.registry().strategiesFor("A").empty());
    EXPECT_EQ(fx.store.settings.count("s1"), 0u);

    // late events for the removed strategy are dropped
    fx.engine.processTrade(fx.gateway.fill(ids[0], "late", 1));
    fx.engine.processTick(pstrat::testing::makeTick("A", 1.0));
}

TEST_F(LifecycleTest, NameIsReusableAfterRemove) {
    ASSERT_NE(fx.add("s1", {"A"}), nullptr);
    ASSERT_TRUE(fx.engine.removeStrategy("s1"));
    EXPECT_NE(fx.add("s1", {"B"}), nullptr);
}

TEST_F(LifecycleTest, BulkOperations) {
    TestStrategy* s1 = fx.add("s1", {"A"});
    TestStrategy* s2 = fx.add("s2", {"B"});
    ASSERT_TRUE(s1 && s2);

    fx.engine.initAllStrategies();
    fx.engine.waitForInit();
    fx.engine.startAllStrategies();
    EXPECT_TRUE(s1->isTrading());
    EXPECT_TRUE(s2->isTrading());

    fx.engine.stopAllStrategies();
    EXPECT_EQ(s1->state(), StrategyState::Stopped);
    EXPECT_EQ(s2->state(), StrategyState::Stopped);
    EXPECT_EQ(fx.store.dataSaves, 2);
}

TEST_F(LifecycleTest, CloseStopsTradingStrategies) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    fx.engine.close();
    EXPECT_EQ(s->state(), StrategyState::Stopped);
    EXPECT_EQ(s->stopCalls, 1);
}

TEST_F(LifecycleTest, GatewayThrowDuringInitFailsInitOnly) {
    fx.gateway.failSubscribe = true;
    TestStrategy* s = fx.add("s1", {"A", "B"});
    ASSERT_NE(s, nullptr);

    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_EQ(s->state(), StrategyState::Created);
    EXPECT_FALSE(s->isInitializing());
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::StrategyCallbackFault));
    EXPECT_EQ(fx.sink.statesOf("s1").back(), StrategyState::Created);

    // the worker survives and the strategy can be initialized again
    fx.gateway.failSubscribe = false;
    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_EQ(s->state(), StrategyState::Initialized);
    EXPECT_EQ(s->initCalls, 2);
}

TEST_F(LifecycleTest, SinkFailureDoesNotBreakLifecycle) {
    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    fx.sink.rejectUpdates = true;

    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_EQ(s->state(), StrategyState::Initialized);
    ASSERT_TRUE(fx.engine.startStrategy("s1"));
    ASSERT_TRUE(fx.engine.stopStrategy("s1"));
    EXPECT_EQ(s->state(), StrategyState::Stopped);
    EXPECT_EQ(s->startCalls, 1);
}

TEST(InitQueue, FullQueueRejectsInit) {
    EngineConfig cfg{};
    cfg.initQueueCapacity = 1;
    EngineFixture fx(cfg);
    fx.gateway.addContract("A", 0.01);

    TestStrategy* first = fx.add("first", {"A"});
    TestStrategy* second = fx.add("second", {"A"});
    TestStrategy* third = fx.add("third", {"A"});
    ASSERT_TRUE(first && second && third);

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    first->initAction = [&entered, gate] {
        entered.set_value();
        gate.wait();
    };

    ASSERT_TRUE(fx.engine.initStrategy("first"));
    entered.get_future().wait();
    EXPECT_EQ(first->state(), StrategyState::Initializing);

    // a busy strategy cannot be removed
    EXPECT_FALSE(fx.engine.removeStrategy("first"));

    ASSERT_TRUE(fx.engine.initStrategy("second"));
    EXPECT_FALSE(fx.engine.initStrategy("third"));
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::InitQueueFull));
    EXPECT_EQ(third->state(), StrategyState::Created);

    release.set_value();
    fx.engine.waitForInit();
    EXPECT_TRUE(first->isInitialized());
    EXPECT_TRUE(second->isInitialized());
    EXPECT_TRUE(fx.engine.initStrategy("third"));
    fx.engine.waitForInit();
    EXPECT_TRUE(third->isInitialized());
}
