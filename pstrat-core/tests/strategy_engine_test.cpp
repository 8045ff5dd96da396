#include <gtest/gtest.h>

#include <stdexcept>

#include "test_fakes.hpp"

using namespace pstrat::core;
using pstrat::testing::EngineFixture;
using pstrat::testing::FakeHistory;
using pstrat::testing::TestStrategy;
using pstrat::testing::makeBar;
using pstrat::testing::makeTick;

class StrategyEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        fx.gateway.addContract("A", 0.01);
        fx.gateway.addContract("B", 0.01);
    }

    EngineFixture fx;
};

TEST_F(StrategyEngineTest, TicksReachOnlyInitializedSubscribers) {
    TestStrategy* ready = fx.add("ready", {"A"});
    TestStrategy* idle = fx.add("idle", {"A"});
    TestStrategy* other = fx.add("other", {"B"});
    ASSERT_TRUE(ready && idle && other);
    ASSERT_TRUE(fx.initNow("ready"));
    ASSERT_TRUE(fx.initNow("other"));

    fx.engine.processTick(makeTick("A", 10.0));
    fx.engine.processTick(makeTick("Z", 1.0));

    EXPECT_EQ(ready->ticks.size(), 1u);
    EXPECT_TRUE(idle->ticks.empty());
    EXPECT_TRUE(other->ticks.empty());
}

TEST_F(StrategyEngineTest, TicksArriveInSubscriptionOrder) {
    std::vector<std::string> seen;
    TestStrategy* first = fx.add("first", {"A"});
    TestStrategy* second = fx.add("second", {"A"});
    ASSERT_TRUE(first && second);
    first->tickAction = [&seen](const TickData&) { seen.push_back("first"); };
    second->tickAction = [&seen](const TickData&) { seen.push_back("second"); };
    ASSERT_TRUE(fx.initNow("first"));
    ASSERT_TRUE(fx.initNow("second"));

    fx.engine.processTick(makeTick("A", 10.0));
    EXPECT_EQ(seen, (std::vector<std::string>{"first", "second"}));
}

TEST_F(StrategyEngineTest, OrderUpdatesRouteToOwner) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    TestStrategy* bystander = fx.addTrading("s2", {"A"});
    ASSERT_TRUE(s && bystander);

    const auto ids = s->buy("A", 10.0, 2);
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_TRUE(s->orderBook().isActive(ids[0]));
    EXPECT_EQ(fx.engine.registry().strategyForOrder(ids[0]), s);

    fx.engine.processOrder(fx.gateway.orderUpdate(ids[0], OrderStatus::PartTraded, 1));
    EXPECT_TRUE(s->orderBook().isActive(ids[0]));
    fx.engine.processOrder(fx.gateway.orderUpdate(ids[0], OrderStatus::AllTraded, 2));
    EXPECT_FALSE(s->orderBook().isActive(ids[0]));

    ASSERT_EQ(s->orderUpdates.size(), 2u);
    EXPECT_TRUE(bystander->orderUpdates.empty());
    ASSERT_NE(s->order(ids[0]), nullptr);
    EXPECT_EQ(s->order(ids[0])->status, OrderStatus::AllTraded);
}

TEST_F(StrategyEngineTest, UpdatesForUnknownOrdersAreDropped) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);

    OrderData foreign{};
    foreign.orderId = "MANUAL-1";
    foreign.instrument = "A";
    foreign.status = OrderStatus::AllTraded;
    fx.engine.processOrder(foreign);

    TradeData t{};
    t.tradeId = "MT1";
    t.orderId = "MANUAL-1";
    t.instrument = "A";
    t.direction = Direction::Long;
    t.volume = 3;
    fx.engine.processTrade(t);

    EXPECT_TRUE(s->orderUpdates.empty());
    EXPECT_EQ(s->pos("A"), 0);
}

TEST_F(StrategyEngineTest, DuplicateTradesApplyOnce) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    const auto ids = s->buy("A", 10.0, 2);
    ASSERT_EQ(ids.size(), 1u);

    const TradeData fill = fx.gateway.fill(ids[0], "T1", 2);
    fx.engine.processTrade(fill);
    fx.engine.processTrade(fill);

    EXPECT_EQ(s->pos("A"), 2);
    EXPECT_EQ(s->tradeUpdates.size(), 1u);
    EXPECT_TRUE(fx.engine.registry().seenTrades().contains("T1"));
}

TEST_F(StrategyEngineTest, UnknownContractRejectsOrder) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);

    EXPECT_TRUE(s->buy("NOPE", 1.0, 1).empty());
    EXPECT_TRUE(fx.gateway.sent.empty());
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::ContractNotFound));
}

TEST_F(StrategyEngineTest, RejectedSubmissionYieldsNoIds) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    fx.gateway.rejectOrders = true;

    EXPECT_TRUE(s->buy("A", 1.0, 1).empty());
    EXPECT_EQ(fx.gateway.sent.size(), 1u);
    EXPECT_EQ(s->orderBook().activeCount(), 0u);
    EXPECT_EQ(fx.engine.registry().orderBindingCount(), 0u);
}

TEST_F(StrategyEngineTest, SplitRequestsRegisterEveryChild) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    fx.gateway.splitInto = 2;

    const auto ids = s->sell("A", 1.0, 4, true, false);
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(fx.gateway.updatedIds, ids);
    for (const auto& id : ids) {
        EXPECT_TRUE(s->orderBook().isActive(id));
        EXPECT_EQ(fx.engine.registry().strategyForOrder(id), s);
    }
}

TEST_F(StrategyEngineTest, OrdersNeedTradingState) {
    TestStrategy* s = fx.add("s1", {"A"});
    ASSERT_NE(s, nullptr);
    EXPECT_TRUE(s->buy("A", 1.0, 1).empty());
    ASSERT_TRUE(fx.initNow("s1"));
    EXPECT_TRUE(s->buy("A", 1.0, 1).empty());
    EXPECT_TRUE(fx.gateway.sent.empty());
}

TEST_F(StrategyEngineTest, AddRejectsDuplicateNameAndUnknownClass) {
    ASSERT_NE(fx.add("s1", {"A"}), nullptr);
    EXPECT_FALSE(fx.engine.addStrategy("TestStrategy", "s1", {"B"}, {}));
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::DuplicateStrategyName));

    EXPECT_FALSE(fx.engine.addStrategy("NoSuchClass", "s2", {"A"}, {}));
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::UnknownStrategyClass));
    EXPECT_EQ(fx.engine.strategyNames(), std::vector<std::string>{"s1"});
}

TEST_F(StrategyEngineTest, UnknownStrategyNamesAreReported) {
    EXPECT_FALSE(fx.engine.initStrategy("ghost"));
    EXPECT_FALSE(fx.engine.startStrategy("ghost"));
    EXPECT_FALSE(fx.engine.stopStrategy("ghost"));
    EXPECT_FALSE(fx.engine.removeStrategy("ghost"));
    EXPECT_EQ(fx.sink.countCode(ErrorCode::UnknownStrategy), 4);
}

TEST_F(StrategyEngineTest, AddAppliesSettingAndPersistsRoster) {
    ValueMap setting{{"fixed_size", Value{std::int64_t{5}}}, {"mode", Value{std::string("slow")}},
                     {"not_declared", Value{true}}};
    TestStrategy* s = fx.add("s1", {"A", "B"}, setting);
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->fixedSize, 5);
    EXPECT_EQ(s->mode, "slow");

    ASSERT_EQ(fx.store.settings.count("s1"), 1u);
    const auto& saved = fx.store.settings.at("s1");
    EXPECT_EQ(saved.className, "TestStrategy");
    EXPECT_EQ(saved.instruments, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(std::get<std::int64_t>(saved.setting.at("fixed_size")), 5);
    EXPECT_EQ(saved.setting.count("not_declared"), 0u);
}

TEST_F(StrategyEngineTest, IncompatibleSettingIsIgnoredWithWarning) {
    TestStrategy* s = fx.add("s1", {"A"}, {{"fixed_size", Value{std::string("big")}}});
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->fixedSize, 1);
    const bool warned = std::any_of(fx.sink.logs.begin(), fx.sink.logs.end(), [](const LogEvent& e) {
        return e.level == LogEvent::Level::Warn && e.strategyName == "s1";
    });
    EXPECT_TRUE(warned);
}

TEST_F(StrategyEngineTest, TickFaultTakesOnlyTheFaultingStrategyOffline) {
    TestStrategy* bad = fx.addTrading("bad", {"A"});
    TestStrategy* good = fx.addTrading("good", {"A"});
    ASSERT_TRUE(bad && good);
    bad->tickAction = [](const TickData&) { throw std::runtime_error("boom"); };

    fx.engine.processTick(makeTick("A", 1.0));

    EXPECT_FALSE(bad->isTrading());
    EXPECT_FALSE(bad->isInitialized());
    EXPECT_EQ(bad->faultCount(), 1u);
    EXPECT_TRUE(good->isTrading());
    EXPECT_EQ(good->ticks.size(), 1u);
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::StrategyCallbackFault));

    fx.engine.processTick(makeTick("A", 2.0));
    EXPECT_EQ(bad->ticks.size(), 1u);
    EXPECT_EQ(good->ticks.size(), 2u);
    EXPECT_TRUE(bad->buy("A", 1.0, 1).empty());
}

TEST_F(StrategyEngineTest, NonStandardExceptionIsIsolatedToo) {
    TestStrategy* bad = fx.addTrading("bad", {"A"});
    ASSERT_NE(bad, nullptr);
    bad->tickAction = [](const TickData&) { throw 42; };

    fx.engine.processTick(makeTick("A", 1.0));
    EXPECT_FALSE(bad->isTrading());
    EXPECT_TRUE(fx.sink.hasCode(ErrorCode::StrategyCallbackFault));
}

TEST_F(StrategyEngineTest, ContractMetadataLookups) {
    fx.gateway.addContract("C", 0.25, 1, 50);
    TestStrategy* s = fx.add("s1", {"C"});
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->pricetick("C"), 0.25);
    EXPECT_EQ(s->size("C"), 50);
    EXPECT_FALSE(s->pricetick("missing").has_value());
    EXPECT_FALSE(s->size("missing").has_value());
    EXPECT_EQ(s->engineType(), EngineType::Live);
}

TEST_F(StrategyEngineTest, HistoryPrefersGatewayWhenContractServesIt) {
    fx.gateway.addContract("H", 0.01, 1, 1, true);
    fx.gateway.history["H"] = {makeBar("H", 60, 1.0)};
    FakeHistory feed("feed");
    FakeHistory db("db");
    feed.bars["H"] = {makeBar("H", 60, 2.0)};
    fx.engine.setDatafeed(&feed);
    fx.engine.setDatabase(&db);

    const auto bars = fx.engine.loadBar("H", 3, Interval::Minute);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].close, 1.0);
    EXPECT_EQ(fx.gateway.historyQueries, 1);
    EXPECT_EQ(feed.queries, 0);
    EXPECT_EQ(db.queries, 0);
}

TEST_F(StrategyEngineTest, HistoryFallsBackToDatafeedThenDatabase) {
    FakeHistory feed("feed");
    FakeHistory db("db");
    feed.bars["A"] = {makeBar("A", 60, 2.0)};
    db.bars["B"] = {makeBar("B", 60, 3.0)};
    fx.engine.setDatafeed(&feed);
    fx.engine.setDatabase(&db);

    const auto a = fx.engine.loadBar("A", 2, Interval::Hour);
    ASSERT_EQ(a.size(), 1u);
    EXPECT_DOUBLE_EQ(a[0].close, 2.0);
    EXPECT_EQ(feed.lastRequest.interval, Interval::Hour);
    EXPECT_EQ(feed.lastRequest.endNs - feed.lastRequest.startNs, 2ULL * 24 * 3600 * 1000000000ULL);
    EXPECT_EQ(db.queries, 0);

    const auto b = fx.engine.loadBar("B", 2, Interval::Minute);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_DOUBLE_EQ(b[0].close, 3.0);
    EXPECT_EQ(db.queries, 1);
    EXPECT_EQ(fx.gateway.historyQueries, 0);
}

TEST_F(StrategyEngineTest, LoadBarsReplaysMergedTimelineDuringInit) {
    FakeHistory db("db");
    db.bars["A"] = {makeBar("A", 60, 1.0), makeBar("A", 120, 1.5)};
    db.bars["B"] = {makeBar("B", 120, 7.0), makeBar("B", 180, 8.0)};
    fx.engine.setDatabase(&db);

    TestStrategy* s = fx.add("s1", {"A", "B"});
    ASSERT_NE(s, nullptr);
    s->initAction = [s] { s->loadBars(1); };
    ASSERT_TRUE(fx.initNow("s1"));

    ASSERT_EQ(s->barSlices.size(), 3u);
    EXPECT_EQ(s->barSlices[0].size(), 1u);
    EXPECT_EQ(s->barSlices[1].size(), 2u);
    const BarData& flat = s->barSlices[2].at("A");
    EXPECT_EQ(flat.tsNs, 180u);
    EXPECT_DOUBLE_EQ(flat.open, 1.5);
    EXPECT_DOUBLE_EQ(flat.close, 1.5);
    EXPECT_DOUBLE_EQ(flat.volume, 0.0);
    EXPECT_DOUBLE_EQ(s->barSlices[2].at("B").close, 8.0);
    EXPECT_TRUE(s->isInitialized());
}

TEST_F(StrategyEngineTest, ClassParametersReportDefaults) {
    const auto params = fx.engine.strategyClassParameters("TestStrategy");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(std::get<std::int64_t>(params->at("fixed_size")), 1);
    EXPECT_EQ(std::get<std::string>(params->at("mode")), "normal");
    EXPECT_FALSE(fx.engine.strategyClassParameters("Nope").has_value());
    EXPECT_TRUE(fx.engine.strategyNames().empty());
    EXPECT_EQ(fx.engine.strategyClassNames(), std::vector<std::string>{"TestStrategy"});
}

TEST_F(StrategyEngineTest, InstanceQueries) {
    ASSERT_NE(fx.add("s1", {"A"}, {{"threshold", Value{0.75}}}), nullptr);
    const auto params = fx.engine.strategyParameters("s1");
    ASSERT_TRUE(params.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(params->at("threshold")), 0.75);

    const auto snap = fx.engine.strategySnapshot("s1");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->className, "TestStrategy");
    EXPECT_EQ(snap->state, StrategyState::Created);
    EXPECT_EQ(snap->variables.count("tick_count"), 1u);

    EXPECT_FALSE(fx.engine.strategyParameters("ghost").has_value());
    EXPECT_FALSE(fx.engine.strategySnapshot("ghost").has_value());
}

TEST_F(StrategyEngineTest, ProcessEventDispatchesByKind) {
    TestStrategy* s = fx.addTrading("s1", {"A"});
    ASSERT_NE(s, nullptr);
    const auto ids = s->buy("A", 1.0, 1);
    ASSERT_EQ(ids.size(), 1u);

    fx.engine.processEvent(EngineEvent{makeTick("A", 1.0)});
    fx.engine.processEvent(EngineEvent{fx.gateway.orderUpdate(ids[0], OrderStatus::AllTraded, 1)});
    fx.engine.processEvent(EngineEvent{fx.gateway.fill(ids[0], "T1", 1)});

    EXPECT_EQ(s->ticks.size(), 1u);
    EXPECT_EQ(s->orderUpdates.size(), 1u);
    EXPECT_EQ(s->pos("A"), 1);
}
