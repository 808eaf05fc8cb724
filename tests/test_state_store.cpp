#include <gtest/gtest.h>

#include "shroud/core/Errors.hpp"
#include "shroud/core/Hash.hpp"
#include "shroud/state/InMemoryStateStore.hpp"

using namespace shroud;

namespace {

fhe::Sealed handle(uint64_t id) {
    fhe::Sealed s;
    s.handle.id = id;
    return s;
}

Strategy makeStrategy(const std::string& label) {
    Strategy s;
    s.id = strategyIdFromLabel(label);
    s.owner = "0xa11ce00000000000000000000000000000000001";
    s.rebalance_frequency = 10;
    return s;
}

}

TEST(StateStoreTest, ReadsOfAbsentEntriesNeverFail) {
    InMemoryStateStore store;
    StrategyId id = strategyIdFromLabel("missing");

    EXPECT_FALSE(store.hasStrategy(id));
    EXPECT_EQ(store.findStrategy(id), nullptr);
    EXPECT_TRUE(store.allocations(id).empty());
    EXPECT_FALSE(store.position(id, "0xa").valid());
    EXPECT_FALSE(store.tradeDelta(id, "0xa").valid());
    EXPECT_FALSE(store.coordination(id).enabled);
    EXPECT_EQ(store.governance(id).votes, 0u);
    EXPECT_FALSE(store.compliance(id).enabled);
    EXPECT_FALSE(store.signals(id).timing.valid());
    EXPECT_EQ(store.executorLastBlock("0xnobody"), 0u);
}

TEST(StateStoreTest, WritesRequireExistingStrategy) {
    InMemoryStateStore store;
    StrategyId id = strategyIdFromLabel("missing");

    try {
        store.setPosition(id, "0xa", handle(1));
        FAIL() << "expected STRATEGY_NOT_FOUND";
    } catch (const RebalanceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::STRATEGY_NOT_FOUND);
    }
    EXPECT_THROW(store.upsertAllocation(id, TargetAllocation{}), RebalanceError);
    EXPECT_THROW(store.appendPoolStrategy(PoolId{}, id), RebalanceError);
}

TEST(StateStoreTest, OneAllocationPerAsset) {
    InMemoryStateStore store;
    Strategy s = makeStrategy("alloc");
    store.putStrategy(s);

    TargetAllocation a;
    a.asset = "0xa";
    a.target_percentage = handle(1);
    store.upsertAllocation(s.id, a);

    TargetAllocation b;
    b.asset = "0xb";
    store.upsertAllocation(s.id, b);

    a.target_percentage = handle(2);
    store.upsertAllocation(s.id, a);

    auto allocs = store.allocations(s.id);
    ASSERT_EQ(allocs.size(), 2u);
    EXPECT_EQ(allocs[0].asset, "0xa");
    EXPECT_EQ(allocs[0].target_percentage.handle.id, 2u);
    EXPECT_EQ(allocs[1].asset, "0xb");
}

TEST(StateStoreTest, CheckpointRestoresEverything) {
    InMemoryStateStore store;
    Strategy s = makeStrategy("checkpoint");
    store.putStrategy(s);
    store.setPosition(s.id, "0xa", handle(5));
    store.setAuthorizedExecutor("0xe1", true);

    auto cp = store.checkpoint();

    s.last_execution_block = 99;
    store.putStrategy(s);
    store.setPosition(s.id, "0xa", handle(6));
    store.setAuthorizedExecutor("0xe1", false);
    store.setExecutorLastBlock("0xe1", 99);
    store.putStrategy(makeStrategy("late"));

    store.restore(*cp);

    EXPECT_EQ(store.findStrategy(s.id)->last_execution_block, 0u);
    EXPECT_EQ(store.position(s.id, "0xa").handle.id, 5u);
    EXPECT_TRUE(store.isAuthorizedExecutor("0xe1"));
    EXPECT_EQ(store.executorLastBlock("0xe1"), 0u);
    EXPECT_FALSE(store.hasStrategy(strategyIdFromLabel("late")));
    EXPECT_EQ(store.strategyIds().size(), 1u);
}

TEST(StateStoreTest, NestedCheckpointsUndoIndependently) {
    InMemoryStateStore store;
    Strategy a = makeStrategy("outer");
    Strategy b = makeStrategy("untouched");
    store.putStrategy(a);
    store.putStrategy(b);
    store.setPosition(a.id, "0xa", handle(1));
    store.setPosition(b.id, "0xa", handle(40));
    PoolId pool = sha256("pool");

    {
        auto outer = store.checkpoint();
        store.setPosition(a.id, "0xa", handle(2));
        store.appendPoolStrategy(pool, a.id);
        {
            auto inner = store.checkpoint();
            EXPECT_EQ(store.openCheckpoints(), 2u);
            store.setPosition(a.id, "0xa", handle(3));
            store.appendPoolStrategy(pool, a.id);
            store.putStrategy(makeStrategy("inner"));
            store.restore(*inner);
        }
        EXPECT_EQ(store.openCheckpoints(), 1u);
        EXPECT_EQ(store.position(a.id, "0xa").handle.id, 2u);
        EXPECT_EQ(store.poolStrategies(pool).size(), 1u);
        EXPECT_FALSE(store.hasStrategy(strategyIdFromLabel("inner")));

        // a committed inner frame is still undone by the outer one
        {
            auto inner = store.checkpoint();
            store.setPosition(a.id, "0xa", handle(4));
        }
        EXPECT_EQ(store.position(a.id, "0xa").handle.id, 4u);
        store.restore(*outer);
    }

    EXPECT_EQ(store.openCheckpoints(), 0u);
    EXPECT_EQ(store.position(a.id, "0xa").handle.id, 1u);
    EXPECT_EQ(store.position(b.id, "0xa").handle.id, 40u);
    EXPECT_TRUE(store.poolStrategies(pool).empty());
    EXPECT_TRUE(store.indexedPools().empty());
    EXPECT_EQ(store.strategyIds().size(), 2u);
}

TEST(StateStoreTest, ForeignCheckpointIsRejected) {
    InMemoryStateStore one;
    InMemoryStateStore other;
    auto cp = one.checkpoint();
    EXPECT_THROW(other.restore(*cp), std::invalid_argument);
}

TEST(StateStoreTest, PoolIndexKeepsInsertionOrderAndDuplicates) {
    InMemoryStateStore store;
    Strategy a = makeStrategy("a");
    Strategy b = makeStrategy("b");
    store.putStrategy(a);
    store.putStrategy(b);

    PoolId pool = sha256("pool");
    store.appendPoolStrategy(pool, b.id);
    store.appendPoolStrategy(pool, a.id);
    store.appendPoolStrategy(pool, b.id);

    auto ids = store.poolStrategies(pool);
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(ids[0], b.id);
    EXPECT_EQ(ids[1], a.id);

    auto pools = store.indexedPools();
    ASSERT_EQ(pools.size(), 1u);
    EXPECT_EQ(pools[0], pool);
}

TEST(StateStoreTest, ExecutorRegistry) {
    InMemoryStateStore store;
    store.setAuthorizedExecutor("0xe2", true);
    store.setAuthorizedExecutor("0xe1", true);
    store.setAuthorizedExecutor("0xe3", true);
    store.setAuthorizedExecutor("0xe3", false);

    auto execs = store.authorizedExecutors();
    ASSERT_EQ(execs.size(), 2u);
    EXPECT_EQ(execs[0], "0xe1");
    EXPECT_EQ(execs[1], "0xe2");

    store.setExecutorLastBlock("0xe1", 120);
    auto records = store.executorBlocks();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].second, 120u);
}

TEST(StateStoreTest, CoordinationAndGovernanceHelpers) {
    CoordinationState coord;
    coord.pools.push_back(sha256("p1"));
    EXPECT_TRUE(coord.contains(sha256("p1")));
    EXPECT_FALSE(coord.contains(sha256("p2")));

    GovernanceState gov;
    gov.voters = {"0xe1", "0xe2"};
    EXPECT_TRUE(gov.isVoter("0xe2"));
    EXPECT_FALSE(gov.isVoter("0xe9"));
}
