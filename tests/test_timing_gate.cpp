#include "TestSupport.hpp"

#include "shroud/engine/TimingGate.hpp"

using namespace shroud;
using namespace shroud::test;

namespace {

class TimingGateTest : public EngineHarness {};

}

TEST_F(TimingGateTest, NotReadyBeforeFrequencyElapses) {
    StrategyId id = scenario(10, 100);

    for (BlockNumber b = 100; b < 110; ++b) {
        EXPECT_FALSE(engine.isExecutionReady(id, b)) << "block " << b;
    }
    EXPECT_TRUE(engine.isExecutionReady(id, 110));
}

TEST_F(TimingGateTest, ReadinessIsMonotonicUntilStale) {
    StrategyId id = scenario(10, 100);

    bool was_ready = false;
    for (BlockNumber b = 100; b <= 200; ++b) {
        bool ready = engine.isExecutionReady(id, b);
        if (was_ready) {
            EXPECT_TRUE(ready) << "block " << b;
        }
        was_ready = ready;
    }

    // more than stale_multiplier * frequency blocks without an execution
    EXPECT_TRUE(engine.isExecutionReady(id, 200));
    EXPECT_FALSE(engine.isExecutionReady(id, 201));
}

TEST_F(TimingGateTest, SpreadWindowIsTheFirstFifthOfTheCycle) {
    StrategyId id = scenario(10, 100);

    EXPECT_FALSE(engine.shouldSpreadExecution(id, 109));
    EXPECT_TRUE(engine.shouldSpreadExecution(id, 110));
    EXPECT_TRUE(engine.shouldSpreadExecution(id, 111));
    EXPECT_FALSE(engine.shouldSpreadExecution(id, 112));
}

TEST_F(TimingGateTest, HugeFrequencyNeverOverflowsTheStaleLimit) {
    const uint64_t frequency = 1ULL << 63;
    StrategyId id = strategyIdFromLabel("glacial");
    create(id, frequency, 100);

    EXPECT_FALSE(engine.isExecutionReady(id, 100 + frequency - 1));
    EXPECT_TRUE(engine.isExecutionReady(id, 100 + frequency));
    EXPECT_TRUE(engine.isExecutionReady(id, UINT64_MAX));
}

TEST_F(TimingGateTest, ShortFrequencyHasNoSpreadWindow) {
    StrategyId id = scenario(4, 100);
    EXPECT_FALSE(engine.shouldSpreadExecution(id, 104));
    EXPECT_TRUE(engine.isExecutionReady(id, 104));
}

TEST_F(TimingGateTest, UnknownOrInactiveStrategiesAreNeverReady) {
    EXPECT_FALSE(engine.isExecutionReady(strategyIdFromLabel("ghost"), 500));
    EXPECT_FALSE(engine.shouldSpreadExecution(strategyIdFromLabel("ghost"), 500));

    StrategyId id = scenario(10, 100);
    engine.deactivateStrategy(as(OWNER, 101), id);
    EXPECT_FALSE(engine.isExecutionReady(id, 115));
    EXPECT_FALSE(engine.shouldSpreadExecution(id, 110));
}

TEST_F(TimingGateTest, OffsetStaysWithinSpreadSpan) {
    StrategyId id = scenario(10, 100);
    Strategy s = engine.getStrategy(id);

    fhe::FheAdapter arith(cop, cfg.engine_principal);
    TimingGate gate(store, arith, cfg);

    for (uint64_t seed = 0; seed < 64; ++seed) {
        EXPECT_LE(gate.timingOffset(s, as(EXEC1, 115, seed)), 2u);
    }
}

TEST_F(TimingGateTest, TimingSignalIsRecordedOnExecution) {
    StrategyId id = scenario(10, 100);
    engine.executeRebalancing(as(EXEC1, 112), id);

    fhe::Sealed signal = engine.getTimingSignal(id);
    ASSERT_TRUE(signal.valid());
    EXPECT_EQ(signal.handle.type, fhe::FheType::EBOOL);
    EXPECT_EQ(store.signals(id).timing_block, 112u);

    // elapsed 12 against an encrypted window of 20 plus jitter
    EXPECT_TRUE(cop.decryptBool(signal.handle, OWNER));
    EXPECT_THROW(cop.decryptBool(signal.handle, STRANGER), fhe::FheError);
}

TEST_F(TimingGateTest, TimingSignalNeverGatesExecution) {
    StrategyId id = strategyIdFromLabel("narrow-window");
    engine.createStrategy(as(OWNER, 100), id, 10, enc(0), enc(2), enc(50));
    allocate(id, TOKEN_A, 10000, 0, 10000, 100);
    position(id, TOKEN_A, 10, 100);

    engine.executeRebalancing(as(EXEC1, 150), id);

    EXPECT_EQ(engine.getStrategy(id).last_execution_block, 150u);
    EXPECT_FALSE(cop.decryptBool(engine.getTimingSignal(id).handle, OWNER));
}

TEST_F(TimingGateTest, SlippageSignalCombinesFillsInOneBlock) {
    StrategyId id = scenario(10, 100);
    Strategy s = engine.getStrategy(id);

    fhe::FheAdapter arith(cop, cfg.engine_principal);
    TimingGate gate(store, arith, cfg);

    // max slippage 50 bps of the expected fill
    fhe::Sealed expected = arith.encryptConstant(100000);
    gate.checkSlippageProtection(s, expected, arith.encryptConstant(99600), 120);
    EXPECT_TRUE(cop.decryptBool(engine.getSlippageSignal(id).handle, OWNER));

    gate.checkSlippageProtection(s, expected, arith.encryptConstant(99000), 120);
    EXPECT_FALSE(cop.decryptBool(engine.getSlippageSignal(id).handle, OWNER));

    gate.checkSlippageProtection(s, expected, arith.encryptConstant(100400), 121);
    EXPECT_TRUE(cop.decryptBool(engine.getSlippageSignal(id).handle, OWNER));
}

TEST_F(TimingGateTest, CrossPoolCheckRejectsForeignPools) {
    StrategyId id = scenario(10, 100);
    PoolId enrolled = sha256("pool-1");
    PoolId foreign = sha256("pool-2");

    fhe::FheAdapter arith(cop, cfg.engine_principal);
    TimingGate gate(store, arith, cfg);

    Strategy s = engine.getStrategy(id);
    fhe::Sealed open = gate.checkCrossPoolCoordination(s, foreign, as(EXEC1, 112));
    EXPECT_TRUE(cop.decryptBool(open.handle, cfg.engine_principal));

    engine.enableCrossPoolCoordination(as(OWNER, 101), id, {enrolled});
    s = engine.getStrategy(id);

    fhe::Sealed rejected =
        gate.checkCrossPoolCoordination(s, foreign, as(EXEC1, 112));
    EXPECT_FALSE(cop.decryptBool(rejected.handle, cfg.engine_principal));

    fhe::Sealed timed =
        gate.checkCrossPoolCoordination(s, enrolled, as(EXEC1, 112));
    EXPECT_TRUE(cop.decryptBool(timed.handle, cfg.engine_principal));
}
