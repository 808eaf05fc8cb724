#include "TestSupport.hpp"

using namespace shroud;
using namespace shroud::test;

namespace {

class TradeDeltaTest : public EngineHarness {};

EngineConfig signedConfig() {
    EngineConfig cfg = testConfig();
    cfg.deviation_mode = DeviationMode::SIGNED;
    return cfg;
}

class SignedDeviationTest : public EngineHarness {
protected:
    SignedDeviationTest() : EngineHarness(signedConfig()) {}
};

}

TEST_F(TradeDeltaTest, FiftyFiftyScenario) {
    StrategyId id = scenario();
    engine.calculateRebalancing(as(OWNER, 101), id);

    EXPECT_EQ(delta(id, TOKEN_A), 100000);
    EXPECT_EQ(delta(id, TOKEN_B), -100000);
    EXPECT_EQ(countEvents(telemetry::EventType::REBALANCING_CALCULATED), 1u);
}

TEST_F(TradeDeltaTest, CalculationIsIdempotent) {
    StrategyId id = scenario();
    engine.calculateRebalancing(as(OWNER, 101), id);
    Int128 first_a = delta(id, TOKEN_A);
    Int128 first_b = delta(id, TOKEN_B);

    engine.calculateRebalancing(as(OWNER, 102), id);
    engine.calculateRebalancing(as(OWNER, 103), id);

    EXPECT_EQ(delta(id, TOKEN_A), first_a);
    EXPECT_EQ(delta(id, TOKEN_B), first_b);
    EXPECT_EQ(engine.getStrategy(id).last_execution_block, 0u);
}

TEST_F(TradeDeltaTest, DeviationBelowMinimumYieldsZero) {
    StrategyId id = scenario();
    // deviation 5000 against a 10000 minimum bound
    position(id, TOKEN_A, 495000, 101);
    position(id, TOKEN_B, 505000, 101);

    engine.calculateRebalancing(as(OWNER, 102), id);
    EXPECT_EQ(delta(id, TOKEN_A), 0);
    EXPECT_EQ(delta(id, TOKEN_B), 0);
}

TEST_F(TradeDeltaTest, DeviationAboveMaximumYieldsZero) {
    StrategyId id = scenario();
    // deviation 300000 against a 100000 maximum bound
    position(id, TOKEN_A, 200000, 101);
    position(id, TOKEN_B, 800000, 101);

    engine.calculateRebalancing(as(OWNER, 102), id);
    EXPECT_EQ(delta(id, TOKEN_A), 0);
    EXPECT_EQ(delta(id, TOKEN_B), 0);
}

TEST_F(TradeDeltaTest, DeviationInsideBandIsReleased) {
    StrategyId id = scenario();
    position(id, TOKEN_A, 470000, 101);
    position(id, TOKEN_B, 530000, 101);

    engine.calculateRebalancing(as(OWNER, 102), id);
    EXPECT_EQ(delta(id, TOKEN_A), 30000);
    EXPECT_EQ(delta(id, TOKEN_B), -30000);
}

TEST_F(TradeDeltaTest, ReplacingAnAllocationKeepsOneEntry) {
    StrategyId id = scenario();
    allocate(id, TOKEN_A, 4000, 100, 1000, 101);

    auto allocs = engine.getTargetAllocations(id);
    ASSERT_EQ(allocs.size(), 2u);
    EXPECT_EQ(allocs[0].asset, TOKEN_A);

    // target for A is now 400000, exactly the current position
    engine.calculateRebalancing(as(OWNER, 102), id);
    EXPECT_EQ(delta(id, TOKEN_A), 0);
    EXPECT_EQ(delta(id, TOKEN_B), -100000);
}

TEST_F(TradeDeltaTest, InactiveAllocationLeavesTotalAndZeroesDelta) {
    StrategyId id = scenario();
    allocate(id, TOKEN_C, 2000, 100, 1000, 101);
    position(id, TOKEN_C, 250000, 101);

    engine.deactivateAllocation(as(OWNER, 102), id, TOKEN_C);
    engine.calculateRebalancing(as(OWNER, 103), id);

    EXPECT_EQ(delta(id, TOKEN_A), 100000);
    EXPECT_EQ(delta(id, TOKEN_B), -100000);
    EXPECT_EQ(delta(id, TOKEN_C), 0);
    EXPECT_FALSE(engine.getTargetAllocations(id)[2].active);

    EXPECT_EQ(errorOf([&] {
        engine.deactivateAllocation(as(OWNER, 104), id, "0xdead");
    }), ErrorCode::INVALID_PARAMETER);
}

TEST_F(TradeDeltaTest, NoAllocationsIsANoOp) {
    StrategyId id = strategyIdFromLabel("empty");
    create(id, 10, 100);

    engine.calculateRebalancing(as(OWNER, 101), id);
    EXPECT_FALSE(engine.getTradeDelta(id, TOKEN_A).valid());
}

TEST_F(TradeDeltaTest, UnsetPositionCountsAsZero) {
    StrategyId id = strategyIdFromLabel("partial");
    create(id, 10, 100);
    allocate(id, TOKEN_A, 5000, 100, 5000, 100);
    allocate(id, TOKEN_B, 5000, 100, 5000, 100);
    position(id, TOKEN_A, 1000000, 100);

    engine.calculateRebalancing(as(OWNER, 101), id);
    EXPECT_EQ(delta(id, TOKEN_A), -500000);
    EXPECT_EQ(delta(id, TOKEN_B), 500000);
}

TEST_F(TradeDeltaTest, DeltasAreReadableByOwnerOnly) {
    StrategyId id = scenario();
    engine.calculateRebalancing(as(OWNER, 101), id);

    fhe::Sealed d = engine.getTradeDelta(id, TOKEN_A);
    EXPECT_TRUE(d.acl.self);
    EXPECT_TRUE(d.acl.allows(OWNER));
    EXPECT_THROW(cop.decrypt(d.handle, STRANGER), fhe::FheError);
}

TEST_F(TradeDeltaTest, OwnershipIsEnforced) {
    StrategyId id = scenario();

    EXPECT_EQ(errorOf([&] {
        engine.setTargetAllocation(as(STRANGER, 101), id, TOKEN_A,
                                   enc(1, STRANGER), enc(1, STRANGER),
                                   enc(1, STRANGER));
    }), ErrorCode::NOT_OWNER);
    EXPECT_EQ(errorOf([&] {
        engine.setEncryptedPosition(as(STRANGER, 101), id, TOKEN_A,
                                    enc(1, STRANGER));
    }), ErrorCode::NOT_OWNER);
    EXPECT_EQ(errorOf([&] {
        engine.calculateRebalancing(as(STRANGER, 101), id);
    }), ErrorCode::NOT_OWNER);
    EXPECT_EQ(errorOf([&] {
        engine.calculateRebalancing(as(OWNER, 101), strategyIdFromLabel("nope"));
    }), ErrorCode::STRATEGY_NOT_FOUND);
}

TEST_F(TradeDeltaTest, ForeignOrUnknownCiphertextsAreRejected) {
    StrategyId id = scenario();
    fhe::CtHandle before = engine.getEncryptedPosition(id, TOKEN_A).handle;

    EXPECT_EQ(errorOf([&] {
        engine.setEncryptedPosition(as(OWNER, 101), id, TOKEN_A,
                                    enc(1, STRANGER));
    }), ErrorCode::INVALID_CIPHERTEXT);
    EXPECT_EQ(errorOf([&] {
        engine.setEncryptedPosition(as(OWNER, 101), id, TOKEN_A,
                                    fhe::CtHandle{424242, fhe::FheType::EINT128});
    }), ErrorCode::INVALID_CIPHERTEXT);
    EXPECT_EQ(errorOf([&] {
        engine.setEncryptedPosition(as(OWNER, 101), id, "", enc(1));
    }), ErrorCode::INVALID_PARAMETER);

    EXPECT_EQ(engine.getEncryptedPosition(id, TOKEN_A).handle, before);
}

TEST_F(TradeDeltaTest, BooleanCiphertextsAreNotAmounts) {
    StrategyId id = scenario();
    fhe::CtHandle flag = cop.encryptBool(true, OWNER);

    EXPECT_EQ(errorOf([&] {
        engine.setEncryptedPosition(as(OWNER, 101), id, TOKEN_A, flag);
    }), ErrorCode::INVALID_CIPHERTEXT);
    EXPECT_EQ(errorOf([&] {
        engine.setTargetAllocation(as(OWNER, 101), id, TOKEN_A,
                                   enc(5000), flag, enc(1000));
    }), ErrorCode::INVALID_CIPHERTEXT);
    EXPECT_EQ(errorOf([&] {
        engine.createStrategy(as(OWNER, 101), strategyIdFromLabel("flagged"),
                              10, enc(20), flag, enc(50));
    }), ErrorCode::INVALID_CIPHERTEXT);
    EXPECT_FALSE(store.hasStrategy(strategyIdFromLabel("flagged")));

    engine.calculateRebalancing(as(OWNER, 102), id);
    EXPECT_EQ(delta(id, TOKEN_A), 100000);
    EXPECT_EQ(delta(id, TOKEN_B), -100000);
}

TEST_F(SignedDeviationTest, OverAllocationNeverTriggers) {
    StrategyId id = scenario();
    engine.calculateRebalancing(as(OWNER, 101), id);

    EXPECT_EQ(delta(id, TOKEN_A), 100000);
    EXPECT_EQ(delta(id, TOKEN_B), 0);
}

TEST_F(SignedDeviationTest, UnderAllocatedSideStillTriggers) {
    StrategyId id = scenario();
    position(id, TOKEN_A, 600000, 101);
    position(id, TOKEN_B, 400000, 101);

    engine.calculateRebalancing(as(OWNER, 102), id);
    EXPECT_EQ(delta(id, TOKEN_A), 0);
    EXPECT_EQ(delta(id, TOKEN_B), 100000);
}
