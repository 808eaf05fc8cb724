#include "TestSupport.hpp"

using namespace shroud;
using namespace shroud::test;
using telemetry::EventType;

namespace {

class GovernanceTest : public EngineHarness {
protected:
    fhe::CtHandle govEnc(Int128 v) {
        return enc(v, cfg.governance);
    }

    StrategyId governed(std::vector<Principal> voters = {EXEC1, EXEC2, EXEC3}) {
        StrategyId id = strategyIdFromLabel("treasury");
        engine.createGovernanceStrategy(
            as(cfg.governance, 100), id, 10,
            govEnc(20), govEnc(2), govEnc(50), voters);

        engine.setTargetAllocation(as(cfg.governance, 100), id, TOKEN_A,
                                   govEnc(5000), govEnc(100), govEnc(1000));
        engine.setTargetAllocation(as(cfg.governance, 100), id, TOKEN_B,
                                   govEnc(5000), govEnc(100), govEnc(1000));
        engine.setEncryptedPosition(as(cfg.governance, 100), id, TOKEN_A,
                                    govEnc(400000));
        engine.setEncryptedPosition(as(cfg.governance, 100), id, TOKEN_B,
                                    govEnc(600000));
        return id;
    }

    Int128 govDelta(const StrategyId& id, const Asset& asset) {
        return cop.decrypt(engine.getTradeDelta(id, asset).handle,
                           cfg.governance);
    }
};

}

TEST_F(GovernanceTest, OnlyGovernanceCreatesGovernedStrategies) {
    StrategyId id = strategyIdFromLabel("rogue");
    EXPECT_EQ(errorOf([&] {
        engine.createGovernanceStrategy(as(OWNER, 100), id, 10,
                                        enc(20), enc(2), enc(50), {EXEC1});
    }), ErrorCode::NOT_GOVERNANCE);
    EXPECT_FALSE(store.hasStrategy(id));
}

TEST_F(GovernanceTest, VoterListIsValidated) {
    EXPECT_EQ(errorOf([&] { governed({}); }), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(errorOf([&] { governed({EXEC1, STRANGER}); }),
              ErrorCode::NOT_AUTHORIZED_EXECUTOR);
    EXPECT_FALSE(store.hasStrategy(strategyIdFromLabel("treasury")));

    StrategyId id = governed({EXEC1, EXEC1, cfg.governance});
    GovernanceState gov = engine.getGovernanceStatus(id);
    EXPECT_EQ(gov.voters.size(), 2u);
    EXPECT_TRUE(engine.getStrategy(id).is_governance);
    EXPECT_EQ(engine.getStrategy(id).owner, cfg.governance);
}

TEST_F(GovernanceTest, VotingRules) {
    StrategyId id = governed();

    EXPECT_EQ(errorOf([&] { engine.voteOnStrategy(as(STRANGER, 101), id); }),
              ErrorCode::NOT_AUTHORIZED_EXECUTOR);

    engine.voteOnStrategy(as(EXEC1, 101), id);
    EXPECT_EQ(errorOf([&] { engine.voteOnStrategy(as(EXEC1, 102), id); }),
              ErrorCode::ALREADY_VOTED);
    EXPECT_EQ(engine.getGovernanceStatus(id).votes, 1u);

    StrategyId plain = scenario();
    EXPECT_EQ(errorOf([&] { engine.voteOnStrategy(as(EXEC1, 102), plain); }),
              ErrorCode::NOT_GOVERNANCE_STRATEGY);
    EXPECT_EQ(errorOf([&] {
        engine.voteOnStrategy(as(EXEC1, 102), strategyIdFromLabel("nope"));
    }), ErrorCode::STRATEGY_NOT_FOUND);
}

TEST_F(GovernanceTest, ThresholdVoteTriggersRebalancing) {
    StrategyId id = governed();

    engine.voteOnStrategy(as(EXEC1, 101), id);
    engine.voteOnStrategy(as(EXEC2, 102), id);
    EXPECT_FALSE(engine.getTradeDelta(id, TOKEN_A).valid());
    EXPECT_FALSE(engine.getGovernanceStatus(id).triggered);

    // the trigger ignores the rebalance frequency
    engine.voteOnStrategy(as(EXEC3, 103), id);

    GovernanceState gov = engine.getGovernanceStatus(id);
    EXPECT_TRUE(gov.triggered);
    EXPECT_EQ(gov.triggered_block, 103u);
    EXPECT_EQ(gov.votes, 3u);

    EXPECT_EQ(govDelta(id, TOKEN_A), 100000);
    EXPECT_EQ(govDelta(id, TOKEN_B), -100000);
    EXPECT_EQ(engine.getStrategy(id).last_execution_block, 103u);
    EXPECT_EQ(countEvents(EventType::GOVERNANCE_TRIGGERED), 1u);
    EXPECT_EQ(countEvents(EventType::VOTE_CAST), 3u);
}

TEST_F(GovernanceTest, LateVotesAreCountedWithoutRetrigger) {
    StrategyId id = governed({EXEC1, EXEC2, EXEC3, cfg.governance});

    engine.voteOnStrategy(as(EXEC1, 101), id);
    engine.voteOnStrategy(as(EXEC2, 101), id);
    engine.voteOnStrategy(as(EXEC3, 101), id);

    fhe::CtHandle delta_before = engine.getTradeDelta(id, TOKEN_A).handle;
    engine.voteOnStrategy(as(cfg.governance, 105), id);

    GovernanceState gov = engine.getGovernanceStatus(id);
    EXPECT_EQ(gov.votes, 4u);
    EXPECT_EQ(gov.triggered_block, 101u);
    EXPECT_EQ(engine.getTradeDelta(id, TOKEN_A).handle, delta_before);
    EXPECT_EQ(engine.getStrategy(id).last_execution_block, 101u);
    EXPECT_EQ(countEvents(EventType::GOVERNANCE_TRIGGERED), 1u);
}

TEST_F(GovernanceTest, InactiveGovernedStrategyRejectsVotes) {
    StrategyId id = governed();
    engine.deactivateStrategy(as(cfg.governance, 101), id);

    EXPECT_EQ(errorOf([&] { engine.voteOnStrategy(as(EXEC1, 102), id); }),
              ErrorCode::STRATEGY_INACTIVE);
    EXPECT_EQ(engine.getGovernanceStatus(id).votes, 0u);
}

TEST_F(GovernanceTest, GovernanceMayDeactivateAnyStrategy) {
    StrategyId id = scenario();
    EXPECT_EQ(errorOf([&] { engine.deactivateStrategy(as(STRANGER, 101), id); }),
              ErrorCode::NOT_OWNER);

    engine.deactivateStrategy(as(cfg.governance, 101), id);
    EXPECT_FALSE(engine.getStrategy(id).active);
}

TEST_F(GovernanceTest, ExecutorRegistryIsGovernanceOnly) {
    const Principal newcomer = "0xe8ec000000000000000000000000000000000009";

    EXPECT_EQ(errorOf([&] {
        engine.addAuthorizedExecutor(as(OWNER, 100), newcomer);
    }), ErrorCode::NOT_GOVERNANCE);
    EXPECT_EQ(errorOf([&] {
        engine.removeAuthorizedExecutor(as(EXEC1, 100), EXEC2);
    }), ErrorCode::NOT_GOVERNANCE);
    EXPECT_EQ(errorOf([&] {
        engine.addAuthorizedExecutor(as(cfg.governance, 100), "");
    }), ErrorCode::INVALID_PARAMETER);

    engine.addAuthorizedExecutor(as(cfg.governance, 100), newcomer);
    EXPECT_TRUE(engine.isAuthorizedExecutor(newcomer));

    engine.removeAuthorizedExecutor(as(cfg.governance, 100), EXEC1);
    EXPECT_FALSE(engine.isAuthorizedExecutor(EXEC1));
    EXPECT_EQ(countEvents(EventType::EXECUTOR_UPDATED), 2u);

    StrategyId id = scenario(10, 100);
    EXPECT_EQ(errorOf([&] { engine.executeRebalancing(as(EXEC1, 115), id); }),
              ErrorCode::NOT_AUTHORIZED_EXECUTOR);

    engine.executeRebalancing(as(newcomer, 115), id);
    EXPECT_EQ(engine.getStrategy(id).last_execution_block, 115u);
}
