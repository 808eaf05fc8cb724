#pragma once

#include <vector>

#include "shroud/config/EngineConfig.hpp"
#include "shroud/state/StateStore.hpp"

namespace shroud {

// Vote-threshold trigger for governance-owned strategies. One vote per
// voter; the strategy fires once when the count reaches the threshold.
class GovernanceVoting {
public:
    GovernanceVoting(
        StateStore& store,
        const EngineConfig& cfg
    );

    bool isGovernance(const Principal& p) const;
    bool isEligibleVoter(const Principal& p) const;

    void requireGovernance(const Principal& caller) const;

    void registerVoters(
        const StrategyId& id,
        const std::vector<Principal>& voters
    );

    // Counts the vote. Returns true when this vote reached the threshold
    // and the strategy has not fired yet.
    bool castVote(const StrategyId& id, const Principal& voter);

    void markTriggered(const StrategyId& id, BlockNumber block);

    uint32_t threshold() const { return config.vote_threshold; }

private:
    StateStore& store;
    const EngineConfig& config;
};

}
