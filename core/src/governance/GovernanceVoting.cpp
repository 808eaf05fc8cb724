#include "shroud/governance/GovernanceVoting.hpp"
#include "shroud/core/Errors.hpp"

namespace shroud {

GovernanceVoting::GovernanceVoting(
    StateStore& s,
    const EngineConfig& cfg
) : store(s),
    config(cfg) {}

bool GovernanceVoting::isGovernance(const Principal& p) const {
    return p == config.governance;
}

bool GovernanceVoting::isEligibleVoter(const Principal& p) const {
    return isGovernance(p) || store.isAuthorizedExecutor(p);
}

void GovernanceVoting::requireGovernance(const Principal& caller) const {
    if (!isGovernance(caller)) {
        throw RebalanceError(ErrorCode::NOT_GOVERNANCE, caller);
    }
}

void GovernanceVoting::registerVoters(
    const StrategyId& id,
    const std::vector<Principal>& voters
) {
    if (voters.empty()) {
        throw RebalanceError(
            ErrorCode::INVALID_PARAMETER, "governance strategy needs voters");
    }

    GovernanceState state;
    for (const auto& v : voters) {
        if (!isEligibleVoter(v)) {
            throw RebalanceError(ErrorCode::NOT_AUTHORIZED_EXECUTOR, v);
        }
        if (!state.isVoter(v)) {
            state.voters.push_back(v);
        }
    }
    store.setGovernance(id, state);
}

bool GovernanceVoting::castVote(
    const StrategyId& id,
    const Principal& voter
) {
    GovernanceState state = store.governance(id);

    if (!state.isVoter(voter)) {
        throw RebalanceError(ErrorCode::NOT_AUTHORIZED_EXECUTOR, voter);
    }
    if (state.voted.count(voter)) {
        throw RebalanceError(ErrorCode::ALREADY_VOTED, voter);
    }

    state.voted.insert(voter);
    state.votes++;
    store.setGovernance(id, state);

    return !state.triggered && state.votes >= config.vote_threshold;
}

void GovernanceVoting::markTriggered(const StrategyId& id, BlockNumber block) {
    GovernanceState state = store.governance(id);
    state.triggered = true;
    state.triggered_block = block;
    store.setGovernance(id, state);
}

}
