#include "shroud/coordination/CoordinationRegistry.hpp"

#include <unordered_set>

namespace shroud {

CoordinationRegistry::CoordinationRegistry(
    StateStore& s
) : store(s) {}

void CoordinationRegistry::enable(
    const StrategyId& id,
    const std::vector<PoolId>& pools
) {
    CoordinationState state = store.coordination(id);

    state.pools.clear();
    for (const auto& pool : pools) {
        if (!state.contains(pool)) {
            state.pools.push_back(pool);
        }
    }
    state.enabled = !state.pools.empty();
    store.setCoordination(id, state);

    for (const auto& pool : state.pools) {
        store.appendPoolStrategy(pool, id);
    }
}

bool CoordinationRegistry::isMember(
    const StrategyId& id,
    const PoolId& pool
) const {
    CoordinationState state = store.coordination(id);
    return state.enabled && state.contains(pool);
}

std::vector<StrategyId> CoordinationRegistry::strategiesForPool(
    const PoolId& pool
) const {
    std::vector<StrategyId> out;
    std::unordered_set<StrategyId, Bytes32Hash> seen;

    for (const auto& id : store.poolStrategies(pool)) {
        if (!seen.insert(id).second) continue;
        if (!isMember(id, pool)) continue;
        out.push_back(id);
    }
    return out;
}

void CoordinationRegistry::recordSync(
    const StrategyId& id,
    const PoolId& pool,
    BlockNumber block
) {
    CoordinationState state = store.coordination(id);
    state.last_synced_pool = pool;
    state.last_sync_block = block;
    state.sync_count++;
    store.setCoordination(id, state);
}

}
