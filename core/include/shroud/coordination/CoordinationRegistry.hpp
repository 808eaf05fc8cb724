#pragma once

#include <vector>

#include "shroud/state/StateStore.hpp"

namespace shroud {

class CoordinationRegistry {
public:
    explicit CoordinationRegistry(StateStore& store);

    // Replaces the strategy's pool set. The reverse index only grows;
    // readers filter on membership.
    void enable(const StrategyId& id, const std::vector<PoolId>& pools);

    bool isMember(const StrategyId& id, const PoolId& pool) const;

    // Strategies currently enrolled for `pool`, each once, in index order.
    std::vector<StrategyId> strategiesForPool(const PoolId& pool) const;

    void recordSync(
        const StrategyId& id,
        const PoolId& pool,
        BlockNumber block
    );

private:
    StateStore& store;
};

}
