#pragma once

#include <vector>

#include "shroud/config/EngineConfig.hpp"
#include "shroud/fhe/FheAdapter.hpp"
#include "shroud/state/StateStore.hpp"

namespace shroud {

// Computes, entirely on ciphertext, how far each asset of a strategy is
// from its target and whether that distance is inside the rebalancing
// band. Results replace the strategy's stored trade deltas.
//
// Fixed point: percentages and thresholds are basis points of the
// strategy's total value, so
//   target    = total * pct / bps
//   min bound = total * min / bps
//   max bound = total * max / bps
// and a delta is released when min bound < deviation <= max bound.
class TradeDeltaEngine {
public:
    TradeDeltaEngine(
        StateStore& store,
        fhe::FheAdapter& arith,
        const EngineConfig& cfg
    );

    // Sum of current positions over the active allocations. Encrypted
    // zero when the strategy has none.
    fhe::Sealed totalValue(const StrategyId& id);

    // Returns the number of assets whose delta was rewritten.
    size_t computeTradeDeltas(const StrategyId& id);

private:
    struct Staged {
        Asset asset;
        fhe::Sealed delta;
    };

    fhe::Sealed currentPosition(const StrategyId& id, const Asset& asset);

    fhe::Sealed conditionalDelta(
        const TargetAllocation& alloc,
        const fhe::Sealed& total,
        const fhe::Sealed& current,
        const fhe::Sealed& bps,
        const fhe::Sealed& zero
    );

    StateStore& store;
    fhe::FheAdapter& arith;
    const EngineConfig& config;
};

}
