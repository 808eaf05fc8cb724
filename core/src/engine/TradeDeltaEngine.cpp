#include "shroud/engine/TradeDeltaEngine.hpp"
#include "shroud/engine/StoragePolicy.hpp"

namespace shroud {

TradeDeltaEngine::TradeDeltaEngine(
    StateStore& s,
    fhe::FheAdapter& f,
    const EngineConfig& cfg
) : store(s),
    arith(f),
    config(cfg) {}

fhe::Sealed TradeDeltaEngine::currentPosition(
    const StrategyId& id,
    const Asset& asset
) {
    fhe::Sealed pos = store.position(id, asset);
    if (pos.valid()) return pos;
    return arith.zero();
}

fhe::Sealed TradeDeltaEngine::totalValue(const StrategyId& id) {
    fhe::Sealed total = arith.zero();
    for (const auto& alloc : store.allocations(id)) {
        if (!alloc.active) continue;
        total = arith.add(total, currentPosition(id, alloc.asset));
    }
    return total;
}

fhe::Sealed TradeDeltaEngine::conditionalDelta(
    const TargetAllocation& alloc,
    const fhe::Sealed& total,
    const fhe::Sealed& current,
    const fhe::Sealed& bps,
    const fhe::Sealed& zero
) {
    fhe::Sealed target =
        arith.div(arith.mul(total, alloc.target_percentage), bps);

    fhe::Sealed deviation = arith.sub(target, current);

    fhe::Sealed magnitude =
        config.deviation_mode == DeviationMode::ABSOLUTE
            ? arith.absDiff(target, current)
            : deviation;

    fhe::Sealed min_bound =
        arith.div(arith.mul(total, alloc.min_threshold), bps);
    fhe::Sealed max_bound =
        arith.div(arith.mul(total, alloc.max_threshold), bps);

    fhe::Sealed exceeds_min = arith.gt(magnitude, min_bound);
    fhe::Sealed within_max = arith.lte(magnitude, max_bound);
    fhe::Sealed needs_rebalancing = arith.land(exceeds_min, within_max);

    return arith.select(needs_rebalancing, deviation, zero);
}

size_t TradeDeltaEngine::computeTradeDeltas(const StrategyId& id) {
    std::vector<TargetAllocation> allocs = store.allocations(id);
    if (allocs.empty()) return 0;

    fhe::Sealed total = totalValue(id);
    fhe::Sealed bps = arith.encryptConstant(config.basis_points);
    fhe::Sealed zero = arith.zero();

    // Evaluate everything first; nothing is written if the coprocessor
    // fails part way.
    std::vector<Staged> staged;
    staged.reserve(allocs.size());

    for (const auto& alloc : allocs) {
        if (!alloc.active) {
            staged.push_back({alloc.asset, zero});
            continue;
        }
        fhe::Sealed current = currentPosition(id, alloc.asset);
        staged.push_back({
            alloc.asset,
            conditionalDelta(alloc, total, current, bps, zero)
        });
    }

    fhe::AclPolicy policy = storagePolicy(store, id);
    for (auto& s : staged) {
        store.setTradeDelta(id, s.asset, arith.share(s.delta, policy));
    }
    return staged.size();
}

}
