#include "shroud/engine/TimingGate.hpp"
#include "shroud/engine/StoragePolicy.hpp"
#include "shroud/core/Hash.hpp"

#include <limits>

namespace shroud {

TimingGate::TimingGate(
    StateStore& s,
    fhe::FheAdapter& f,
    const EngineConfig& cfg
) : store(s),
    arith(f),
    config(cfg) {}

uint64_t TimingGate::blocksSinceAnchor(
    const Strategy& s,
    BlockNumber block
) const {
    if (block <= s.cycle_anchor_block) return 0;
    return block - s.cycle_anchor_block;
}

bool TimingGate::isStale(const Strategy& s, BlockNumber block) const {
    // saturates: a window too long to represent never goes stale
    uint64_t limit = std::numeric_limits<uint64_t>::max();
    if (s.rebalance_frequency <= limit / config.stale_multiplier) {
        limit = config.stale_multiplier * s.rebalance_frequency;
    }
    return blocksSinceAnchor(s, block) > limit;
}

bool TimingGate::isExecutionReady(
    const Strategy& s,
    BlockNumber block
) const {
    if (!s.active) return false;

    uint64_t elapsed = blocksSinceAnchor(s, block);
    if (elapsed < s.rebalance_frequency) return false;
    if (isStale(s, block)) return false;
    // one round per block while a cycle is being spread
    if (s.execution_round > 0 && block <= s.round_block) return false;
    return true;
}

bool TimingGate::shouldSpreadExecution(
    const Strategy& s,
    BlockNumber block
) const {
    uint64_t elapsed = blocksSinceAnchor(s, block);
    if (elapsed < s.rebalance_frequency) return false;

    uint64_t into_window = elapsed - s.rebalance_frequency;
    return into_window < s.rebalance_frequency / config.spread_divisor;
}

uint64_t TimingGate::timingOffset(
    const Strategy& s,
    const CallContext& ctx
) const {
    uint64_t span = s.rebalance_frequency / config.spread_divisor + 1;
    return blockEntropy(ctx.block_seed, ctx.block_number, s.id) % span;
}

fhe::Sealed TimingGate::checkEncryptedTiming(
    const Strategy& s,
    const CallContext& ctx
) {
    uint64_t elapsed = blocksSinceAnchor(s, ctx.block_number);

    fhe::Sealed enc_elapsed =
        arith.encryptConstant(static_cast<Int128>(elapsed));
    fhe::Sealed enc_offset =
        arith.encryptConstant(static_cast<Int128>(timingOffset(s, ctx)));

    fhe::Sealed adjusted_window =
        arith.add(s.params.execution_window, enc_offset);
    fhe::Sealed inside = arith.lt(enc_elapsed, adjusted_window);

    fhe::Sealed eligible =
        arith.encryptBool(isExecutionReady(s, ctx.block_number));
    fhe::Sealed signal = arith.land(eligible, inside);

    SignalState sig = store.signals(s.id);
    sig.timing = arith.share(signal, storagePolicy(store, s.id));
    sig.timing_block = ctx.block_number;
    store.setSignals(s.id, sig);

    return sig.timing;
}

fhe::Sealed TimingGate::checkSlippageProtection(
    const Strategy& s,
    const fhe::Sealed& expected,
    const fhe::Sealed& realised,
    BlockNumber block
) {
    fhe::Sealed zero = arith.zero();
    fhe::Sealed bps = arith.encryptConstant(config.basis_points);

    // |expected - realised| * bps <= maxSlippage * |expected|
    fhe::Sealed miss = arith.mul(arith.absDiff(expected, realised), bps);
    fhe::Sealed allowance =
        arith.mul(s.params.max_slippage, arith.absDiff(expected, zero));
    fhe::Sealed ok = arith.lte(miss, allowance);

    SignalState sig = store.signals(s.id);
    if (sig.slippage.valid() && sig.slippage_block == block) {
        ok = arith.land(sig.slippage, ok);
    }
    sig.slippage = arith.share(ok, storagePolicy(store, s.id));
    sig.slippage_block = block;
    store.setSignals(s.id, sig);

    return sig.slippage;
}

fhe::Sealed TimingGate::checkCrossPoolCoordination(
    const Strategy& s,
    const PoolId& pool,
    const CallContext& ctx
) {
    CoordinationState coord = store.coordination(s.id);
    if (!coord.enabled) {
        return arith.encryptBool(true);
    }
    if (!coord.contains(pool)) {
        return arith.encryptBool(false);
    }
    return checkEncryptedTiming(s, ctx);
}

}
