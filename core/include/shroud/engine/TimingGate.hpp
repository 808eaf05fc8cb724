#pragma once

#include "shroud/config/EngineConfig.hpp"
#include "shroud/fhe/FheAdapter.hpp"
#include "shroud/state/StateStore.hpp"

namespace shroud {

// Decides when a strategy may execute. The coarse window is plaintext;
// the precise instant is blurred by encrypted per-strategy parameters and
// block entropy.
//
//   anchor            anchor+freq        anchor+freq+freq/5    anchor+10*freq
//     |---- cooling ----|---- spread rounds ----|---- final ----|---- stale
class TimingGate {
public:
    TimingGate(
        StateStore& store,
        fhe::FheAdapter& arith,
        const EngineConfig& cfg
    );

    uint64_t blocksSinceAnchor(const Strategy& s, BlockNumber block) const;

    bool isExecutionReady(const Strategy& s, BlockNumber block) const;
    bool isStale(const Strategy& s, BlockNumber block) const;
    bool shouldSpreadExecution(const Strategy& s, BlockNumber block) const;

    // Plaintext jitter added to the encrypted execution window.
    uint64_t timingOffset(const Strategy& s, const CallContext& ctx) const;

    // Encrypted "inside the adjusted window" flag. Recorded as the
    // strategy's timing signal; never decrypted here.
    fhe::Sealed checkEncryptedTiming(const Strategy& s, const CallContext& ctx);

    // Encrypted "realised fill stayed within maxSlippage of the expected
    // trade delta" flag, recorded as the slippage signal. Fills in the
    // same block are combined with AND.
    fhe::Sealed checkSlippageProtection(
        const Strategy& s,
        const fhe::Sealed& expected,
        const fhe::Sealed& realised,
        BlockNumber block
    );

    // Encrypted false when coordination is on and `pool` is not enrolled;
    // otherwise the timing flag (coordination on) or encrypted true.
    fhe::Sealed checkCrossPoolCoordination(
        const Strategy& s,
        const PoolId& pool,
        const CallContext& ctx
    );

private:
    StateStore& store;
    fhe::FheAdapter& arith;
    const EngineConfig& config;
};

}
