#pragma once

#include <unordered_set>

#include "shroud/state/StateStore.hpp"

namespace shroud {

// Per-strategy reentrancy lock plus the per-executor block discipline.
//
// Lock states: IDLE -> EXECUTING -> IDLE. A second acquisition while
// EXECUTING throws EXECUTION_IN_PROGRESS.
//
// Executors: the first execution is free; later ones must share the
// block of the caller's previous execution (one batch) or come after the
// cooldown. A block before the recorded one is a replayed, stale
// transaction and throws MEV_PROTECTION_VIOLATION.
class ExecutionGuard {
public:
    class Lock {
    public:
        Lock(ExecutionGuard& guard, const StrategyId& id);
        ~Lock();

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        ExecutionGuard& owner;
        StrategyId strategy;
    };

    bool isLocked(const StrategyId& id) const;
    size_t heldLocks() const { return held.size(); }

    void checkExecutor(
        const StateStore& store,
        const Principal& caller,
        BlockNumber block,
        uint64_t cooldown_blocks
    ) const;

    void recordExecution(
        StateStore& store,
        const Principal& caller,
        BlockNumber block
    );

private:
    std::unordered_set<StrategyId, Bytes32Hash> held;
};

}
