#include "shroud/engine/ExecutionGuard.hpp"
#include "shroud/core/Errors.hpp"

namespace shroud {

ExecutionGuard::Lock::Lock(
    ExecutionGuard& guard,
    const StrategyId& id
) : owner(guard),
    strategy(id) {
    if (!owner.held.insert(id).second) {
        throw RebalanceError(ErrorCode::EXECUTION_IN_PROGRESS, toHex(id));
    }
}

ExecutionGuard::Lock::~Lock() {
    owner.held.erase(strategy);
}

bool ExecutionGuard::isLocked(const StrategyId& id) const {
    return held.count(id) > 0;
}

void ExecutionGuard::checkExecutor(
    const StateStore& store,
    const Principal& caller,
    BlockNumber block,
    uint64_t cooldown_blocks
) const {
    BlockNumber last = store.executorLastBlock(caller);
    if (last == 0) return;

    if (block < last) {
        throw RebalanceError(
            ErrorCode::MEV_PROTECTION_VIOLATION,
            "block " + std::to_string(block) +
            " precedes last execution at " + std::to_string(last));
    }
    if (block == last) return;

    if (block <= last + cooldown_blocks) {
        throw RebalanceError(
            ErrorCode::COOLDOWN_NOT_MET,
            "next execution after block " +
            std::to_string(last + cooldown_blocks));
    }
}

void ExecutionGuard::recordExecution(
    StateStore& store,
    const Principal& caller,
    BlockNumber block
) {
    store.setExecutorLastBlock(caller, block);
}

}
