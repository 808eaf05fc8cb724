#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "shroud/state/StrategyState.hpp"

namespace shroud {

class StoreCheckpoint {
public:
    virtual ~StoreCheckpoint() = default;
};

// Owner of all per-strategy state. Reads never fail: absent entries come
// back as null handles or default structs. Writes other than putStrategy
// require the strategy to exist (STRATEGY_NOT_FOUND otherwise).
class StateStore {
public:
    virtual ~StateStore() = default;

    // strategies
    virtual bool hasStrategy(const StrategyId& id) const = 0;
    virtual const Strategy* findStrategy(const StrategyId& id) const = 0;
    virtual void putStrategy(const Strategy& s) = 0;
    virtual std::vector<StrategyId> strategyIds() const = 0;

    // allocations: at most one entry per asset
    virtual std::vector<TargetAllocation> allocations(
        const StrategyId& id
    ) const = 0;
    virtual void upsertAllocation(
        const StrategyId& id,
        const TargetAllocation& alloc
    ) = 0;

    // positions and trade deltas
    virtual fhe::Sealed position(
        const StrategyId& id,
        const Asset& asset
    ) const = 0;
    virtual void setPosition(
        const StrategyId& id,
        const Asset& asset,
        const fhe::Sealed& value
    ) = 0;
    virtual std::vector<Asset> positionAssets(const StrategyId& id) const = 0;

    virtual fhe::Sealed tradeDelta(
        const StrategyId& id,
        const Asset& asset
    ) const = 0;
    virtual void setTradeDelta(
        const StrategyId& id,
        const Asset& asset,
        const fhe::Sealed& value
    ) = 0;
    virtual std::vector<Asset> tradeDeltaAssets(const StrategyId& id) const = 0;

    // coordination
    virtual CoordinationState coordination(const StrategyId& id) const = 0;
    virtual void setCoordination(
        const StrategyId& id,
        const CoordinationState& state
    ) = 0;
    virtual std::vector<StrategyId> poolStrategies(const PoolId& pool) const = 0;
    virtual std::vector<PoolId> indexedPools() const = 0;
    virtual void appendPoolStrategy(
        const PoolId& pool,
        const StrategyId& id
    ) = 0;

    // governance, compliance, signals
    virtual GovernanceState governance(const StrategyId& id) const = 0;
    virtual void setGovernance(
        const StrategyId& id,
        const GovernanceState& state
    ) = 0;

    virtual ComplianceState compliance(const StrategyId& id) const = 0;
    virtual void setCompliance(
        const StrategyId& id,
        const ComplianceState& state
    ) = 0;

    virtual SignalState signals(const StrategyId& id) const = 0;
    virtual void setSignals(
        const StrategyId& id,
        const SignalState& state
    ) = 0;

    // executors
    virtual bool isAuthorizedExecutor(const Principal& p) const = 0;
    virtual void setAuthorizedExecutor(const Principal& p, bool allowed) = 0;
    virtual std::vector<Principal> authorizedExecutors() const = 0;

    virtual BlockNumber executorLastBlock(const Principal& p) const = 0;
    virtual void setExecutorLastBlock(const Principal& p, BlockNumber b) = 0;
    virtual std::vector<std::pair<Principal, BlockNumber>>
        executorBlocks() const = 0;

    // all-or-nothing support. Checkpoints nest and stay live until
    // destroyed; restore() undoes every write made since the checkpoint.
    virtual std::unique_ptr<StoreCheckpoint> checkpoint() = 0;
    virtual void restore(const StoreCheckpoint& cp) = 0;
};

}
