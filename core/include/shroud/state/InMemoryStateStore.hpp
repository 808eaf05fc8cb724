#pragma once

#include <map>
#include <optional>
#include <unordered_map>

#include "shroud/state/StateStore.hpp"

namespace shroud {

class InMemoryStateStore : public StateStore {
public:
    InMemoryStateStore() = default;
    InMemoryStateStore(const InMemoryStateStore&) = delete;
    InMemoryStateStore& operator=(const InMemoryStateStore&) = delete;

    bool hasStrategy(const StrategyId& id) const override;
    const Strategy* findStrategy(const StrategyId& id) const override;
    void putStrategy(const Strategy& s) override;
    std::vector<StrategyId> strategyIds() const override;

    std::vector<TargetAllocation> allocations(
        const StrategyId& id
    ) const override;
    void upsertAllocation(
        const StrategyId& id,
        const TargetAllocation& alloc
    ) override;

    fhe::Sealed position(
        const StrategyId& id,
        const Asset& asset
    ) const override;
    void setPosition(
        const StrategyId& id,
        const Asset& asset,
        const fhe::Sealed& value
    ) override;
    std::vector<Asset> positionAssets(const StrategyId& id) const override;

    fhe::Sealed tradeDelta(
        const StrategyId& id,
        const Asset& asset
    ) const override;
    void setTradeDelta(
        const StrategyId& id,
        const Asset& asset,
        const fhe::Sealed& value
    ) override;
    std::vector<Asset> tradeDeltaAssets(const StrategyId& id) const override;

    CoordinationState coordination(const StrategyId& id) const override;
    void setCoordination(
        const StrategyId& id,
        const CoordinationState& state
    ) override;
    std::vector<StrategyId> poolStrategies(const PoolId& pool) const override;
    std::vector<PoolId> indexedPools() const override;
    void appendPoolStrategy(
        const PoolId& pool,
        const StrategyId& id
    ) override;

    GovernanceState governance(const StrategyId& id) const override;
    void setGovernance(
        const StrategyId& id,
        const GovernanceState& state
    ) override;

    ComplianceState compliance(const StrategyId& id) const override;
    void setCompliance(
        const StrategyId& id,
        const ComplianceState& state
    ) override;

    SignalState signals(const StrategyId& id) const override;
    void setSignals(
        const StrategyId& id,
        const SignalState& state
    ) override;

    bool isAuthorizedExecutor(const Principal& p) const override;
    void setAuthorizedExecutor(const Principal& p, bool allowed) override;
    std::vector<Principal> authorizedExecutors() const override;

    BlockNumber executorLastBlock(const Principal& p) const override;
    void setExecutorLastBlock(const Principal& p, BlockNumber b) override;
    std::vector<std::pair<Principal, BlockNumber>>
        executorBlocks() const override;

    std::unique_ptr<StoreCheckpoint> checkpoint() override;
    void restore(const StoreCheckpoint& cp) override;

    size_t openCheckpoints() const { return frames.size(); }

private:
    template <typename T>
    using ById = std::unordered_map<StrategyId, T, Bytes32Hash>;

    // Everything stored for one strategy.
    struct Record {
        Strategy strategy;
        std::vector<TargetAllocation> allocations;
        std::map<Asset, fhe::Sealed> positions;
        std::map<Asset, fhe::Sealed> trade_deltas;
        CoordinationState coordination;
        GovernanceState governance;
        ComplianceState compliance;
        SignalState signals;
    };

    // Undo log of one open checkpoint: the value each entry had before its
    // first write, or nullopt when it did not exist yet.
    class UndoFrame : public StoreCheckpoint {
    public:
        explicit UndoFrame(InMemoryStateStore& s);
        ~UndoFrame() override;

        UndoFrame(const UndoFrame&) = delete;
        UndoFrame& operator=(const UndoFrame&) = delete;

        InMemoryStateStore& store;
        size_t order_size;
        ById<std::optional<Record>> records;
        std::map<PoolId, std::optional<std::vector<StrategyId>>> pools;
        std::map<Principal, std::optional<bool>> executors;
        std::map<Principal, std::optional<BlockNumber>> executor_blocks;
    };

    const Record* find(const StrategyId& id) const;
    Record& mutableRecord(const StrategyId& id);

    void touchRecord(const StrategyId& id);
    void touchPool(const PoolId& pool);
    void touchExecutor(const Principal& p);
    void touchExecutorBlock(const Principal& p);

    std::vector<StrategyId> order;
    ById<Record> records;
    std::map<PoolId, std::vector<StrategyId>> pool_index;
    std::map<Principal, bool> executors;
    std::map<Principal, BlockNumber> executor_blocks;

    std::vector<UndoFrame*> frames;
};

}
