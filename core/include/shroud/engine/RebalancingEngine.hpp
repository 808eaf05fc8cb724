#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "shroud/compliance/ComplianceReporter.hpp"
#include "shroud/compliance/HashAuditJournal.hpp"
#include "shroud/config/EngineConfig.hpp"
#include "shroud/coordination/CoordinationRegistry.hpp"
#include "shroud/engine/ExecutionGuard.hpp"
#include "shroud/engine/TimingGate.hpp"
#include "shroud/engine/TradeDeltaEngine.hpp"
#include "shroud/fhe/FheAdapter.hpp"
#include "shroud/governance/GovernanceVoting.hpp"
#include "shroud/state/StateStore.hpp"
#include "shroud/telemetry/EventBus.hpp"
#include "shroud/telemetry/EventSinkStdout.hpp"

namespace shroud {

// Public surface of the engine: strategy owners, governance, executors
// and the swap pipeline all enter here.
//
// Every operation is all-or-nothing. State is checkpointed on entry and
// restored on any exception; events are buffered and published once the
// outermost operation commits. Coprocessor failures are reported as an
// immediate FHE_OPERATION_FAILED event and rethrown as RebalanceError.
class RebalancingEngine {
public:
    RebalancingEngine(
        const EngineConfig& cfg,
        StateStore& store,
        fhe::IFheCoprocessor& coprocessor,
        telemetry::EventBus& bus,
        HashAuditJournal* journal = nullptr
    );

    // ---------------------------------------------------------------
    // Strategy lifecycle
    // ---------------------------------------------------------------
    void createStrategy(
        const CallContext& ctx,
        const StrategyId& id,
        uint64_t rebalance_frequency,
        const fhe::CtHandle& execution_window,
        const fhe::CtHandle& spread_blocks,
        const fhe::CtHandle& max_slippage
    );

    void createGovernanceStrategy(
        const CallContext& ctx,
        const StrategyId& id,
        uint64_t rebalance_frequency,
        const fhe::CtHandle& execution_window,
        const fhe::CtHandle& spread_blocks,
        const fhe::CtHandle& max_slippage,
        const std::vector<Principal>& voters
    );

    void setTargetAllocation(
        const CallContext& ctx,
        const StrategyId& id,
        const Asset& asset,
        const fhe::CtHandle& target_percentage,
        const fhe::CtHandle& min_threshold,
        const fhe::CtHandle& max_threshold
    );

    void deactivateAllocation(
        const CallContext& ctx,
        const StrategyId& id,
        const Asset& asset
    );

    void setEncryptedPosition(
        const CallContext& ctx,
        const StrategyId& id,
        const Asset& asset,
        const fhe::CtHandle& amount
    );

    void deactivateStrategy(const CallContext& ctx, const StrategyId& id);
    void rearmStrategy(const CallContext& ctx, const StrategyId& id);

    // ---------------------------------------------------------------
    // Rebalancing
    // ---------------------------------------------------------------
    void calculateRebalancing(const CallContext& ctx, const StrategyId& id);
    void executeRebalancing(const CallContext& ctx, const StrategyId& id);

    // ---------------------------------------------------------------
    // Swap pipeline (pool manager only)
    // ---------------------------------------------------------------
    void onPreSwap(
        const CallContext& ctx,
        const PoolId& pool,
        const Asset& asset0,
        const Asset& asset1
    );

    void onPostSwap(
        const CallContext& ctx,
        const PoolId& pool,
        const Asset& asset0,
        const Asset& asset1,
        Int128 realised0,
        Int128 realised1
    );

    // ---------------------------------------------------------------
    // Coordination, compliance, governance
    // ---------------------------------------------------------------
    void enableCrossPoolCoordination(
        const CallContext& ctx,
        const StrategyId& id,
        const std::vector<PoolId>& pools
    );

    void enableComplianceReporting(
        const CallContext& ctx,
        const StrategyId& id,
        const Principal& reporter
    );

    ComplianceReport generateComplianceReport(
        const CallContext& ctx,
        const StrategyId& id
    );

    void voteOnStrategy(const CallContext& ctx, const StrategyId& id);

    void addAuthorizedExecutor(const CallContext& ctx, const Principal& p);
    void removeAuthorizedExecutor(const CallContext& ctx, const Principal& p);

    // ---------------------------------------------------------------
    // Read-only
    // ---------------------------------------------------------------
    Strategy getStrategy(const StrategyId& id) const;
    std::vector<TargetAllocation> getTargetAllocations(
        const StrategyId& id
    ) const;
    fhe::Sealed getEncryptedPosition(
        const StrategyId& id,
        const Asset& asset
    ) const;
    fhe::Sealed getTradeDelta(const StrategyId& id, const Asset& asset) const;
    std::vector<StrategyId> getPoolStrategies(const PoolId& pool) const;
    CoordinationState getCoordinationStatus(const StrategyId& id) const;
    ComplianceState getComplianceStatus(const StrategyId& id) const;
    GovernanceState getGovernanceStatus(const StrategyId& id) const;
    bool isExecutionReady(const StrategyId& id, BlockNumber block) const;
    bool shouldSpreadExecution(const StrategyId& id, BlockNumber block) const;
    fhe::Sealed getTimingSignal(const StrategyId& id) const;
    fhe::Sealed getSlippageSignal(const StrategyId& id) const;
    bool isAuthorizedExecutor(const Principal& p) const;

    const EngineConfig& config() const { return cfg; }
    const fhe::FheAdapter& adapter() const { return arith; }

private:
    class Transaction {
    public:
        explicit Transaction(RebalancingEngine& engine);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit() { done = true; }
        void rollback();

    private:
        RebalancingEngine& engine;
        std::unique_ptr<StoreCheckpoint> checkpoint;
        size_t event_mark;
        bool done = false;
    };

    void transact(
        const char* op,
        const CallContext& ctx,
        const StrategyId& id,
        const std::function<void()>& fn
    );

    void reportFheFailure(
        const char* op,
        const CallContext& ctx,
        const StrategyId& id,
        const fhe::FheError& e
    );

    void emit(
        telemetry::EventType type,
        const StrategyId& id,
        const CallContext& ctx,
        const std::string& detail = ""
    );
    void flushEvents();

    Strategy requireStrategy(const StrategyId& id) const;
    Strategy requireOwner(const CallContext& ctx, const StrategyId& id) const;
    void requirePoolManager(const CallContext& ctx) const;
    fhe::Sealed acceptInput(
        const fhe::CtHandle& h,
        const Principal& caller,
        const fhe::AclPolicy& policy
    );

    void createInternal(
        const CallContext& ctx,
        const StrategyId& id,
        uint64_t rebalance_frequency,
        const fhe::CtHandle& execution_window,
        const fhe::CtHandle& spread_blocks,
        const fhe::CtHandle& max_slippage,
        const Principal& owner,
        bool is_governance
    );

    // Deltas, timing signal and the cycle bookkeeping shared by explicit
    // execution and the pre-swap hook (`pool` set).
    void performExecution(
        const Strategy& s,
        const CallContext& ctx,
        const PoolId* pool
    );
    void finalizeCycle(Strategy& s, BlockNumber block);

    void applyRealised(
        const Strategy& s,
        const CallContext& ctx,
        const PoolId& pool,
        const Asset& asset,
        Int128 amount
    );

    EngineConfig cfg;
    StateStore& store;
    telemetry::EventBus& bus;

    fhe::FheAdapter arith;
    TradeDeltaEngine deltas;
    TimingGate timing;
    ExecutionGuard guard;
    CoordinationRegistry coordination;
    GovernanceVoting governance;
    ComplianceReporter compliance;

    std::unique_ptr<telemetry::EventSinkStdout> sink;

    std::vector<telemetry::EngineEvent> pending;
    int depth = 0;
};

}
