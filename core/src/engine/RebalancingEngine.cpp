#include "shroud/engine/RebalancingEngine.hpp"
#include "shroud/core/Errors.hpp"
#include "shroud/engine/StoragePolicy.hpp"

#include <cstddef>
#include <iostream>

namespace shroud {

using telemetry::EventType;

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------

RebalancingEngine::Transaction::Transaction(
    RebalancingEngine& e
) : engine(e),
    checkpoint(e.store.checkpoint()),
    event_mark(e.pending.size()) {
    engine.depth++;
}

RebalancingEngine::Transaction::~Transaction() {
    rollback();
    engine.depth--;
}

void RebalancingEngine::Transaction::rollback() {
    if (done) return;
    done = true;

    engine.store.restore(*checkpoint);
    engine.pending.erase(
        engine.pending.begin() + static_cast<std::ptrdiff_t>(event_mark),
        engine.pending.end());
}

RebalancingEngine::RebalancingEngine(
    const EngineConfig& config,
    StateStore& s,
    fhe::IFheCoprocessor& coprocessor,
    telemetry::EventBus& b,
    HashAuditJournal* journal
) : cfg(config),
    store(s),
    bus(b),
    arith(coprocessor, config.engine_principal),
    deltas(s, arith, cfg),
    timing(s, arith, cfg),
    coordination(s),
    governance(s, cfg),
    compliance(s, arith, journal) {
    cfg.validate();

    for (const auto& p : cfg.executors) {
        store.setAuthorizedExecutor(p, true);
    }

    if (cfg.log_events) {
        sink = std::make_unique<telemetry::EventSinkStdout>(bus);
    }

    std::cout << "[SHROUD] engine ready principal=" << cfg.engine_principal
              << " mode=" << deviationModeToString(cfg.deviation_mode)
              << " executors=" << store.authorizedExecutors().size() << "\n";
}

void RebalancingEngine::transact(
    const char* op,
    const CallContext& ctx,
    const StrategyId& id,
    const std::function<void()>& fn
) {
    {
        Transaction tx(*this);
        try {
            fn();
        } catch (const fhe::FheError& e) {
            tx.rollback();
            reportFheFailure(op, ctx, id, e);
            throw RebalanceError(
                ErrorCode::FHE_OPERATION_FAILED,
                std::string(op) + ": " + e.what());
        }
        tx.commit();
    }

    if (depth == 0) {
        flushEvents();
    }
}

void RebalancingEngine::reportFheFailure(
    const char* op,
    const CallContext& ctx,
    const StrategyId& id,
    const fhe::FheError& e
) {
    std::cerr << "[SHROUD] coprocessor failure in " << op
              << " strategy=" << toHex(id)
              << " block=" << ctx.block_number
              << ": " << e.what() << "\n";

    telemetry::EngineEvent ev;
    ev.type = EventType::FHE_OPERATION_FAILED;
    ev.strategy = id;
    ev.block = ctx.block_number;
    ev.actor = ctx.sender;
    ev.detail = std::string(op) + ": " + e.what();
    bus.publish(ev);
}

void RebalancingEngine::emit(
    EventType type,
    const StrategyId& id,
    const CallContext& ctx,
    const std::string& detail
) {
    telemetry::EngineEvent ev;
    ev.type = type;
    ev.strategy = id;
    ev.block = ctx.block_number;
    ev.actor = ctx.sender;
    ev.detail = detail;
    pending.push_back(std::move(ev));
}

void RebalancingEngine::flushEvents() {
    while (!pending.empty()) {
        std::vector<telemetry::EngineEvent> batch;
        batch.swap(pending);
        for (const auto& ev : batch) {
            bus.publish(ev);
        }
    }
}

// ---------------------------------------------------------------------------
// Checks
// ---------------------------------------------------------------------------

Strategy RebalancingEngine::requireStrategy(const StrategyId& id) const {
    const Strategy* s = store.findStrategy(id);
    if (!s) {
        throw RebalanceError(ErrorCode::STRATEGY_NOT_FOUND, toHex(id));
    }
    return *s;
}

Strategy RebalancingEngine::requireOwner(
    const CallContext& ctx,
    const StrategyId& id
) const {
    Strategy s = requireStrategy(id);
    if (ctx.sender != s.owner) {
        throw RebalanceError(ErrorCode::NOT_OWNER, ctx.sender);
    }
    return s;
}

void RebalancingEngine::requirePoolManager(const CallContext& ctx) const {
    if (ctx.sender != cfg.pool_manager) {
        throw RebalanceError(ErrorCode::NOT_POOL_MANAGER, ctx.sender);
    }
}

fhe::Sealed RebalancingEngine::acceptInput(
    const fhe::CtHandle& h,
    const Principal& caller,
    const fhe::AclPolicy& policy
) {
    if (!arith.verifyInput(h, caller)) {
        throw RebalanceError(
            ErrorCode::INVALID_CIPHERTEXT,
            "handle " + std::to_string(h.id) + " not usable by " + caller);
    }
    return arith.share(arith.adopt(h), policy);
}

// ---------------------------------------------------------------------------
// Strategy lifecycle
// ---------------------------------------------------------------------------

void RebalancingEngine::createInternal(
    const CallContext& ctx,
    const StrategyId& id,
    uint64_t rebalance_frequency,
    const fhe::CtHandle& execution_window,
    const fhe::CtHandle& spread_blocks,
    const fhe::CtHandle& max_slippage,
    const Principal& owner,
    bool is_governance
) {
    if (isZero(id)) {
        throw RebalanceError(ErrorCode::INVALID_PARAMETER, "zero strategy id");
    }
    if (rebalance_frequency == 0) {
        throw RebalanceError(
            ErrorCode::INVALID_PARAMETER, "rebalance frequency must be >= 1");
    }
    if (store.hasStrategy(id)) {
        throw RebalanceError(ErrorCode::STRATEGY_ALREADY_EXISTS, toHex(id));
    }

    Strategy s;
    s.id = id;
    s.owner = owner;
    s.is_governance = is_governance;
    s.created_block = ctx.block_number;
    s.cycle_anchor_block = ctx.block_number;
    s.rebalance_frequency = rebalance_frequency;
    store.putStrategy(s);

    fhe::AclPolicy policy = storagePolicy(store, id);
    s.params.execution_window =
        acceptInput(execution_window, ctx.sender, policy);
    s.params.spread_blocks = acceptInput(spread_blocks, ctx.sender, policy);
    s.params.max_slippage = acceptInput(max_slippage, ctx.sender, policy);
    s.params.priority_fee = arith.share(arith.zero(), policy);
    store.putStrategy(s);

    emit(EventType::STRATEGY_CREATED, id, ctx,
         "frequency=" + std::to_string(rebalance_frequency) +
         (is_governance ? " governance" : ""));
}

void RebalancingEngine::createStrategy(
    const CallContext& ctx,
    const StrategyId& id,
    uint64_t rebalance_frequency,
    const fhe::CtHandle& execution_window,
    const fhe::CtHandle& spread_blocks,
    const fhe::CtHandle& max_slippage
) {
    transact("createStrategy", ctx, id, [&] {
        createInternal(ctx, id, rebalance_frequency, execution_window,
                       spread_blocks, max_slippage, ctx.sender, false);
    });
}

void RebalancingEngine::createGovernanceStrategy(
    const CallContext& ctx,
    const StrategyId& id,
    uint64_t rebalance_frequency,
    const fhe::CtHandle& execution_window,
    const fhe::CtHandle& spread_blocks,
    const fhe::CtHandle& max_slippage,
    const std::vector<Principal>& voters
) {
    transact("createGovernanceStrategy", ctx, id, [&] {
        governance.requireGovernance(ctx.sender);
        createInternal(ctx, id, rebalance_frequency, execution_window,
                       spread_blocks, max_slippage, ctx.sender, true);
        governance.registerVoters(id, voters);
    });
}

void RebalancingEngine::setTargetAllocation(
    const CallContext& ctx,
    const StrategyId& id,
    const Asset& asset,
    const fhe::CtHandle& target_percentage,
    const fhe::CtHandle& min_threshold,
    const fhe::CtHandle& max_threshold
) {
    transact("setTargetAllocation", ctx, id, [&] {
        requireOwner(ctx, id);
        if (asset.empty()) {
            throw RebalanceError(ErrorCode::INVALID_PARAMETER, "empty asset");
        }

        fhe::AclPolicy policy = storagePolicy(store, id);

        TargetAllocation alloc;
        alloc.asset = asset;
        alloc.target_percentage =
            acceptInput(target_percentage, ctx.sender, policy);
        alloc.min_threshold = acceptInput(min_threshold, ctx.sender, policy);
        alloc.max_threshold = acceptInput(max_threshold, ctx.sender, policy);
        alloc.active = true;
        store.upsertAllocation(id, alloc);

        emit(EventType::ALLOCATION_SET, id, ctx, "asset=" + asset);
    });
}

void RebalancingEngine::deactivateAllocation(
    const CallContext& ctx,
    const StrategyId& id,
    const Asset& asset
) {
    transact("deactivateAllocation", ctx, id, [&] {
        requireOwner(ctx, id);

        for (auto alloc : store.allocations(id)) {
            if (alloc.asset != asset) continue;
            alloc.active = false;
            store.upsertAllocation(id, alloc);
            emit(EventType::ALLOCATION_SET, id, ctx,
                 "asset=" + asset + " inactive");
            return;
        }
        throw RebalanceError(
            ErrorCode::INVALID_PARAMETER, "no allocation for " + asset);
    });
}

void RebalancingEngine::setEncryptedPosition(
    const CallContext& ctx,
    const StrategyId& id,
    const Asset& asset,
    const fhe::CtHandle& amount
) {
    transact("setEncryptedPosition", ctx, id, [&] {
        requireOwner(ctx, id);
        if (asset.empty()) {
            throw RebalanceError(ErrorCode::INVALID_PARAMETER, "empty asset");
        }

        store.setPosition(
            id, asset, acceptInput(amount, ctx.sender, storagePolicy(store, id)));

        emit(EventType::POSITION_SET, id, ctx, "asset=" + asset);
    });
}

void RebalancingEngine::deactivateStrategy(
    const CallContext& ctx,
    const StrategyId& id
) {
    transact("deactivateStrategy", ctx, id, [&] {
        Strategy s = requireStrategy(id);
        if (ctx.sender != s.owner && !governance.isGovernance(ctx.sender)) {
            throw RebalanceError(ErrorCode::NOT_OWNER, ctx.sender);
        }
        if (!s.active) return;

        s.active = false;
        store.putStrategy(s);
        emit(EventType::STRATEGY_DEACTIVATED, id, ctx);
    });
}

void RebalancingEngine::rearmStrategy(
    const CallContext& ctx,
    const StrategyId& id
) {
    transact("rearmStrategy", ctx, id, [&] {
        Strategy s = requireOwner(ctx, id);
        if (!s.active) {
            throw RebalanceError(ErrorCode::STRATEGY_INACTIVE, toHex(id));
        }

        s.cycle_anchor_block = ctx.block_number;
        s.execution_round = 0;
        s.round_block = 0;
        store.putStrategy(s);
        emit(EventType::STRATEGY_REARMED, id, ctx,
             "anchor=" + std::to_string(ctx.block_number));
    });
}

// ---------------------------------------------------------------------------
// Rebalancing
// ---------------------------------------------------------------------------

void RebalancingEngine::calculateRebalancing(
    const CallContext& ctx,
    const StrategyId& id
) {
    transact("calculateRebalancing", ctx, id, [&] {
        Strategy s = requireOwner(ctx, id);
        if (!s.active) {
            throw RebalanceError(ErrorCode::STRATEGY_INACTIVE, toHex(id));
        }

        ExecutionGuard::Lock lock(guard, id);
        size_t n = deltas.computeTradeDeltas(id);
        emit(EventType::REBALANCING_CALCULATED, id, ctx,
             "assets=" + std::to_string(n));
    });
}

void RebalancingEngine::finalizeCycle(Strategy& s, BlockNumber block) {
    s.last_execution_block = block;
    s.cycle_anchor_block = block;
    s.execution_round = 0;
    s.round_block = block;
}

void RebalancingEngine::performExecution(
    const Strategy& s,
    const CallContext& ctx,
    const PoolId* pool
) {
    size_t n = deltas.computeTradeDeltas(s.id);

    if (pool) {
        timing.checkCrossPoolCoordination(s, *pool, ctx);
    } else {
        timing.checkEncryptedTiming(s, ctx);
    }

    Strategy updated = requireStrategy(s.id);
    if (timing.shouldSpreadExecution(updated, ctx.block_number)) {
        updated.execution_round++;
        updated.round_block = ctx.block_number;
        store.putStrategy(updated);
        emit(EventType::EXECUTION_SPREAD, s.id, ctx,
             "round=" + std::to_string(updated.execution_round) +
             " assets=" + std::to_string(n));
        return;
    }

    finalizeCycle(updated, ctx.block_number);
    store.putStrategy(updated);
    emit(EventType::REBALANCING_EXECUTED, s.id, ctx,
         "assets=" + std::to_string(n));
}

void RebalancingEngine::executeRebalancing(
    const CallContext& ctx,
    const StrategyId& id
) {
    transact("executeRebalancing", ctx, id, [&] {
        Strategy s = requireStrategy(id);

        if (!store.isAuthorizedExecutor(ctx.sender) &&
            !governance.isGovernance(ctx.sender)) {
            throw RebalanceError(ErrorCode::NOT_AUTHORIZED_EXECUTOR, ctx.sender);
        }
        if (!s.active) {
            throw RebalanceError(ErrorCode::STRATEGY_INACTIVE, toHex(id));
        }

        guard.checkExecutor(
            store, ctx.sender, ctx.block_number, cfg.cooldown_blocks);

        if (!timing.isExecutionReady(s, ctx.block_number)) {
            throw RebalanceError(
                ErrorCode::NOT_READY_FOR_EXECUTION,
                "elapsed=" +
                std::to_string(timing.blocksSinceAnchor(s, ctx.block_number)) +
                " frequency=" + std::to_string(s.rebalance_frequency));
        }

        ExecutionGuard::Lock lock(guard, id);
        performExecution(s, ctx, nullptr);
        guard.recordExecution(store, ctx.sender, ctx.block_number);
    });
}

// ---------------------------------------------------------------------------
// Swap pipeline
// ---------------------------------------------------------------------------

void RebalancingEngine::onPreSwap(
    const CallContext& ctx,
    const PoolId& pool,
    const Asset& asset0,
    const Asset& asset1
) {
    requirePoolManager(ctx);

    transact("onPreSwap", ctx, StrategyId{}, [&] {
        for (const auto& id : coordination.strategiesForPool(pool)) {
            Strategy s = requireStrategy(id);
            if (!s.active || !timing.isExecutionReady(s, ctx.block_number)) {
                continue;
            }

            ExecutionGuard::Lock lock(guard, id);
            performExecution(s, ctx, &pool);
        }
    });

    std::cout << "[SHROUD] pre-swap pool=" << toHex(pool).substr(0, 18)
              << " " << asset0 << "/" << asset1
              << " block=" << ctx.block_number << "\n";
}

void RebalancingEngine::applyRealised(
    const Strategy& s,
    const CallContext& ctx,
    const PoolId& pool,
    const Asset& asset,
    Int128 amount
) {
    fhe::Sealed realised = arith.encryptConstant(amount);

    fhe::Sealed expected = store.tradeDelta(s.id, asset);
    if (expected.valid()) {
        timing.checkSlippageProtection(s, expected, realised, ctx.block_number);
    }

    fhe::Sealed updated = arith.add(store.position(s.id, asset), realised);
    store.setPosition(
        s.id, asset, arith.share(updated, storagePolicy(store, s.id)));

    compliance.forwardRealized(s.id, pool, asset, realised, ctx.block_number);
}

void RebalancingEngine::onPostSwap(
    const CallContext& ctx,
    const PoolId& pool,
    const Asset& asset0,
    const Asset& asset1,
    Int128 realised0,
    Int128 realised1
) {
    requirePoolManager(ctx);

    transact("onPostSwap", ctx, StrategyId{}, [&] {
        for (const auto& id : coordination.strategiesForPool(pool)) {
            Strategy s = requireStrategy(id);

            ExecutionGuard::Lock lock(guard, id);
            applyRealised(s, ctx, pool, asset0, realised0);
            applyRealised(s, ctx, pool, asset1, realised1);
            deltas.computeTradeDeltas(id);
            coordination.recordSync(id, pool, ctx.block_number);

            emit(EventType::POSITIONS_UPDATED, id, ctx,
                 asset0 + "/" + asset1);
            emit(EventType::COORDINATION_SYNCED, id, ctx,
                 "pool=" + toHex(pool).substr(0, 18));
        }
    });
}

// ---------------------------------------------------------------------------
// Coordination, compliance, governance
// ---------------------------------------------------------------------------

void RebalancingEngine::enableCrossPoolCoordination(
    const CallContext& ctx,
    const StrategyId& id,
    const std::vector<PoolId>& pools
) {
    transact("enableCrossPoolCoordination", ctx, id, [&] {
        requireOwner(ctx, id);
        coordination.enable(id, pools);

        CoordinationState state = store.coordination(id);
        emit(EventType::COORDINATION_ENABLED, id, ctx,
             "pools=" + std::to_string(state.pools.size()));
    });
}

void RebalancingEngine::enableComplianceReporting(
    const CallContext& ctx,
    const StrategyId& id,
    const Principal& reporter
) {
    transact("enableComplianceReporting", ctx, id, [&] {
        requireOwner(ctx, id);
        compliance.enable(id, reporter);
        emit(EventType::COMPLIANCE_ENABLED, id, ctx, "reporter=" + reporter);
    });
}

ComplianceReport RebalancingEngine::generateComplianceReport(
    const CallContext& ctx,
    const StrategyId& id
) {
    ComplianceReport report;
    transact("generateComplianceReport", ctx, id, [&] {
        report = compliance.generate(id, ctx.sender, ctx.block_number);
        emit(EventType::COMPLIANCE_REPORT, id, ctx,
             "seq=" + std::to_string(report.sequence) +
             " digest=" + toHex(report.digest).substr(0, 18));
    });
    return report;
}

void RebalancingEngine::voteOnStrategy(
    const CallContext& ctx,
    const StrategyId& id
) {
    transact("voteOnStrategy", ctx, id, [&] {
        Strategy s = requireStrategy(id);
        if (!s.is_governance) {
            throw RebalanceError(ErrorCode::NOT_GOVERNANCE_STRATEGY, toHex(id));
        }
        if (!s.active) {
            throw RebalanceError(ErrorCode::STRATEGY_INACTIVE, toHex(id));
        }

        bool fire = governance.castVote(id, ctx.sender);
        GovernanceState state = store.governance(id);
        emit(EventType::VOTE_CAST, id, ctx,
             "votes=" + std::to_string(state.votes) + "/" +
             std::to_string(governance.threshold()));

        if (!fire) return;

        ExecutionGuard::Lock lock(guard, id);
        size_t n = deltas.computeTradeDeltas(id);

        Strategy updated = requireStrategy(id);
        finalizeCycle(updated, ctx.block_number);
        store.putStrategy(updated);
        governance.markTriggered(id, ctx.block_number);

        emit(EventType::GOVERNANCE_TRIGGERED, id, ctx,
             "assets=" + std::to_string(n));
    });
}

void RebalancingEngine::addAuthorizedExecutor(
    const CallContext& ctx,
    const Principal& p
) {
    transact("addAuthorizedExecutor", ctx, StrategyId{}, [&] {
        governance.requireGovernance(ctx.sender);
        if (p.empty()) {
            throw RebalanceError(ErrorCode::INVALID_PARAMETER, "empty executor");
        }
        store.setAuthorizedExecutor(p, true);
        emit(EventType::EXECUTOR_UPDATED, StrategyId{}, ctx, "+" + p);
    });
}

void RebalancingEngine::removeAuthorizedExecutor(
    const CallContext& ctx,
    const Principal& p
) {
    transact("removeAuthorizedExecutor", ctx, StrategyId{}, [&] {
        governance.requireGovernance(ctx.sender);
        store.setAuthorizedExecutor(p, false);
        emit(EventType::EXECUTOR_UPDATED, StrategyId{}, ctx, "-" + p);
    });
}

// ---------------------------------------------------------------------------
// Read-only
// ---------------------------------------------------------------------------

Strategy RebalancingEngine::getStrategy(const StrategyId& id) const {
    const Strategy* s = store.findStrategy(id);
    if (!s) return Strategy{};
    return *s;
}

std::vector<TargetAllocation> RebalancingEngine::getTargetAllocations(
    const StrategyId& id
) const {
    return store.allocations(id);
}

fhe::Sealed RebalancingEngine::getEncryptedPosition(
    const StrategyId& id,
    const Asset& asset
) const {
    return store.position(id, asset);
}

fhe::Sealed RebalancingEngine::getTradeDelta(
    const StrategyId& id,
    const Asset& asset
) const {
    return store.tradeDelta(id, asset);
}

std::vector<StrategyId> RebalancingEngine::getPoolStrategies(
    const PoolId& pool
) const {
    return coordination.strategiesForPool(pool);
}

CoordinationState RebalancingEngine::getCoordinationStatus(
    const StrategyId& id
) const {
    return store.coordination(id);
}

ComplianceState RebalancingEngine::getComplianceStatus(
    const StrategyId& id
) const {
    return store.compliance(id);
}

GovernanceState RebalancingEngine::getGovernanceStatus(
    const StrategyId& id
) const {
    return store.governance(id);
}

bool RebalancingEngine::isExecutionReady(
    const StrategyId& id,
    BlockNumber block
) const {
    const Strategy* s = store.findStrategy(id);
    return s && timing.isExecutionReady(*s, block);
}

bool RebalancingEngine::shouldSpreadExecution(
    const StrategyId& id,
    BlockNumber block
) const {
    const Strategy* s = store.findStrategy(id);
    return s && s->active && timing.shouldSpreadExecution(*s, block);
}

fhe::Sealed RebalancingEngine::getTimingSignal(const StrategyId& id) const {
    return store.signals(id).timing;
}

fhe::Sealed RebalancingEngine::getSlippageSignal(const StrategyId& id) const {
    return store.signals(id).slippage;
}

bool RebalancingEngine::isAuthorizedExecutor(const Principal& p) const {
    return store.isAuthorizedExecutor(p);
}

}
