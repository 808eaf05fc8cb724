#include "shroud/state/InMemoryStateStore.hpp"
#include "shroud/core/Errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace shroud {

bool CoordinationState::contains(const PoolId& pool) const {
    return std::find(pools.begin(), pools.end(), pool) != pools.end();
}

bool GovernanceState::isVoter(const Principal& p) const {
    return std::find(voters.begin(), voters.end(), p) != voters.end();
}

// ---------------------------------------------------------------------------
// Undo log
// ---------------------------------------------------------------------------

InMemoryStateStore::UndoFrame::UndoFrame(
    InMemoryStateStore& s
) : store(s),
    order_size(s.order.size()) {
    store.frames.push_back(this);
}

InMemoryStateStore::UndoFrame::~UndoFrame() {
    auto& open = store.frames;
    open.erase(std::remove(open.begin(), open.end(), this), open.end());
}

void InMemoryStateStore::touchRecord(const StrategyId& id) {
    for (UndoFrame* f : frames) {
        if (f->records.count(id)) continue;
        const Record* r = find(id);
        f->records.emplace(id, r ? std::optional<Record>(*r) : std::nullopt);
    }
}

void InMemoryStateStore::touchPool(const PoolId& pool) {
    for (UndoFrame* f : frames) {
        if (f->pools.count(pool)) continue;
        auto it = pool_index.find(pool);
        f->pools.emplace(pool, it == pool_index.end()
            ? std::nullopt
            : std::optional<std::vector<StrategyId>>(it->second));
    }
}

void InMemoryStateStore::touchExecutor(const Principal& p) {
    for (UndoFrame* f : frames) {
        if (f->executors.count(p)) continue;
        auto it = executors.find(p);
        f->executors.emplace(p, it == executors.end()
            ? std::nullopt
            : std::optional<bool>(it->second));
    }
}

void InMemoryStateStore::touchExecutorBlock(const Principal& p) {
    for (UndoFrame* f : frames) {
        if (f->executor_blocks.count(p)) continue;
        auto it = executor_blocks.find(p);
        f->executor_blocks.emplace(p, it == executor_blocks.end()
            ? std::nullopt
            : std::optional<BlockNumber>(it->second));
    }
}

std::unique_ptr<StoreCheckpoint> InMemoryStateStore::checkpoint() {
    return std::make_unique<UndoFrame>(*this);
}

void InMemoryStateStore::restore(const StoreCheckpoint& cp) {
    const auto* frame = dynamic_cast<const UndoFrame*>(&cp);
    if (!frame || &frame->store != this) {
        throw std::invalid_argument("checkpoint from a different store");
    }

    for (const auto& kv : frame->records) {
        if (kv.second) {
            records[kv.first] = *kv.second;
        } else {
            records.erase(kv.first);
        }
    }
    for (const auto& kv : frame->pools) {
        if (kv.second) {
            pool_index[kv.first] = *kv.second;
        } else {
            pool_index.erase(kv.first);
        }
    }
    for (const auto& kv : frame->executors) {
        if (kv.second) {
            executors[kv.first] = *kv.second;
        } else {
            executors.erase(kv.first);
        }
    }
    for (const auto& kv : frame->executor_blocks) {
        if (kv.second) {
            executor_blocks[kv.first] = *kv.second;
        } else {
            executor_blocks.erase(kv.first);
        }
    }
    if (order.size() > frame->order_size) {
        order.resize(frame->order_size);
    }
}

// ---------------------------------------------------------------------------
// Strategies
// ---------------------------------------------------------------------------

const InMemoryStateStore::Record* InMemoryStateStore::find(
    const StrategyId& id
) const {
    auto it = records.find(id);
    if (it == records.end()) return nullptr;
    return &it->second;
}

InMemoryStateStore::Record& InMemoryStateStore::mutableRecord(
    const StrategyId& id
) {
    auto it = records.find(id);
    if (it == records.end()) {
        throw RebalanceError(ErrorCode::STRATEGY_NOT_FOUND, toHex(id));
    }
    touchRecord(id);
    return it->second;
}

bool InMemoryStateStore::hasStrategy(const StrategyId& id) const {
    return records.count(id) > 0;
}

const Strategy* InMemoryStateStore::findStrategy(const StrategyId& id) const {
    const Record* r = find(id);
    return r ? &r->strategy : nullptr;
}

void InMemoryStateStore::putStrategy(const Strategy& s) {
    touchRecord(s.id);
    auto it = records.find(s.id);
    if (it == records.end()) {
        order.push_back(s.id);
        it = records.emplace(s.id, Record{}).first;
    }
    it->second.strategy = s;
}

std::vector<StrategyId> InMemoryStateStore::strategyIds() const {
    return order;
}

std::vector<TargetAllocation> InMemoryStateStore::allocations(
    const StrategyId& id
) const {
    const Record* r = find(id);
    if (!r) return {};
    return r->allocations;
}

void InMemoryStateStore::upsertAllocation(
    const StrategyId& id,
    const TargetAllocation& alloc
) {
    auto& list = mutableRecord(id).allocations;
    for (auto& existing : list) {
        if (existing.asset == alloc.asset) {
            existing = alloc;
            return;
        }
    }
    list.push_back(alloc);
}

fhe::Sealed InMemoryStateStore::position(
    const StrategyId& id,
    const Asset& asset
) const {
    const Record* r = find(id);
    if (!r) return {};
    auto it = r->positions.find(asset);
    if (it == r->positions.end()) return {};
    return it->second;
}

void InMemoryStateStore::setPosition(
    const StrategyId& id,
    const Asset& asset,
    const fhe::Sealed& value
) {
    mutableRecord(id).positions[asset] = value;
}

std::vector<Asset> InMemoryStateStore::positionAssets(
    const StrategyId& id
) const {
    std::vector<Asset> out;
    const Record* r = find(id);
    if (!r) return out;
    for (const auto& kv : r->positions) out.push_back(kv.first);
    return out;
}

fhe::Sealed InMemoryStateStore::tradeDelta(
    const StrategyId& id,
    const Asset& asset
) const {
    const Record* r = find(id);
    if (!r) return {};
    auto it = r->trade_deltas.find(asset);
    if (it == r->trade_deltas.end()) return {};
    return it->second;
}

void InMemoryStateStore::setTradeDelta(
    const StrategyId& id,
    const Asset& asset,
    const fhe::Sealed& value
) {
    mutableRecord(id).trade_deltas[asset] = value;
}

std::vector<Asset> InMemoryStateStore::tradeDeltaAssets(
    const StrategyId& id
) const {
    std::vector<Asset> out;
    const Record* r = find(id);
    if (!r) return out;
    for (const auto& kv : r->trade_deltas) out.push_back(kv.first);
    return out;
}

// ---------------------------------------------------------------------------
// Coordination
// ---------------------------------------------------------------------------

CoordinationState InMemoryStateStore::coordination(
    const StrategyId& id
) const {
    const Record* r = find(id);
    if (!r) return {};
    return r->coordination;
}

void InMemoryStateStore::setCoordination(
    const StrategyId& id,
    const CoordinationState& state
) {
    mutableRecord(id).coordination = state;
}

std::vector<StrategyId> InMemoryStateStore::poolStrategies(
    const PoolId& pool
) const {
    auto it = pool_index.find(pool);
    if (it == pool_index.end()) return {};
    return it->second;
}

void InMemoryStateStore::appendPoolStrategy(
    const PoolId& pool,
    const StrategyId& id
) {
    if (!hasStrategy(id)) {
        throw RebalanceError(ErrorCode::STRATEGY_NOT_FOUND, toHex(id));
    }
    touchPool(pool);
    pool_index[pool].push_back(id);
}

std::vector<PoolId> InMemoryStateStore::indexedPools() const {
    std::vector<PoolId> out;
    out.reserve(pool_index.size());
    for (const auto& kv : pool_index) {
        out.push_back(kv.first);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Governance, compliance, signals
// ---------------------------------------------------------------------------

GovernanceState InMemoryStateStore::governance(const StrategyId& id) const {
    const Record* r = find(id);
    if (!r) return {};
    return r->governance;
}

void InMemoryStateStore::setGovernance(
    const StrategyId& id,
    const GovernanceState& state
) {
    mutableRecord(id).governance = state;
}

ComplianceState InMemoryStateStore::compliance(const StrategyId& id) const {
    const Record* r = find(id);
    if (!r) return {};
    return r->compliance;
}

void InMemoryStateStore::setCompliance(
    const StrategyId& id,
    const ComplianceState& state
) {
    mutableRecord(id).compliance = state;
}

SignalState InMemoryStateStore::signals(const StrategyId& id) const {
    const Record* r = find(id);
    if (!r) return {};
    return r->signals;
}

void InMemoryStateStore::setSignals(
    const StrategyId& id,
    const SignalState& state
) {
    mutableRecord(id).signals = state;
}

// ---------------------------------------------------------------------------
// Executors
// ---------------------------------------------------------------------------

bool InMemoryStateStore::isAuthorizedExecutor(const Principal& p) const {
    auto it = executors.find(p);
    return it != executors.end() && it->second;
}

void InMemoryStateStore::setAuthorizedExecutor(
    const Principal& p,
    bool allowed
) {
    touchExecutor(p);
    if (allowed) {
        executors[p] = true;
    } else {
        executors.erase(p);
    }
}

std::vector<Principal> InMemoryStateStore::authorizedExecutors() const {
    std::vector<Principal> out;
    for (const auto& kv : executors) {
        if (kv.second) out.push_back(kv.first);
    }
    return out;
}

BlockNumber InMemoryStateStore::executorLastBlock(const Principal& p) const {
    auto it = executor_blocks.find(p);
    if (it == executor_blocks.end()) return 0;
    return it->second;
}

void InMemoryStateStore::setExecutorLastBlock(
    const Principal& p,
    BlockNumber b
) {
    touchExecutorBlock(p);
    executor_blocks[p] = b;
}

std::vector<std::pair<Principal, BlockNumber>>
InMemoryStateStore::executorBlocks() const {
    return {executor_blocks.begin(), executor_blocks.end()};
}

}
