#include "shroud/compliance/ComplianceReporter.hpp"
#include "shroud/core/Errors.hpp"
#include "shroud/core/Hash.hpp"
#include "shroud/engine/StoragePolicy.hpp"

#include <boost/json.hpp>

namespace json = boost::json;

namespace shroud {

namespace {

json::object reportObject(const ComplianceReport& r) {
    json::object root;
    root["strategy"] = toHex(r.strategy);
    root["owner"] = r.owner;
    root["reporter"] = r.reporter;
    root["requested_by"] = r.requested_by;
    root["block"] = r.block;
    root["sequence"] = r.sequence;
    root["active"] = r.active;
    root["last_execution_block"] = r.last_execution_block;

    json::array lines;
    for (const auto& l : r.lines) {
        json::object o;
        o["asset"] = l.asset;
        o["position"] = l.position.id;
        o["trade_delta"] = l.trade_delta.id;
        lines.push_back(o);
    }
    root["lines"] = lines;

    json::array realized;
    for (const auto& rec : r.realized) {
        json::object o;
        o["pool"] = toHex(rec.pool);
        o["asset"] = rec.asset;
        o["amount"] = rec.amount.handle.id;
        o["block"] = rec.block;
        realized.push_back(o);
    }
    root["realized"] = realized;

    root["previous_digest"] = toHex(r.previous_digest);
    return root;
}

}

std::string ComplianceReport::body() const {
    return json::serialize(reportObject(*this));
}

std::string ComplianceReport::toJson() const {
    json::object root = reportObject(*this);
    root["digest"] = toHex(digest);
    return json::serialize(root);
}

ComplianceReporter::ComplianceReporter(
    StateStore& s,
    fhe::FheAdapter& f,
    HashAuditJournal* j
) : store(s),
    arith(f),
    journal(j) {}

Bytes32 ComplianceReporter::chainDigest(
    const Bytes32& previous,
    const std::string& body
) {
    return sha256(toHex(previous) + body);
}

bool ComplianceReporter::isEnabled(const StrategyId& id) const {
    return store.compliance(id).enabled;
}

void ComplianceReporter::enable(
    const StrategyId& id,
    const Principal& reporter
) {
    if (reporter.empty()) {
        throw RebalanceError(ErrorCode::INVALID_PARAMETER, "empty reporter");
    }

    ComplianceState state = store.compliance(id);
    state.enabled = true;
    state.reporter = reporter;
    store.setCompliance(id, state);

    regrantExisting(id);
}

void ComplianceReporter::regrantExisting(const StrategyId& id) {
    fhe::AclPolicy policy = storagePolicy(store, id);

    for (const auto& asset : store.positionAssets(id)) {
        fhe::Sealed pos = store.position(id, asset);
        if (pos.valid()) {
            store.setPosition(id, asset, arith.share(pos, policy));
        }
    }
    for (const auto& asset : store.tradeDeltaAssets(id)) {
        fhe::Sealed delta = store.tradeDelta(id, asset);
        if (delta.valid()) {
            store.setTradeDelta(id, asset, arith.share(delta, policy));
        }
    }

    SignalState sig = store.signals(id);
    if (sig.timing.valid()) sig.timing = arith.share(sig.timing, policy);
    if (sig.slippage.valid()) sig.slippage = arith.share(sig.slippage, policy);
    store.setSignals(id, sig);
}

ComplianceReport ComplianceReporter::generate(
    const StrategyId& id,
    const Principal& requested_by,
    BlockNumber block
) {
    const Strategy* s = store.findStrategy(id);
    if (!s) {
        throw RebalanceError(ErrorCode::STRATEGY_NOT_FOUND, toHex(id));
    }

    ComplianceState state = store.compliance(id);
    if (!state.enabled) {
        throw RebalanceError(ErrorCode::UNAUTHORIZED, "reporting disabled");
    }
    if (requested_by != state.reporter && requested_by != s->owner) {
        throw RebalanceError(ErrorCode::UNAUTHORIZED, requested_by);
    }

    ComplianceReport r;
    r.strategy = id;
    r.owner = s->owner;
    r.reporter = state.reporter;
    r.requested_by = requested_by;
    r.block = block;
    r.sequence = state.report_seq + 1;
    r.active = s->active;
    r.last_execution_block = s->last_execution_block;

    for (const auto& alloc : store.allocations(id)) {
        ComplianceLine line;
        line.asset = alloc.asset;
        line.position = store.position(id, alloc.asset).handle;
        line.trade_delta = store.tradeDelta(id, alloc.asset).handle;
        r.lines.push_back(line);
    }
    // realised swaps are reported once, then leave the live state
    r.realized.swap(state.realized);

    r.previous_digest = state.last_digest;
    r.digest = chainDigest(r.previous_digest, r.body());

    state.report_seq = r.sequence;
    state.last_digest = r.digest;
    store.setCompliance(id, state);

    if (journal) {
        journal->append(r.toJson());
    }
    return r;
}

void ComplianceReporter::forwardRealized(
    const StrategyId& id,
    const PoolId& pool,
    const Asset& asset,
    const fhe::Sealed& amount,
    BlockNumber block
) {
    ComplianceState state = store.compliance(id);
    if (!state.enabled) return;

    RealizedRecord rec;
    rec.pool = pool;
    rec.asset = asset;
    rec.amount = arith.share(amount, storagePolicy(store, id));
    rec.block = block;

    state.realized.push_back(rec);
    store.setCompliance(id, state);
}

}
