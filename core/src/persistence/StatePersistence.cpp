#include "shroud/persistence/StatePersistence.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <boost/json.hpp>

namespace json = boost::json;

namespace shroud {

namespace {

constexpr int64_t kSnapshotVersion = 1;

uint64_t u64(const json::value& v) {
    return json::value_to<uint64_t>(v);
}

std::string str(const json::value& v) {
    return std::string(v.as_string());
}

json::object sealedToJson(const fhe::Sealed& s) {
    json::object o;
    o["id"] = s.handle.id;
    o["type"] = static_cast<int64_t>(s.handle.type);
    o["self"] = s.acl.self;

    json::array readers;
    for (const auto& r : s.acl.readers) {
        readers.push_back(json::value(r));
    }
    o["readers"] = readers;
    return o;
}

fhe::Sealed sealedFromJson(const json::value& v) {
    const json::object& o = v.as_object();
    fhe::Sealed s;
    s.handle.id = u64(o.at("id"));
    s.handle.type = static_cast<fhe::FheType>(o.at("type").as_int64());
    s.acl.self = o.at("self").as_bool();
    for (const auto& r : o.at("readers").as_array()) {
        s.acl.readers.push_back(str(r));
    }
    return s;
}

json::object sealedMap(
    const StateStore& store,
    const StrategyId& id,
    const std::vector<Asset>& assets,
    fhe::Sealed (StateStore::*read)(const StrategyId&, const Asset&) const
) {
    json::object out;
    for (const auto& a : assets) {
        out[a] = sealedToJson((store.*read)(id, a));
    }
    return out;
}

json::object strategyToJson(const StateStore& store, const Strategy& s) {
    json::object o;
    o["id"] = toHex(s.id);
    o["owner"] = s.owner;
    o["active"] = s.active;
    o["is_governance"] = s.is_governance;
    o["created_block"] = s.created_block;
    o["last_execution_block"] = s.last_execution_block;
    o["cycle_anchor_block"] = s.cycle_anchor_block;
    o["execution_round"] = s.execution_round;
    o["round_block"] = s.round_block;
    o["rebalance_frequency"] = s.rebalance_frequency;

    json::object params;
    params["execution_window"] = sealedToJson(s.params.execution_window);
    params["spread_blocks"] = sealedToJson(s.params.spread_blocks);
    params["priority_fee"] = sealedToJson(s.params.priority_fee);
    params["max_slippage"] = sealedToJson(s.params.max_slippage);
    o["params"] = params;

    json::array allocs;
    for (const auto& a : store.allocations(s.id)) {
        json::object ao;
        ao["asset"] = a.asset;
        ao["target_percentage"] = sealedToJson(a.target_percentage);
        ao["min_threshold"] = sealedToJson(a.min_threshold);
        ao["max_threshold"] = sealedToJson(a.max_threshold);
        ao["active"] = a.active;
        allocs.push_back(ao);
    }
    o["allocations"] = allocs;

    o["positions"] = sealedMap(
        store, s.id, store.positionAssets(s.id), &StateStore::position);
    o["trade_deltas"] = sealedMap(
        store, s.id, store.tradeDeltaAssets(s.id), &StateStore::tradeDelta);

    CoordinationState coord = store.coordination(s.id);
    json::object co;
    co["enabled"] = coord.enabled;
    json::array pools;
    for (const auto& p : coord.pools) {
        pools.push_back(json::value(toHex(p)));
    }
    co["pools"] = pools;
    co["last_synced_pool"] = toHex(coord.last_synced_pool);
    co["last_sync_block"] = coord.last_sync_block;
    co["sync_count"] = coord.sync_count;
    o["coordination"] = co;

    GovernanceState gov = store.governance(s.id);
    json::object go;
    json::array voters;
    for (const auto& v : gov.voters) {
        voters.push_back(json::value(v));
    }
    go["voters"] = voters;
    json::array voted;
    for (const auto& v : gov.voted) {
        voted.push_back(json::value(v));
    }
    go["voted"] = voted;
    go["votes"] = gov.votes;
    go["triggered"] = gov.triggered;
    go["triggered_block"] = gov.triggered_block;
    o["governance"] = go;

    ComplianceState comp = store.compliance(s.id);
    json::object cp;
    cp["enabled"] = comp.enabled;
    cp["reporter"] = comp.reporter;
    cp["report_seq"] = comp.report_seq;
    cp["last_digest"] = toHex(comp.last_digest);
    json::array realized;
    for (const auto& rec : comp.realized) {
        json::object ro;
        ro["pool"] = toHex(rec.pool);
        ro["asset"] = rec.asset;
        ro["amount"] = sealedToJson(rec.amount);
        ro["block"] = rec.block;
        realized.push_back(ro);
    }
    cp["realized"] = realized;
    o["compliance"] = cp;

    SignalState sig = store.signals(s.id);
    json::object so;
    so["timing"] = sealedToJson(sig.timing);
    so["slippage"] = sealedToJson(sig.slippage);
    so["timing_block"] = sig.timing_block;
    so["slippage_block"] = sig.slippage_block;
    o["signals"] = so;

    return o;
}

void strategyFromJson(const json::object& o, StateStore& store) {
    Strategy s;
    s.id = fromHex(str(o.at("id")));
    s.owner = str(o.at("owner"));
    s.active = o.at("active").as_bool();
    s.is_governance = o.at("is_governance").as_bool();
    s.created_block = u64(o.at("created_block"));
    s.last_execution_block = u64(o.at("last_execution_block"));
    s.cycle_anchor_block = u64(o.at("cycle_anchor_block"));
    s.execution_round = static_cast<uint32_t>(u64(o.at("execution_round")));
    s.round_block = u64(o.at("round_block"));
    s.rebalance_frequency = u64(o.at("rebalance_frequency"));

    const json::object& params = o.at("params").as_object();
    s.params.execution_window = sealedFromJson(params.at("execution_window"));
    s.params.spread_blocks = sealedFromJson(params.at("spread_blocks"));
    s.params.priority_fee = sealedFromJson(params.at("priority_fee"));
    s.params.max_slippage = sealedFromJson(params.at("max_slippage"));

    store.putStrategy(s);

    for (const auto& v : o.at("allocations").as_array()) {
        const json::object& ao = v.as_object();
        TargetAllocation a;
        a.asset = str(ao.at("asset"));
        a.target_percentage = sealedFromJson(ao.at("target_percentage"));
        a.min_threshold = sealedFromJson(ao.at("min_threshold"));
        a.max_threshold = sealedFromJson(ao.at("max_threshold"));
        a.active = ao.at("active").as_bool();
        store.upsertAllocation(s.id, a);
    }

    for (const auto& kv : o.at("positions").as_object()) {
        store.setPosition(s.id, std::string(kv.key()), sealedFromJson(kv.value()));
    }
    for (const auto& kv : o.at("trade_deltas").as_object()) {
        store.setTradeDelta(
            s.id, std::string(kv.key()), sealedFromJson(kv.value()));
    }

    const json::object& co = o.at("coordination").as_object();
    CoordinationState coord;
    coord.enabled = co.at("enabled").as_bool();
    for (const auto& p : co.at("pools").as_array()) {
        coord.pools.push_back(fromHex(str(p)));
    }
    coord.last_synced_pool = fromHex(str(co.at("last_synced_pool")));
    coord.last_sync_block = u64(co.at("last_sync_block"));
    coord.sync_count = u64(co.at("sync_count"));
    store.setCoordination(s.id, coord);

    const json::object& go = o.at("governance").as_object();
    GovernanceState gov;
    for (const auto& v : go.at("voters").as_array()) {
        gov.voters.push_back(str(v));
    }
    for (const auto& v : go.at("voted").as_array()) {
        gov.voted.insert(str(v));
    }
    gov.votes = static_cast<uint32_t>(u64(go.at("votes")));
    gov.triggered = go.at("triggered").as_bool();
    gov.triggered_block = u64(go.at("triggered_block"));
    store.setGovernance(s.id, gov);

    const json::object& cp = o.at("compliance").as_object();
    ComplianceState comp;
    comp.enabled = cp.at("enabled").as_bool();
    comp.reporter = str(cp.at("reporter"));
    comp.report_seq = u64(cp.at("report_seq"));
    comp.last_digest = fromHex(str(cp.at("last_digest")));
    for (const auto& v : cp.at("realized").as_array()) {
        const json::object& ro = v.as_object();
        RealizedRecord rec;
        rec.pool = fromHex(str(ro.at("pool")));
        rec.asset = str(ro.at("asset"));
        rec.amount = sealedFromJson(ro.at("amount"));
        rec.block = u64(ro.at("block"));
        comp.realized.push_back(rec);
    }
    store.setCompliance(s.id, comp);

    const json::object& so = o.at("signals").as_object();
    SignalState sig;
    sig.timing = sealedFromJson(so.at("timing"));
    sig.slippage = sealedFromJson(so.at("slippage"));
    sig.timing_block = u64(so.at("timing_block"));
    sig.slippage_block = u64(so.at("slippage_block"));
    store.setSignals(s.id, sig);
}

}

StatePersistence::StatePersistence(
    const std::string& path
) : file(path) {}

std::string StatePersistence::toJson(const StateStore& store) const {
    json::object root;
    root["version"] = kSnapshotVersion;

    json::array strategies;
    for (const auto& id : store.strategyIds()) {
        const Strategy* s = store.findStrategy(id);
        if (!s) continue;
        strategies.push_back(strategyToJson(store, *s));
    }
    root["strategies"] = strategies;

    json::object pool_index;
    for (const auto& pool : store.indexedPools()) {
        json::array ids;
        for (const auto& id : store.poolStrategies(pool)) {
            ids.push_back(json::value(toHex(id)));
        }
        pool_index[toHex(pool)] = ids;
    }
    root["pool_index"] = pool_index;

    json::array executors;
    for (const auto& p : store.authorizedExecutors()) {
        executors.push_back(json::value(p));
    }
    root["executors"] = executors;

    json::object executor_blocks;
    for (const auto& kv : store.executorBlocks()) {
        executor_blocks[kv.first] = kv.second;
    }
    root["executor_blocks"] = executor_blocks;

    return json::serialize(root);
}

void StatePersistence::fromJson(
    const std::string& data,
    StateStore& store
) const {
    if (!store.strategyIds().empty()) {
        throw std::runtime_error("snapshot must be loaded into an empty store");
    }

    // A snapshot loads completely or not at all.
    auto checkpoint = store.checkpoint();
    try {
        json::object root = json::parse(data).as_object();

        if (root.at("version").as_int64() != kSnapshotVersion) {
            throw std::runtime_error("unsupported snapshot version");
        }

        for (const auto& v : root.at("strategies").as_array()) {
            strategyFromJson(v.as_object(), store);
        }

        for (const auto& kv : root.at("pool_index").as_object()) {
            PoolId pool = fromHex(std::string(kv.key()));
            for (const auto& id : kv.value().as_array()) {
                store.appendPoolStrategy(pool, fromHex(str(id)));
            }
        }

        for (const auto& p : root.at("executors").as_array()) {
            store.setAuthorizedExecutor(str(p), true);
        }

        for (const auto& kv : root.at("executor_blocks").as_object()) {
            store.setExecutorLastBlock(std::string(kv.key()), u64(kv.value()));
        }
    } catch (const std::exception& e) {
        store.restore(*checkpoint);
        std::cerr << "[PERSIST] snapshot rejected: " << e.what() << "\n";
        throw std::runtime_error(std::string("cannot load snapshot: ") + e.what());
    }
}

void StatePersistence::save(const StateStore& store) const {
    std::ofstream out(file);
    if (!out.is_open()) {
        throw std::runtime_error("cannot write snapshot " + file);
    }
    out << toJson(store);
    std::cout << "[PERSIST] snapshot written to " << file << "\n";
}

bool StatePersistence::load(StateStore& store) const {
    std::ifstream in(file);
    if (!in.is_open()) return false;

    std::string data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );

    fromJson(data, store);
    std::cout << "[PERSIST] restored " << store.strategyIds().size()
              << " strategies from " << file << "\n";
    return true;
}

}
