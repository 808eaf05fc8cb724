#include "shroud/compliance/HashAuditJournal.hpp"
#include "shroud/config/ConfigLoader.hpp"
#include "shroud/config/EngineConfig.hpp"
#include "shroud/core/Errors.hpp"
#include "shroud/core/Hash.hpp"
#include "shroud/engine/RebalancingEngine.hpp"
#include "shroud/fhe/MockCoprocessor.hpp"
#include "shroud/persistence/StatePersistence.hpp"
#include "shroud/state/InMemoryStateStore.hpp"
#include "shroud/telemetry/EventBus.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

using namespace shroud;

static const Principal OWNER = "0xa11ce00000000000000000000000000000000001";
static const Principal AUDITOR = "0xa0d1700000000000000000000000000000000001";
static const Asset TOKEN_A = "0x000000000000000000000000000000000000000a";
static const Asset TOKEN_B = "0x000000000000000000000000000000000000000b";

static void printDelta(
    const RebalancingEngine& engine,
    const fhe::MockCoprocessor& cop,
    const StrategyId& id,
    const Asset& asset
) {
    fhe::Sealed delta = engine.getTradeDelta(id, asset);
    std::cout << "[DEMO] delta " << asset.substr(0, 8) << ".. = "
              << int128ToString(cop.decrypt(delta.handle, OWNER)) << "\n";
}

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : "config.ini";

    ConfigLoader loader;
    if (!loader.load(config_path)) {
        std::cerr << "[DEMO] running with built-in defaults\n";
    }

    try {
        EngineConfig cfg = EngineConfig::fromLoader(loader);

        std::filesystem::create_directories("state");

        std::unique_ptr<HashAuditJournal> journal;
        if (!cfg.audit_journal_path.empty()) {
            journal = std::make_unique<HashAuditJournal>(cfg.audit_journal_path);
        }

        fhe::MockCoprocessor cop(cfg.engine_principal);
        InMemoryStateStore store;
        telemetry::EventBus bus;
        RebalancingEngine engine(cfg, store, cop, bus, journal.get());

        const Principal executor =
            cfg.executors.empty() ? cfg.governance : cfg.executors.front();

        StrategyId id = strategyIdFromLabel("demo-50-50");
        CallContext owner{OWNER, 100, 0x5eed};

        engine.createStrategy(
            owner, id, 10,
            cop.encrypt(20, OWNER),
            cop.encrypt(2, OWNER),
            cop.encrypt(50, OWNER));

        // 50% each, trigger above 1% and up to 10% of total value
        for (const auto& asset : {TOKEN_A, TOKEN_B}) {
            engine.setTargetAllocation(
                owner, id, asset,
                cop.encrypt(5000, OWNER),
                cop.encrypt(100, OWNER),
                cop.encrypt(1000, OWNER));
        }
        engine.setEncryptedPosition(owner, id, TOKEN_A, cop.encrypt(400000, OWNER));
        engine.setEncryptedPosition(owner, id, TOKEN_B, cop.encrypt(600000, OWNER));

        engine.calculateRebalancing(owner, id);
        printDelta(engine, cop, id, TOKEN_A);
        printDelta(engine, cop, id, TOKEN_B);

        PoolKey key;
        key.currency0 = TOKEN_A;
        key.currency1 = TOKEN_B;
        PoolId pool = poolIdOf(key);
        engine.enableCrossPoolCoordination(owner, id, {pool});
        engine.enableComplianceReporting(owner, id, AUDITOR);

        CallContext exec{executor, 113, 0xb10c};
        engine.executeRebalancing(exec, id);
        std::cout << "[DEMO] last execution block "
                  << engine.getStrategy(id).last_execution_block << "\n";

        CallContext hook{cfg.pool_manager, 114, 0xb10d};
        engine.onPostSwap(hook, pool, TOKEN_A, TOKEN_B, 100000, -100000);
        printDelta(engine, cop, id, TOKEN_A);
        printDelta(engine, cop, id, TOKEN_B);

        CallContext audit{AUDITOR, 115, 0};
        ComplianceReport report = engine.generateComplianceReport(audit, id);
        std::cout << "[DEMO] compliance report #" << report.sequence
                  << " digest " << toHex(report.digest) << "\n";
        std::cout << "[DEMO] auditor reads position A = "
                  << int128ToString(cop.decrypt(
                         engine.getEncryptedPosition(id, TOKEN_A).handle,
                         AUDITOR))
                  << "\n";

        if (!cfg.snapshot_path.empty()) {
            StatePersistence(cfg.snapshot_path).save(store);
        }

        std::cout << "[DEMO] " << engine.adapter().operations()
                  << " encrypted operations, " << bus.publishedCount()
                  << " events\n";
    } catch (const RebalanceError& e) {
        std::cerr << "[DEMO] rejected (" << errorCodeToString(e.code())
                  << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[DEMO] FATAL: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
