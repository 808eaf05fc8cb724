#pragma once

#include <string>
#include <vector>

#include "shroud/compliance/HashAuditJournal.hpp"
#include "shroud/fhe/FheAdapter.hpp"
#include "shroud/state/StateStore.hpp"

namespace shroud {

struct ComplianceLine {
    Asset asset;
    fhe::CtHandle position;
    fhe::CtHandle trade_delta;
};

// Snapshot of a strategy's encrypted book for its designated reporter.
// Carries handles only; the reporter decrypts them out-of-band under the
// ACL the engine granted.
struct ComplianceReport {
    StrategyId strategy{};
    Principal owner;
    Principal reporter;
    Principal requested_by;
    BlockNumber block = 0;
    uint64_t sequence = 0;

    bool active = false;
    BlockNumber last_execution_block = 0;

    std::vector<ComplianceLine> lines;
    std::vector<RealizedRecord> realized;

    // digest = SHA-256(hex(previous_digest) + body)
    Bytes32 previous_digest{};
    Bytes32 digest{};

    // Everything except the digest.
    std::string body() const;
    std::string toJson() const;
};

class ComplianceReporter {
public:
    ComplianceReporter(
        StateStore& store,
        fhe::FheAdapter& arith,
        HashAuditJournal* journal = nullptr
    );

    // Designates `reporter` and extends read access on every ciphertext
    // the strategy already holds.
    void enable(const StrategyId& id, const Principal& reporter);

    bool isEnabled(const StrategyId& id) const;

    // Requester must be the reporter or the owner (UNAUTHORIZED otherwise,
    // or when reporting is off). Realised records move into the report.
    ComplianceReport generate(
        const StrategyId& id,
        const Principal& requested_by,
        BlockNumber block
    );

    // Keeps an encrypted realised swap delta for the reporter. No-op when
    // reporting is off.
    void forwardRealized(
        const StrategyId& id,
        const PoolId& pool,
        const Asset& asset,
        const fhe::Sealed& amount,
        BlockNumber block
    );

    static Bytes32 chainDigest(
        const Bytes32& previous,
        const std::string& body
    );

private:
    void regrantExisting(const StrategyId& id);

    StateStore& store;
    fhe::FheAdapter& arith;
    HashAuditJournal* journal;
};

}
