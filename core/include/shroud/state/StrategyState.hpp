#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "shroud/core/Types.hpp"
#include "shroud/fhe/Ciphertext.hpp"

namespace shroud {

// Encrypted execution parameters. Only the owner and the engine may ever
// decrypt or compute on them.
struct ExecutionParams {
    fhe::Sealed execution_window;
    fhe::Sealed spread_blocks;
    fhe::Sealed priority_fee;
    fhe::Sealed max_slippage;
};

struct Strategy {
    StrategyId id{};
    Principal owner;
    bool active = true;
    bool is_governance = false;

    BlockNumber created_block = 0;
    BlockNumber last_execution_block = 0;   // 0 until first final execution
    BlockNumber cycle_anchor_block = 0;     // readiness is measured from here
    uint32_t execution_round = 0;           // spread rounds in current cycle
    BlockNumber round_block = 0;            // block of the latest round

    uint64_t rebalance_frequency = 0;
    ExecutionParams params;
};

struct TargetAllocation {
    Asset asset;
    fhe::Sealed target_percentage;   // basis points 0..10000
    fhe::Sealed min_threshold;       // basis points of total value
    fhe::Sealed max_threshold;
    bool active = true;
};

struct CoordinationState {
    bool enabled = false;
    std::vector<PoolId> pools;

    PoolId last_synced_pool{};
    BlockNumber last_sync_block = 0;
    uint64_t sync_count = 0;

    bool contains(const PoolId& pool) const;
};

struct GovernanceState {
    std::vector<Principal> voters;
    std::unordered_set<Principal> voted;
    uint32_t votes = 0;
    bool triggered = false;
    BlockNumber triggered_block = 0;

    bool isVoter(const Principal& p) const;
};

struct RealizedRecord {
    PoolId pool{};
    Asset asset;
    fhe::Sealed amount;
    BlockNumber block = 0;
};

struct ComplianceState {
    bool enabled = false;
    Principal reporter;
    std::vector<RealizedRecord> realized;
    uint64_t report_seq = 0;
    Bytes32 last_digest{};
};

// Latest confidential telemetry. Never decrypted by the engine.
struct SignalState {
    fhe::Sealed timing;
    fhe::Sealed slippage;
    BlockNumber timing_block = 0;
    BlockNumber slippage_block = 0;
};

}
