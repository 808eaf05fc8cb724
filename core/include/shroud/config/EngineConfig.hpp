#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "shroud/core/Types.hpp"

namespace shroud {

class ConfigLoader;

// How the deviation is measured before the threshold comparison.
enum class DeviationMode : uint8_t {
    SIGNED,     // target - current; over-allocation never triggers
    ABSOLUTE    // |target - current|
};

const char* deviationModeToString(DeviationMode m);
DeviationMode deviationModeFromString(const std::string& s);

struct EngineConfig {
    // [engine]
    Principal engine_principal = "0x5e1f000000000000000000000000000000000001";
    Principal pool_manager = "0x5e1f0000000000000000000000000000000000a0";
    int64_t basis_points = 10000;
    DeviationMode deviation_mode = DeviationMode::ABSOLUTE;
    bool log_events = true;

    // [governance]
    Principal governance = "0x5e1f0000000000000000000000000000000000ff";
    uint32_t vote_threshold = 3;
    std::vector<Principal> executors;

    // [timing]
    uint64_t cooldown_blocks = 0;
    uint64_t stale_multiplier = 10;
    uint64_t spread_divisor = 5;

    // [persistence]
    std::string snapshot_path;
    std::string audit_journal_path;

    static EngineConfig fromLoader(const ConfigLoader& cfg);

    // Throws std::invalid_argument on values the engine cannot run with.
    void validate() const;
};

}
