#include "shroud/config/EngineConfig.hpp"
#include "shroud/config/ConfigLoader.hpp"

#include <limits>
#include <stdexcept>

namespace shroud {

namespace {

// Reads a block count or threshold. Negative or oversized values are
// rejected rather than wrapped into the unsigned range.
uint64_t unsignedSetting(
    const ConfigLoader& cfg,
    const std::string& section,
    const std::string& key,
    uint64_t defaultVal,
    uint64_t maxVal = std::numeric_limits<int64_t>::max()
) {
    int64_t v = cfg.getInt(section, key, static_cast<int64_t>(defaultVal));
    if (v < 0 || static_cast<uint64_t>(v) > maxVal) {
        throw std::invalid_argument(
            section + "." + key + " out of range: " + std::to_string(v));
    }
    return static_cast<uint64_t>(v);
}

}

const char* deviationModeToString(DeviationMode m) {
    switch (m) {
        case DeviationMode::SIGNED:   return "signed";
        case DeviationMode::ABSOLUTE: return "absolute";
        default:                      return "unknown";
    }
}

DeviationMode deviationModeFromString(const std::string& s) {
    if (s == "signed") return DeviationMode::SIGNED;
    if (s == "absolute") return DeviationMode::ABSOLUTE;
    throw std::invalid_argument("unknown deviation mode: " + s);
}

EngineConfig EngineConfig::fromLoader(const ConfigLoader& cfg) {
    EngineConfig c;

    c.engine_principal = cfg.get("engine", "principal", c.engine_principal);
    c.pool_manager = cfg.get("engine", "pool_manager", c.pool_manager);
    c.basis_points = cfg.getInt("engine", "basis_points", c.basis_points);
    c.deviation_mode = deviationModeFromString(
        cfg.get("engine", "deviation_mode",
                deviationModeToString(c.deviation_mode)));
    c.log_events = cfg.getBool("engine", "log_events", c.log_events);

    c.governance = cfg.get("governance", "principal", c.governance);
    c.vote_threshold = static_cast<uint32_t>(unsignedSetting(
        cfg, "governance", "vote_threshold", c.vote_threshold,
        std::numeric_limits<uint32_t>::max()));
    c.executors = cfg.getList("governance", "executors");

    c.cooldown_blocks = unsignedSetting(
        cfg, "timing", "cooldown_blocks", c.cooldown_blocks);
    c.stale_multiplier = unsignedSetting(
        cfg, "timing", "stale_multiplier", c.stale_multiplier);
    c.spread_divisor = unsignedSetting(
        cfg, "timing", "spread_divisor", c.spread_divisor);

    c.snapshot_path = cfg.get("persistence", "snapshot_path");
    c.audit_journal_path = cfg.get("persistence", "audit_journal_path");

    c.validate();
    return c;
}

void EngineConfig::validate() const {
    if (engine_principal.empty())
        throw std::invalid_argument("engine.principal must be set");
    if (pool_manager.empty())
        throw std::invalid_argument("engine.pool_manager must be set");
    if (governance.empty())
        throw std::invalid_argument("governance.principal must be set");
    if (basis_points <= 0)
        throw std::invalid_argument("engine.basis_points must be positive");
    if (vote_threshold == 0)
        throw std::invalid_argument("governance.vote_threshold must be >= 1");
    if (stale_multiplier == 0)
        throw std::invalid_argument("timing.stale_multiplier must be >= 1");
    if (spread_divisor == 0)
        throw std::invalid_argument("timing.spread_divisor must be >= 1");
}

}
