#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "shroud/core/Types.hpp"

namespace shroud::telemetry {

enum class EventType : uint8_t {
    STRATEGY_CREATED = 1,
    STRATEGY_DEACTIVATED,
    STRATEGY_REARMED,
    ALLOCATION_SET,
    POSITION_SET,
    POSITIONS_UPDATED,
    REBALANCING_CALCULATED,
    REBALANCING_EXECUTED,
    EXECUTION_SPREAD,
    COORDINATION_ENABLED,
    COORDINATION_SYNCED,
    COMPLIANCE_ENABLED,
    COMPLIANCE_REPORT,
    VOTE_CAST,
    GOVERNANCE_TRIGGERED,
    EXECUTOR_UPDATED,
    FHE_OPERATION_FAILED
};

const char* eventTypeToString(EventType t);

struct EngineEvent {
    EventType type = EventType::STRATEGY_CREATED;
    StrategyId strategy{};
    BlockNumber block = 0;
    Principal actor;
    std::string detail;
};

using Subscriber = std::function<void(const EngineEvent&)>;

class EventBus {
public:
    void publish(const EngineEvent& ev) {
        std::vector<Subscriber> targets;
        {
            std::lock_guard<std::mutex> lock(mu);
            targets = subs;
            ++published;
        }
        // Subscribers run unlocked so they may call back into the engine.
        for (auto& fn : targets) {
            fn(ev);
        }
    }

    void subscribe(Subscriber fn) {
        std::lock_guard<std::mutex> lock(mu);
        subs.push_back(std::move(fn));
    }

    uint64_t publishedCount() const {
        std::lock_guard<std::mutex> lock(mu);
        return published;
    }

private:
    mutable std::mutex mu;
    std::vector<Subscriber> subs;
    uint64_t published = 0;
};

} // namespace shroud::telemetry
