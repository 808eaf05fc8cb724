#include "shroud/telemetry/EventSinkStdout.hpp"

#include <iostream>

namespace shroud::telemetry {

const char* eventTypeToString(EventType t) {
    switch (t) {
        case EventType::STRATEGY_CREATED:       return "STRATEGY_CREATED";
        case EventType::STRATEGY_DEACTIVATED:   return "STRATEGY_DEACTIVATED";
        case EventType::STRATEGY_REARMED:       return "STRATEGY_REARMED";
        case EventType::ALLOCATION_SET:         return "ALLOCATION_SET";
        case EventType::POSITION_SET:           return "POSITION_SET";
        case EventType::POSITIONS_UPDATED:      return "POSITIONS_UPDATED";
        case EventType::REBALANCING_CALCULATED: return "REBALANCING_CALCULATED";
        case EventType::REBALANCING_EXECUTED:   return "REBALANCING_EXECUTED";
        case EventType::EXECUTION_SPREAD:       return "EXECUTION_SPREAD";
        case EventType::COORDINATION_ENABLED:   return "COORDINATION_ENABLED";
        case EventType::COORDINATION_SYNCED:    return "COORDINATION_SYNCED";
        case EventType::COMPLIANCE_ENABLED:     return "COMPLIANCE_ENABLED";
        case EventType::COMPLIANCE_REPORT:      return "COMPLIANCE_REPORT";
        case EventType::VOTE_CAST:              return "VOTE_CAST";
        case EventType::GOVERNANCE_TRIGGERED:   return "GOVERNANCE_TRIGGERED";
        case EventType::EXECUTOR_UPDATED:       return "EXECUTOR_UPDATED";
        case EventType::FHE_OPERATION_FAILED:   return "FHE_OPERATION_FAILED";
        default:                                return "UNKNOWN";
    }
}

EventSinkStdout::EventSinkStdout(EventBus& bus) {
    bus.subscribe([](const EngineEvent& ev) { write(ev); });
}

void EventSinkStdout::write(const EngineEvent& ev) {
    std::ostream& out =
        ev.type == EventType::FHE_OPERATION_FAILED ? std::cerr : std::cout;

    out << "[SHROUD] " << eventTypeToString(ev.type)
        << " block=" << ev.block
        << " strategy=" << toHex(ev.strategy).substr(0, 18);
    if (!ev.actor.empty()) {
        out << " actor=" << ev.actor;
    }
    if (!ev.detail.empty()) {
        out << " " << ev.detail;
    }
    out << "\n";
}

} // namespace shroud::telemetry
