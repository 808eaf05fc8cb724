#pragma once

#include "shroud/telemetry/EventBus.hpp"

namespace shroud::telemetry {

// Prints every engine event as one tagged line.
class EventSinkStdout {
public:
    explicit EventSinkStdout(EventBus& bus);

    static void write(const EngineEvent& ev);
};

} // namespace shroud::telemetry
