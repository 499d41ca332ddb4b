#pragma once

#include "LivenessResult.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace livegate {

struct BlinkEvent {
    uint32_t count;     // Blink total including this one
    TimestampMs at;
    float average_ear;
};

struct MovementEvent {
    float delta;        // |nose_x - previous nose_x| that latched the movement
    TimestampMs at;
};

struct MouthActivityEvent {
    uint32_t count;
    TimestampMs at;
    float opening;
};

struct ProgressTick {
    TimestampMs elapsed_ms;
    float progress;     // [0,1] of the session window
};

struct SessionEndedEvent {
    SessionState state;
    std::string reason;
};

/**
 * @brief Discrete notification queued by the session for the caller to poll
 */
using LivenessEvent = std::variant<BlinkEvent, MovementEvent, MouthActivityEvent,
                                   ProgressTick, SessionEndedEvent>;

/** One-line human readable description, for logs */
std::string describe(const LivenessEvent& event);

} // namespace livegate
