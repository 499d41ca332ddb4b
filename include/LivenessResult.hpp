#pragma once

#include "LandmarkSample.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace livegate {

/**
 * @brief Session lifecycle
 *
 * IDLE -> RUNNING -> one of the terminal states. ERROR marks a caller contract
 * violation and is distinct from FAILED, which is an evaluated negative verdict.
 */
enum class SessionState {
    IDLE,
    RUNNING,
    PASSED,
    FAILED,
    TIMED_OUT,     // Window elapsed without a single frame
    CANCELLED,
    ERROR
};

/// Hard pass conditions of the verdict.
enum class LivenessCondition {
    BLINK,
    HEAD_MOVEMENT,
    MOUTH_ACTIVITY,
    FACE_PRESENCE,
    FACE_LOST       // Miss ceiling crossed mid-session
};

enum class FacePosition { UNKNOWN, CENTER, LEFT, RIGHT, TOP, BOTTOM };
enum class FaceSize { UNKNOWN, GOOD, TOO_SMALL, TOO_LARGE };

/**
 * @brief Final verdict of one liveness session
 *
 * Produced exactly once by LivenessSession::finalize().
 */
struct LivenessResult {
    bool is_live = false;
    float confidence = 0.0f;
    uint32_t detected_blinks = 0;
    float face_detection_rate = 0.0f;
    bool head_moved = false;
    uint32_t mouth_activity_count = 0;
    std::string reason;

    std::vector<LivenessCondition> failed_conditions;
    FacePosition face_position = FacePosition::UNKNOWN;
    FaceSize face_size = FaceSize::UNKNOWN;
    SessionState terminal_state = SessionState::IDLE;
    uint32_t frames_total = 0;
    uint32_t frames_with_face = 0;
    TimestampMs duration_ms = 0;

    bool failed(LivenessCondition condition) const;
};

const char* to_string(SessionState state);
const char* to_string(LivenessCondition condition);
const char* to_string(FacePosition position);
const char* to_string(FaceSize size);

bool is_terminal(SessionState state);

nlohmann::json to_json(const LivenessResult& result);

} // namespace livegate
