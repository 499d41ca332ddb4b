#include "LivenessResult.hpp"

#include <algorithm>

namespace livegate {

bool LivenessResult::failed(LivenessCondition condition) const {
    return std::find(failed_conditions.begin(), failed_conditions.end(), condition) !=
           failed_conditions.end();
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::RUNNING: return "RUNNING";
        case SessionState::PASSED: return "PASSED";
        case SessionState::FAILED: return "FAILED";
        case SessionState::TIMED_OUT: return "TIMED_OUT";
        case SessionState::CANCELLED: return "CANCELLED";
        case SessionState::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

const char* to_string(LivenessCondition condition) {
    switch (condition) {
        case LivenessCondition::BLINK: return "blink";
        case LivenessCondition::HEAD_MOVEMENT: return "head_movement";
        case LivenessCondition::MOUTH_ACTIVITY: return "mouth_activity";
        case LivenessCondition::FACE_PRESENCE: return "face_presence";
        case LivenessCondition::FACE_LOST: return "face_lost";
    }
    return "unknown";
}

const char* to_string(FacePosition position) {
    switch (position) {
        case FacePosition::UNKNOWN: return "unknown";
        case FacePosition::CENTER: return "center";
        case FacePosition::LEFT: return "left";
        case FacePosition::RIGHT: return "right";
        case FacePosition::TOP: return "top";
        case FacePosition::BOTTOM: return "bottom";
    }
    return "unknown";
}

const char* to_string(FaceSize size) {
    switch (size) {
        case FaceSize::UNKNOWN: return "unknown";
        case FaceSize::GOOD: return "good";
        case FaceSize::TOO_SMALL: return "too-small";
        case FaceSize::TOO_LARGE: return "too-large";
    }
    return "unknown";
}

bool is_terminal(SessionState state) {
    return state != SessionState::IDLE && state != SessionState::RUNNING;
}

nlohmann::json to_json(const LivenessResult& result) {
    nlohmann::json failed = nlohmann::json::array();
    for (auto c : result.failed_conditions) {
        failed.push_back(to_string(c));
    }
    return {
        {"is_live", result.is_live},
        {"confidence", result.confidence},
        {"detected_blinks", result.detected_blinks},
        {"face_detection_rate", result.face_detection_rate},
        {"head_moved", result.head_moved},
        {"mouth_activity_count", result.mouth_activity_count},
        {"reason", result.reason},
        {"failed_conditions", failed},
        {"face_position", to_string(result.face_position)},
        {"face_size", to_string(result.face_size)},
        {"state", to_string(result.terminal_state)},
        {"frames_total", result.frames_total},
        {"frames_with_face", result.frames_with_face},
        {"duration_ms", result.duration_ms}
    };
}

} // namespace livegate
