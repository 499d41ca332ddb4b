#include "LivenessGuidance.hpp"

namespace livegate {
namespace guidance {

std::vector<std::string> get_instructions() {
    return {
        "Position your face in the center of the frame",
        "Ensure good lighting on your face",
        "Look directly at the camera",
        "Blink naturally during the check",
        "Turn your head slightly to one side",
        "Open and close your mouth twice",
        "Remove glasses or hats if possible",
    };
}

std::vector<std::string> get_tips() {
    return {
        "Find a well-lit environment",
        "Hold your device at arm's length",
        "Avoid backlighting or shadows",
        "Keep your face clearly visible",
        "Blink naturally, don't force it",
    };
}

std::string retry_hint(LivenessCondition condition) {
    switch (condition) {
        case LivenessCondition::BLINK:
            return "blink naturally";
        case LivenessCondition::HEAD_MOVEMENT:
            return "move your head slightly";
        case LivenessCondition::MOUTH_ACTIVITY:
            return "open your mouth";
        case LivenessCondition::FACE_PRESENCE:
            return "keep your face inside the frame";
        case LivenessCondition::FACE_LOST:
            return "stay in front of the camera";
    }
    return "try again";
}

std::string framing_hint(FacePosition position, FaceSize size) {
    if (size == FaceSize::TOO_SMALL) return "move closer to the camera";
    if (size == FaceSize::TOO_LARGE) return "move further from the camera";

    switch (position) {
        case FacePosition::LEFT:
        case FacePosition::RIGHT:
        case FacePosition::TOP:
        case FacePosition::BOTTOM:
            return std::string("your face is too far ") + to_string(position) +
                   ", center it in the frame";
        default:
            return "";
    }
}

} // namespace guidance
} // namespace livegate
