#include "SignalTrackers.hpp"

#include <cmath>

namespace livegate {

namespace {

// No previous event means the cooldown is satisfied.
bool cooldown_elapsed(const std::optional<TimestampMs>& last, TimestampMs now, int64_t cooldown_ms) {
    return !last || (now - *last) >= cooldown_ms;
}

} // namespace

// ============================================================================
// BlinkTracker
// ============================================================================

BlinkTracker::BlinkTracker(const LivenessConfig& config)
    : closed_threshold_(config.closed_threshold),
      open_threshold_(config.open_threshold),
      cooldown_ms_(config.blink_cooldown_ms) {}

std::optional<BlinkEvent> BlinkTracker::update(float ear_left, float ear_right, TimestampMs now) {
    float avg_ear = (ear_left + ear_right) / 2.0f;

    if (avg_ear >= open_threshold_) {
        state_.in_progress = false;
        return std::nullopt;
    }

    if (avg_ear < closed_threshold_ && !state_.in_progress &&
        cooldown_elapsed(state_.last_blink_at, now, cooldown_ms_)) {
        state_.count++;
        state_.in_progress = true;
        state_.last_blink_at = now;
        return BlinkEvent{state_.count, now, avg_ear};
    }

    // Dead zone, or still closed from the current blink
    return std::nullopt;
}

// ============================================================================
// HeadMovementTracker
// ============================================================================

HeadMovementTracker::HeadMovementTracker(const LivenessConfig& config)
    : threshold_(config.movement_threshold),
      cooldown_ms_(config.movement_cooldown_ms) {}

bool HeadMovementTracker::update(float nose_x, TimestampMs now) {
    if (!state_.previous_nose_x) {
        state_.previous_nose_x = nose_x;
        last_delta_ = 0.0f;
        return false;
    }

    last_delta_ = std::fabs(nose_x - *state_.previous_nose_x);
    state_.previous_nose_x = nose_x;

    if (last_delta_ > threshold_ &&
        cooldown_elapsed(state_.last_movement_at, now, cooldown_ms_)) {
        bool newly_latched = !state_.has_moved;
        state_.has_moved = true;
        state_.last_movement_at = now;
        return newly_latched;
    }
    return false;
}

// ============================================================================
// MouthActivityTracker
// ============================================================================

MouthActivityTracker::MouthActivityTracker(const LivenessConfig& config)
    : threshold_(config.mouth_threshold),
      cooldown_ms_(config.activity_cooldown_ms) {}

bool MouthActivityTracker::update(float mouth_distance, TimestampMs now) {
    if (mouth_distance > threshold_ &&
        cooldown_elapsed(state_.last_activity_at, now, cooldown_ms_)) {
        state_.count++;
        state_.last_activity_at = now;
        return true;
    }
    return false;
}

// ============================================================================
// FacePresenceTracker
// ============================================================================

void FacePresenceTracker::update(bool face_found) {
    stats_.frames_total++;
    if (face_found) {
        stats_.frames_with_face++;
        stats_.consecutive_misses = 0;
    } else {
        stats_.consecutive_misses++;
    }
}

float FacePresenceTracker::detection_rate() const {
    if (stats_.frames_total == 0) return 0.0f;
    return static_cast<float>(stats_.frames_with_face) / static_cast<float>(stats_.frames_total);
}

} // namespace livegate
