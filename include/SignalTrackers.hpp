#pragma once

/**
 * @file SignalTrackers.hpp
 * @brief Per-frame liveness signal trackers
 *
 * Each tracker consumes one derived value per frame and keeps only the rolling
 * state needed for its cooldown and hysteresis rules. Timestamps passed to
 * update() must be non-decreasing.
 */

#include "LivenessConfig.hpp"
#include "LivenessEvents.hpp"

#include <cstdint>
#include <optional>

namespace livegate {

/**
 * @brief Blink counter with EAR hysteresis and a refractory cooldown
 *
 * A blink registers when the mean EAR drops below closed_threshold while no blink
 * is in progress and the cooldown since the previous blink has elapsed. The blink
 * stays in progress until the EAR climbs back to open_threshold.
 */
class BlinkTracker {
public:
    struct State {
        bool in_progress = false;
        uint32_t count = 0;
        std::optional<TimestampMs> last_blink_at;
    };

    explicit BlinkTracker(const LivenessConfig& config);

    std::optional<BlinkEvent> update(float ear_left, float ear_right, TimestampMs now);
    void reset() { state_ = State{}; }

    const State& state() const { return state_; }
    uint32_t count() const { return state_.count; }

private:
    float closed_threshold_;
    float open_threshold_;
    int64_t cooldown_ms_;
    State state_;
};

/**
 * @brief One-way latch on a deliberate head turn
 *
 * Compares each nose x to the previous frame's, so slow drift never accumulates
 * into a trigger.
 */
class HeadMovementTracker {
public:
    struct State {
        std::optional<float> previous_nose_x;
        bool has_moved = false;
        std::optional<TimestampMs> last_movement_at;
    };

    explicit HeadMovementTracker(const LivenessConfig& config);

    /**
     * @return true only on the call that first sets the movement latch
     */
    bool update(float nose_x, TimestampMs now);
    void reset() { state_ = State{}; last_delta_ = 0.0f; }

    const State& state() const { return state_; }
    bool has_moved() const { return state_.has_moved; }
    float last_delta() const { return last_delta_; }

private:
    float threshold_;
    int64_t cooldown_ms_;
    State state_;
    float last_delta_ = 0.0f;
};

class MouthActivityTracker {
public:
    struct State {
        uint32_t count = 0;
        std::optional<TimestampMs> last_activity_at;
    };

    explicit MouthActivityTracker(const LivenessConfig& config);

    /**
     * @return true if this frame counted as a new mouth activity
     */
    bool update(float mouth_distance, TimestampMs now);
    void reset() { state_ = State{}; }

    const State& state() const { return state_; }
    uint32_t count() const { return state_.count; }

private:
    float threshold_;
    int64_t cooldown_ms_;
    State state_;
};

/**
 * @brief Face detection rate and the consecutive-miss run length
 */
class FacePresenceTracker {
public:
    struct Stats {
        uint32_t frames_total = 0;
        uint32_t frames_with_face = 0;
        uint32_t consecutive_misses = 0;
    };

    void update(bool face_found);
    void reset() { stats_ = Stats{}; }

    /// frames_with_face / frames_total, 0 before the first frame.
    float detection_rate() const;

    const Stats& stats() const { return stats_; }
    uint32_t consecutive_misses() const { return stats_.consecutive_misses; }

private:
    Stats stats_;
};

} // namespace livegate
