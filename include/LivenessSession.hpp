#pragma once

/**
 * @file LivenessSession.hpp
 * @brief One bounded-duration liveness evaluation
 */

#include "LandmarkSample.hpp"
#include "LivenessConfig.hpp"
#include "LivenessErrors.hpp"
#include "LivenessEvents.hpp"
#include "LivenessResult.hpp"
#include "RingBuffer.hpp"
#include "SignalTrackers.hpp"

#include <opencv2/core.hpp>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace livegate {

/**
 * @brief Signals derived from one ingested frame, kept for diagnostics
 */
struct FrameResult {
    TimestampMs timestamp = 0;
    bool face_found = false;
    float average_ear = 0.0f;
    float mouth_opening = 0.0f;
    float nose_x = 0.0f;
    float nose_delta = 0.0f;
    bool blink = false;
    bool movement = false;
    bool mouth_activity = false;
    cv::Rect2f face_bounds;
};

/**
 * @brief Liveness decision engine for a single user attempt
 *
 * The caller drives the session: start(), then ingest() each landmark sample in
 * capture order and tick() on the sampling cadence until the session reaches a
 * terminal state, then finalize() once to read the verdict. Single-threaded: the
 * caller must serialize all calls for one session.
 *
 * Contract violations throw LivenessContractError; a negative verdict never does.
 */
class LivenessSession {
public:
    /**
     * @throws std::invalid_argument if the config fails validation
     */
    explicit LivenessSession(const LivenessConfig& config = LivenessConfig());

    /**
     * @brief Begin sampling with the configured duration and cadence
     */
    void start(TimestampMs now);

    /**
     * @brief Begin sampling (IDLE -> RUNNING)
     * @param now Start of the window on the landmark clock
     * @param duration_ms Window length
     * @param frame_interval_hint_ms Expected spacing of ingest()/tick() calls
     * @throws LivenessContractError if not IDLE
     * @throws std::invalid_argument for a non-positive duration, or an interval
     *         outside (0, duration_ms]
     */
    void start(TimestampMs now, TimestampMs duration_ms, TimestampMs frame_interval_hint_ms);

    /**
     * @brief Feed one landmark sample
     *
     * A frame without a face, or with degenerate eye geometry, counts as a miss.
     * Too many consecutive misses end the session as FAILED.
     *
     * @throws LivenessContractError if not RUNNING
     * @throws MalformedSampleError if the point count does not match the mesh;
     *         the session moves to ERROR
     */
    void ingest(const LandmarkSample& sample);

    /**
     * @brief Advance the session clock; concludes the session once the window elapsed
     *
     * No-op outside RUNNING so capture loops may keep ticking after an early end.
     */
    void tick(TimestampMs now);

    /**
     * @brief Abort a running session (RUNNING -> CANCELLED), discarding tracker state
     * @throws LivenessContractError if not RUNNING
     */
    void cancel();

    /**
     * @brief Read the verdict; allowed once, from PASSED, FAILED or TIMED_OUT
     * @throws LivenessContractError otherwise
     */
    LivenessResult finalize();

    /**
     * @brief Return to IDLE from any state, dropping all session data
     */
    void reset();

    // === State ===

    SessionState state() const { return state_; }
    bool is_running() const { return state_ == SessionState::RUNNING; }
    bool is_finished() const { return is_terminal(state_); }
    bool has_verdict() const { return verdict_.has_value() && !verdict_taken_; }

    /// Fraction of the window elapsed at the last tick, [0,1]. Stays below 1 when
    /// the session ended early, matching the last ProgressTick.
    float progress() const;

    TimestampMs started_at() const { return started_at_; }
    TimestampMs duration_ms() const { return duration_ms_; }
    TimestampMs frame_interval_hint_ms() const { return frame_interval_ms_; }

    // === Events ===

    std::optional<LivenessEvent> poll_event();
    std::vector<LivenessEvent> drain_events();
    size_t pending_events() const { return events_.size(); }
    uint64_t dropped_events() const { return dropped_events_; }

    // === Diagnostics ===

    const HistoryRing<FrameResult>& history() const { return history_; }
    const BlinkTracker& blink_tracker() const { return blink_; }
    const HeadMovementTracker& head_tracker() const { return head_; }
    const MouthActivityTracker& mouth_tracker() const { return mouth_; }
    const FacePresenceTracker& presence_tracker() const { return presence_; }
    const LivenessConfig& config() const { return config_; }

private:
    LivenessConfig config_;
    SessionState state_ = SessionState::IDLE;

    TimestampMs started_at_ = 0;
    TimestampMs duration_ms_ = 0;
    TimestampMs frame_interval_ms_ = 0;
    TimestampMs last_elapsed_ms_ = 0;

    BlinkTracker blink_;
    HeadMovementTracker head_;
    MouthActivityTracker mouth_;
    FacePresenceTracker presence_;

    HistoryRing<FrameResult> history_;
    std::deque<LivenessEvent> events_;
    uint64_t dropped_events_ = 0;

    std::optional<LivenessResult> verdict_;
    bool verdict_taken_ = false;

    void set_state(SessionState new_state, const std::string& reason);
    void require_state(SessionState expected, const char* operation) const;
    void reset_trackers();
    void push_event(LivenessEvent event);

    bool has_usable_geometry(const LandmarkSample& sample) const;
    void process_face_frame(const LandmarkSample& sample, FrameResult& frame);

    void conclude(bool face_lost);
    LivenessResult evaluate(bool face_lost) const;
    void classify_framing(FacePosition& position, FaceSize& size) const;
    std::string build_reason(const LivenessResult& result) const;
};

} // namespace livegate
