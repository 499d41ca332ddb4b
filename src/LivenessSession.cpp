/**
 * @file LivenessSession.cpp
 * @brief Liveness session state machine and verdict
 */

#include "LivenessSession.hpp"
#include "Geometry.hpp"
#include "LivenessGuidance.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace livegate {

namespace {

constexpr float MIN_EYE_WIDTH = 1e-6f;

LivenessConfig validated(const LivenessConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid liveness config: " + error);
    }
    return config;
}

// Share of a count-based requirement met, capped at 1. A zero requirement is always met.
float factor_confidence(float value, float required) {
    if (required <= 0.0f) return 1.0f;
    return std::min(value / required, 1.0f);
}

int percent(float rate) {
    return static_cast<int>(std::lround(rate * 100.0f));
}

} // namespace

LivenessSession::LivenessSession(const LivenessConfig& config)
    : config_(validated(config)),
      blink_(config_),
      head_(config_),
      mouth_(config_),
      history_(config_.history_capacity) {}

// ============================================================================
// Lifecycle
// ============================================================================

void LivenessSession::start(TimestampMs now) {
    start(now, config_.session_duration_ms, config_.frame_interval_ms);
}

void LivenessSession::start(TimestampMs now, TimestampMs duration_ms, TimestampMs frame_interval_hint_ms) {
    require_state(SessionState::IDLE, "start");
    if (duration_ms <= 0) {
        throw std::invalid_argument("Session duration must be > 0");
    }
    if (frame_interval_hint_ms <= 0 || frame_interval_hint_ms > duration_ms) {
        throw std::invalid_argument("Frame interval must be in (0, duration]");
    }

    reset_trackers();
    history_.clear();
    verdict_.reset();
    verdict_taken_ = false;

    started_at_ = now;
    duration_ms_ = duration_ms;
    frame_interval_ms_ = frame_interval_hint_ms;
    last_elapsed_ms_ = 0;

    std::ostringstream reason;
    reason << duration_ms << "ms window, ~" << frame_interval_hint_ms << "ms cadence";
    set_state(SessionState::RUNNING, reason.str());
}

void LivenessSession::ingest(const LandmarkSample& sample) {
    require_state(SessionState::RUNNING, "ingest");

    if (sample.face_found && !config_.accepts_landmark_count(sample.size())) {
        MalformedSampleError error(sample.size(), config_.landmark_count);
        set_state(SessionState::ERROR, error.what());
        push_event(SessionEndedEvent{SessionState::ERROR, error.what()});
        throw error;
    }

    FrameResult frame;
    frame.timestamp = sample.timestamp;

    if (sample.face_found && has_usable_geometry(sample)) {
        presence_.update(true);
        process_face_frame(sample, frame);
        history_.push(frame);
        return;
    }

    // Transient miss: no face, or a landmark set too degenerate to measure
    presence_.update(false);
    history_.push(frame);

    if (presence_.consecutive_misses() > config_.max_consecutive_misses) {
        conclude(true);
    }
}

void LivenessSession::tick(TimestampMs now) {
    if (state_ != SessionState::RUNNING) return;

    TimestampMs elapsed = std::max<TimestampMs>(0, now - started_at_);
    last_elapsed_ms_ = std::min(elapsed, duration_ms_);
    push_event(ProgressTick{elapsed, progress()});

    if (elapsed >= duration_ms_) {
        conclude(false);
    }
}

void LivenessSession::cancel() {
    require_state(SessionState::RUNNING, "cancel");
    reset_trackers();
    history_.clear();
    set_state(SessionState::CANCELLED, "cancelled by caller");
    push_event(SessionEndedEvent{SessionState::CANCELLED, "cancelled by caller"});
}

LivenessResult LivenessSession::finalize() {
    if (state_ != SessionState::PASSED && state_ != SessionState::FAILED &&
        state_ != SessionState::TIMED_OUT) {
        throw LivenessContractError(
            std::string("finalize() not allowed in state ") + to_string(state_), state_);
    }
    if (verdict_taken_ || !verdict_) {
        throw LivenessContractError("finalize() already called for this session", state_);
    }
    verdict_taken_ = true;
    return *verdict_;
}

void LivenessSession::reset() {
    reset_trackers();
    history_.clear();
    events_.clear();
    dropped_events_ = 0;
    verdict_.reset();
    verdict_taken_ = false;
    started_at_ = 0;
    duration_ms_ = 0;
    frame_interval_ms_ = 0;
    last_elapsed_ms_ = 0;
    if (state_ != SessionState::IDLE) {
        set_state(SessionState::IDLE, "reset");
    }
}

float LivenessSession::progress() const {
    if (duration_ms_ <= 0) return 0.0f;
    return std::min(1.0f, static_cast<float>(last_elapsed_ms_) / static_cast<float>(duration_ms_));
}

// ============================================================================
// Events
// ============================================================================

std::optional<LivenessEvent> LivenessSession::poll_event() {
    if (events_.empty()) return std::nullopt;
    LivenessEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<LivenessEvent> LivenessSession::drain_events() {
    std::vector<LivenessEvent> out(std::make_move_iterator(events_.begin()),
                                   std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

void LivenessSession::push_event(LivenessEvent event) {
    if (config_.verbose_logging) {
        std::cout << "   " << describe(event) << std::endl;
    }
    // Drop oldest if the caller is not polling
    if (events_.size() >= config_.event_queue_capacity) {
        events_.pop_front();
        dropped_events_++;
    }
    events_.push_back(std::move(event));
}

// ============================================================================
// Helpers
// ============================================================================

void LivenessSession::set_state(SessionState new_state, const std::string& reason) {
    std::cout << "🔄 Liveness session " << to_string(state_) << " → " << to_string(new_state);
    if (!reason.empty()) {
        std::cout << " (" << reason << ")";
    }
    std::cout << std::endl;
    state_ = new_state;
}

void LivenessSession::require_state(SessionState expected, const char* operation) const {
    if (state_ != expected) {
        throw LivenessContractError(
            std::string(operation) + "() not allowed in state " + to_string(state_), state_);
    }
}

void LivenessSession::reset_trackers() {
    blink_.reset();
    head_.reset();
    mouth_.reset();
    presence_.reset();
}

bool LivenessSession::has_usable_geometry(const LandmarkSample& sample) const {
    const int used[] = {face_mesh::NOSE_TIP, face_mesh::UPPER_LIP_INNER, face_mesh::LOWER_LIP_INNER};
    for (int idx : used) {
        const auto& p = sample.at(idx);
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
    }
    for (const auto* eye : {&face_mesh::LEFT_EYE, &face_mesh::RIGHT_EYE}) {
        for (int idx : *eye) {
            const auto& p = sample.at(idx);
            if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) return false;
        }
        if (geometry::eye_width(sample, *eye) < MIN_EYE_WIDTH) return false;
    }
    return true;
}

void LivenessSession::process_face_frame(const LandmarkSample& sample, FrameResult& frame) {
    const TimestampMs now = sample.timestamp;
    frame.face_found = true;
    frame.face_bounds = geometry::landmark_bounds(sample.points);

    float ear_left = geometry::eye_aspect_ratio(sample, face_mesh::LEFT_EYE);
    float ear_right = geometry::eye_aspect_ratio(sample, face_mesh::RIGHT_EYE);
    frame.average_ear = (ear_left + ear_right) / 2.0f;
    if (auto blink = blink_.update(ear_left, ear_right, now)) {
        frame.blink = true;
        push_event(*blink);
    }

    frame.nose_x = sample.at(face_mesh::NOSE_TIP).x;
    if (head_.update(frame.nose_x, now)) {
        frame.movement = true;
        push_event(MovementEvent{head_.last_delta(), now});
    }
    frame.nose_delta = head_.last_delta();

    frame.mouth_opening = geometry::mouth_opening(sample, face_mesh::UPPER_LIP_INNER,
                                                  face_mesh::LOWER_LIP_INNER);
    if (mouth_.update(frame.mouth_opening, now)) {
        frame.mouth_activity = true;
        push_event(MouthActivityEvent{mouth_.count(), now, frame.mouth_opening});
    }
}

// ============================================================================
// Verdict
// ============================================================================

void LivenessSession::conclude(bool face_lost) {
    LivenessResult result = evaluate(face_lost);

    if (face_lost) {
        result.terminal_state = SessionState::FAILED;
    } else if (presence_.stats().frames_total == 0) {
        result.terminal_state = SessionState::TIMED_OUT;
    } else {
        result.terminal_state = result.is_live ? SessionState::PASSED : SessionState::FAILED;
    }
    result.reason = build_reason(result);

    verdict_ = result;
    verdict_taken_ = false;

    std::cout << (result.is_live ? "✅ " : "❌ ") << result.reason
              << " [confidence " << std::fixed << std::setprecision(2) << result.confidence << "]"
              << std::defaultfloat << std::endl;

    set_state(result.terminal_state, face_lost ? "face lost" : "window elapsed");
    push_event(SessionEndedEvent{result.terminal_state, result.reason});
}

LivenessResult LivenessSession::evaluate(bool face_lost) const {
    LivenessResult r;
    const auto& stats = presence_.stats();

    r.detected_blinks = blink_.count();
    r.head_moved = head_.has_moved();
    r.mouth_activity_count = mouth_.count();
    r.face_detection_rate = presence_.detection_rate();
    r.frames_total = stats.frames_total;
    r.frames_with_face = stats.frames_with_face;
    r.duration_ms = last_elapsed_ms_;

    if (face_lost) {
        r.failed_conditions.push_back(LivenessCondition::FACE_LOST);
    }
    if (r.detected_blinks < config_.min_blinks) {
        r.failed_conditions.push_back(LivenessCondition::BLINK);
    }
    if (!r.head_moved) {
        r.failed_conditions.push_back(LivenessCondition::HEAD_MOVEMENT);
    }
    if (r.mouth_activity_count < config_.min_mouth_activity) {
        r.failed_conditions.push_back(LivenessCondition::MOUTH_ACTIVITY);
    }
    if (r.face_detection_rate < config_.min_face_detection_rate) {
        r.failed_conditions.push_back(LivenessCondition::FACE_PRESENCE);
    }

    // Confidence is reported, but the hard conditions alone decide the verdict
    float blink_conf = factor_confidence(static_cast<float>(r.detected_blinks),
                                         static_cast<float>(config_.min_blinks));
    float head_conf = r.head_moved ? 1.0f : 0.0f;
    float mouth_conf = factor_confidence(static_cast<float>(r.mouth_activity_count),
                                         static_cast<float>(config_.min_mouth_activity));
    float face_conf = factor_confidence(r.face_detection_rate, config_.min_face_detection_rate);
    r.confidence = (blink_conf + head_conf + mouth_conf + face_conf) / 4.0f;

    r.is_live = r.failed_conditions.empty();

    classify_framing(r.face_position, r.face_size);
    return r;
}

void LivenessSession::classify_framing(FacePosition& position, FaceSize& size) const {
    position = FacePosition::UNKNOWN;
    size = FaceSize::UNKNOWN;

    std::vector<FrameResult> recent;
    for (const auto& frame : history_.snapshot()) {
        if (frame.face_found && frame.face_bounds.width > 0.0f) {
            recent.push_back(frame);
        }
    }
    if (recent.empty()) return;
    if (recent.size() > config_.framing_window) {
        recent.erase(recent.begin(), recent.end() - static_cast<std::ptrdiff_t>(config_.framing_window));
    }

    int position_votes[6] = {0};
    int size_votes[4] = {0};
    for (const auto& frame : recent) {
        const auto& box = frame.face_bounds;
        float dx = box.x + box.width / 2.0f - 0.5f;
        float dy = box.y + box.height / 2.0f - 0.5f;

        FacePosition p;
        if (std::fabs(dx) <= config_.framing_center_tolerance &&
            std::fabs(dy) <= config_.framing_center_tolerance) {
            p = FacePosition::CENTER;
        } else if (std::fabs(dx) >= std::fabs(dy)) {
            p = dx < 0.0f ? FacePosition::LEFT : FacePosition::RIGHT;
        } else {
            p = dy < 0.0f ? FacePosition::TOP : FacePosition::BOTTOM;
        }
        position_votes[static_cast<int>(p)]++;

        FaceSize s = FaceSize::GOOD;
        if (box.width < config_.min_face_width) s = FaceSize::TOO_SMALL;
        else if (box.width > config_.max_face_width) s = FaceSize::TOO_LARGE;
        size_votes[static_cast<int>(s)]++;
    }

    // A category wins when it covers at least half of the window
    const int n = static_cast<int>(recent.size());
    for (int i = 1; i < 6; ++i) {
        if (position_votes[i] * 2 >= n) {
            position = static_cast<FacePosition>(i);
            break;
        }
    }
    for (int i = 1; i < 4; ++i) {
        if (size_votes[i] * 2 >= n) {
            size = static_cast<FaceSize>(i);
            break;
        }
    }
}

std::string LivenessSession::build_reason(const LivenessResult& r) const {
    std::ostringstream out;

    if (r.terminal_state == SessionState::TIMED_OUT) {
        out << "Liveness check timed out: no frames received in " << duration_ms_ << "ms ("
            << guidance::retry_hint(LivenessCondition::FACE_LOST) << ")";
        return out.str();
    }

    if (r.is_live) {
        out << "Liveness check passed: " << r.detected_blinks << " blink(s), head movement, "
            << r.mouth_activity_count << " mouth movement(s), "
            << percent(r.face_detection_rate) << "% face detection rate";
        return out.str();
    }

    out << "Liveness check failed: ";
    bool first = true;
    for (auto condition : r.failed_conditions) {
        if (!first) out << "; ";
        first = false;

        switch (condition) {
            case LivenessCondition::FACE_LOST:
                out << "face lost for more than " << config_.max_consecutive_misses
                    << " consecutive frames";
                break;
            case LivenessCondition::BLINK:
                out << "detected " << r.detected_blinks << " of " << config_.min_blinks
                    << " required blink(s)";
                break;
            case LivenessCondition::HEAD_MOVEMENT:
                out << "no head movement detected";
                break;
            case LivenessCondition::MOUTH_ACTIVITY:
                out << "detected " << r.mouth_activity_count << " of "
                    << config_.min_mouth_activity << " required mouth movement(s)";
                break;
            case LivenessCondition::FACE_PRESENCE:
                out << "face visible in " << percent(r.face_detection_rate) << "% of frames, need "
                    << percent(config_.min_face_detection_rate) << "%";
                break;
        }
        out << " (" << guidance::retry_hint(condition) << ")";
    }

    std::string framing = guidance::framing_hint(r.face_position, r.face_size);
    if (!framing.empty()) {
        out << "; " << framing;
    }
    return out.str();
}

} // namespace livegate
