#include "LivenessConfig.hpp"
#include "LandmarkSample.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace livegate {

namespace {

constexpr size_t MAX_BUFFER_CAPACITY = 4096;

// Count fields are unsigned; a negative or oversized JSON value is rejected instead of wrapped
template<typename T>
T count_value(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    int64_t value = j.at(key).get<int64_t>();
    if (value < 0 || static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(value));
    }
    return static_cast<T>(value);
}

} // namespace

bool LivenessConfig::validate(std::string& error) const {
    if (closed_threshold <= 0.0f) {
        error = "closed_threshold must be > 0";
        return false;
    }
    if (open_threshold < closed_threshold) {
        error = "open_threshold must be >= closed_threshold";
        return false;
    }
    if (blink_cooldown_ms < 0 || movement_cooldown_ms < 0 || activity_cooldown_ms < 0) {
        error = "cooldowns must be >= 0";
        return false;
    }
    if (movement_threshold <= 0.0f || mouth_threshold <= 0.0f) {
        error = "movement_threshold and mouth_threshold must be > 0";
        return false;
    }
    if (min_face_detection_rate < 0.0f || min_face_detection_rate > 1.0f) {
        error = "min_face_detection_rate must be in [0,1]";
        return false;
    }
    if (session_duration_ms <= 0) {
        error = "session_duration_ms must be > 0";
        return false;
    }
    if (frame_interval_ms <= 0 || frame_interval_ms > session_duration_ms) {
        error = "frame_interval_ms must be in (0, session_duration_ms]";
        return false;
    }
    if (history_capacity == 0 || event_queue_capacity == 0) {
        error = "history_capacity and event_queue_capacity must be > 0";
        return false;
    }
    if (history_capacity > MAX_BUFFER_CAPACITY || event_queue_capacity > MAX_BUFFER_CAPACITY) {
        error = "history_capacity and event_queue_capacity must be <= " +
                std::to_string(MAX_BUFFER_CAPACITY);
        return false;
    }
    // Nose tip and the eye contours must exist in the mesh
    if (landmark_count <= static_cast<size_t>(face_mesh::RIGHT_EYE[1])) {
        error = "landmark_count too small for the face mesh indices";
        return false;
    }
    if (min_face_width >= max_face_width) {
        error = "min_face_width must be < max_face_width";
        return false;
    }
    if (framing_window == 0) {
        error = "framing_window must be > 0";
        return false;
    }
    return true;
}

bool LivenessConfig::accepts_landmark_count(size_t count) const {
    if (count == landmark_count) return true;
    return accept_iris_landmarks &&
           landmark_count == face_mesh::LANDMARK_COUNT &&
           count == face_mesh::LANDMARK_COUNT_WITH_IRIS;
}

LivenessConfig config_from_json(const nlohmann::json& j) {
    LivenessConfig c;
    c.closed_threshold = j.value("closed_threshold", c.closed_threshold);
    c.open_threshold = j.value("open_threshold", c.open_threshold);
    c.blink_cooldown_ms = j.value("blink_cooldown_ms", c.blink_cooldown_ms);
    c.movement_threshold = j.value("movement_threshold", c.movement_threshold);
    c.movement_cooldown_ms = j.value("movement_cooldown_ms", c.movement_cooldown_ms);
    c.mouth_threshold = j.value("mouth_threshold", c.mouth_threshold);
    c.activity_cooldown_ms = j.value("activity_cooldown_ms", c.activity_cooldown_ms);
    c.min_blinks = count_value(j, "min_blinks", c.min_blinks);
    c.min_mouth_activity = count_value(j, "min_mouth_activity", c.min_mouth_activity);
    c.min_face_detection_rate = j.value("min_face_detection_rate", c.min_face_detection_rate);
    c.max_consecutive_misses = count_value(j, "max_consecutive_misses", c.max_consecutive_misses);
    c.session_duration_ms = j.value("session_duration_ms", c.session_duration_ms);
    c.frame_interval_ms = j.value("frame_interval_ms", c.frame_interval_ms);
    c.history_capacity = count_value(j, "history_capacity", c.history_capacity);
    c.event_queue_capacity = count_value(j, "event_queue_capacity", c.event_queue_capacity);
    c.landmark_count = count_value(j, "landmark_count", c.landmark_count);
    c.accept_iris_landmarks = j.value("accept_iris_landmarks", c.accept_iris_landmarks);
    c.framing_center_tolerance = j.value("framing_center_tolerance", c.framing_center_tolerance);
    c.min_face_width = j.value("min_face_width", c.min_face_width);
    c.max_face_width = j.value("max_face_width", c.max_face_width);
    c.framing_window = count_value(j, "framing_window", c.framing_window);
    c.verbose_logging = j.value("verbose_logging", c.verbose_logging);
    return c;
}

nlohmann::json config_to_json(const LivenessConfig& c) {
    return {
        {"closed_threshold", c.closed_threshold},
        {"open_threshold", c.open_threshold},
        {"blink_cooldown_ms", c.blink_cooldown_ms},
        {"movement_threshold", c.movement_threshold},
        {"movement_cooldown_ms", c.movement_cooldown_ms},
        {"mouth_threshold", c.mouth_threshold},
        {"activity_cooldown_ms", c.activity_cooldown_ms},
        {"min_blinks", c.min_blinks},
        {"min_mouth_activity", c.min_mouth_activity},
        {"min_face_detection_rate", c.min_face_detection_rate},
        {"max_consecutive_misses", c.max_consecutive_misses},
        {"session_duration_ms", c.session_duration_ms},
        {"frame_interval_ms", c.frame_interval_ms},
        {"history_capacity", c.history_capacity},
        {"event_queue_capacity", c.event_queue_capacity},
        {"landmark_count", c.landmark_count},
        {"accept_iris_landmarks", c.accept_iris_landmarks},
        {"framing_center_tolerance", c.framing_center_tolerance},
        {"min_face_width", c.min_face_width},
        {"max_face_width", c.max_face_width},
        {"framing_window", c.framing_window},
        {"verbose_logging", c.verbose_logging}
    };
}

bool load_config_file(const std::string& path, LivenessConfig& config) {
    std::ifstream config_file(path);
    if (!config_file.is_open()) {
        std::cerr << "❌ Cannot open config file: " << path << std::endl;
        return false;
    }

    LivenessConfig loaded;
    try {
        nlohmann::json j;
        config_file >> j;
        loaded = config_from_json(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "❌ Invalid config " << path << ": " << e.what() << std::endl;
        return false;
    } catch (const std::invalid_argument& e) {
        std::cerr << "❌ Invalid config " << path << ": " << e.what() << std::endl;
        return false;
    }

    std::string error;
    if (!loaded.validate(error)) {
        std::cerr << "❌ Rejected config " << path << ": " << error << std::endl;
        return false;
    }

    config = loaded;
    std::cout << "✅ Loaded liveness config from " << path << std::endl;
    return true;
}

} // namespace livegate
