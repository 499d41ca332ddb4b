#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace livegate {

/**
 * @brief Tunables for the liveness engine
 *
 * Defaults are the production values. Any field can be overridden from a JSON
 * config file; missing keys keep their defaults.
 */
struct LivenessConfig {
    // Blink (eye aspect ratio hysteresis)
    float closed_threshold = 0.20f;
    float open_threshold = 0.25f;      // 0.20-0.25 is the dead zone
    int64_t blink_cooldown_ms = 500;

    // Head movement (frame-to-frame nose x delta, normalized units)
    float movement_threshold = 0.02f;
    int64_t movement_cooldown_ms = 1000;

    // Mouth activity (inner lip gap, normalized units)
    float mouth_threshold = 0.04f;
    int64_t activity_cooldown_ms = 800;

    // Verdict
    uint32_t min_blinks = 1;
    uint32_t min_mouth_activity = 2;
    float min_face_detection_rate = 0.8f;
    uint32_t max_consecutive_misses = 10;

    // Session window
    int64_t session_duration_ms = 8000;
    int64_t frame_interval_ms = 200;   // ~5 Hz sampling cadence
    size_t history_capacity = 10;
    size_t event_queue_capacity = 64;

    // Landmark topology
    size_t landmark_count = 468;
    bool accept_iris_landmarks = true; // also accept the 478-point refined mesh

    // Face framing guidance
    float framing_center_tolerance = 0.15f;
    float min_face_width = 0.20f;
    float max_face_width = 0.80f;
    size_t framing_window = 5;

    bool verbose_logging = false;

    /**
     * @brief Check internal consistency
     * @param error Receives a description of the first problem found
     * @return true if the config is usable
     */
    bool validate(std::string& error) const;

    /// True if a sample with this many points matches the configured mesh.
    bool accepts_landmark_count(size_t count) const;
};

/**
 * @brief Build a config from JSON, starting from defaults
 * @throws nlohmann::json::exception if a present key has the wrong type
 * @throws std::invalid_argument if a count key is negative or does not fit its field
 */
LivenessConfig config_from_json(const nlohmann::json& j);

nlohmann::json config_to_json(const LivenessConfig& config);

/**
 * @brief Load and validate a config file
 * @param path JSON file path
 * @param config Receives the loaded config (untouched on failure)
 * @return false if the file is unreadable, malformed or fails validation
 */
bool load_config_file(const std::string& path, LivenessConfig& config);

} // namespace livegate
