#pragma once

/**
 * @file LandmarkSample.hpp
 * @brief One frame of face-mesh landmarks as delivered by the landmark source
 */

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace livegate {

/// Milliseconds on the capture clock of the landmark source.
using TimestampMs = int64_t;

/// Landmark coordinates: x, y normalized to [0,1], z is MediaPipe relative depth.
using Point3D = cv::Point3f;

/**
 * @brief MediaPipe Face Mesh indices used by the liveness signals
 *
 * Eye contours are ordered [p0..p5] = outer corner, upper lid (2), inner corner,
 * lower lid (2), matching the EAR formula in Geometry.hpp.
 */
namespace face_mesh {
constexpr size_t LANDMARK_COUNT = 468;
constexpr size_t LANDMARK_COUNT_WITH_IRIS = 478;

constexpr std::array<int, 6> LEFT_EYE = {33, 160, 158, 133, 153, 144};
constexpr std::array<int, 6> RIGHT_EYE = {263, 387, 385, 362, 380, 373};
constexpr int UPPER_LIP_INNER = 13;
constexpr int LOWER_LIP_INNER = 14;
constexpr int NOSE_TIP = 1;
} // namespace face_mesh

/**
 * @brief Landmarks for a single captured frame
 *
 * When face_found is false the points are not inspected and may be empty.
 */
struct LandmarkSample {
    std::vector<Point3D> points;
    TimestampMs timestamp = 0;
    bool face_found = false;

    LandmarkSample() = default;
    LandmarkSample(std::vector<Point3D> pts, TimestampMs ts, bool found)
        : points(std::move(pts)), timestamp(ts), face_found(found) {}

    /// A frame where the landmark model reported no face.
    static LandmarkSample miss(TimestampMs ts) { return LandmarkSample({}, ts, false); }

    size_t size() const { return points.size(); }
    const Point3D& at(int index) const { return points.at(static_cast<size_t>(index)); }
};

/**
 * @brief Decode a sample from its JSON form
 *
 * Format: {"t": 1200, "face": true, "points": [[x, y, z], ...]}
 * @throws nlohmann::json::exception on missing or mistyped fields
 */
LandmarkSample sample_from_json(const nlohmann::json& j);

/**
 * @brief Encode a sample in the format read by sample_from_json()
 */
nlohmann::json sample_to_json(const LandmarkSample& sample);

} // namespace livegate
