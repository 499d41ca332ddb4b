#pragma once

/**
 * Synthetic face-mesh samples with controllable EAR, mouth opening and nose x.
 *
 * Eyes are drawn as a horizontal segment of width EYE_WIDTH with two vertical lid
 * pairs of height ear * EYE_WIDTH, so the EAR of each eye equals the requested
 * value. Every other landmark sits at the frame center.
 */

#include "LandmarkSample.hpp"

#include <array>
#include <vector>

namespace test_support {

using livegate::LandmarkSample;
using livegate::Point3D;
using livegate::TimestampMs;

constexpr float EYE_WIDTH = 0.10f;
constexpr float EYE_Y = 0.40f;
constexpr float LEFT_EYE_X = 0.30f;
constexpr float RIGHT_EYE_X = 0.60f;
constexpr float MOUTH_Y = 0.65f;

inline void place_eye(std::vector<Point3D>& pts, const std::array<int, 6>& eye,
                      float x0, float ear) {
    const float h = ear * EYE_WIDTH;
    pts[eye[0]] = Point3D(x0, EYE_Y, 0.0f);
    pts[eye[3]] = Point3D(x0 + EYE_WIDTH, EYE_Y, 0.0f);
    pts[eye[1]] = Point3D(x0 + EYE_WIDTH / 3.0f, EYE_Y - h / 2.0f, 0.0f);
    pts[eye[5]] = Point3D(x0 + EYE_WIDTH / 3.0f, EYE_Y + h / 2.0f, 0.0f);
    pts[eye[2]] = Point3D(x0 + 2.0f * EYE_WIDTH / 3.0f, EYE_Y - h / 2.0f, 0.0f);
    pts[eye[4]] = Point3D(x0 + 2.0f * EYE_WIDTH / 3.0f, EYE_Y + h / 2.0f, 0.0f);
}

inline LandmarkSample make_face(TimestampMs t, float ear, float mouth, float nose_x,
                                size_t count = livegate::face_mesh::LANDMARK_COUNT) {
    namespace fm = livegate::face_mesh;
    std::vector<Point3D> pts(count, Point3D(0.5f, 0.5f, 0.0f));
    place_eye(pts, fm::LEFT_EYE, LEFT_EYE_X, ear);
    place_eye(pts, fm::RIGHT_EYE, RIGHT_EYE_X, ear);
    pts[fm::UPPER_LIP_INNER] = Point3D(0.5f, MOUTH_Y, 0.0f);
    pts[fm::LOWER_LIP_INNER] = Point3D(0.5f, MOUTH_Y + mouth, 0.0f);
    pts[fm::NOSE_TIP] = Point3D(nose_x, 0.5f, 0.0f);
    return LandmarkSample(std::move(pts), t, true);
}

/// Neutral face: eyes open, mouth closed, nose centered.
inline LandmarkSample make_neutral(TimestampMs t) {
    return make_face(t, 0.30f, 0.01f, 0.50f);
}

inline LandmarkSample shifted(LandmarkSample sample, float dx, float dy) {
    for (auto& p : sample.points) {
        p.x += dx;
        p.y += dy;
    }
    return sample;
}

} // namespace test_support
