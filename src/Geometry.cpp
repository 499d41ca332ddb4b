#include "Geometry.hpp"

#include <algorithm>
#include <cmath>

namespace livegate {
namespace geometry {

float distance(const Point3D& a, const Point3D& b) {
    return static_cast<float>(cv::norm(a - b));
}

float eye_width(const LandmarkSample& sample, const std::array<int, 6>& eye) {
    return distance(sample.at(eye[0]), sample.at(eye[3]));
}

float eye_aspect_ratio(const LandmarkSample& sample, const std::array<int, 6>& eye) {
    float vertical_a = distance(sample.at(eye[1]), sample.at(eye[5]));
    float vertical_b = distance(sample.at(eye[2]), sample.at(eye[4]));
    return (vertical_a + vertical_b) / (2.0f * eye_width(sample, eye));
}

float mouth_opening(const LandmarkSample& sample, int top_index, int bottom_index) {
    return std::fabs(sample.at(bottom_index).y - sample.at(top_index).y);
}

cv::Rect2f landmark_bounds(const std::vector<Point3D>& points) {
    if (points.empty()) return cv::Rect2f();

    float min_x = points[0].x, max_x = points[0].x;
    float min_y = points[0].y, max_y = points[0].y;
    for (const auto& p : points) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    return cv::Rect2f(min_x, min_y, max_x - min_x, max_y - min_y);
}

} // namespace geometry
} // namespace livegate
