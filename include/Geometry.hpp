#pragma once

#include "LandmarkSample.hpp"

#include <opencv2/core.hpp>
#include <array>
#include <vector>

namespace livegate {
namespace geometry {

/** Euclidean distance between two landmark points */
float distance(const Point3D& a, const Point3D& b);

/**
 * @brief Eye aspect ratio from six ordered eye-contour landmarks
 *
 * EAR = (|p1-p5| + |p2-p4|) / (2 * |p0-p3|)
 *
 * The caller must reject samples where |p0-p3| is zero (see eye_width()).
 */
float eye_aspect_ratio(const LandmarkSample& sample, const std::array<int, 6>& eye);

/** Horizontal eye span |p0-p3|, the EAR denominator */
float eye_width(const LandmarkSample& sample, const std::array<int, 6>& eye);

/** Vertical distance between the inner upper and lower lip landmarks */
float mouth_opening(const LandmarkSample& sample, int top_index, int bottom_index);

/** Axis-aligned bounding box of all points (empty rect for no points) */
cv::Rect2f landmark_bounds(const std::vector<Point3D>& points);

} // namespace geometry
} // namespace livegate
