#include "Geometry.hpp"
#include "SampleFactory.hpp"

#include <cmath>
#include <iostream>

using namespace livegate;
using namespace test_support;

static int fails = 0;

static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++fails;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
}

static bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

int main() {
    std::cout << "=== Geometry Utilities Test ===" << std::endl;

    // distance
    {
        Point3D a(0.0f, 0.0f, 0.0f);
        Point3D b(3.0f, 4.0f, 0.0f);
        assert_true(near(geometry::distance(a, b), 5.0f), "distance of 3-4-5 triangle is 5");
        assert_true(near(geometry::distance(b, a), 5.0f), "distance is symmetric");
        assert_true(near(geometry::distance(a, Point3D(0.0f, 0.0f, 2.0f)), 2.0f),
                    "distance includes z");
        assert_true(geometry::distance(a, a) == 0.0f, "distance to self is 0");
    }

    // eye aspect ratio
    {
        LandmarkSample open = make_face(0, 0.30f, 0.01f, 0.5f);
        assert_true(near(geometry::eye_aspect_ratio(open, face_mesh::LEFT_EYE), 0.30f),
                    "left EAR matches synthetic open eye");
        assert_true(near(geometry::eye_aspect_ratio(open, face_mesh::RIGHT_EYE), 0.30f),
                    "right EAR matches synthetic open eye");
        assert_true(near(geometry::eye_width(open, face_mesh::LEFT_EYE), EYE_WIDTH),
                    "eye width is the p0-p3 span");

        LandmarkSample closed = make_face(0, 0.05f, 0.01f, 0.5f);
        assert_true(near(geometry::eye_aspect_ratio(closed, face_mesh::LEFT_EYE), 0.05f),
                    "EAR drops for a closed eye");

        // Same shape at twice the scale keeps the ratio
        LandmarkSample scaled = open;
        for (auto& p : scaled.points) {
            p.x *= 2.0f;
            p.y *= 2.0f;
        }
        assert_true(near(geometry::eye_aspect_ratio(scaled, face_mesh::LEFT_EYE), 0.30f),
                    "EAR is scale invariant");
    }

    // mouth opening
    {
        LandmarkSample s = make_face(0, 0.30f, 0.06f, 0.5f);
        assert_true(near(geometry::mouth_opening(s, face_mesh::UPPER_LIP_INNER,
                                                 face_mesh::LOWER_LIP_INNER), 0.06f),
                    "mouth opening is the lip gap");
        assert_true(near(geometry::mouth_opening(s, face_mesh::LOWER_LIP_INNER,
                                                 face_mesh::UPPER_LIP_INNER), 0.06f),
                    "mouth opening ignores argument order");
    }

    // landmark bounds
    {
        std::vector<Point3D> pts = {{0.2f, 0.3f, 0.0f}, {0.6f, 0.1f, 0.0f}, {0.4f, 0.9f, 0.0f}};
        cv::Rect2f box = geometry::landmark_bounds(pts);
        assert_true(near(box.x, 0.2f) && near(box.y, 0.1f), "bounds origin is the min corner");
        assert_true(near(box.width, 0.4f) && near(box.height, 0.8f), "bounds span all points");
        assert_true(geometry::landmark_bounds({}).area() == 0.0f, "no points gives empty bounds");
    }

    if (fails == 0) {
        std::cout << "\nAll tests passed." << std::endl;
        return 0;
    } else {
        std::cerr << "\nTests failed: " << fails << std::endl;
        return 1;
    }
}
