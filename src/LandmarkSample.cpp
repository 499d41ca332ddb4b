#include "LandmarkSample.hpp"

namespace livegate {

LandmarkSample sample_from_json(const nlohmann::json& j) {
    LandmarkSample sample;
    sample.timestamp = j.at("t").get<TimestampMs>();
    sample.face_found = j.value("face", false);

    if (j.contains("points")) {
        const auto& pts = j.at("points");
        sample.points.reserve(pts.size());
        for (const auto& p : pts) {
            // z is optional; 2D landmark dumps omit it
            float z = p.size() > 2 ? p.at(2).get<float>() : 0.0f;
            sample.points.emplace_back(p.at(0).get<float>(), p.at(1).get<float>(), z);
        }
    }
    return sample;
}

nlohmann::json sample_to_json(const LandmarkSample& sample) {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& p : sample.points) {
        points.push_back({p.x, p.y, p.z});
    }
    return {
        {"t", sample.timestamp},
        {"face", sample.face_found},
        {"points", points}
    };
}

} // namespace livegate
