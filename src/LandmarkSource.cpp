#include "LandmarkSource.hpp"

#include <nlohmann/json.hpp>
#include <iostream>

namespace livegate {

JsonLinesLandmarkSource::JsonLinesLandmarkSource(const std::string& path)
    : path_(path), stream_(path) {
    if (!stream_.is_open()) {
        std::cerr << "❌ Cannot open landmark stream: " << path << std::endl;
    }
}

bool JsonLinesLandmarkSource::next(LandmarkSample& sample) {
    std::string line;
    while (std::getline(stream_, line)) {
        lines_read_++;
        if (line.empty() || line[0] == '#') continue;

        try {
            sample = sample_from_json(nlohmann::json::parse(line));
            last_timestamp_ = sample.timestamp;
        } catch (const nlohmann::json::exception& e) {
            bad_lines_++;
            std::cerr << "⚠ " << path_ << ":" << lines_read_ << ": " << e.what() << std::endl;
            sample = LandmarkSample::miss(last_timestamp_);
        }
        return true;
    }
    return false;
}

std::string JsonLinesLandmarkSource::name() const {
    return "jsonl:" + path_;
}

std::unique_ptr<LandmarkSource> create_landmark_source(const std::string& path) {
    auto source = std::make_unique<JsonLinesLandmarkSource>(path);
    if (!source->is_open()) {
        return nullptr;
    }
    std::cout << "✓ Using landmark source " << source->name() << std::endl;
    return source;
}

} // namespace livegate
