#pragma once

#include "LandmarkSample.hpp"

#include <fstream>
#include <memory>
#include <string>

namespace livegate {

/**
 * @brief Abstract producer of landmark samples
 *
 * Implemented by whatever runs the face-mesh model (live camera, recorded
 * stream, test fixture) so the session never depends on a capture backend.
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    /**
     * @brief Fetch the next sample in capture order
     * @param sample Receives the sample
     * @return false when the source is exhausted
     */
    virtual bool next(LandmarkSample& sample) = 0;

    /**
     * @brief Get source name/type
     */
    virtual std::string name() const = 0;

    virtual bool is_open() const = 0;
};

/**
 * @brief Recorded landmark stream, one JSON sample per line
 *
 * Lines that fail to parse are delivered as face-less samples at the previous
 * timestamp, the same way a failed landmark extraction reaches the session.
 */
class JsonLinesLandmarkSource : public LandmarkSource {
public:
    explicit JsonLinesLandmarkSource(const std::string& path);

    bool next(LandmarkSample& sample) override;
    std::string name() const override;
    bool is_open() const override { return stream_.is_open(); }

    uint64_t lines_read() const { return lines_read_; }
    uint64_t bad_lines() const { return bad_lines_; }

private:
    std::string path_;
    std::ifstream stream_;
    uint64_t lines_read_ = 0;
    uint64_t bad_lines_ = 0;
    TimestampMs last_timestamp_ = 0;
};

/**
 * @brief Factory for a landmark source from a path
 * @return nullptr if the source cannot be opened
 */
std::unique_ptr<LandmarkSource> create_landmark_source(const std::string& path);

} // namespace livegate
