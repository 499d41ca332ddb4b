#pragma once

#include "LivenessResult.hpp"

#include <stdexcept>
#include <string>

namespace livegate {

/**
 * @brief Caller bug: an operation invoked in a state that does not allow it
 *
 * Never used for a negative liveness verdict.
 */
class LivenessContractError : public std::logic_error {
public:
    LivenessContractError(const std::string& message, SessionState state)
        : std::logic_error(message), state_(state) {}

    /// Session state when the violation was detected.
    SessionState state() const { return state_; }

private:
    SessionState state_;
};

/**
 * @brief Landmark sample that does not match the configured face mesh
 */
class MalformedSampleError : public LivenessContractError {
public:
    MalformedSampleError(size_t point_count, size_t expected)
        : LivenessContractError("malformed landmark sample: " + std::to_string(point_count) +
                                    " points, expected " + std::to_string(expected),
                                SessionState::ERROR),
          point_count_(point_count) {}

    size_t point_count() const { return point_count_; }

private:
    size_t point_count_;
};

} // namespace livegate
