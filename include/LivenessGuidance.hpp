#pragma once

#include "LivenessResult.hpp"

#include <string>
#include <vector>

namespace livegate {
namespace guidance {

/** Steps shown to the user before a check starts */
std::vector<std::string> get_instructions();

/** Environment tips for a successful check */
std::vector<std::string> get_tips();

/** Short factor-specific retry advice for a failed condition */
std::string retry_hint(LivenessCondition condition);

/** Advice for a badly framed face, empty when framing is fine or unknown */
std::string framing_hint(FacePosition position, FaceSize size);

} // namespace guidance
} // namespace livegate
