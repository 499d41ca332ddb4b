#include "LivenessEvents.hpp"

#include <iomanip>
#include <sstream>

namespace livegate {

namespace {

struct EventDescriber {
    std::ostringstream& out;

    void operator()(const BlinkEvent& e) const {
        out << "👁 blink #" << e.count << " at " << e.at << "ms (EAR "
            << std::setprecision(3) << e.average_ear << ")";
    }
    void operator()(const MovementEvent& e) const {
        out << "↔ head movement at " << e.at << "ms (delta "
            << std::setprecision(3) << e.delta << ")";
    }
    void operator()(const MouthActivityEvent& e) const {
        out << "👄 mouth activity #" << e.count << " at " << e.at << "ms (opening "
            << std::setprecision(3) << e.opening << ")";
    }
    void operator()(const ProgressTick& e) const {
        out << "⏱ " << e.elapsed_ms << "ms ("
            << std::fixed << std::setprecision(0) << e.progress * 100.0f << "%)";
    }
    void operator()(const SessionEndedEvent& e) const {
        out << "🏁 session " << to_string(e.state) << ": " << e.reason;
    }
};

} // namespace

std::string describe(const LivenessEvent& event) {
    std::ostringstream out;
    std::visit(EventDescriber{out}, event);
    return out.str();
}

} // namespace livegate
