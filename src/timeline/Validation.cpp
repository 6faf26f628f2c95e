#include "timeline/Validation.h"
#include <sstream>
#include "core/Errors.h"
#include "timeline/Timeline.h"

namespace ntm {

bool IsValidMarkerCode(int code) {
    return code >= kMinMarkerCode && code <= kMaxMarkerCode;
}

bool IsValidVolume(double volume) {
    return volume >= 0.0 && volume <= 1.0; // NaN fails both
}

std::vector<std::string> CollectValidationIssues(const StimulusEvent& event) {
    std::vector<std::string> issues;
    if (event.onsetMs < 0)
        issues.push_back("onset_ms must be >= 0 (got " + std::to_string(event.onsetMs) + ")");
    if (event.durationMs <= 0)
        issues.push_back("duration_ms must be > 0 (got " + std::to_string(event.durationMs) + ")");
    if (!EndIsRepresentable(event.onsetMs, event.durationMs))
        issues.push_back("onset_ms + duration_ms is out of range");
    if (event.FilePath().empty())
        issues.push_back("file_path must not be empty");

    if (const auto* audio = std::get_if<AudioPayload>(&event.payload)) {
        if (!IsValidVolume(audio->volume)) {
            std::ostringstream ss; ss << "volume must be between 0 and 1 (got " << audio->volume << ")";
            issues.push_back(ss.str());
        }
    }
    if (auto code = event.MarkerCodeValue(); code && !IsValidMarkerCode(*code))
        issues.push_back("marker_code must be between 1 and 255 (got " + std::to_string(*code) + ")");
    return issues;
}

void ValidateEvent(const StimulusEvent& event) {
    auto issues = CollectValidationIssues(event);
    if (issues.empty()) return;
    std::string msg = std::string("Invalid ") + ToString(event.Kind()) + " stimulus: ";
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i) msg += "; ";
        msg += issues[i];
    }
    throw ValidationError(msg);
}

std::vector<std::string> CollectValidationIssues(const Timeline& timeline) {
    std::vector<std::string> out;
    size_t index = 0;
    for (const auto& e : timeline.Events()) {
        ++index;
        for (const auto& issue : CollectValidationIssues(e))
            out.push_back("event " + std::to_string(index) + " (" + ToString(e.Kind()) + "): " + issue);
    }
    return out;
}

} // namespace ntm
