#pragma once

#include <string>
#include <vector>
#include "timeline/StimulusEvent.h"

namespace ntm {

class Timeline;

// Range rules for editor input. Timeline::AddEvent does not run these; the
// editing surface calls them before committing an event.
//
//   onset_ms >= 0, duration_ms > 0, file path not empty,
//   audio volume in [0, 1], marker code (when set) in [1, 255]
std::vector<std::string> CollectValidationIssues(const StimulusEvent& event);

// Throws ValidationError listing every violated rule.
void ValidateEvent(const StimulusEvent& event);

// Issues for every event in timeline order, each prefixed with the event's
// 1-based position and kind.
std::vector<std::string> CollectValidationIssues(const Timeline& timeline);

bool IsValidMarkerCode(int code);
bool IsValidVolume(double volume);

} // namespace ntm
