#pragma once
#include <string>
#include "timeline/LaneAssignment.h"

namespace ntm {

// Text rendering of lanes for terminals and logs:
//
//   L1 |#####=====      ######|
//   L2 |     ########         |
//      0ms               3500ms
//
// Each event covers at least one cell; neighbouring events in a lane
// alternate '#' and '=' so a touching boundary stays visible.
std::string RenderLaneText(const std::vector<Lane>& lanes, TimeMs durationMs, size_t width = 60);

} // namespace ntm
