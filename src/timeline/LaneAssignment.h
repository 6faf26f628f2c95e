#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>
#include "timeline/StimulusEvent.h"

namespace ntm {

class Timeline;

struct Lane {
    std::vector<const StimulusEvent*> events; // in placement order
    TimeMs freeAtMs = 0;                      // end of the last event placed
};

// Greedy interval partitioning into the minimum number of rows in which no
// two events overlap. Events are taken in onset order (ties keep input
// order) and go to the first lane, in creation order, whose freeAtMs <=
// onset. A touching boundary (end == next onset) shares a lane.
//
// The result points into `events`, which must outlive it.
std::vector<Lane> AssignLanes(const std::vector<StimulusEvent>& events);
std::vector<Lane> AssignLanes(const Timeline& timeline);
std::vector<Lane> AssignLanes(std::vector<StimulusEvent>&&) = delete;
std::vector<Lane> AssignLanes(Timeline&&) = delete;

// Largest number of events overlapping at any instant, using the same
// half-open convention. Events with duration <= 0 are not counted. For
// valid events this equals AssignLanes(...).size().
size_t MaxConcurrentEvents(const std::vector<StimulusEvent>& events);

std::unordered_map<EventID, size_t> LaneIndexByEvent(const std::vector<Lane>& lanes);

} // namespace ntm
