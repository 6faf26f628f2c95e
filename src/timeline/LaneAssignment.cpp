#include "timeline/LaneAssignment.h"
#include <algorithm>
#include <utility>
#include "timeline/Timeline.h"

namespace ntm {

std::vector<Lane> AssignLanes(const std::vector<StimulusEvent>& events)
{
    std::vector<const StimulusEvent*> order;
    order.reserve(events.size());
    for (const auto& e : events) order.push_back(&e);
    std::stable_sort(order.begin(), order.end(),
                     [](const StimulusEvent* a, const StimulusEvent* b){ return a->onsetMs < b->onsetMs; });

    std::vector<Lane> lanes;
    for (const StimulusEvent* e : order) {
        auto it = std::find_if(lanes.begin(), lanes.end(), [e](const Lane& l){ return l.freeAtMs <= e->onsetMs; });
        if (it == lanes.end()) {
            lanes.emplace_back();
            it = std::prev(lanes.end());
        }
        it->events.push_back(e);
        it->freeAtMs = e->EndMs();
    }
    return lanes;
}

std::vector<Lane> AssignLanes(const Timeline& timeline)
{
    return AssignLanes(timeline.Events());
}

size_t MaxConcurrentEvents(const std::vector<StimulusEvent>& events)
{
    // +1 at onset, -1 at end; ends sort before starts at the same instant
    std::vector<std::pair<TimeMs, int>> edges;
    edges.reserve(events.size() * 2);
    for (const auto& e : events) {
        if (e.durationMs <= 0) continue;
        edges.emplace_back(e.onsetMs, +1);
        edges.emplace_back(e.EndMs(), -1);
    }
    std::sort(edges.begin(), edges.end());

    size_t current = 0, peak = 0;
    for (const auto& [t, delta] : edges) {
        if (delta > 0) peak = std::max(peak, ++current);
        else --current;
    }
    return peak;
}

std::unordered_map<EventID, size_t> LaneIndexByEvent(const std::vector<Lane>& lanes)
{
    std::unordered_map<EventID, size_t> index;
    for (size_t i = 0; i < lanes.size(); ++i)
        for (const StimulusEvent* e : lanes[i].events) index[e->id] = i;
    return index;
}

} // namespace ntm
