#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "timeline/StimulusEvent.h"

namespace ntm {

class IFileStore;

struct TimelineMetadata {
    std::string name = "Untitled Test";
    std::string description;
    TimeMs durationMs = 0; // derived, see Timeline::RecomputeDuration
    nlohmann::json extra = nlohmann::json::object(); // unrecognized keys from a loaded file
};

// Time-ordered set of stimulus events plus test metadata.
//
// Every mutating call leaves the timeline invariant-complete before it
// returns: events sorted by onset (ties keep insertion order) and
// durationMs == max(onset + duration), 0 when empty. There is no internal
// locking; a caller that polls GetEventsAtTime from a playback thread while
// an editor mutates must serialize the two itself.
class Timeline {
public:
    // Inserts without range checks (see Validation.h). Overlaps and
    // duplicates are legal. Returns the event's id.
    EventID AddEvent(StimulusEvent event);

    // Removes by identity; false when no such event.
    bool RemoveEvent(EventID id);
    bool RemoveEvent(const StimulusEvent& event) { return RemoveEvent(event.id); }

    // In-place edit of timing/payload fields. The id cannot be changed.
    bool EditEvent(EventID id, const std::function<void(StimulusEvent&)>& edit);

    // Back to an empty "Untitled Test".
    void Clear();

    // Replace metadata and events wholesale; duration is recomputed.
    void Reset(TimelineMetadata metadata, std::vector<StimulusEvent> events);

    const StimulusEvent* FindEvent(EventID id) const;

    // Events with onset - tol <= t <= onset + duration + tol, in timeline order.
    std::vector<const StimulusEvent*> GetEventsAtTime(TimeMs timeMs, TimeMs toleranceMs = 0) const;

    const std::vector<StimulusEvent>& Events() const { return m_Events; }
    size_t Size() const { return m_Events.size(); }
    bool Empty() const { return m_Events.empty(); }

    const TimelineMetadata& Metadata() const { return m_Metadata; }
    TimeMs Duration() const { return m_Metadata.durationMs; }
    void SetName(std::string name);
    void SetDescription(std::string description);

    // Unsaved changes since construction, the last Save or the last Load.
    bool IsDirty() const { return m_Dirty; }

    nlohmann::json ToSerializable() const;
    // Throws FormatError; nothing is constructed on failure.
    static Timeline FromSerializable(const nlohmann::json& data);

    // JSON on disk (or through the given store). IOError / FormatError.
    void Save(const std::string& path);
    void Save(const std::string& path, IFileStore& store);
    // All-or-nothing: on failure this timeline is left exactly as it was.
    void Load(const std::string& path);
    void Load(const std::string& path, const IFileStore& store);

private:
    void Reorder();
    void RecomputeDuration();

    std::vector<StimulusEvent> m_Events;
    TimelineMetadata m_Metadata;
    bool m_Dirty = false;
};

} // namespace ntm
