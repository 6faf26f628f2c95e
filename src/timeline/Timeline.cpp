#include "timeline/Timeline.h"
#include <algorithm>
#include "core/Logger.h"
#include "io/FileSystem.h"
#include "timeline/TimelineSerializer.h"

namespace ntm {

EventID Timeline::AddEvent(StimulusEvent event)
{
    EventID id = event.id;
    m_Events.push_back(std::move(event));
    Reorder();
    RecomputeDuration();
    m_Dirty = true;
    return id;
}

bool Timeline::RemoveEvent(EventID id)
{
    auto it = std::find_if(m_Events.begin(), m_Events.end(), [id](const StimulusEvent& e){ return e.id == id; });
    if (it == m_Events.end()) return false;
    m_Events.erase(it);
    RecomputeDuration();
    m_Dirty = true;
    return true;
}

bool Timeline::EditEvent(EventID id, const std::function<void(StimulusEvent&)>& edit)
{
    auto it = std::find_if(m_Events.begin(), m_Events.end(), [id](const StimulusEvent& e){ return e.id == id; });
    if (it == m_Events.end()) return false;
    // Edit a copy so a throwing callback leaves the timeline untouched
    StimulusEvent copy = *it;
    edit(copy);
    copy.id = id;
    *it = std::move(copy);
    Reorder();
    RecomputeDuration();
    m_Dirty = true;
    return true;
}

void Timeline::Clear()
{
    m_Events.clear();
    m_Metadata = TimelineMetadata{};
    m_Dirty = false;
}

void Timeline::Reset(TimelineMetadata metadata, std::vector<StimulusEvent> events)
{
    m_Metadata = std::move(metadata);
    m_Events = std::move(events);
    Reorder();
    RecomputeDuration();
    m_Dirty = true;
}

const StimulusEvent* Timeline::FindEvent(EventID id) const
{
    for (const auto& e : m_Events) if (e.id == id) return &e;
    return nullptr;
}

std::vector<const StimulusEvent*> Timeline::GetEventsAtTime(TimeMs timeMs, TimeMs toleranceMs) const
{
    std::vector<const StimulusEvent*> active;
    for (const auto& e : m_Events) {
        // Sorted by onset: nothing later can start in time
        if (e.onsetMs - toleranceMs > timeMs) break;
        if (e.IsActiveAt(timeMs, toleranceMs)) active.push_back(&e);
    }
    return active;
}

void Timeline::SetName(std::string name)
{
    m_Metadata.name = std::move(name);
    m_Dirty = true;
}

void Timeline::SetDescription(std::string description)
{
    m_Metadata.description = std::move(description);
    m_Dirty = true;
}

nlohmann::json Timeline::ToSerializable() const
{
    return SerializeTimeline(*this);
}

Timeline Timeline::FromSerializable(const nlohmann::json& data)
{
    return DeserializeTimeline(data);
}

void Timeline::Save(const std::string& path)
{
    Save(path, DiskFileStore::Instance());
}

void Timeline::Save(const std::string& path, IFileStore& store)
{
    SaveTimeline(*this, path, store);
    m_Dirty = false;
    Logger::Log("[Timeline] Saved '" + m_Metadata.name + "' (" + std::to_string(m_Events.size()) + " events) to " + path);
}

void Timeline::Load(const std::string& path)
{
    Load(path, DiskFileStore::Instance());
}

void Timeline::Load(const std::string& path, const IFileStore& store)
{
    Timeline loaded = LoadTimeline(path, store);
    loaded.m_Dirty = false;
    *this = std::move(loaded);
    Logger::Log("[Timeline] Loaded '" + m_Metadata.name + "' (" + std::to_string(m_Events.size()) + " events) from " + path);
}

void Timeline::Reorder()
{
    std::stable_sort(m_Events.begin(), m_Events.end(),
                     [](const StimulusEvent& a, const StimulusEvent& b){ return a.onsetMs < b.onsetMs; });
}

void Timeline::RecomputeDuration()
{
    if (m_Events.empty()) { m_Metadata.durationMs = 0; return; }
    TimeMs end = m_Events.front().EndMs();
    for (const auto& e : m_Events) end = std::max(end, e.EndMs());
    m_Metadata.durationMs = end;
}

} // namespace ntm
