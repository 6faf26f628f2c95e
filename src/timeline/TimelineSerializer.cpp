#include "timeline/TimelineSerializer.h"
#include <initializer_list>
#include <limits>
#include "core/Errors.h"
#include "io/FileSystem.h"

namespace ntm {

namespace {
    [[noreturn]] void Malformed(size_t index, const std::string& what)
    {
        throw FormatError("Malformed event #" + std::to_string(index + 1) + ": " + what);
    }

    TimeMs RequireInteger(const json& obj, const char* key, size_t index)
    {
        auto it = obj.find(key);
        if (it == obj.end()) Malformed(index, std::string("missing '") + key + "'");
        if (!it->is_number_integer()) Malformed(index, std::string("'") + key + "' must be an integer");
        return it->get<TimeMs>();
    }

    std::optional<int> ReadMarkerCode(const json& data, size_t index)
    {
        auto it = data.find("marker_code");
        if (it == data.end() || it->is_null()) return std::nullopt;
        if (!it->is_number_integer()) Malformed(index, "'marker_code' must be an integer");
        auto v = it->get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
            Malformed(index, "'marker_code' out of integer range");
        return static_cast<int>(v);
    }

    std::string ReadFilePath(const json& data, size_t index)
    {
        // "filepath" is what older editor builds wrote
        auto it = data.find("file_path");
        if (it == data.end()) it = data.find("filepath");
        if (it == data.end()) Malformed(index, "missing 'file_path'");
        if (!it->is_string()) Malformed(index, "'file_path' must be a string");
        return it->get<std::string>();
    }

    json CollectExtra(const json& obj, std::initializer_list<const char*> known)
    {
        json extra = json::object();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            bool isKnown = false;
            for (const char* k : known) if (it.key() == k) { isKnown = true; break; }
            if (!isKnown) extra[it.key()] = it.value();
        }
        return extra;
    }

    std::string OptionalString(const json& obj, const char* key, const std::string& fallback)
    {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return fallback;
        if (!it->is_string()) throw FormatError(std::string("Malformed metadata: '") + key + "' must be a string");
        return it->get<std::string>();
    }
}

// ---------------- Events ----------------
json SerializeEvent(const StimulusEvent& event)
{
    json data = event.extra.is_object() ? event.extra : json::object();
    data["file_path"] = event.FilePath();
    data["duration_ms"] = event.durationMs;
    if (const auto* img = std::get_if<ImagePayload>(&event.payload)) {
        data["position"] = ToString(img->position);
        if (img->markerCode) data["marker_code"] = *img->markerCode;
    } else {
        const auto& aud = std::get<AudioPayload>(event.payload);
        data["volume"] = aud.volume;
        if (aud.markerCode) data["marker_code"] = *aud.markerCode;
    }
    return json{{"event_type", ToString(event.Kind())}, {"timestamp_ms", event.onsetMs}, {"data", std::move(data)}};
}

StimulusEvent DeserializeEvent(const json& j, size_t index)
{
    if (!j.is_object()) Malformed(index, "entry is not an object");

    auto typeIt = j.find("event_type");
    if (typeIt == j.end()) Malformed(index, "missing 'event_type'");
    if (!typeIt->is_string()) Malformed(index, "'event_type' must be a string");
    auto kind = ParseStimulusKind(typeIt->get<std::string>());
    if (!kind) Malformed(index, "unknown event_type '" + typeIt->get<std::string>() + "'");

    TimeMs onset = RequireInteger(j, "timestamp_ms", index);

    auto dataIt = j.find("data");
    if (dataIt == j.end()) Malformed(index, "missing 'data'");
    if (!dataIt->is_object()) Malformed(index, "'data' must be an object");
    const json& data = *dataIt;

    TimeMs duration = RequireInteger(data, "duration_ms", index);
    if (!EndIsRepresentable(onset, duration))
        Malformed(index, "'timestamp_ms' + 'duration_ms' is out of range");
    std::string filePath = ReadFilePath(data, index);
    std::optional<int> markerCode = ReadMarkerCode(data, index);

    StimulusEvent e;
    e.onsetMs = onset;
    e.durationMs = duration;

    if (*kind == StimulusKind::Image) {
        ImagePayload p;
        p.filePath = std::move(filePath);
        p.markerCode = markerCode;
        if (auto posIt = data.find("position"); posIt != data.end() && !posIt->is_null()) {
            if (!posIt->is_string()) Malformed(index, "'position' must be a string");
            auto pos = ParseImagePosition(posIt->get<std::string>());
            if (!pos) Malformed(index, "unknown position '" + posIt->get<std::string>() + "'");
            p.position = *pos;
        }
        e.payload = std::move(p);
        e.extra = CollectExtra(data, {"file_path", "filepath", "duration_ms", "position", "marker_code"});
    } else {
        AudioPayload p;
        p.filePath = std::move(filePath);
        p.markerCode = markerCode;
        if (auto volIt = data.find("volume"); volIt != data.end() && !volIt->is_null()) {
            if (!volIt->is_number()) Malformed(index, "'volume' must be a number");
            p.volume = volIt->get<double>();
        }
        e.payload = std::move(p);
        e.extra = CollectExtra(data, {"file_path", "filepath", "duration_ms", "volume", "marker_code"});
    }
    return e;
}

// ---------------- Metadata ----------------
json SerializeMetadata(const TimelineMetadata& metadata)
{
    json j = metadata.extra.is_object() ? metadata.extra : json::object();
    j["name"] = metadata.name;
    j["description"] = metadata.description;
    j["duration_ms"] = metadata.durationMs;
    return j;
}

TimelineMetadata DeserializeMetadata(const json& j)
{
    if (!j.is_object()) throw FormatError("Malformed timeline: 'metadata' must be an object");
    TimelineMetadata m;
    m.name = OptionalString(j, "name", m.name);
    m.description = OptionalString(j, "description", m.description);
    // duration_ms is derived from the events and never read back
    m.extra = CollectExtra(j, {"name", "description", "duration_ms"});
    return m;
}

// ---------------- Timeline ----------------
json SerializeTimeline(const Timeline& timeline)
{
    json j;
    j["metadata"] = SerializeMetadata(timeline.Metadata());
    j["events"] = json::array();
    for (const auto& e : timeline.Events()) j["events"].push_back(SerializeEvent(e));
    return j;
}

Timeline DeserializeTimeline(const json& j)
{
    if (!j.is_object()) throw FormatError("Malformed timeline: root must be an object");

    TimelineMetadata metadata;
    if (auto it = j.find("metadata"); it != j.end() && !it->is_null())
        metadata = DeserializeMetadata(*it);

    std::vector<StimulusEvent> events;
    if (auto it = j.find("events"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) throw FormatError("Malformed timeline: 'events' must be an array");
        events.reserve(it->size());
        size_t index = 0;
        for (const auto& ej : *it) events.push_back(DeserializeEvent(ej, index++));
    }

    Timeline timeline;
    timeline.Reset(std::move(metadata), std::move(events));
    return timeline;
}

// ---------------- Text / files ----------------
std::string DumpTimelineJson(const json& j)
{
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

json ParseTimelineJson(const std::string& text, const std::string& source)
{
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw FormatError("Invalid JSON in " + source + ": " + e.what());
    }
}

void SaveTimeline(const Timeline& timeline, const std::string& path, IFileStore& store)
{
    store.WriteTextFile(path, DumpTimelineJson(SerializeTimeline(timeline)));
}

Timeline LoadTimeline(const std::string& path, const IFileStore& store)
{
    const std::string text = store.ReadTextFile(path);
    return DeserializeTimeline(ParseTimelineJson(text, path));
}

} // namespace ntm
