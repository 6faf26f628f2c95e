#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "timeline/StimulusEvent.h"
#include "timeline/Timeline.h"

namespace ntm {

using json = nlohmann::json;

class IFileStore;

// Canonical structured form:
//   { "metadata": { "name", "description", "duration_ms" },
//     "events": [ { "event_type", "timestamp_ms", "data": { "file_path", "duration_ms", ... } } ] }
json SerializeEvent(const StimulusEvent& event);
json SerializeMetadata(const TimelineMetadata& metadata);
json SerializeTimeline(const Timeline& timeline);

// Shape checks only (types and required keys); ranges are Validation.h's
// job. Throw FormatError. `index` is used in messages only.
StimulusEvent DeserializeEvent(const json& j, size_t index = 0);
TimelineMetadata DeserializeMetadata(const json& j);
Timeline DeserializeTimeline(const json& j);

// Text form: 2-space indented UTF-8. Parse failures throw FormatError.
std::string DumpTimelineJson(const json& j);
json ParseTimelineJson(const std::string& text, const std::string& source = "<memory>");

void SaveTimeline(const Timeline& timeline, const std::string& path, IFileStore& store);
Timeline LoadTimeline(const std::string& path, const IFileStore& store);

} // namespace ntm
