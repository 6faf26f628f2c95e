#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace ntm {

using EventID = std::uint64_t;
using TimeMs  = std::int64_t;

enum class StimulusKind { Image, Audio };

enum class ImagePosition { Center, TopLeft, TopRight, BottomLeft, BottomRight };

constexpr int kDefaultMarkerCode = 1;
constexpr int kMinMarkerCode = 1;
constexpr int kMaxMarkerCode = 255;

struct ImagePayload {
    std::string filePath;
    ImagePosition position = ImagePosition::Center;
    std::optional<int> markerCode; // absent means kDefaultMarkerCode
};

struct AudioPayload {
    std::string filePath;
    double volume = 1.0; // 0..1
    std::optional<int> markerCode;
};

using StimulusPayload = std::variant<ImagePayload, AudioPayload>;

// Process-unique, monotonically increasing. Thread-safe.
EventID GenerateEventID();

// One scheduled stimulus occurrence. The id is assigned at construction and
// identifies the event for lookup/removal only; copies share it.
struct StimulusEvent {
    EventID id = 0;
    TimeMs onsetMs = 0;
    TimeMs durationMs = 0;
    StimulusPayload payload;
    nlohmann::json extra = nlohmann::json::object(); // unrecognized "data" keys, kept for round trips

    StimulusEvent();
    StimulusEvent(TimeMs onset, TimeMs duration, StimulusPayload p);

    StimulusKind Kind() const;
    TimeMs EndMs() const { return onsetMs + durationMs; }
    const std::string& FilePath() const;
    std::optional<int> MarkerCodeValue() const;
    int MarkerCode() const { return MarkerCodeValue().value_or(kDefaultMarkerCode); }

    // Inclusive on both ends: active exactly at onset and exactly at end.
    bool IsActiveAt(TimeMs t, TimeMs toleranceMs = 0) const;
    // Half-open overlap; touching intervals do not overlap.
    bool Overlaps(const StimulusEvent& other) const;
};

StimulusEvent MakeImageEvent(TimeMs onset, TimeMs duration, std::string filePath,
                             ImagePosition position = ImagePosition::Center,
                             std::optional<int> markerCode = std::nullopt);
StimulusEvent MakeAudioEvent(TimeMs onset, TimeMs duration, std::string filePath,
                             double volume = 1.0,
                             std::optional<int> markerCode = std::nullopt);

// False when onset + duration does not fit in TimeMs.
bool EndIsRepresentable(TimeMs onsetMs, TimeMs durationMs);

const char* ToString(StimulusKind kind);    // "image" / "audio"
const char* ToString(ImagePosition position); // "center", "top-left", ...
std::optional<StimulusKind> ParseStimulusKind(const std::string& s);
std::optional<ImagePosition> ParseImagePosition(const std::string& s);

} // namespace ntm
