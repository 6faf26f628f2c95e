#include "timeline/StimulusEvent.h"
#include <atomic>
#include <limits>

namespace ntm {

EventID GenerateEventID() {
    static std::atomic<EventID> s_NextId{1};
    return s_NextId.fetch_add(1, std::memory_order_relaxed);
}

StimulusEvent::StimulusEvent() : id(GenerateEventID()) {}

StimulusEvent::StimulusEvent(TimeMs onset, TimeMs duration, StimulusPayload p)
    : id(GenerateEventID()), onsetMs(onset), durationMs(duration), payload(std::move(p)) {}

StimulusKind StimulusEvent::Kind() const {
    return std::holds_alternative<ImagePayload>(payload) ? StimulusKind::Image : StimulusKind::Audio;
}

const std::string& StimulusEvent::FilePath() const {
    return std::visit([](const auto& p) -> const std::string& { return p.filePath; }, payload);
}

std::optional<int> StimulusEvent::MarkerCodeValue() const {
    return std::visit([](const auto& p) { return p.markerCode; }, payload);
}

bool StimulusEvent::IsActiveAt(TimeMs t, TimeMs toleranceMs) const {
    return onsetMs - toleranceMs <= t && t <= EndMs() + toleranceMs;
}

bool StimulusEvent::Overlaps(const StimulusEvent& other) const {
    return onsetMs < other.EndMs() && other.onsetMs < EndMs();
}

StimulusEvent MakeImageEvent(TimeMs onset, TimeMs duration, std::string filePath,
                             ImagePosition position, std::optional<int> markerCode) {
    return StimulusEvent(onset, duration, ImagePayload{std::move(filePath), position, markerCode});
}

StimulusEvent MakeAudioEvent(TimeMs onset, TimeMs duration, std::string filePath,
                             double volume, std::optional<int> markerCode) {
    return StimulusEvent(onset, duration, AudioPayload{std::move(filePath), volume, markerCode});
}

bool EndIsRepresentable(TimeMs onsetMs, TimeMs durationMs) {
    if (durationMs > 0) return onsetMs <= std::numeric_limits<TimeMs>::max() - durationMs;
    return onsetMs >= std::numeric_limits<TimeMs>::min() - durationMs;
}

const char* ToString(StimulusKind kind) {
    switch (kind) {
        case StimulusKind::Image: return "image";
        case StimulusKind::Audio: return "audio";
    }
    return "image";
}

const char* ToString(ImagePosition position) {
    switch (position) {
        case ImagePosition::Center:      return "center";
        case ImagePosition::TopLeft:     return "top-left";
        case ImagePosition::TopRight:    return "top-right";
        case ImagePosition::BottomLeft:  return "bottom-left";
        case ImagePosition::BottomRight: return "bottom-right";
    }
    return "center";
}

std::optional<StimulusKind> ParseStimulusKind(const std::string& s) {
    if (s == "image") return StimulusKind::Image;
    if (s == "audio") return StimulusKind::Audio;
    return std::nullopt;
}

std::optional<ImagePosition> ParseImagePosition(const std::string& s) {
    static const ImagePosition all[] = { ImagePosition::Center, ImagePosition::TopLeft, ImagePosition::TopRight,
                                         ImagePosition::BottomLeft, ImagePosition::BottomRight };
    for (ImagePosition p : all) if (s == ToString(p)) return p;
    return std::nullopt;
}

} // namespace ntm
