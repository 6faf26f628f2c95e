#include "view/LaneTextView.h"
#include <algorithm>

namespace ntm {

std::string RenderLaneText(const std::vector<Lane>& lanes, TimeMs durationMs, size_t width)
{
    if (lanes.empty() || durationMs <= 0 || width == 0) return "(empty timeline)\n";

    // "L<n>" padded to a common width, then a space and the opening bar
    const size_t labelWidth = std::to_string(lanes.size()).size() + 1;
    const size_t prefix = labelWidth + 2;
    auto cellAt = [&](TimeMs t) -> size_t {
        t = std::clamp<TimeMs>(t, 0, durationMs);
        return static_cast<size_t>((static_cast<long double>(t) * width) / durationMs);
    };

    std::string out;
    for (size_t i = 0; i < lanes.size(); ++i) {
        std::string row(width, ' ');
        bool alt = false;
        for (const StimulusEvent* e : lanes[i].events) {
            size_t begin = std::min(cellAt(e->onsetMs), width - 1);
            size_t end = std::max(begin + 1, std::min(cellAt(e->EndMs()), width));
            std::fill(row.begin() + begin, row.begin() + end, alt ? '=' : '#');
            alt = !alt;
        }
        std::string label = "L" + std::to_string(i + 1);
        label.resize(labelWidth + 1, ' ');
        out += label + "|" + row + "|\n";
    }

    const std::string left = "0ms";
    const std::string right = std::to_string(durationMs) + "ms";
    std::string axis(prefix + width, ' ');
    axis.replace(prefix, std::min(left.size(), width), left.substr(0, width));
    if (left.size() + right.size() < width) axis.replace(prefix + width - right.size(), right.size(), right);
    out += axis + "\n";
    return out;
}

} // namespace ntm
