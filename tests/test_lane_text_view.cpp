#include <gtest/gtest.h>

#include "timeline/LaneAssignment.h"
#include "view/LaneTextView.h"

using namespace ntm;

TEST(LaneTextView, EmptyTimeline) {
    EXPECT_EQ(RenderLaneText({}, 0), "(empty timeline)\n");
}

TEST(LaneTextView, TouchingEventsAlternateFill) {
    std::vector<StimulusEvent> events = {
        MakeImageEvent(0, 500, "a.png"),
        MakeAudioEvent(500, 500, "b.wav"),
    };
    auto lanes = AssignLanes(events);
    EXPECT_EQ(RenderLaneText(lanes, 1000, 10),
              "L1 |#####=====|\n"
              "    0ms 1000ms\n");
}

TEST(LaneTextView, OneRowPerLane) {
    std::vector<StimulusEvent> events = {
        MakeImageEvent(0, 1000, "a.png"),
        MakeAudioEvent(0, 1, "b.wav"),
    };
    auto lanes = AssignLanes(events);
    ASSERT_EQ(lanes.size(), 2u);
    const std::string text = RenderLaneText(lanes, 1000, 10);
    EXPECT_NE(text.find("L1 |##########|\n"), std::string::npos);
    EXPECT_NE(text.find("L2 |#         |\n"), std::string::npos);
}
