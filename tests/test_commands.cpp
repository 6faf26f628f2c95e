#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "cli/Commands.h"
#include "config/Settings.h"
#include "core/Errors.h"
#include "io/FileSystem.h"

using namespace ntm;
using namespace ntm::cli;

namespace {

struct CommandFixture : public ::testing::Test {
    MemoryFileStore store;
    Settings settings;
    std::ostringstream out;
    CommandContext ctx{store, settings, out};

    void SetUp() override {
        store.CreateDirectories("work");
        BuildDemoTimeline().Save("work/demo.json", store);
    }

    int Run(const std::string& name, Args args) {
        out.str("");
        return RunCommand(name, std::move(args), ctx);
    }
};

} // namespace

TEST(Commands, DemoTimelineMatchesAttentionTest) {
    Timeline t = BuildDemoTimeline();
    EXPECT_EQ(t.Size(), 5u);
    EXPECT_EQ(t.Duration(), 3500);
    EXPECT_EQ(t.Metadata().name, "Visual-Auditory Attention Test");
    EXPECT_EQ(t.GetEventsAtTime(1500).size(), 2u);
}

TEST_F(CommandFixture, DemoSavesAndReloads) {
    EXPECT_EQ(Run("demo", {"work/out.json"}), 0);
    EXPECT_TRUE(store.Exists("work/out.json"));
    EXPECT_NE(out.str().find("Saved and reloaded work/out.json (5 events)"), std::string::npos);
    EXPECT_NE(out.str().find("No active stimuli"), std::string::npos);
}

TEST_F(CommandFixture, InfoListsEvents) {
    EXPECT_EQ(Run("info", {"work/demo.json"}), 0);
    EXPECT_NE(out.str().find("Duration:    3500ms"), std::string::npos);
    EXPECT_NE(out.str().find("distractor.png"), std::string::npos);
}

TEST_F(CommandFixture, AtHonoursTolerance) {
    EXPECT_EQ(Run("at", {"work/demo.json", "3501"}), 0);
    EXPECT_NE(out.str().find("No active stimuli"), std::string::npos);

    EXPECT_EQ(Run("at", {"work/demo.json", "3501", "--tolerance", "1"}), 0);
    EXPECT_NE(out.str().find("distractor.png"), std::string::npos);

    EXPECT_THROW(Run("at", {"work/demo.json", "soon"}), ValidationError);
}

TEST_F(CommandFixture, LanesReportsCount) {
    EXPECT_EQ(Run("lanes", {"work/demo.json", "--width", "35"}), 0);
    EXPECT_NE(out.str().find("Lanes: 2 (max concurrent events: 2)"), std::string::npos);
    EXPECT_THROW(Run("lanes", {"work/demo.json", "--width", "0"}), ValidationError);
}

TEST_F(CommandFixture, PreviewReportsOnsetsAndOffsets) {
    EXPECT_EQ(Run("preview", {"work/demo.json", "--tick", "100"}), 0);
    const std::string text = out.str();
    EXPECT_NE(text.find("1000ms  + image"), std::string::npos);
    EXPECT_NE(text.find("3600ms  - image"), std::string::npos);
    EXPECT_NE(text.find("Preview finished at 3500ms"), std::string::npos);
}

TEST_F(CommandFixture, ExportDetectsFormatAndRemembersInput) {
    EXPECT_EQ(Run("export", {"work/demo.json", "work/events.tsv"}), 0);
    ASSERT_TRUE(store.Exists("work/events.tsv"));
    EXPECT_EQ(store.ReadTextFile("work/events.tsv").rfind("onset\tduration", 0), 0u);
    EXPECT_TRUE(ctx.settingsChanged);
    ASSERT_EQ(settings.RecentTests().size(), 1u);
    EXPECT_EQ(settings.RecentTests()[0], "work/demo.json");

    EXPECT_EQ(Run("recent", {}), 0);
    EXPECT_EQ(out.str(), "work/demo.json\n");

    EXPECT_THROW(Run("export", {"work/demo.json", "work/x.out", "--format", "mat"}), UnsupportedFormatError);
    EXPECT_THROW(Run("export", {"work/demo.json", "missing/x.csv"}), IOError);
}

TEST_F(CommandFixture, ValidateFailsOnBadEvents) {
    EXPECT_EQ(Run("validate", {"work/demo.json"}), 0);

    Timeline bad;
    bad.AddEvent(MakeAudioEvent(0, 0, "a.wav", 3.0));
    bad.Save("work/bad.json", store);
    EXPECT_EQ(Run("validate", {"work/bad.json"}), 1);
    EXPECT_NE(out.str().find("Invalid: 1 events, 2 issues"), std::string::npos);
}

TEST_F(CommandFixture, ToneCommands) {
    EXPECT_EQ(Run("tone", {"440", "0.1", "work/a.wav", "--rate", "8000"}), 0);
    EXPECT_EQ(store.ReadTextFile("work/a.wav").size(), 44u + 800u * 2u);

    EXPECT_EQ(Run("tones", {"200", "300", "100", "0.01", "work/sweep", "--prefix", "beep"}), 0);
    EXPECT_TRUE(store.Exists("work/sweep/beep_200Hz.wav"));
    EXPECT_TRUE(store.Exists("work/sweep/beep_300Hz.wav"));
}

TEST_F(CommandFixture, UnknownCommandPrintsUsage) {
    EXPECT_EQ(Run("frobnicate", {}), 2);
    EXPECT_EQ(out.str().rfind("Usage: ntm", 0), 0u);
    EXPECT_THROW(Run("info", {}), ValidationError);
    EXPECT_THROW(Run("info", {"work/none.json"}), IOError);
}
