#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "core/Errors.h"
#include "formats/ExportFormats.h"
#include "io/FileSystem.h"
#include "timeline/Timeline.h"

using namespace ntm;
using namespace ntm::formats;

namespace {

Timeline MakeSampleTimeline() {
    Timeline t;
    t.SetName("Sample Export Test");
    t.SetDescription("Testing multi-format export functionality");
    t.AddEvent(MakeImageEvent(0,    1000, "stimulus1.jpg"));
    t.AddEvent(MakeAudioEvent(500,  2000, "tone1.wav"));
    t.AddEvent(MakeImageEvent(2000, 1500, "stimulus2.jpg", ImagePosition::Center, 12));
    t.AddEvent(MakeAudioEvent(3000, 1000, "tone2.wav"));
    return t;
}

// Lines without their terminator; a trailing terminator gives no empty tail.
std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream in(text);
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST(ExportFormats, MarkerCsvHasHeaderAndOneRowPerEvent) {
    const std::string csv = FormatMarkerCsv(MakeSampleTimeline().ToSerializable());
    auto lines = SplitLines(csv);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "onset_ms,duration_ms,marker_code,event_type,stimulus_file");
    EXPECT_EQ(lines[1], "0,1000,1,image,stimulus1.jpg");
    EXPECT_EQ(lines[2], "500,2000,1,audio,tone1.wav");
    EXPECT_EQ(lines[3], "2000,1500,12,image,stimulus2.jpg");
    EXPECT_EQ(lines[4], "3000,1000,1,audio,tone2.wav");
    EXPECT_EQ(csv.find('\r'), std::string::npos);
}

TEST(ExportFormats, EeglabLayout) {
    const std::string text = FormatEeglab(MakeSampleTimeline().ToSerializable());
    const std::string header = "Latency(ms)\tType\tDuration(ms)\tEventID\tStimulusFile";
    auto lines = SplitLines(text);
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[0], header);
    EXPECT_EQ(lines[1], "# Exported from Neuroscience Test Maker");
    EXPECT_EQ(lines[2], "# Test: Sample Export Test");
    EXPECT_EQ(lines[3], "# Description: Testing multi-format export functionality");
    EXPECT_EQ(lines[4], "");
    EXPECT_EQ(lines[5], header);
    EXPECT_EQ(lines[6], "0\timage\t1000\t1\tstimulus1.jpg");
    EXPECT_EQ(lines[9], "3000\taudio\t1000\t4\ttone2.wav");
    EXPECT_NE(text.find("\r\n"), std::string::npos);
}

TEST(ExportFormats, EPrimeLayout) {
    const std::string text = FormatEPrime(MakeSampleTimeline().ToSerializable());
    ASSERT_EQ(text.rfind("\xEF\xBB\xBF", 0), 0u);

    auto lines = SplitLines(text.substr(3));
    ASSERT_EQ(lines.size(), 15u);
    EXPECT_EQ(lines[0], "*** Header Start ***");
    EXPECT_EQ(lines[3], "Title:\tSample Export Test");
    EXPECT_EQ(lines[6], "*** Header End ***");
    EXPECT_EQ(lines[8], "Procedure\tTrial\tStimulus\tStimulusFile\tOnsetTime\tDuration\tType\tModality");
    EXPECT_EQ(lines[9], "TrialProc\t1\tstimulus1\tstimulus1.jpg\t0\t1000\timage\tIMAGE");
    EXPECT_EQ(lines[10], "TrialProc\t2\ttone1\ttone1.wav\t500\t2000\taudio\tAUDIO");
    EXPECT_EQ(lines[14], "*** End of data ***");
}

TEST(ExportFormats, BidsUsesSeconds) {
    auto lines = SplitLines(FormatBidsTsv(MakeSampleTimeline().ToSerializable()));
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "onset\tduration\tvalue\tevent_type\tstim_file");
    EXPECT_EQ(lines[1], "0.000\t1.000\t1\timage\tstimulus1.jpg");
    EXPECT_EQ(lines[2], "0.500\t2.000\t1\taudio\ttone1.wav");
    EXPECT_EQ(lines[3], "2.000\t1.500\t12\timage\tstimulus2.jpg");
}

TEST(ExportFormats, NativeJsonReloads) {
    Timeline t = MakeSampleTimeline();
    json reparsed = json::parse(FormatNativeJson(t.ToSerializable()));
    Timeline back = Timeline::FromSerializable(reparsed);
    EXPECT_EQ(back.Size(), t.Size());
    EXPECT_EQ(back.Duration(), t.Duration());
    EXPECT_EQ(back.Metadata().name, "Sample Export Test");
}

TEST(ExportFormats, UnsortedEventsAreExportedInOnsetOrder) {
    json j = json::parse(R"({"metadata":{"name":"U"},"events":[
        {"event_type":"image","timestamp_ms":900,"data":{"file_path":"dir/late.png","duration_ms":10}},
        {"event_type":"audio","timestamp_ms":100,"data":{"file_path":"C:\\stim\\early.wav","duration_ms":10}}]})");
    auto lines = SplitLines(FormatMarkerCsv(j));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "100,10,1,audio,early.wav");
    EXPECT_EQ(lines[2], "900,10,1,image,late.png");
}

TEST(ExportFormats, FieldsWithDelimitersAreQuoted) {
    json j = json::parse(R"({"events":[
        {"event_type":"image","timestamp_ms":0,"data":{"file_path":"a,b.png","duration_ms":10}}]})");
    auto lines = SplitLines(FormatMarkerCsv(j));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "0,10,1,image,\"a,b.png\"");
}

TEST(ExportFormats, EmptyTimelineGivesHeaderOnly) {
    Timeline t;
    EXPECT_EQ(SplitLines(FormatMarkerCsv(t.ToSerializable())).size(), 1u);
    EXPECT_EQ(SplitLines(FormatBidsTsv(t.ToSerializable())).size(), 1u);
    EXPECT_EQ(SplitLines(FormatEeglab(t.ToSerializable())).size(), 6u);
}

TEST(ExportFormats, SelectorParsing) {
    EXPECT_EQ(ParseExportFormat("json"), ExportFormat::Json);
    EXPECT_EQ(ParseExportFormat("EEGLAB"), ExportFormat::Eeglab);
    EXPECT_EQ(ParseExportFormat("e-prime"), ExportFormat::EPrime);
    EXPECT_EQ(ParseExportFormat("csv"), ExportFormat::MarkerCsv);
    EXPECT_EQ(ParseExportFormat("tsv"), ExportFormat::BidsTsv);
    EXPECT_STREQ(ToSelector(ExportFormat::BidsTsv), "bids");
    EXPECT_EQ(GetFormatInfo().size(), 5u);

    try {
        ParseExportFormat("xml");
        FAIL() << "expected UnsupportedFormatError";
    } catch (const UnsupportedFormatError& e) {
        EXPECT_EQ(e.Selector(), "xml");
    }
}

TEST(ExportFormats, DetectFromPath) {
    EXPECT_EQ(DetectFormatFromPath("out/test.json"), ExportFormat::Json);
    EXPECT_EQ(DetectFormatFromPath("test_eeglab.txt"), ExportFormat::Eeglab);
    EXPECT_EQ(DetectFormatFromPath("test_eprime.txt"), ExportFormat::EPrime);
    EXPECT_EQ(DetectFormatFromPath("markers.txt"), ExportFormat::Eeglab);
    EXPECT_EQ(DetectFormatFromPath("markers.CSV"), ExportFormat::MarkerCsv);
    EXPECT_EQ(DetectFormatFromPath("sub-01_events.tsv"), ExportFormat::BidsTsv);
    EXPECT_EQ(DetectFormatFromPath("noextension"), ExportFormat::Json);
}

TEST(ExportFormats, ExportWritesThroughStore) {
    MemoryFileStore store;
    store.CreateDirectories("exports");
    const json data = MakeSampleTimeline().ToSerializable();

    ExportTimeline(data, "exports/run.csv", "csv", store);
    EXPECT_EQ(store.ReadTextFile("exports/run.csv"), FormatMarkerCsv(data));

    EXPECT_THROW(ExportTimeline(data, "exports/run.xml", "xml", store), UnsupportedFormatError);
    EXPECT_FALSE(store.Exists("exports/run.xml"));
}

TEST(ExportFormats, MissingDirectoryIsAnIOError) {
    MemoryFileStore store;
    try {
        ExportTimeline(MakeSampleTimeline().ToSerializable(), "missing/run.tsv", ExportFormat::BidsTsv, store);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.Path(), "missing");
    }
}

TEST(ExportFormats, MalformedRootIsRejected) {
    EXPECT_THROW(FormatEeglab(json::array()), FormatError);
    EXPECT_THROW(FormatMarkerCsv(json::parse(R"({"events": 3})")), FormatError);
}

TEST(ExportFormats, FileNameHelpers) {
    EXPECT_EQ(StimulusFileName("a/b/c.png"), "c.png");
    EXPECT_EQ(StimulusFileName("C:\\x\\y.wav"), "y.wav");
    EXPECT_EQ(StimulusFileStem("dir/tone.1.wav"), "tone.1");
    EXPECT_EQ(StimulusFileStem(".hidden"), ".hidden");
}

TEST(ExportFormats, EPrimeStimulusFallsBackToTypeAndIndex) {
    json j = json::parse(R"({"events":[
        {"event_type":"image","timestamp_ms":0,"data":{"file_path":"","duration_ms":100}},
        {"event_type":"audio","timestamp_ms":200,"data":{"file_path":"snd/beep.wav","duration_ms":50}}]})");
    auto lines = SplitLines(FormatEPrime(j).substr(3));
    ASSERT_EQ(lines.size(), 13u);
    EXPECT_EQ(lines[9], "TrialProc\t1\timage_1\t\t0\t100\timage\tIMAGE");
    EXPECT_EQ(lines[10], "TrialProc\t2\tbeep\tbeep.wav\t200\t50\taudio\tAUDIO");
}

TEST(ExportFormats, DetectTxtHints) {
    EXPECT_EQ(DetectFormatFromPath("session_e-prime.txt"), ExportFormat::EPrime);
    EXPECT_EQ(DetectFormatFromPath("run_eeg_eprime.txt"), ExportFormat::Eeglab);
    EXPECT_EQ(DetectFormatFromPath("EPRIME_run.TXT"), ExportFormat::EPrime);
}

TEST(ExportFormats, MarkerCodeOutsideIntRangeFallsBackToDefault) {
    json j = json::parse(R"({"events":[
        {"event_type":"image","timestamp_ms":0,"data":{"file_path":"a.png","duration_ms":10,"marker_code":5000000000}},
        {"event_type":"image","timestamp_ms":5,"data":{"file_path":"b.png","duration_ms":10,"marker_code":-5000000000}}]})");
    auto lines = SplitLines(FormatMarkerCsv(j));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "0,10,1,image,a.png");
    EXPECT_EQ(lines[2], "5,10,1,image,b.png");
}
