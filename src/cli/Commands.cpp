#include "cli/Commands.h"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include "audio/ToneGenerator.h"
#include "config/Settings.h"
#include "core/Errors.h"
#include "core/Logger.h"
#include "formats/ExportFormats.h"
#include "io/FileSystem.h"
#include "timeline/LaneAssignment.h"
#include "timeline/TimelineSerializer.h"
#include "timeline/Validation.h"
#include "view/LaneTextView.h"

namespace ntm {
namespace cli {

namespace {
    // Removes "--name value" from args and returns the value.
    std::optional<std::string> TakeOption(Args& args, const std::string& name)
    {
        auto it = std::find(args.begin(), args.end(), "--" + name);
        if (it == args.end()) return std::nullopt;
        if (std::next(it) == args.end()) throw ValidationError("Option --" + name + " needs a value");
        std::string value = *std::next(it);
        args.erase(it, it + 2);
        return value;
    }

    long long ParseInteger(const std::string& text, const std::string& what)
    {
        try {
            size_t used = 0;
            long long v = std::stoll(text, &used);
            if (used == text.size()) return v;
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        throw ValidationError("Invalid " + what + ": '" + text + "'");
    }

    double ParseNumber(const std::string& text, const std::string& what)
    {
        try {
            size_t used = 0;
            double v = std::stod(text, &used);
            if (used == text.size()) return v;
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        throw ValidationError("Invalid " + what + ": '" + text + "'");
    }

    void RequireArgs(const Args& args, size_t count, const char* usage)
    {
        if (args.size() < count) throw ValidationError(std::string("Usage: ntm ") + usage);
    }

    std::string Describe(const StimulusEvent& e)
    {
        std::ostringstream ss;
        ss << std::left << std::setw(6) << ToString(e.Kind()) << ' '
           << std::right << std::setw(7) << e.onsetMs << "ms -> " << std::setw(7) << e.EndMs() << "ms  "
           << formats::StimulusFileName(e.FilePath());
        if (const auto* img = std::get_if<ImagePayload>(&e.payload))
            ss << "  position=" << ToString(img->position);
        else
            ss << "  volume=" << std::get<AudioPayload>(e.payload).volume;
        if (auto code = e.MarkerCodeValue()) ss << "  marker=" << *code;
        return ss.str();
    }

    void PrintActive(std::ostream& out, TimeMs t, const std::vector<const StimulusEvent*>& active)
    {
        out << "At " << t << "ms:\n";
        if (active.empty()) out << "  No active stimuli\n";
        for (const auto* e : active) out << "  - " << Describe(*e) << "\n";
    }

    Timeline LoadInput(const std::string& path, CommandContext& ctx)
    {
        Timeline t;
        t.Load(path, ctx.store);
        return t;
    }

    int CmdDemo(Args& args, CommandContext& ctx)
    {
        std::string path = args.empty() ? (std::filesystem::temp_directory_path() / "demo_test.json").string() : args[0];
        Timeline timeline = BuildDemoTimeline();
        ctx.out << "Created '" << timeline.Metadata().name << "' with " << timeline.Size()
                << " events, " << timeline.Duration() << "ms total\n\n";

        for (TimeMs t : {250, 600, 1500, 2700, 4000}) PrintActive(ctx.out, t, timeline.GetEventsAtTime(t));

        timeline.Save(path, ctx.store);
        Timeline loaded;
        loaded.Load(path, ctx.store);
        ctx.out << "\nSaved and reloaded " << path << " (" << loaded.Size() << " events)\n\n";

        auto lanes = AssignLanes(loaded);
        ctx.out << RenderLaneText(lanes, loaded.Duration());
        return 0;
    }

    int CmdInfo(Args& args, CommandContext& ctx)
    {
        RequireArgs(args, 1, "info <test.json>");
        Timeline t = LoadInput(args[0], ctx);
        ctx.out << "Name:        " << t.Metadata().name << "\n"
                << "Description: " << t.Metadata().description << "\n"
                << "Duration:    " << t.Duration() << "ms\n"
                << "Events:      " << t.Size() << "\n";
        size_t i = 0;
        for (const auto& e : t.Events()) ctx.out << std::setw(4) << ++i << ". " << Describe(e) << "\n";
        return 0;
    }

    int CmdAt(Args& args, CommandContext& ctx)
    {
        TimeMs tolerance = ctx.settings.toleranceMs;
        if (auto tol = TakeOption(args, "tolerance")) tolerance = ParseInteger(*tol, "tolerance");
        RequireArgs(args, 2, "at <test.json> <t_ms> [--tolerance N]");
        Timeline t = LoadInput(args[0], ctx);
        TimeMs at = ParseInteger(args[1], "time");
        PrintActive(ctx.out, at, t.GetEventsAtTime(at, tolerance));
        return 0;
    }

    int CmdLanes(Args& args, CommandContext& ctx)
    {
        size_t width = 60;
        if (auto w = TakeOption(args, "width")) {
            long long v = ParseInteger(*w, "width");
            if (v <= 0) throw ValidationError("Width must be > 0");
            width = static_cast<size_t>(v);
        }
        RequireArgs(args, 1, "lanes <test.json> [--width N]");
        Timeline t = LoadInput(args[0], ctx);
        auto lanes = AssignLanes(t);
        ctx.out << "Lanes: " << lanes.size() << " (max concurrent events: " << MaxConcurrentEvents(t.Events()) << ")\n";
        ctx.out << RenderLaneText(lanes, t.Duration(), width);
        return 0;
    }

    // Dry run of the playback loop: poll once per tick and report changes.
    int CmdPreview(Args& args, CommandContext& ctx)
    {
        TimeMs tick = ctx.settings.previewTickMs;
        if (auto v = TakeOption(args, "tick")) tick = ParseInteger(*v, "tick");
        if (tick <= 0) throw ValidationError("Tick must be > 0");
        RequireArgs(args, 1, "preview <test.json> [--tick N]");
        Timeline t = LoadInput(args[0], ctx);

        std::set<EventID> previous;
        auto step = [&](TimeMs now) {
            std::set<EventID> current;
            for (const auto* e : t.GetEventsAtTime(now)) current.insert(e->id);
            for (EventID id : current)
                if (!previous.count(id)) ctx.out << std::setw(8) << now << "ms  + " << Describe(*t.FindEvent(id)) << "\n";
            for (EventID id : previous)
                if (!current.count(id)) ctx.out << std::setw(8) << now << "ms  - " << Describe(*t.FindEvent(id)) << "\n";
            previous = std::move(current);
        };
        for (TimeMs now = 0; now <= t.Duration(); now += tick) step(now);
        step(t.Duration() + tick);
        ctx.out << "Preview finished at " << t.Duration() << "ms\n";
        return 0;
    }

    int CmdExport(Args& args, CommandContext& ctx)
    {
        std::optional<std::string> selector = TakeOption(args, "format");
        RequireArgs(args, 2, "export <test.json> <out> [--format json|eeglab|eprime|csv|bids]");
        Timeline t = LoadInput(args[0], ctx);
        formats::ExportFormat format = selector ? formats::ParseExportFormat(*selector)
                                                : formats::DetectFormatFromPath(args[1]);
        formats::ExportTimeline(t.ToSerializable(), args[1], format, ctx.store);
        ctx.out << "Exported " << t.Size() << " events to " << args[1] << " (" << formats::ToSelector(format) << ")\n";
        ctx.settings.AddRecentTest(args[0]);
        ctx.settingsChanged = true;
        return 0;
    }

    int CmdValidate(Args& args, CommandContext& ctx)
    {
        RequireArgs(args, 1, "validate <test.json>");
        Timeline t = LoadInput(args[0], ctx);
        auto issues = CollectValidationIssues(t);
        for (const auto& issue : issues) ctx.out << issue << "\n";
        ctx.out << (issues.empty() ? "OK: " : "Invalid: ") << t.Size() << " events, " << issues.size() << " issues\n";
        return issues.empty() ? 0 : 1;
    }

    int CmdTone(Args& args, CommandContext& ctx)
    {
        double amplitude = audio::kDefaultAmplitude;
        int rate = audio::kDefaultSampleRate;
        if (auto a = TakeOption(args, "amplitude")) amplitude = ParseNumber(*a, "amplitude");
        if (auto r = TakeOption(args, "rate")) rate = static_cast<int>(ParseInteger(*r, "sample rate"));
        RequireArgs(args, 3, "tone <freq_hz> <duration_s> <out.wav> [--amplitude a] [--rate r]");
        auto samples = audio::GenerateTone(ParseNumber(args[0], "frequency"), ParseNumber(args[1], "duration"), amplitude, rate);
        audio::SaveTone(samples, args[2], ctx.store, rate);
        ctx.out << "Wrote " << args[2] << " (" << samples.size() << " samples)\n";
        return 0;
    }

    int CmdTones(Args& args, CommandContext& ctx)
    {
        double amplitude = audio::kDefaultAmplitude;
        std::string prefix = "tone";
        if (auto a = TakeOption(args, "amplitude")) amplitude = ParseNumber(*a, "amplitude");
        if (auto p = TakeOption(args, "prefix")) prefix = *p;
        RequireArgs(args, 5, "tones <start_hz> <end_hz> <step_hz> <duration_s> <dir> [--amplitude a] [--prefix p]");
        auto files = audio::GenerateFrequencyRange(ParseNumber(args[0], "start frequency"), ParseNumber(args[1], "end frequency"),
                                                   ParseNumber(args[2], "step"), ParseNumber(args[3], "duration"),
                                                   args[4], ctx.store, amplitude, prefix);
        for (const auto& f : files) ctx.out << f << "\n";
        return 0;
    }

    int CmdRecent(Args&, CommandContext& ctx)
    {
        auto recent = ctx.settings.ExistingRecentTests(ctx.store);
        if (recent.empty()) ctx.out << "No recent tests\n";
        for (const auto& p : recent) ctx.out << p << "\n";
        return 0;
    }
}

Timeline BuildDemoTimeline()
{
    Timeline t;
    t.SetName("Visual-Auditory Attention Test");
    t.SetDescription("Fixation, warning beep, target with tone, distractor");
    t.AddEvent(MakeImageEvent(0,    500,  "stimuli/fixation.png"));
    t.AddEvent(MakeAudioEvent(500,  200,  "stimuli/beep.wav", 0.8));
    t.AddEvent(MakeImageEvent(1000, 2000, "stimuli/target.png", ImagePosition::Center, 10));
    t.AddEvent(MakeAudioEvent(1000, 1000, "stimuli/tone.wav", 1.0, 20));
    t.AddEvent(MakeImageEvent(2500, 1000, "stimuli/distractor.png", ImagePosition::TopRight, 30));
    return t;
}

void PrintUsage(std::ostream& out)
{
    out << "Usage: ntm [--settings path] [--quiet] <command> [args]\n\n"
           "Commands:\n"
           "  demo [out.json]                          build, check, save and reload the demo test\n"
           "  info <test.json>                         metadata and event listing\n"
           "  at <test.json> <t_ms> [--tolerance N]    events active at an instant\n"
           "  lanes <test.json> [--width N]            non-overlapping lane layout\n"
           "  preview <test.json> [--tick N]           dry run of playback, prints on/off changes\n"
           "  export <test.json> <out> [--format F]    json, eeglab, eprime, csv, bids\n"
           "  validate <test.json>                     range-check every event\n"
           "  tone <hz> <seconds> <out.wav>            sine tone (--amplitude, --rate)\n"
           "  tones <start> <end> <step> <s> <dir>     one tone file per frequency\n"
           "  recent                                   recently exported tests\n";
}

int RunCommand(const std::string& name, Args args, CommandContext& ctx)
{
    if (name == "demo")     return CmdDemo(args, ctx);
    if (name == "info")     return CmdInfo(args, ctx);
    if (name == "at")       return CmdAt(args, ctx);
    if (name == "lanes")    return CmdLanes(args, ctx);
    if (name == "preview")  return CmdPreview(args, ctx);
    if (name == "export")   return CmdExport(args, ctx);
    if (name == "validate") return CmdValidate(args, ctx);
    if (name == "tone")     return CmdTone(args, ctx);
    if (name == "tones")    return CmdTones(args, ctx);
    if (name == "recent")   return CmdRecent(args, ctx);
    PrintUsage(ctx.out);
    return 2;
}

} // namespace cli
} // namespace ntm
