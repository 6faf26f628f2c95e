#include "formats/ExportFormats.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include "core/Errors.h"
#include "core/Logger.h"
#include "formats/DelimitedWriter.h"
#include "io/FileSystem.h"
#include "timeline/TimelineSerializer.h"

namespace ntm {
namespace formats {

namespace {
    const char* kExporterName = "Neuroscience Test Maker";
    const char* kUtf8Bom = "\xEF\xBB\xBF";

    // One export row, read leniently from the serializable form
    struct ExportRow {
        long long onsetMs = 0;
        long long durationMs = 0;
        std::string eventType = "unknown";
        std::string filePath;
        int markerCode = 1;
    };

    struct ExportInput {
        std::string name = "Untitled";
        std::string description;
        std::vector<ExportRow> rows; // ascending onset, stable
    };

    long long ReadMs(const json& obj, const char* key)
    {
        auto it = obj.find(key);
        if (it == obj.end()) return 0;
        if (it->is_number_integer()) return it->get<long long>();
        if (it->is_number()) return std::llround(it->get<double>());
        return 0;
    }

    std::string ReadString(const json& obj, const char* key, const std::string& fallback)
    {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_string()) return fallback;
        return it->get<std::string>();
    }

    ExportInput ReadInput(const json& timeline)
    {
        if (!timeline.is_object()) throw FormatError("Cannot export: timeline data must be an object");

        ExportInput in;
        if (auto it = timeline.find("metadata"); it != timeline.end() && it->is_object()) {
            in.name = ReadString(*it, "name", in.name);
            in.description = ReadString(*it, "description", in.description);
        }

        auto eventsIt = timeline.find("events");
        if (eventsIt == timeline.end() || eventsIt->is_null()) return in;
        if (!eventsIt->is_array()) throw FormatError("Cannot export: 'events' must be an array");

        static const json kEmpty = json::object();
        for (const auto& ej : *eventsIt) {
            if (!ej.is_object()) throw FormatError("Cannot export: event entries must be objects");
            auto dataIt = ej.find("data");
            const json& data = (dataIt != ej.end() && dataIt->is_object()) ? *dataIt : kEmpty;

            ExportRow row;
            row.onsetMs = ReadMs(ej, "timestamp_ms");
            row.eventType = ReadString(ej, "event_type", row.eventType);
            row.durationMs = ReadMs(data, "duration_ms");
            row.filePath = ReadString(data, "file_path", ReadString(data, "filepath", ""));
            // Codes outside int range are treated like a missing code
            if (auto mc = data.find("marker_code"); mc != data.end() && mc->is_number_integer()) {
                auto v = mc->get<std::int64_t>();
                if (v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max())
                    row.markerCode = static_cast<int>(v);
            }
            in.rows.push_back(std::move(row));
        }
        std::stable_sort(in.rows.begin(), in.rows.end(),
                         [](const ExportRow& a, const ExportRow& b){ return a.onsetMs < b.onsetMs; });
        return in;
    }

    std::string ToLower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string ToUpper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        return s;
    }

    // Milliseconds as seconds with exactly three decimals, without going
    // through floating point.
    std::string MsToSeconds(long long ms)
    {
        std::string sign = ms < 0 ? "-" : "";
        unsigned long long a = ms < 0 ? 0ull - static_cast<unsigned long long>(ms) : static_cast<unsigned long long>(ms);
        std::string frac = std::to_string(a % 1000);
        frac.insert(0, 3 - frac.size(), '0');
        return sign + std::to_string(a / 1000) + "." + frac;
    }
}

std::string StimulusFileName(const std::string& path)
{
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string StimulusFileStem(const std::string& path)
{
    std::string name = StimulusFileName(path);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return name;
    return name.substr(0, dot);
}

// ---------------- Selection ----------------
const std::vector<FormatInfo>& GetFormatInfo()
{
    static const std::vector<FormatInfo> s_Info = {
        { ExportFormat::Json,      "json",   "JSON Format",       ".json", "Native format (editable)" },
        { ExportFormat::Eeglab,    "eeglab", "EEGLAB Event List", ".txt",  "Tab-delimited event markers for EEGLAB" },
        { ExportFormat::EPrime,    "eprime", "E-Prime Format",    ".txt",  "Tab-delimited format for E-Prime" },
        { ExportFormat::MarkerCsv, "csv",    "Marker Code CSV",   ".csv",  "Onset, duration and trigger code per event" },
        { ExportFormat::BidsTsv,   "bids",   "BIDS Events",       ".tsv",  "BIDS events.tsv (onset/duration in seconds)" },
    };
    return s_Info;
}

const char* ToSelector(ExportFormat format)
{
    for (const auto& info : GetFormatInfo()) if (info.format == format) return info.selector;
    return "json";
}

ExportFormat ParseExportFormat(const std::string& selector)
{
    const std::string s = ToLower(selector);
    for (const auto& info : GetFormatInfo()) if (s == info.selector) return info.format;
    if (s == "e-prime") return ExportFormat::EPrime;
    if (s == "tsv") return ExportFormat::BidsTsv;
    throw UnsupportedFormatError(selector);
}

ExportFormat DetectFormatFromPath(const std::string& path)
{
    std::filesystem::path p(path);
    const std::string ext = ToLower(p.extension().string());
    if (ext == ".json") return ExportFormat::Json;
    if (ext == ".txt") {
        const std::string stem = ToLower(p.stem().string());
        if (stem.find("eeglab") != std::string::npos || stem.find("eeg") != std::string::npos)
            return ExportFormat::Eeglab;
        if (stem.find("eprime") != std::string::npos || stem.find("e-prime") != std::string::npos)
            return ExportFormat::EPrime;
        return ExportFormat::Eeglab;
    }
    if (ext == ".csv") return ExportFormat::MarkerCsv;
    if (ext == ".tsv") return ExportFormat::BidsTsv;
    return ExportFormat::Json;
}

// ---------------- Formatters ----------------
std::string FormatNativeJson(const json& timeline)
{
    if (!timeline.is_object()) throw FormatError("Cannot export: timeline data must be an object");
    return DumpTimelineJson(timeline);
}

std::string FormatEeglab(const json& timeline)
{
    const ExportInput in = ReadInput(timeline);
    const std::vector<std::string> header = {"Latency(ms)", "Type", "Duration(ms)", "EventID", "StimulusFile"};

    DelimitedWriter w('\t', "\r\n");
    w.WriteRow(header);
    w.WriteRow({std::string("# Exported from ") + kExporterName});
    w.WriteRow({"# Test: " + in.name});
    w.WriteRow({"# Description: " + in.description});
    w.WriteBlankRow();
    w.WriteRow(header);

    size_t index = 0;
    for (const auto& r : in.rows) {
        w.WriteRow({std::to_string(r.onsetMs), r.eventType, std::to_string(r.durationMs),
                    std::to_string(++index), StimulusFileName(r.filePath)});
    }
    return w.Str();
}

std::string FormatEPrime(const json& timeline)
{
    const ExportInput in = ReadInput(timeline);

    DelimitedWriter w('\t', "\r\n");
    w.WriteRaw(kUtf8Bom);
    w.WriteRow({"*** Header Start ***"});
    w.WriteRow({"VersionNumber:", "1.0"});
    w.WriteRow({"LevelName:", "Session"});
    w.WriteRow({"Title:", in.name});
    w.WriteRow({"Description:", in.description});
    w.WriteRow({"Exported:", kExporterName});
    w.WriteRow({"*** Header End ***"});
    w.WriteBlankRow();
    w.WriteRow({"Procedure", "Trial", "Stimulus", "StimulusFile", "OnsetTime", "Duration", "Type", "Modality"});

    size_t index = 0;
    for (const auto& r : in.rows) {
        ++index;
        std::string stimulus = r.eventType + "_" + std::to_string(index);
        std::string file;
        if (!r.filePath.empty()) {
            file = StimulusFileName(r.filePath);
            stimulus = StimulusFileStem(file);
        }
        w.WriteRow({"TrialProc", std::to_string(index), stimulus, file,
                    std::to_string(r.onsetMs), std::to_string(r.durationMs),
                    r.eventType, ToUpper(r.eventType)});
    }
    w.WriteBlankRow();
    w.WriteRow({"*** End of data ***"});
    return w.Str();
}

std::string FormatMarkerCsv(const json& timeline)
{
    const ExportInput in = ReadInput(timeline);
    DelimitedWriter w(',', "\n");
    w.WriteRow({"onset_ms", "duration_ms", "marker_code", "event_type", "stimulus_file"});
    for (const auto& r : in.rows) {
        w.WriteRow({std::to_string(r.onsetMs), std::to_string(r.durationMs), std::to_string(r.markerCode),
                    r.eventType, StimulusFileName(r.filePath)});
    }
    return w.Str();
}

std::string FormatBidsTsv(const json& timeline)
{
    const ExportInput in = ReadInput(timeline);
    DelimitedWriter w('\t', "\n");
    w.WriteRow({"onset", "duration", "value", "event_type", "stim_file"});
    for (const auto& r : in.rows) {
        std::string file = StimulusFileName(r.filePath);
        w.WriteRow({MsToSeconds(r.onsetMs), MsToSeconds(r.durationMs), std::to_string(r.markerCode),
                    r.eventType, file.empty() ? "n/a" : file});
    }
    return w.Str();
}

std::string FormatTimeline(const json& timeline, ExportFormat format)
{
    switch (format) {
        case ExportFormat::Json:      return FormatNativeJson(timeline);
        case ExportFormat::Eeglab:    return FormatEeglab(timeline);
        case ExportFormat::EPrime:    return FormatEPrime(timeline);
        case ExportFormat::MarkerCsv: return FormatMarkerCsv(timeline);
        case ExportFormat::BidsTsv:   return FormatBidsTsv(timeline);
    }
    throw UnsupportedFormatError(std::to_string(static_cast<int>(format)));
}

// ---------------- Files ----------------
void ExportTimeline(const json& timeline, const std::string& path, ExportFormat format, IFileStore& store)
{
    const std::string contents = FormatTimeline(timeline, format);
    store.WriteTextFile(path, contents);

    size_t count = 0;
    if (auto it = timeline.find("events"); it != timeline.end() && it->is_array()) count = it->size();
    Logger::Log(std::string("[Export] Wrote ") + std::to_string(count) + " events as " + ToSelector(format) + " to " + path);
}

void ExportTimeline(const json& timeline, const std::string& path, const std::string& selector, IFileStore& store)
{
    ExportTimeline(timeline, path, ParseExportFormat(selector), store);
}

void ExportTimeline(const json& timeline, const std::string& path, ExportFormat format)
{
    ExportTimeline(timeline, path, format, DiskFileStore::Instance());
}

} // namespace formats
} // namespace ntm
