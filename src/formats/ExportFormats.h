#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ntm {

class IFileStore;

namespace formats {

using json = nlohmann::json;

enum class ExportFormat {
    Json,      // native, reloadable
    Eeglab,    // tab-delimited marker list
    EPrime,    // procedure/trial table
    MarkerCsv, // onset, duration, marker code
    BidsTsv    // BIDS events.tsv, seconds
};

struct FormatInfo {
    ExportFormat format;
    const char* selector;   // value accepted by ParseExportFormat
    const char* name;
    const char* extension;
    const char* description;
};

const std::vector<FormatInfo>& GetFormatInfo();
const char* ToSelector(ExportFormat format);

// Throws UnsupportedFormatError for unknown selectors. Case-insensitive.
ExportFormat ParseExportFormat(const std::string& selector);

// .json -> Json; .txt -> Eeglab, or EPrime when the file stem mentions
// "eprime"/"e-prime" (and not "eeglab"/"eeg"); .csv -> MarkerCsv;
// .tsv -> BidsTsv; anything else -> Json.
ExportFormat DetectFormatFromPath(const std::string& path);

// Formatters take the Timeline::ToSerializable() structure, or any data of
// that shape, and never assume its events are already ordered. Malformed
// roots throw FormatError.
std::string FormatNativeJson(const json& timeline);
std::string FormatEeglab(const json& timeline);
std::string FormatEPrime(const json& timeline);
std::string FormatMarkerCsv(const json& timeline);
std::string FormatBidsTsv(const json& timeline);
std::string FormatTimeline(const json& timeline, ExportFormat format);

// Writes one export file. IOError when the path cannot be written; nothing
// is retried.
void ExportTimeline(const json& timeline, const std::string& path, ExportFormat format, IFileStore& store);
void ExportTimeline(const json& timeline, const std::string& path, const std::string& selector, IFileStore& store);
void ExportTimeline(const json& timeline, const std::string& path, ExportFormat format);

// Base name and base name without its last extension, for paths written
// with either separator.
std::string StimulusFileName(const std::string& path);
std::string StimulusFileStem(const std::string& path);

} // namespace formats
} // namespace ntm
