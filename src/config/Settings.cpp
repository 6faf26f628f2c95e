#include "config/Settings.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "core/Logger.h"
#include "io/FileSystem.h"

namespace ntm {

using json = nlohmann::json;

std::string Settings::DefaultPath()
{
    if (const char* env = std::getenv("NTM_SETTINGS"); env && *env) return env;
    if (const char* home = std::getenv("HOME"); home && *home)
        return (std::filesystem::path(home) / ".neuroscience_test_maker" / "settings.json").string();
    return "settings.json";
}

Settings Settings::Load(const std::string& path, const IFileStore& store)
{
    Settings s;
    if (!store.Exists(path)) {
        Logger::Log("[Settings] No settings at " + path + ", using defaults");
        return s;
    }

    json j;
    try {
        j = json::parse(store.ReadTextFile(path));
    } catch (const json::parse_error& e) {
        throw FormatError("Invalid settings file " + path + ": " + e.what());
    }
    if (!j.is_object()) throw FormatError("Invalid settings file " + path + ": root must be an object");

    try {
        s.exportFormat = j.value("export_format", s.exportFormat);
        s.toleranceMs = j.value("tolerance_ms", s.toleranceMs);
        s.previewTickMs = j.value("preview_tick_ms", s.previewTickMs);
        if (j.contains("recent_tests")) {
            if (!j["recent_tests"].is_array())
                throw FormatError("Invalid settings file " + path + ": recent_tests must be an array");
            for (const auto& p : j["recent_tests"]) {
                if (s.m_RecentTests.size() >= kMaxRecentTests) break;
                s.m_RecentTests.push_back(p.get<std::string>());
            }
        }
    } catch (const json::type_error& e) {
        throw FormatError("Invalid settings file " + path + ": " + e.what());
    }
    if (s.previewTickMs <= 0) throw FormatError("Invalid settings file " + path + ": preview_tick_ms must be > 0");
    return s;
}

void Settings::Save(const std::string& path, IFileStore& store) const
{
    std::string parent = ParentPath(path);
    if (!parent.empty() && !store.Exists(parent)) store.CreateDirectories(parent);

    json j;
    j["export_format"] = exportFormat;
    j["tolerance_ms"] = toleranceMs;
    j["preview_tick_ms"] = previewTickMs;
    j["recent_tests"] = m_RecentTests;
    // Paths need not be valid UTF-8; bad bytes become U+FFFD
    store.WriteTextFile(path, j.dump(2, ' ', false, json::error_handler_t::replace));
}

void Settings::AddRecentTest(const std::string& path)
{
    m_RecentTests.erase(std::remove(m_RecentTests.begin(), m_RecentTests.end(), path), m_RecentTests.end());
    m_RecentTests.insert(m_RecentTests.begin(), path);
    if (m_RecentTests.size() > kMaxRecentTests) m_RecentTests.resize(kMaxRecentTests);
}

std::vector<std::string> Settings::ExistingRecentTests(const IFileStore& store) const
{
    std::vector<std::string> out;
    for (const auto& p : m_RecentTests) if (store.Exists(p)) out.push_back(p);
    return out;
}

} // namespace ntm
