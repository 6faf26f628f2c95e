#pragma once
#include <string>
#include <vector>
#include "timeline/StimulusEvent.h"

namespace ntm {

class IFileStore;

// User configuration persisted as JSON next to the recent-tests list.
class Settings {
public:
    static constexpr size_t kMaxRecentTests = 10;

    // $NTM_SETTINGS, else $HOME/.neuroscience_test_maker/settings.json,
    // else settings.json in the working directory.
    static std::string DefaultPath();

    // Missing file -> defaults. Malformed file -> FormatError.
    static Settings Load(const std::string& path, const IFileStore& store);
    // Creates the parent directory when needed.
    void Save(const std::string& path, IFileStore& store) const;

    // Moves `path` to the front; the list stays de-duplicated and capped.
    void AddRecentTest(const std::string& path);
    const std::vector<std::string>& RecentTests() const { return m_RecentTests; }
    // Recent entries whose files still exist in `store`.
    std::vector<std::string> ExistingRecentTests(const IFileStore& store) const;

    std::string exportFormat = "json";
    TimeMs toleranceMs = 0;
    TimeMs previewTickMs = 16;

private:
    std::vector<std::string> m_RecentTests;
};

} // namespace ntm
