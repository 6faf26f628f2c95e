#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "timeline/Timeline.h"

namespace ntm {

class IFileStore;
class Settings;

namespace cli {

using Args = std::vector<std::string>;

struct CommandContext {
    IFileStore& store;
    Settings& settings;
    std::ostream& out;
    bool settingsChanged = false;
};

// Returns the process exit status. ntm::Error propagates to the caller.
int RunCommand(const std::string& name, Args args, CommandContext& ctx);
void PrintUsage(std::ostream& out);

// Fixation / beep / target + tone / distractor attention test.
Timeline BuildDemoTimeline();

} // namespace cli
} // namespace ntm
