#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "cli/Commands.h"
#include "config/Settings.h"
#include "core/Errors.h"
#include "core/Logger.h"
#include "io/FileSystem.h"

int main(int argc, char** argv)
{
    using namespace ntm;

    std::vector<std::string> args(argv + 1, argv + argc);
    std::string settingsPath = Settings::DefaultPath();
    bool quiet = false;

    // Global options come before the command name
    size_t i = 0;
    for (; i < args.size(); ++i) {
        if (args[i] == "--quiet") quiet = true;
        else if (args[i] == "--settings" && i + 1 < args.size()) settingsPath = args[++i];
        else break;
    }
    if (i >= args.size() || args[i] == "--help" || args[i] == "help") {
        cli::PrintUsage(std::cout);
        return i >= args.size() ? 2 : 0;
    }

    Logger::SetCallback([quiet](const std::string& message, LogLevel level) {
        if (quiet && level == LogLevel::Info) return;
        std::cerr << "[" << ToString(level) << "] " << message << std::endl;
    });

    const std::string command = args[i];
    cli::Args commandArgs(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());

    try {
        auto& store = DiskFileStore::Instance();
        Settings settings = Settings::Load(settingsPath, store);
        cli::CommandContext ctx{store, settings, std::cout};
        int status = cli::RunCommand(command, std::move(commandArgs), ctx);
        if (ctx.settingsChanged) {
            try {
                settings.Save(settingsPath, store);
            } catch (const IOError& e) {
                Logger::LogWarning(std::string("[Settings] Recent tests not saved: ") + e.what());
            }
        }
        return status;
    } catch (const Error& e) {
        Logger::LogError(e.what());
        return 1;
    }
}
