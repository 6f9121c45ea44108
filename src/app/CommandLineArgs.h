#pragma once

#include "skywatch/core/Config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skywatch::app {

// Parsed command-line arguments for the skywatch executable.
//
// Notes:
//   - Option names are case-insensitive; values are kept as typed.
//   - Both "--flag=value" and "--flag value" forms are supported.
//   - Anything that is not an option (including negative numbers) is positional:
//     the first positional is the command, the rest are its operands.
struct CommandLineArgs
{
    bool showHelp = false;                       // --help / -h / -?

    std::optional<std::string> configPath;       // --config <file>
    std::optional<std::string> storePath;        // --store <file>
    std::optional<std::string> logLevel;         // --log-level <level>
    std::optional<core::Role>  role;             // --role gm|observer, --gm, --observer
    std::optional<bool>        useCelsius;       // --celsius / --fahrenheit
    std::optional<std::uint64_t> seed;           // --seed <n>
    std::optional<bool>        consoleLog;       // --quiet

    std::vector<std::string> positional;

    // Unknown options and bad values, in the order they were seen.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

// Applies the overrides on top of a loaded config.
void ApplyOverrides(const CommandLineArgs& args, core::Config& cfg);

} // namespace skywatch::app
