#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <sstream>

namespace skywatch::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value" -> value. The name part of `arg` is already lower-cased by the caller,
// the value comes from the untouched original.
[[nodiscard]] bool ConsumeValue(std::string_view lowered,
                                std::string_view raw,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(lowered, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (lowered.size() == n || lowered[n] != '=')
        return false;

    outValue = raw.substr(n + 1);
    return true;
}

[[nodiscard]] bool IsOption(std::string_view s)
{
    if (s.size() < 2 || s[0] != '-')
        return false;
    // "-5" is an operand (e.g. a window offset), not an option.
    return !std::isdigit(static_cast<unsigned char>(s[1]));
}

[[nodiscard]] std::optional<std::uint64_t> ParseU64(std::string_view s)
{
    std::uint64_t v = 0;
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (s.empty() || ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    bool optionsDone = false;
    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        if (optionsDone || !IsOption(raw))
        {
            out.positional.emplace_back(raw);
            continue;
        }

        if (raw == "--")
        {
            optionsDone = true;
            continue;
        }

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }

        if (arg == "--gm")         { out.role = core::Role::GameMaster; continue; }
        if (arg == "--observer")   { out.role = core::Role::Observer; continue; }
        if (arg == "--celsius")    { out.useCelsius = true; continue; }
        if (arg == "--fahrenheit") { out.useCelsius = false; continue; }
        if (arg == "--quiet" || arg == "-q") { out.consoleLog = false; continue; }

        // Options with values
        std::string_view value;

        auto optionNamed = [&](std::string_view name) -> bool {
            if (arg == name)
            {
                if (i + 1 >= argv.size())
                    return false;
                value = argv[++i];
                return true;
            }
            return ConsumeValue(arg, raw, name, value);
        };

        if (optionNamed("--config"))
        {
            out.configPath = std::string(value);
            continue;
        }
        if (optionNamed("--store"))
        {
            out.storePath = std::string(value);
            continue;
        }
        if (optionNamed("--log-level"))
        {
            out.logLevel = ToLower(value);
            continue;
        }
        if (optionNamed("--role"))
        {
            core::Role parsed{};
            if (core::ParseRole(value, parsed))
                out.role = parsed;
            else
                addUnknown(raw);
            continue;
        }
        if (optionNamed("--seed"))
        {
            if (const auto parsed = ParseU64(value))
                out.seed = *parsed;
            else
                addUnknown(raw);
            continue;
        }

        // Unknown names, and known value options at the end of argv without a value.
        addUnknown(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i]);
    return ParseCommandLineArgsFromArgv(v);
}

void ApplyOverrides(const CommandLineArgs& args, core::Config& cfg)
{
    if (args.storePath)  cfg.storePath     = *args.storePath;
    if (args.logLevel)   cfg.logLevel      = *args.logLevel;
    if (args.role)       cfg.role          = *args.role;
    if (args.useCelsius) cfg.useCelsius    = *args.useCelsius;
    if (args.seed)       cfg.generatorSeed = *args.seed;
    if (args.consoleLog) cfg.consoleLog    = *args.consoleLog;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "skywatch - shared campaign weather\n\n";
    oss << "Usage: skywatch [options] <command> [operands]\n";
    oss << "       skywatch [options] -        (commands from stdin, one per line)\n\n";

    oss << "Commands\n";
    oss << "  show                          Print the current weather panel\n";
    oss << "  tick <json>                   Feed one calendar reading (JSON object)\n";
    oss << "  tick <y> <m> <d> <h> <mi> <s> Feed one calendar reading from numbers\n";
    oss << "  regenerate [c h s]            New weather from the stored (or given) selection\n";
    oss << "  climate|humidity|season <v>   Store one selection value\n";
    oss << "  biome <id>                    Store a biome and its climate/humidity\n";
    oss << "  biomes                        List the known biomes\n";
    oss << "  reload                        Re-read the shared record\n";
    oss << "  move <left> <top>             Store this instance's window position\n\n";

    oss << "Options\n";
    oss << "  --config <file>               Settings file (default skywatch.ini)\n";
    oss << "  --store <file>                Shared world store (JSON)\n";
    oss << "  --role gm|observer            Who this instance is (also --gm / --observer)\n";
    oss << "  --celsius / --fahrenheit      Temperature units\n";
    oss << "  --seed <n>                    Generator seed (0 = from the clock)\n";
    oss << "  --log-level <level>           trace, debug, info, warn, error, critical, off\n";
    oss << "  --quiet, -q                   Log to file only\n";
    oss << "  --help, -h                    Show this help\n\n";

    oss << "Examples\n";
    oss << "  skywatch --gm tick 1492 3 14 8 0 0\n";
    oss << "  skywatch --gm biome desert\n";
    oss << "  skywatch --observer reload\n";
    return oss.str();
}

} // namespace skywatch::app
