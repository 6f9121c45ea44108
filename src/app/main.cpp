// skywatch command-line host.
//
// Each invocation is one instance joining the shared world file: it bootstraps (the
// game master generates a first record when the file has none), runs one command, and
// exits. Several invocations against the same --store behave like several clients.
// With "-" as the only operand, commands are read from stdin instead, which keeps one
// instance alive across many ticks.

#include "app/CommandLineArgs.h"
#include "app/CommandRunner.h"

#include "skywatch/authority/AuthorityGate.hpp"
#include "skywatch/core/Config.hpp"
#include "skywatch/core/Log.hpp"
#include "skywatch/engine/WeatherEngine.hpp"
#include "skywatch/store/KeyValueStore.hpp"
#include "skywatch/weather/WeatherGenerator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>

int main(int argc, char** argv)
{
    using namespace skywatch;

    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::cout << app::BuildCommandLineHelpText();
        return app::kExitOk;
    }

    if (!args.unknown.empty())
    {
        for (const auto& u : args.unknown)
            std::cerr << "unknown or incomplete option: " << u << "\n";
        std::cerr << "\n" << app::BuildCommandLineHelpText();
        return app::kExitUsage;
    }

    core::Config cfg;
    const std::filesystem::path configPath = args.configPath ? *args.configPath : core::kConfigFileName;
    const bool haveConfigFile = core::LoadConfig(cfg, configPath);
    app::ApplyOverrides(args, cfg);

    core::LogOptions logOpts;
    logOpts.dir     = cfg.logDir;
    logOpts.level   = cfg.logLevel;
    logOpts.async   = cfg.asyncLogging;
    logOpts.console = cfg.consoleLog;
    core::InitLogging(logOpts);

    if (!haveConfigFile)
        spdlog::debug("No config at {}, using defaults", configPath.string());

    spdlog::info("skywatch starting. role={}, store={}", core::RoleName(cfg.role), cfg.storePath.string());

    const std::uint64_t seed = cfg.generatorSeed != 0
        ? cfg.generatorSeed
        : static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());

    store::JsonFileStore worldStore(cfg.storePath);
    weather::SeasonalWeatherGenerator generator(seed);
    authority::StaticRole role(cfg.role == core::Role::GameMaster);

    auto created = engine::WeatherEngine::Create(engine::EngineDependencies{worldStore, generator, role});
    if (!created)
    {
        std::cerr << "error: " << engine::EngineErrorCodeName(created.error().code)
                  << ": " << created.error().message << "\n";
        spdlog::shutdown();
        return app::kExitFailure;
    }

    engine::WeatherEngine& weatherEngine = **created;

    // Only the game master publishes its unit preference; observers keep theirs local.
    if (weatherEngine.IsAuthoritative())
    {
        if (auto w = weatherEngine.SetUseCelsius(cfg.useCelsius); !w)
            spdlog::warn("Cannot store unit preference: {}", w.error().message);
    }
    else
    {
        weatherEngine.SetLocalUnits(cfg.useCelsius);
    }

    app::CommandRunner runner(weatherEngine, std::cout, std::cerr);
    const bool script = args.positional.size() == 1 && args.positional[0] == "-";
    const int rc = script ? runner.RunScript(std::cin) : runner.Run(args.positional);

    spdlog::info("skywatch shutdown (exit {}).", rc);
    spdlog::shutdown();
    return rc;
}
