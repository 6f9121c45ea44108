// tests/test_core_log.cpp
//
// core::InitLogging sink selection and core::ParseLogLevel.

#include <doctest/doctest.h>

#include "skywatch/core/Log.hpp"

#include "support/EngineFakes.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace skywatch;

namespace {

std::string read_text(const fs::path& p)
{
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// Puts the test logger back once InitLogging has replaced it.
struct RestoreDefaultLogger
{
    std::shared_ptr<spdlog::logger> previous = spdlog::default_logger();
    spdlog::level::level_enum       level    = spdlog::get_level();

    ~RestoreDefaultLogger()
    {
        spdlog::set_default_logger(previous);
        spdlog::set_level(level);
        spdlog::drop("skywatch");
    }
};

struct RestoreWorkingDirectory
{
    fs::path previous = fs::current_path();
    ~RestoreWorkingDirectory()
    {
        std::error_code ec;
        fs::current_path(previous, ec);
    }
};

} // namespace

TEST_CASE("ParseLogLevel maps unknown names to info")
{
    CHECK(core::ParseLogLevel("debug") == spdlog::level::debug);
    CHECK(core::ParseLogLevel("warn") == spdlog::level::warn);
    CHECK(core::ParseLogLevel("off") == spdlog::level::off);
    CHECK(core::ParseLogLevel("loud") == spdlog::level::info);
}

TEST_CASE("InitLogging writes to the log file and reports no console fallback")
{
    const fs::path dir = testing::MakeUniqueTempDir("log_file");
    std::string text;
    {
        RestoreDefaultLogger restore;

        core::LogOptions opts;
        opts.dir     = dir / "logs";
        opts.level   = "debug";
        opts.console = false;

        auto logger = core::InitLogging(opts);
        REQUIRE(logger);
        spdlog::info("weather log check");
        logger->flush();
        text = read_text(opts.dir / "skywatch.log");
    }

    CHECK(text.find("weather log check") != std::string::npos);
    CHECK(text.find("console only") == std::string::npos);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("InitLogging: a failed directory create does not count as a console fallback")
{
    // An empty directory makes create_directories report an error while the log file
    // still opens relative to the working directory.
    const fs::path dir = testing::MakeUniqueTempDir("log_cwd");

    std::string text;
    {
        RestoreWorkingDirectory cwd;
        fs::current_path(dir);
        RestoreDefaultLogger restore;

        core::LogOptions opts;
        opts.dir     = fs::path();
        opts.level   = "info";
        opts.console = false;

        auto logger = core::InitLogging(opts);
        REQUIRE(logger);
        spdlog::info("relative log check");
        logger->flush();
        text = read_text(dir / "skywatch.log");
    }

    CHECK(text.find("relative log check") != std::string::npos);
    CHECK(text.find("console only") == std::string::npos);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
