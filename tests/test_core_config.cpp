// tests/test_core_config.cpp
//
// Regression/robustness tests for skywatch/core/Config.
//
// Goals:
//   - Saving writes skywatch.ini and loading round-trips values
//   - Corrupt values do not throw and leave defaults in place
//   - Inline comments and a UTF-8 BOM are tolerated

#include <doctest/doctest.h>

#include "skywatch/core/Config.hpp"

#include "support/EngineFakes.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace skywatch;

namespace {

void write_text(const fs::path& p, const std::string& text)
{
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << text;
}

} // namespace

TEST_CASE("core::SaveConfig writes skywatch.ini and core::LoadConfig round-trips values")
{
    const fs::path dir = testing::MakeUniqueTempDir("config_roundtrip");
    const fs::path file = dir / "sub" / core::kConfigFileName;

    core::Config cfg;
    cfg.storePath     = "campaign/world.json";
    cfg.logDir        = "var/log";
    cfg.logLevel      = "debug";
    cfg.asyncLogging  = true;
    cfg.consoleLog    = false;
    cfg.role          = core::Role::Observer;
    cfg.useCelsius    = true;
    cfg.generatorSeed = 424242;

    CHECK(core::SaveConfig(cfg, file));

    core::Config loaded;
    CHECK(core::LoadConfig(loaded, file));
    CHECK(loaded.storePath == fs::path("campaign/world.json"));
    CHECK(loaded.logDir == fs::path("var/log"));
    CHECK(loaded.logLevel == "debug");
    CHECK(loaded.asyncLogging);
    CHECK_FALSE(loaded.consoleLog);
    CHECK(loaded.role == core::Role::Observer);
    CHECK(loaded.useCelsius);
    CHECK(loaded.generatorSeed == 424242u);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig returns false for a missing file (first run)")
{
    const fs::path dir = testing::MakeUniqueTempDir("config_missing");

    core::Config cfg;
    CHECK_FALSE(core::LoadConfig(cfg, dir / core::kConfigFileName));
    CHECK(cfg.role == core::Role::GameMaster);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig ignores invalid values and unknown keys")
{
    const fs::path dir = testing::MakeUniqueTempDir("config_invalid");
    const fs::path file = dir / core::kConfigFileName;
    write_text(file,
               "role=wizard\n"
               "useCelsius=perhaps\n"
               "generatorSeed=-5\n"
               "asyncLogging=\n"
               "colour=blue\n"
               "no equals sign here\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, file));
    CHECK(cfg.role == core::Role::GameMaster);
    CHECK_FALSE(cfg.useCelsius);
    CHECK(cfg.generatorSeed == 0u);
    CHECK_FALSE(cfg.asyncLogging);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig supports comments, sections, whitespace and a BOM")
{
    const fs::path dir = testing::MakeUniqueTempDir("config_comments");
    const fs::path file = dir / core::kConfigFileName;
    write_text(file,
               "\xEF\xBB\xBF# skywatch settings\n"
               "[engine]\n"
               "  role = observer   ; players run this\n"
               "useCelsius = yes # metric table\n"
               "generatorSeed=7 // fixed\n"
               "storePath = shared/world#1.json\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, file));
    CHECK(cfg.role == core::Role::Observer);
    CHECK(cfg.useCelsius);
    CHECK(cfg.generatorSeed == 7u);
    CHECK(cfg.storePath == fs::path("shared/world#1.json"));

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::ParseRole accepts gm/observer aliases")
{
    core::Role r = core::Role::Observer;
    CHECK(core::ParseRole("GM", r));
    CHECK(r == core::Role::GameMaster);
    CHECK(core::ParseRole(" player ", r));
    CHECK(r == core::Role::Observer);
    CHECK_FALSE(core::ParseRole("dm", r));
    CHECK(r == core::Role::Observer);
}
