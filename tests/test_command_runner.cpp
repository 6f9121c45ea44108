// tests/test_command_runner.cpp
//
// Drives app::CommandRunner the way main() does, against an in-memory store.

#include <doctest/doctest.h>

#include "app/CommandRunner.h"

#include "skywatch/store/KeyValueStore.hpp"

#include "support/EngineFakes.h"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace skywatch;

namespace {

struct Host
{
    explicit Host(bool gm) : role(gm)
    {
        auto e = engine::WeatherEngine::Create({kv, generator, role});
        REQUIRE(e.has_value());
        instance = std::move(*e);
    }

    int Run(std::vector<std::string> words)
    {
        out.str({});
        err.str({});
        app::CommandRunner runner(*instance, out, err);
        return runner.Run(words);
    }

    store::MemoryKeyValueStore kv;
    testing::CountingGenerator generator;
    authority::StaticRole      role;
    std::unique_ptr<engine::WeatherEngine> instance;
    std::ostringstream out;
    std::ostringstream err;
};

} // namespace

TEST_CASE("CommandRunner: tick from numbers regenerates on a new day")
{
    Host h(true);

    CHECK(h.Run({"tick", "1000", "1", "1", "8", "0", "0"}) == app::kExitOk);
    CHECK(h.out.str().find("tick: adopted") != std::string::npos);

    CHECK(h.Run({"tick", "1000", "1", "2", "8", "0", "0"}) == app::kExitOk);
    CHECK(h.out.str().find("tick: regenerated") != std::string::npos);
    CHECK(h.out.str().find("2/1/1000") != std::string::npos);
    CHECK(h.generator.calls == 2);
}

TEST_CASE("CommandRunner: tick from JSON with a partial reading is ignored")
{
    Host h(true);

    CHECK(h.Run({"tick", R"({"day": 2, "month": 1, "year": 1000, "second": null, "minute": 0})"}) == app::kExitOk);
    CHECK(h.out.str().find("tick: ignored") != std::string::npos);

    CHECK(h.Run({"tick", "{not json"}) == app::kExitUsage);
    CHECK(h.Run({"tick", "1000", "x", "1", "8", "0", "0"}) == app::kExitUsage);
}

TEST_CASE("CommandRunner: observers get an error for operator commands")
{
    Host h(false);

    CHECK(h.Run({"regenerate", "hot", "barren", "summer"}) == app::kExitFailure);
    CHECK(h.err.str().find("UnauthorizedMutation") != std::string::npos);
    CHECK(h.Run({"biome", "desert"}) == app::kExitFailure);
    CHECK(h.Run({"climate", "hot"}) == app::kExitFailure);
}

TEST_CASE("CommandRunner: selection commands and regenerate")
{
    Host h(true);

    CHECK(h.Run({"biome", "savanna"}) == app::kExitOk);
    CHECK(h.Run({"season", "autumn"}) == app::kExitOk);
    CHECK(h.Run({"season", "monsoon"}) == app::kExitUsage);

    const int before = h.generator.calls;
    CHECK(h.Run({"regenerate"}) == app::kExitOk);
    CHECK(h.generator.calls == before + 1);
    CHECK(h.instance->Current()->content.climate ==
          weather::ClimateSelection{weather::Climate::Hot, weather::Humidity::Modest, weather::Season::Fall});
}

TEST_CASE("CommandRunner: show, move, biomes and unknown commands")
{
    Host h(false);

    CHECK(h.Run({}) == app::kExitOk);
    CHECK(h.out.str().find("observer") != std::string::npos);
    CHECK(h.out.str().find("none yet") != std::string::npos);

    CHECK(h.Run({"move", "-10", "250"}) == app::kExitOk);
    CHECK(h.instance->GetWindowPosition().left == -10);
    CHECK(h.Run({"move", "1"}) == app::kExitUsage);

    CHECK(h.Run({"biomes"}) == app::kExitOk);
    CHECK(h.out.str().find("borealForest") != std::string::npos);

    CHECK(h.Run({"dance"}) == app::kExitUsage);
}

TEST_CASE("CommandRunner: SplitLine keeps a tick JSON object whole")
{
    const auto words = app::CommandRunner::SplitLine(R"(tick {"day": 2, "month": 1, "year": 1000})");
    REQUIRE(words.size() == 2);
    CHECK(words[1] == R"({"day": 2, "month": 1, "year": 1000})");

    const auto plain = app::CommandRunner::SplitLine("  move   5  6 ");
    REQUIRE(plain.size() == 3);
    CHECK(plain[2] == "6");
}

TEST_CASE("CommandRunner: script mode runs every line and reports the last failure")
{
    Host h(true);

    std::istringstream script(
        "# morning\n"
        "tick 1000 1 1 6 0 0\n"
        "\n"
        "tick {\"second\": 0, \"minute\": 0, \"hour\": 7, \"day\": 2, \"month\": 1, \"year\": 1000}\n"
        "biome nowhere\n"
        "show\n");

    app::CommandRunner runner(*h.instance, h.out, h.err);
    CHECK(runner.RunScript(script) == app::kExitFailure);
    CHECK(h.out.str().find("tick: regenerated") != std::string::npos);
    CHECK(h.err.str().find("UnknownBiome") != std::string::npos);
    REQUIRE(h.instance->Current().has_value());
    CHECK(h.instance->Current()->date->day == 2);
}
