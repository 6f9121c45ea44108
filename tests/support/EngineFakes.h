#pragma once
// tests/support/EngineFakes.h
//
// Hand-written collaborators for engine tests: a weather store that counts and can be
// told to fail, and a generator that hands out predictable content.

#include "skywatch/store/WeatherStore.hpp"
#include "skywatch/time/TimeSnapshot.hpp"
#include "skywatch/weather/WeatherGenerator.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace skywatch::testing {

class FakeWeatherStore final : public store::IWeatherStore {
public:
    [[nodiscard]] std::expected<std::optional<weather::WeatherRecord>, store::StoreError> Read() const override
    {
        ++reads;
        if (failReads)
            return std::unexpected(store::StoreError{store::StoreError::Code::IoReadFail, "read refused"});
        return stored;
    }

    [[nodiscard]] std::expected<void, store::StoreError> Write(const weather::WeatherRecord& record) override
    {
        ++writes;
        if (failWrites)
            return std::unexpected(store::StoreError{store::StoreError::Code::IoWriteFail, "disk full"});
        stored = record;
        return {};
    }

    std::optional<weather::WeatherRecord> stored;
    bool failReads  = false;
    bool failWrites = false;

    mutable int reads = 0;
    int writes = 0;
};

// Content temperature counts up from 50 so every generated record is distinguishable.
class CountingGenerator final : public weather::IWeatherGenerator {
public:
    [[nodiscard]] weather::WeatherContent Generate(const weather::ClimateSelection& climate,
                                                   const weather::WeatherRecord* seed) override
    {
        ++calls;
        lastClimate = climate;
        lastSeedTemperature = seed ? std::optional<int>(seed->content.temperatureF) : std::nullopt;

        weather::WeatherContent c;
        c.climate      = climate;
        c.condition    = weather::Condition::Clear;
        c.temperatureF = 50 + calls;
        c.description  = "generated #" + std::to_string(calls);
        return c;
    }

    int calls = 0;
    std::optional<weather::ClimateSelection> lastClimate;
    std::optional<int> lastSeedTemperature;
};

inline time::RawTimeSnapshot MakeRaw(int year, int month, int day, int hour = 8, int minute = 0, int second = 0)
{
    time::RawTimeSnapshot r;
    r.year   = year;
    r.month  = month;
    r.day    = day;
    r.hour   = hour;
    r.minute = minute;
    r.second = second;
    return r;
}

inline time::TimeSnapshot MakeSnapshot(int year, int month, int day, int hour = 8, int minute = 0, int second = 0)
{
    const time::TimeReading reading = time::Inspect(MakeRaw(year, month, day, hour, minute, second));
    return *time::CompleteSnapshot(reading);
}

inline weather::WeatherRecord MakeRecord(std::optional<time::TimeSnapshot> date, int temperatureF = 40)
{
    weather::WeatherRecord r;
    r.date = std::move(date);
    r.content.climate      = weather::kDefaultClimate;
    r.content.condition    = weather::Condition::Overcast;
    r.content.temperatureF = temperatureF;
    r.content.description  = "stored";
    return r;
}

inline std::filesystem::path MakeUniqueTempDir(const std::string& tag)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("skywatch_" + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;
    return dir;
}

} // namespace skywatch::testing
