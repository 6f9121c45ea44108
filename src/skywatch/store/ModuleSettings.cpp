// src/skywatch/store/ModuleSettings.cpp
#include "skywatch/store/ModuleSettings.hpp"

#include <spdlog/spdlog.h>

namespace skywatch::store {

using weather::WeatherRecord;

std::expected<std::optional<WeatherRecord>, StoreError> ModuleSettings::LastWeather() const
{
    auto raw = m_store.Get(SettingKeys::kLastWeatherData);
    if (!raw)
        return std::unexpected(raw.error());

    // Never written, or explicitly cleared.
    if (!raw->has_value() || (*raw)->is_null())
        return std::optional<WeatherRecord>{};

    const json& j = **raw;
    if (!j.is_object())
        return std::unexpected(StoreError{StoreError::Code::TypeError, "lastWeatherData must be an object"});

    try {
        return std::optional<WeatherRecord>{j.get<WeatherRecord>()};
    }
    catch (const nlohmann::json::type_error& e) {
        return std::unexpected(StoreError{StoreError::Code::TypeError, e.what()});
    }
    catch (const nlohmann::json::out_of_range& e) {
        return std::unexpected(StoreError{StoreError::Code::TypeError, e.what()});
    }
}

std::expected<void, StoreError> ModuleSettings::SetLastWeather(const WeatherRecord& record)
{
    return m_store.Set(SettingKeys::kLastWeatherData, json(record));
}

std::expected<weather::ClimateParameters, StoreError> ModuleSettings::SelectedClimate() const
{
    weather::ClimateParameters out;

    auto climate = m_store.Get(SettingKeys::kClimate);
    if (!climate) return std::unexpected(climate.error());
    if (climate->has_value()) out.climate = weather::ClimateFromJson(**climate);

    auto humidity = m_store.Get(SettingKeys::kHumidity);
    if (!humidity) return std::unexpected(humidity.error());
    if (humidity->has_value()) out.humidity = weather::HumidityFromJson(**humidity);

    auto season = m_store.Get(SettingKeys::kSeason);
    if (!season) return std::unexpected(season.error());
    if (season->has_value()) out.season = weather::SeasonFromJson(**season);

    return out;
}

std::expected<void, StoreError> ModuleSettings::SetClimate(weather::Climate c)
{
    return m_store.Set(SettingKeys::kClimate, static_cast<int>(c));
}

std::expected<void, StoreError> ModuleSettings::SetHumidity(weather::Humidity h)
{
    return m_store.Set(SettingKeys::kHumidity, static_cast<int>(h));
}

std::expected<void, StoreError> ModuleSettings::SetSeason(weather::Season s)
{
    return m_store.Set(SettingKeys::kSeason, static_cast<int>(s));
}

std::expected<std::optional<std::string>, StoreError> ModuleSettings::Biome() const
{
    auto raw = m_store.Get(SettingKeys::kBiome);
    if (!raw)
        return std::unexpected(raw.error());
    if (!raw->has_value() || !(*raw)->is_string())
        return std::optional<std::string>{};
    return std::optional<std::string>{(*raw)->get<std::string>()};
}

std::expected<void, StoreError> ModuleSettings::SetBiome(const std::string& id)
{
    return m_store.Set(SettingKeys::kBiome, id);
}

WindowPosition ModuleSettings::GetWindowPosition() const
{
    auto raw = m_store.Get(SettingKeys::kWindowPosition);
    if (!raw)
    {
        spdlog::warn("ModuleSettings: window position unreadable ({}), using default",
                     raw.error().message);
        return {};
    }
    if (!raw->has_value())
        return {};
    return (*raw)->get<WindowPosition>();
}

std::expected<void, StoreError> ModuleSettings::SetWindowPosition(const WindowPosition& pos)
{
    return m_store.Set(SettingKeys::kWindowPosition, json(pos));
}

bool ModuleSettings::ReadBool(const char* key, bool fallback) const
{
    auto raw = m_store.Get(key);
    if (!raw)
    {
        spdlog::warn("ModuleSettings: '{}' unreadable ({}), using default", key, raw.error().message);
        return fallback;
    }
    if (!raw->has_value() || !(*raw)->is_boolean())
        return fallback;
    return (*raw)->get<bool>();
}

bool ModuleSettings::UseCelsius() const
{
    return ReadBool(SettingKeys::kUseCelsius, false);
}

std::expected<void, StoreError> ModuleSettings::SetUseCelsius(bool v)
{
    return m_store.Set(SettingKeys::kUseCelsius, v);
}

bool ModuleSettings::DialogDisplay() const
{
    return ReadBool(SettingKeys::kDialogDisplay, true);
}

std::expected<void, StoreError> ModuleSettings::SetDialogDisplay(bool v)
{
    return m_store.Set(SettingKeys::kDialogDisplay, v);
}

// ---------- WindowPosition ----------
void to_json(json& j, const WindowPosition& v) {
    j = json::object({
        {"left", v.left},
        {"top",  v.top}
    });
}
void from_json(const json& j, WindowPosition& v) {
    v = {};
    if (!j.is_object()) return;
    if (auto it = j.find("left"); it != j.end() && it->is_number()) v.left = it->get<int>();
    if (auto it = j.find("top"); it != j.end() && it->is_number())  v.top  = it->get<int>();
}

} // namespace skywatch::store
