#pragma once
// include/skywatch/store/ModuleSettings.hpp
//
// Typed access to the keys this module keeps in the shared store.

#include "skywatch/store/KeyValueStore.hpp"
#include "skywatch/weather/Climate.hpp"
#include "skywatch/weather/WeatherRecord.hpp"

#include <expected>
#include <optional>
#include <string>

namespace skywatch::store {

namespace SettingKeys {
inline constexpr const char* kLastWeatherData = "lastWeatherData";
inline constexpr const char* kClimate         = "climate";
inline constexpr const char* kHumidity        = "humidity";
inline constexpr const char* kSeason          = "season";
inline constexpr const char* kBiome           = "biome";
inline constexpr const char* kWindowPosition  = "windowPosition";
inline constexpr const char* kUseCelsius      = "useCelsius";
inline constexpr const char* kDialogDisplay   = "dialogDisplay";
} // namespace SettingKeys

struct WindowPosition {
    int left = 100;
    int top  = 100;
};

class ModuleSettings {
public:
    explicit ModuleSettings(KeyValueStore& store) noexcept : m_store(store) {}

    // ---- weather record ----
    [[nodiscard]] std::expected<std::optional<weather::WeatherRecord>, StoreError> LastWeather() const;
    [[nodiscard]] std::expected<void, StoreError> SetLastWeather(const weather::WeatherRecord& record);

    // ---- climate selection ----
    // Missing or unreadable values come back as absent fields.
    [[nodiscard]] std::expected<weather::ClimateParameters, StoreError> SelectedClimate() const;
    [[nodiscard]] std::expected<void, StoreError> SetClimate(weather::Climate c);
    [[nodiscard]] std::expected<void, StoreError> SetHumidity(weather::Humidity h);
    [[nodiscard]] std::expected<void, StoreError> SetSeason(weather::Season s);

    [[nodiscard]] std::expected<std::optional<std::string>, StoreError> Biome() const;
    [[nodiscard]] std::expected<void, StoreError> SetBiome(const std::string& id);

    // ---- presentation ----
    // {100, 100} when nothing has been saved or the stored value is malformed.
    [[nodiscard]] WindowPosition GetWindowPosition() const;
    [[nodiscard]] std::expected<void, StoreError> SetWindowPosition(const WindowPosition& pos);

    [[nodiscard]] bool UseCelsius() const;
    [[nodiscard]] std::expected<void, StoreError> SetUseCelsius(bool v);

    [[nodiscard]] bool DialogDisplay() const;
    [[nodiscard]] std::expected<void, StoreError> SetDialogDisplay(bool v);

    [[nodiscard]] KeyValueStore& Store() noexcept { return m_store; }

private:
    [[nodiscard]] bool ReadBool(const char* key, bool fallback) const;

    KeyValueStore& m_store;
};

void to_json(json& j, const WindowPosition& v);
void from_json(const json& j, WindowPosition& v);

} // namespace skywatch::store
