#pragma once
// include/skywatch/engine/WeatherEngine.hpp
//
// One instance's view of the shared weather record.
//
// The host constructs the engine once and hands it by reference to whatever needs it.
// Every call is expected on the instance's single event stream (time feed ticks, operator
// actions, store-changed pushes); the engine does no locking of its own.

#include "skywatch/authority/AuthorityGate.hpp"
#include "skywatch/engine/BootstrapLoader.hpp"
#include "skywatch/engine/ChangeNotifier.hpp"
#include "skywatch/engine/EngineError.hpp"
#include "skywatch/engine/RegenerationController.hpp"
#include "skywatch/engine/WeatherState.hpp"
#include "skywatch/engine/WeatherView.hpp"
#include "skywatch/store/KeyValueStore.hpp"
#include "skywatch/store/ModuleSettings.hpp"
#include "skywatch/store/WeatherStore.hpp"
#include "skywatch/weather/WeatherGenerator.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string_view>

namespace skywatch::engine {

struct EngineDependencies {
    store::KeyValueStore&        store;
    weather::IWeatherGenerator&  generator;
    const authority::IRoleSource& role;

    // Optional override for where the record itself is read/written. Defaults to the
    // lastWeatherData key of `store`.
    store::IWeatherStore*        weatherStore = nullptr;
};

class WeatherEngine {
public:
    // Builds the engine and runs the bootstrap loader once.
    [[nodiscard]] static std::expected<std::unique_ptr<WeatherEngine>, EngineError>
    Create(const EngineDependencies& deps);

    WeatherEngine(const WeatherEngine&) = delete;
    WeatherEngine& operator=(const WeatherEngine&) = delete;

    // ---- time feed ----
    [[nodiscard]] std::expected<TimeUpdateOutcome, EngineError>
    OnTimeUpdate(const std::optional<time::RawTimeSnapshot>& incoming);

    // ---- operator actions (authority-gated) ----
    [[nodiscard]] std::expected<void, EngineError> ManualRegenerate(const weather::ClimateParameters& params);

    // Regenerates from the persisted climate selection.
    [[nodiscard]] std::expected<void, EngineError> RegenerateFromSelection();

    // Selection changes are persisted but do not regenerate.
    [[nodiscard]] std::expected<void, EngineError> SetClimate(weather::Climate c);
    [[nodiscard]] std::expected<void, EngineError> SetHumidity(weather::Humidity h);
    [[nodiscard]] std::expected<void, EngineError> SetSeason(weather::Season s);

    // Persists the biome and the climate/humidity it maps to.
    [[nodiscard]] std::expected<void, EngineError> SelectBiome(std::string_view id);

    // Shared unit preference. Skips the write when the stored value already matches.
    [[nodiscard]] std::expected<void, EngineError> SetUseCelsius(bool useCelsius);

    // ---- observers ----
    // Re-reads the store, e.g. after the authoritative instance announced a commit.
    // Keeps the current record when nothing is stored.
    [[nodiscard]] std::expected<std::optional<weather::WeatherRecord>, EngineError> ReloadFromStore();

    // ---- presentation ----
    [[nodiscard]] std::expected<void, EngineError> SetWindowPosition(const store::WindowPosition& pos);
    [[nodiscard]] store::WindowPosition GetWindowPosition() const;

    // Instance-local units for View(); never written to the store. nullopt follows the
    // shared preference.
    void SetLocalUnits(std::optional<bool> useCelsius) noexcept { m_localCelsius = useCelsius; }

    [[nodiscard]] WeatherView View() const;

    [[nodiscard]] const std::optional<weather::WeatherRecord>& Current() const noexcept { return m_state.record; }
    [[nodiscard]] const WeatherState& State() const noexcept { return m_state; }

    [[nodiscard]] bool IsAuthoritative() const { return m_gate.IsAuthoritative(); }

    [[nodiscard]] ChangeNotifier& Notifier() noexcept { return m_notifier; }
    [[nodiscard]] store::ModuleSettings& Settings() noexcept { return m_settings; }

private:
    explicit WeatherEngine(const EngineDependencies& deps);

    [[nodiscard]] std::expected<void, EngineError> RequireAuthority(const char* action) const;

    store::ModuleSettings                        m_settings;
    std::unique_ptr<store::SettingsWeatherStore> m_ownedWeatherStore;
    store::IWeatherStore&                        m_weatherStore;
    authority::AuthorityGate                     m_gate;

    WeatherState                                 m_state;
    ChangeNotifier                               m_notifier;
    std::optional<bool>                          m_localCelsius;

    RegenerationController                       m_controller;
    BootstrapLoader                              m_bootstrap;
};

} // namespace skywatch::engine
