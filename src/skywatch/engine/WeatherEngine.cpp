// src/skywatch/engine/WeatherEngine.cpp
#include "skywatch/engine/WeatherEngine.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace skywatch::engine {

WeatherEngine::WeatherEngine(const EngineDependencies& deps)
    : m_settings(deps.store)
    , m_ownedWeatherStore(deps.weatherStore ? nullptr : std::make_unique<store::SettingsWeatherStore>(m_settings))
    , m_weatherStore(deps.weatherStore ? *deps.weatherStore : *m_ownedWeatherStore)
    , m_gate(deps.role)
    , m_controller(m_state, m_weatherStore, m_settings, deps.generator, m_notifier)
    , m_bootstrap(m_state, m_weatherStore, deps.generator, m_gate)
{
}

std::expected<std::unique_ptr<WeatherEngine>, EngineError> WeatherEngine::Create(const EngineDependencies& deps)
{
    std::unique_ptr<WeatherEngine> engine(new WeatherEngine(deps));

    spdlog::info("Weather: engine starting ({})", engine->IsAuthoritative() ? "authoritative" : "observer");

    auto loaded = engine->m_bootstrap.Initialize();
    if (!loaded)
        return std::unexpected(loaded.error());

    return engine;
}

std::expected<void, EngineError> WeatherEngine::RequireAuthority(const char* action) const
{
    if (m_gate.IsAuthoritative())
        return {};

    spdlog::warn("Weather: {} refused, instance is not authoritative", action);
    return std::unexpected(EngineError{EngineError::Code::UnauthorizedMutation,
                                       std::string(action) + " requires the authoritative instance"});
}

std::expected<TimeUpdateOutcome, EngineError>
WeatherEngine::OnTimeUpdate(const std::optional<time::RawTimeSnapshot>& incoming)
{
    return m_controller.OnTimeUpdate(incoming, m_gate.IsAuthoritative());
}

std::expected<void, EngineError> WeatherEngine::ManualRegenerate(const weather::ClimateParameters& params)
{
    return m_controller.ManualRegenerate(params, m_gate.IsAuthoritative());
}

std::expected<void, EngineError> WeatherEngine::RegenerateFromSelection()
{
    if (auto ok = RequireAuthority("regenerate"); !ok)
        return ok;

    auto params = m_settings.SelectedClimate();
    if (!params)
        return std::unexpected(FromStoreRead(params.error()));

    return m_controller.ManualRegenerate(*params, m_gate.IsAuthoritative());
}

std::expected<void, EngineError> WeatherEngine::SetClimate(weather::Climate c)
{
    if (auto ok = RequireAuthority("set climate"); !ok)
        return ok;
    if (auto w = m_settings.SetClimate(c); !w)
        return std::unexpected(FromStoreWrite(w.error()));
    return {};
}

std::expected<void, EngineError> WeatherEngine::SetHumidity(weather::Humidity h)
{
    if (auto ok = RequireAuthority("set humidity"); !ok)
        return ok;
    if (auto w = m_settings.SetHumidity(h); !w)
        return std::unexpected(FromStoreWrite(w.error()));
    return {};
}

std::expected<void, EngineError> WeatherEngine::SetSeason(weather::Season s)
{
    if (auto ok = RequireAuthority("set season"); !ok)
        return ok;
    if (auto w = m_settings.SetSeason(s); !w)
        return std::unexpected(FromStoreWrite(w.error()));
    return {};
}

std::expected<void, EngineError> WeatherEngine::SelectBiome(std::string_view id)
{
    if (auto ok = RequireAuthority("select biome"); !ok)
        return ok;

    const weather::BiomeMapping* biome = weather::FindBiome(id);
    if (!biome)
        return std::unexpected(EngineError{EngineError::Code::UnknownBiome,
                                           "unknown biome '" + std::string(id) + "'"});

    if (auto w = m_settings.SetBiome(std::string(biome->id)); !w)
        return std::unexpected(FromStoreWrite(w.error()));
    if (auto w = m_settings.SetClimate(biome->climate); !w)
        return std::unexpected(FromStoreWrite(w.error()));
    if (auto w = m_settings.SetHumidity(biome->humidity); !w)
        return std::unexpected(FromStoreWrite(w.error()));

    spdlog::info("Weather: biome '{}' selected ({} / {})", biome->id,
                 weather::ClimateName(biome->climate), weather::HumidityName(biome->humidity));
    m_notifier.Notify();
    return {};
}

std::expected<void, EngineError> WeatherEngine::SetUseCelsius(bool useCelsius)
{
    if (auto ok = RequireAuthority("set units"); !ok)
        return ok;
    if (m_settings.UseCelsius() == useCelsius)
        return {};
    if (auto w = m_settings.SetUseCelsius(useCelsius); !w)
        return std::unexpected(FromStoreWrite(w.error()));
    m_notifier.Notify();
    return {};
}

std::expected<std::optional<weather::WeatherRecord>, EngineError> WeatherEngine::ReloadFromStore()
{
    auto stored = m_weatherStore.Read();
    if (!stored)
        return std::unexpected(FromStoreRead(stored.error()));

    if (!*stored)
        return m_state.record;

    m_state.record = std::move(**stored);
    if (!m_state.clock)
        m_state.clock = m_state.record->date;

    spdlog::debug("Weather: reloaded record from store");
    m_notifier.Notify();
    return m_state.record;
}

std::expected<void, EngineError> WeatherEngine::SetWindowPosition(const store::WindowPosition& pos)
{
    if (auto w = m_settings.SetWindowPosition(pos); !w)
        return std::unexpected(FromStoreWrite(w.error()));
    return {};
}

store::WindowPosition WeatherEngine::GetWindowPosition() const
{
    return m_settings.GetWindowPosition();
}

WeatherView WeatherEngine::View() const
{
    ViewOptions opts;
    opts.isGM           = m_gate.IsAuthoritative();
    opts.useCelsius     = m_localCelsius ? *m_localCelsius : m_settings.UseCelsius();
    opts.dialogDisplay  = m_settings.DialogDisplay();
    opts.windowPosition = m_settings.GetWindowPosition();
    return BuildWeatherView(m_state, opts);
}

} // namespace skywatch::engine
