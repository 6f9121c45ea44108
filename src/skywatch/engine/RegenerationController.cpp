// src/skywatch/engine/RegenerationController.cpp
#include "skywatch/engine/RegenerationController.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace skywatch::engine {

using time::Transition;
using weather::WeatherRecord;

const char* TimeUpdateOutcomeName(TimeUpdateOutcome o) noexcept
{
    switch (o)
    {
    case TimeUpdateOutcome::Ignored:     return "ignored";
    case TimeUpdateOutcome::Refreshed:   return "refreshed";
    case TimeUpdateOutcome::Deferred:    return "deferred";
    case TimeUpdateOutcome::Adopted:     return "adopted";
    case TimeUpdateOutcome::Regenerated: return "regenerated";
    }
    return "?";
}

RegenerationController::RegenerationController(WeatherState& state,
                                               store::IWeatherStore& weatherStore,
                                               const store::ModuleSettings& settings,
                                               weather::IWeatherGenerator& generator,
                                               const ChangeNotifier& notifier) noexcept
    : m_state(state)
    , m_store(weatherStore)
    , m_settings(settings)
    , m_generator(generator)
    , m_notifier(notifier)
{
}

std::expected<void, EngineError> RegenerationController::Commit(WeatherRecord record)
{
    auto written = m_store.Write(record);
    if (!written)
    {
        spdlog::error("Weather: commit failed ({}: {}); keeping last-known-good record",
                      store::StoreErrorCodeName(written.error().code), written.error().message);
        return std::unexpected(FromStoreWrite(written.error()));
    }

    m_state.record = std::move(record);
    return {};
}

std::expected<TimeUpdateOutcome, EngineError>
RegenerationController::OnTimeUpdate(const std::optional<time::RawTimeSnapshot>& incoming,
                                     bool isAuthoritative)
{
    const time::TimeReading reading = time::Inspect(incoming);
    const time::TimeSnapshot* next = time::CompleteSnapshot(reading);
    if (!next)
    {
        // A partial reading still redraws presentation; an absent one carries nothing.
        if (std::holds_alternative<time::Partial>(reading))
        {
            spdlog::debug("Weather: ignoring partial time reading");
            m_notifier.Notify();
        }
        return TimeUpdateOutcome::Ignored;
    }

    const std::optional<time::TimeSnapshot> previous = m_state.RecordDate();
    const Transition transition = time::Classify(previous, reading);

    // The clock always follows the feed.
    m_state.clock = *next;

    if (transition == Transition::None)
    {
        if (m_state.record)
            m_state.record->date = *next;
        m_notifier.Notify();
        return TimeUpdateOutcome::Refreshed;
    }

    if (!isAuthoritative)
    {
        spdlog::debug("Weather: date changed to {}, waiting for the authoritative record",
                      time::FormatDate(*next));
        m_notifier.Notify();
        return TimeUpdateOutcome::Deferred;
    }

    // First snapshot for a record that was seeded without one: attach it, keep content.
    if (m_state.record && !previous)
    {
        WeatherRecord dated = *m_state.record;
        dated.date = *next;
        if (auto c = Commit(std::move(dated)); !c)
            return std::unexpected(c.error());

        spdlog::info("Weather: attached first date {} to existing record", time::FormatDate(*next));
        m_notifier.Notify();
        return TimeUpdateOutcome::Adopted;
    }

    auto params = m_settings.SelectedClimate();
    if (!params)
        return std::unexpected(FromStoreRead(params.error()));

    const weather::ClimateSelection selection = weather::Resolve(*params);

    WeatherRecord fresh;
    fresh.content = m_generator.Generate(selection, m_state.Seed());
    fresh.date    = *next;

    if (auto c = Commit(std::move(fresh)); !c)
        return std::unexpected(c.error());

    spdlog::info("Weather: date changed to {}, generated '{}' ({}F)", time::FormatDate(*next),
                 m_state.record->content.description, m_state.record->content.temperatureF);
    m_notifier.Notify();
    return TimeUpdateOutcome::Regenerated;
}

std::expected<void, EngineError>
RegenerationController::ManualRegenerate(const weather::ClimateParameters& params, bool isAuthoritative)
{
    if (!isAuthoritative)
    {
        spdlog::warn("Weather: manual regeneration refused, instance is not authoritative");
        return std::unexpected(EngineError{EngineError::Code::UnauthorizedMutation,
                                           "only the authoritative instance may regenerate weather"});
    }

    const auto selection = weather::ToSelection(params);
    if (!selection)
    {
        spdlog::warn("Weather: manual regeneration refused, climate parameters incomplete");
        return std::unexpected(EngineError{EngineError::Code::IncompleteParameters,
                                           "climate, humidity and season are all required"});
    }

    WeatherRecord fresh;
    fresh.content = m_generator.Generate(*selection, m_state.Seed());
    fresh.date    = m_state.record && m_state.record->date ? m_state.record->date : m_state.clock;

    if (auto c = Commit(std::move(fresh)); !c)
        return std::unexpected(c.error());

    spdlog::info("Weather: regenerated ({} / {} / {}): '{}'",
                 weather::ClimateName(selection->climate), weather::HumidityName(selection->humidity),
                 weather::SeasonName(selection->season), m_state.record->content.description);
    m_notifier.Notify();
    return {};
}

} // namespace skywatch::engine
