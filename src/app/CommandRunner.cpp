#include "app/CommandRunner.h"

#include "skywatch/time/TimeSnapshot.hpp"
#include "skywatch/weather/Climate.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <expected>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <utility>

namespace skywatch::app {

namespace {

[[nodiscard]] std::optional<int> ParseInt(const std::string& s)
{
    int v = 0;
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, v);
    if (s.empty() || ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

} // namespace

int CommandRunner::Run(const std::vector<std::string>& words)
{
    if (words.empty())
        return Show();

    const std::string& cmd = words.front();
    const std::vector<std::string> operands(words.begin() + 1, words.end());

    spdlog::debug("Command: {} ({} operand(s))", cmd, operands.size());

    if (cmd == "show")       return Show();
    if (cmd == "tick")       return Tick(operands);
    if (cmd == "regenerate") return Regenerate(operands);
    if (cmd == "reload")     return Reload();
    if (cmd == "climate" || cmd == "humidity" || cmd == "season")
        return Select(cmd, operands);
    if (cmd == "biome")      return SelectBiome(operands);
    if (cmd == "biomes")     return ListBiomes();
    if (cmd == "move")       return Move(operands);

    return Usage("unknown command '" + cmd + "'");
}

std::vector<std::string> CommandRunner::SplitLine(const std::string& line)
{
    std::vector<std::string> words;
    std::istringstream iss(line);
    std::string w;
    while (iss >> w)
    {
        if (words.size() == 1 && words[0] == "tick" && !w.empty() && w[0] == '{')
        {
            std::string rest;
            std::getline(iss, rest);
            words.push_back(w + rest);
            break;
        }
        words.push_back(std::move(w));
    }
    return words;
}

int CommandRunner::RunScript(std::istream& in)
{
    int rc = kExitOk;
    std::string line;
    while (std::getline(in, line))
    {
        const auto words = SplitLine(line);
        if (words.empty() || words[0][0] == '#')
            continue;

        if (const int r = Run(words); r != kExitOk)
            rc = r;
    }
    return rc;
}

int CommandRunner::Fail(const engine::EngineError& e)
{
    m_err << "error: " << engine::EngineErrorCodeName(e.code) << ": " << e.message << "\n";
    return kExitFailure;
}

int CommandRunner::Usage(const std::string& message)
{
    m_err << "usage: " << message << "\n";
    return kExitUsage;
}

int CommandRunner::Show()
{
    const engine::WeatherView v = m_engine.View();

    m_out << "Role:     " << (v.isGM ? "game master" : "observer") << "\n";

    if (!v.formattedDate.empty())
    {
        m_out << "Date:     " << v.formattedDate;
        if (!v.weekday.empty())
            m_out << " (" << v.weekday << ")";
        m_out << "\n";
    }
    if (!v.displayDate.empty())
        m_out << "Calendar: " << v.displayDate << " " << v.formattedTime << "\n";

    if (v.hideWeather)
        m_out << "Weather:  hidden\n";
    else if (v.hasWeather)
        m_out << "Weather:  " << v.currentTemperature << ", " << v.currentDescription << "\n";
    else
        m_out << "Weather:  none yet\n";

    m_out << "Window:   " << v.windowPosition.left << "," << v.windowPosition.top << "\n";
    return kExitOk;
}

int CommandRunner::Tick(const std::vector<std::string>& operands)
{
    std::optional<time::RawTimeSnapshot> reading;

    if (operands.size() == 1)
    {
        const auto j = nlohmann::json::parse(operands[0], nullptr, false);
        if (j.is_discarded())
            return Usage("tick <json>: not valid JSON");
        reading = time::ParseTimeSnapshot(j);
    }
    else if (operands.size() == 6)
    {
        time::RawTimeSnapshot raw;
        std::optional<int>* fields[] = {&raw.year, &raw.month, &raw.day, &raw.hour, &raw.minute, &raw.second};
        for (std::size_t i = 0; i < operands.size(); ++i)
        {
            const auto parsed = ParseInt(operands[i]);
            if (!parsed)
                return Usage("tick <y> <m> <d> <h> <mi> <s>: '" + operands[i] + "' is not a number");
            *fields[i] = *parsed;
        }
        reading = std::move(raw);
    }
    else
    {
        return Usage("tick <json> | tick <y> <m> <d> <h> <mi> <s>");
    }

    auto outcome = m_engine.OnTimeUpdate(reading);
    if (!outcome)
        return Fail(outcome.error());

    m_out << "tick: " << engine::TimeUpdateOutcomeName(*outcome) << "\n";
    return Show();
}

int CommandRunner::Regenerate(const std::vector<std::string>& operands)
{
    std::expected<void, engine::EngineError> result;

    if (operands.empty())
    {
        result = m_engine.RegenerateFromSelection();
    }
    else if (operands.size() == 3)
    {
        weather::ClimateParameters params;
        params.climate  = weather::ParseClimate(operands[0]);
        params.humidity = weather::ParseHumidity(operands[1]);
        params.season   = weather::ParseSeason(operands[2]);
        result = m_engine.ManualRegenerate(params);
    }
    else
    {
        return Usage("regenerate [<climate> <humidity> <season>]");
    }

    if (!result)
        return Fail(result.error());
    return Show();
}

int CommandRunner::Reload()
{
    auto reloaded = m_engine.ReloadFromStore();
    if (!reloaded)
        return Fail(reloaded.error());
    return Show();
}

int CommandRunner::Select(const std::string& what, const std::vector<std::string>& operands)
{
    if (operands.size() != 1)
        return Usage(what + " <value>");

    std::expected<void, engine::EngineError> result;
    if (what == "climate")
    {
        const auto c = weather::ParseClimate(operands[0]);
        if (!c)
            return Usage("climate: cold, temperate or hot");
        result = m_engine.SetClimate(*c);
    }
    else if (what == "humidity")
    {
        const auto h = weather::ParseHumidity(operands[0]);
        if (!h)
            return Usage("humidity: barren, modest or verdant");
        result = m_engine.SetHumidity(*h);
    }
    else
    {
        const auto s = weather::ParseSeason(operands[0]);
        if (!s)
            return Usage("season: spring, summer, fall or winter");
        result = m_engine.SetSeason(*s);
    }

    if (!result)
        return Fail(result.error());

    m_out << what << " set to " << operands[0] << "\n";
    return kExitOk;
}

int CommandRunner::SelectBiome(const std::vector<std::string>& operands)
{
    if (operands.size() != 1)
        return Usage("biome <id>");

    auto result = m_engine.SelectBiome(operands[0]);
    if (!result)
        return Fail(result.error());

    m_out << "biome set to " << operands[0] << "\n";
    return kExitOk;
}

int CommandRunner::ListBiomes()
{
    for (const auto& b : weather::kBiomeMappings)
    {
        m_out << b.id << "  " << b.label << " ("
              << weather::ClimateName(b.climate) << ", "
              << weather::HumidityName(b.humidity) << ")\n";
    }
    return kExitOk;
}

int CommandRunner::Move(const std::vector<std::string>& operands)
{
    if (operands.size() != 2)
        return Usage("move <left> <top>");

    const auto left = ParseInt(operands[0]);
    const auto top  = ParseInt(operands[1]);
    if (!left || !top)
        return Usage("move <left> <top>: expected two integers");

    auto result = m_engine.SetWindowPosition(store::WindowPosition{*left, *top});
    if (!result)
        return Fail(result.error());

    m_out << "window at " << *left << "," << *top << "\n";
    return kExitOk;
}

} // namespace skywatch::app
