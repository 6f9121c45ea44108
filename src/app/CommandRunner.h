#pragma once

#include "skywatch/engine/WeatherEngine.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace skywatch::app {

enum ExitCode : int {
    kExitOk      = 0,
    kExitFailure = 1,
    kExitUsage   = 2,
};

// Executes one command line's worth of work against an engine and prints the result.
class CommandRunner
{
public:
    CommandRunner(engine::WeatherEngine& engine, std::ostream& out, std::ostream& err) noexcept
        : m_engine(engine), m_out(out), m_err(err) {}

    // `words[0]` is the command. An empty list behaves like "show".
    [[nodiscard]] int Run(const std::vector<std::string>& words);

    // One command per line until end of input. Blank lines and '#' comments are skipped.
    // A JSON object after "tick" is kept whole. Returns the last non-zero exit code.
    [[nodiscard]] int RunScript(std::istream& in);

    [[nodiscard]] static std::vector<std::string> SplitLine(const std::string& line);

private:
    int Show();
    int Tick(const std::vector<std::string>& operands);
    int Regenerate(const std::vector<std::string>& operands);
    int Reload();
    int Select(const std::string& what, const std::vector<std::string>& operands);
    int SelectBiome(const std::vector<std::string>& operands);
    int ListBiomes();
    int Move(const std::vector<std::string>& operands);

    int Fail(const engine::EngineError& e);
    int Usage(const std::string& message);

    engine::WeatherEngine& m_engine;
    std::ostream&          m_out;
    std::ostream&          m_err;
};

} // namespace skywatch::app
