// src/skywatch/core/Config.cpp
#include "skywatch/core/Config.hpp"

#include "skywatch/store/KeyValueStore.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace skywatch::core {

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static std::string_view Trimmed(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

template <typename Int>
static bool ParseInteger(std::string_view sv, Int& out) noexcept
{
    sv = Trimmed(sv);

    Int v{};
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), end, v);
    if (ec != std::errc{} || ptr != end || sv.empty())
        return false;

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = Trimmed(sv);

    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

const char* RoleName(Role r) noexcept
{
    return r == Role::GameMaster ? "gm" : "observer";
}

bool ParseRole(std::string_view text, Role& out) noexcept
{
    text = Trimmed(text);
    if (EqualsI(text, "gm") || EqualsI(text, "gamemaster"))
    {
        out = Role::GameMaster;
        return true;
    }
    if (EqualsI(text, "observer") || EqualsI(text, "player"))
    {
        out = Role::Observer;
        return true;
    }
    return false;
}

static void StripInlineComment(std::string& v)
{
    //   storePath=world.json  # shared file
    //   logLevel=debug        ; noisy
    //   useCelsius=1          // metric
    std::size_t cut = std::string::npos;
    auto consider = [&](std::size_t p)
    {
        if (p == std::string::npos) return;
        if (cut == std::string::npos || p < cut) cut = p;
    };

    consider(v.find('#'));
    consider(v.find(';'));
    consider(v.find("//"));

    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

bool LoadConfig(Config& cfg, const std::filesystem::path& file)
{
    std::ifstream f(file, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Editors on Windows like to prepend a UTF-8 BOM.
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF)
    {
        text.erase(0, 3);
    }

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Paths may legitimately contain '#' or ';', so only scalar keys get comments stripped.
        if (k != "storePath" && k != "logDir")
            StripInlineComment(v);

        if (k.empty()) continue;

        bool ok = true;
        if (k == "storePath")
        {
            if (v.empty()) ok = false;
            else cfg.storePath = v;
        }
        else if (k == "logDir")
        {
            if (v.empty()) ok = false;
            else cfg.logDir = v;
        }
        else if (k == "logLevel")
        {
            if (v.empty()) ok = false;
            else cfg.logLevel = v;
        }
        else if (k == "asyncLogging")
        {
            bool parsed = cfg.asyncLogging;
            if ((ok = ParseBool(v, parsed)))
                cfg.asyncLogging = parsed;
        }
        else if (k == "consoleLog")
        {
            bool parsed = cfg.consoleLog;
            if ((ok = ParseBool(v, parsed)))
                cfg.consoleLog = parsed;
        }
        else if (k == "role")
        {
            Role parsed = cfg.role;
            if ((ok = ParseRole(v, parsed)))
                cfg.role = parsed;
        }
        else if (k == "useCelsius")
        {
            bool parsed = cfg.useCelsius;
            if ((ok = ParseBool(v, parsed)))
                cfg.useCelsius = parsed;
        }
        else if (k == "generatorSeed")
        {
            std::uint64_t parsed = cfg.generatorSeed;
            if ((ok = ParseInteger(v, parsed)))
                cfg.generatorSeed = parsed;
        }
        else
        {
            spdlog::debug("LoadConfig: {}:{}: unknown key '{}'", file.string(), lineNo, k);
        }

        if (!ok)
            spdlog::warn("LoadConfig: {}:{}: ignoring bad value '{}' for '{}'", file.string(), lineNo, v, k);
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file)
{
    std::ostringstream oss;
    oss << "storePath="     << cfg.storePath.string() << "\n";
    oss << "logDir="        << cfg.logDir.string() << "\n";
    oss << "logLevel="      << cfg.logLevel << "\n";
    oss << "asyncLogging="  << (cfg.asyncLogging ? 1 : 0) << "\n";
    oss << "consoleLog="    << (cfg.consoleLog ? 1 : 0) << "\n";
    oss << "role="          << RoleName(cfg.role) << "\n";
    oss << "useCelsius="    << (cfg.useCelsius ? 1 : 0) << "\n";
    oss << "generatorSeed=" << cfg.generatorSeed << "\n";

    std::string err;
    if (!store::WriteFileAtomic(file, oss.str(), &err))
    {
        spdlog::error("SaveConfig: cannot write {} ({})", file.string(), err);
        return false;
    }
    return true;
}

} // namespace skywatch::core
