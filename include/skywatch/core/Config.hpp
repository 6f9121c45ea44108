#pragma once
// include/skywatch/core/Config.hpp
//
// skywatch.ini: hand-editable key=value settings for the command-line host.

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace skywatch::core {

enum class Role { GameMaster, Observer };

[[nodiscard]] const char* RoleName(Role r) noexcept;
[[nodiscard]] bool ParseRole(std::string_view text, Role& out) noexcept;

struct Config {
    std::filesystem::path storePath = "skywatch-world.json";
    std::filesystem::path logDir    = "logs";
    std::string           logLevel  = "info";
    bool                  asyncLogging = false;
    bool                  consoleLog   = true;

    Role          role          = Role::GameMaster;
    bool          useCelsius    = false;
    std::uint64_t generatorSeed = 0; // 0 = seed from the clock
};

inline constexpr const char* kConfigFileName = "skywatch.ini";

// Missing file leaves `cfg` untouched and returns false. Unknown keys and unparsable
// values are skipped.
bool LoadConfig(Config& cfg, const std::filesystem::path& file);
bool SaveConfig(const Config& cfg, const std::filesystem::path& file);

} // namespace skywatch::core
