#pragma once
// include/skywatch/core/Log.hpp

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string_view>

namespace skywatch::core {

struct LogOptions {
    std::filesystem::path dir = "logs";
    std::string_view      level = "info";
    bool                  async   = false;
    bool                  console = true;
};

// Installs the "skywatch" logger as spdlog's default. Safe to call again (the previous
// default is replaced).
std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& opts);

// Accepts spdlog's level names ("trace".."off"); anything else maps to info.
[[nodiscard]] spdlog::level::level_enum ParseLogLevel(std::string_view name);

} // namespace skywatch::core
