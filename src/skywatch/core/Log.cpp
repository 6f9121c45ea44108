// src/skywatch/core/Log.cpp
#include "skywatch/core/Log.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace skywatch::core {

namespace {

constexpr const char* kLoggerName = "skywatch";

void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger,
                              spdlog::level::level_enum level)
{
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace

spdlog::level::level_enum ParseLogLevel(std::string_view name)
{
    const std::string s(name);
    if (s == "off")
        return spdlog::level::off;

    // from_str() returns off for anything it does not know.
    const auto level = spdlog::level::from_str(s);
    return level == spdlog::level::off ? spdlog::level::info : level;
}

std::shared_ptr<spdlog::logger> InitLogging(const LogOptions& opts)
{
    std::vector<spdlog::sink_ptr> sinks;

    std::error_code ec;
    fs::create_directories(opts.dir, ec);
    const auto log_path = opts.dir / "skywatch.log";

    bool file_sink_failed = false;
    try {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(), true));
    } catch (const spdlog::spdlog_ex& e) {
        // Fall back to the console only; reported once the logger exists.
        file_sink_failed = true;
        if (!opts.console)
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        spdlog::error("InitLogging: cannot open {}: {}", log_path.string(), e.what());
    }

    if (opts.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::shared_ptr<spdlog::logger> logger;
    spdlog::drop(kLoggerName);

    if (opts.async)
    {
        static std::once_flag s_thread_pool_once;
        std::call_once(s_thread_pool_once, [] {
            spdlog::init_thread_pool(8192, 1);
        });

        logger = std::make_shared<spdlog::async_logger>(
            kLoggerName,
            sinks.begin(), sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::overrun_oldest);
    }
    else
    {
        logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    }

    configure_default_logger(logger, ParseLogLevel(opts.level));

    if (file_sink_failed)
        spdlog::warn("InitLogging: logging to console only ({})", log_path.string());
    else if (ec)
        spdlog::debug("InitLogging: create_directories({}) reported {}", opts.dir.string(), ec.message());

    return logger;
}

} // namespace skywatch::core
