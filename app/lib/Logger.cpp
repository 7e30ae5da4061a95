#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogFileName = "distro-hello.log";
}


std::string Logger::get_cache_directory()
{
    if (const char* xdg_cache = std::getenv("XDG_CACHE_HOME"); xdg_cache && *xdg_cache) {
        return std::string(xdg_cache) + "/distro-hello";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.cache/distro-hello";
    }
    return (std::filesystem::temp_directory_path() / "distro-hello").string();
}


std::string Logger::get_log_directory()
{
    return get_cache_directory() + "/logs";
}


void Logger::setup_loggers(bool verbose)
{
    const std::filesystem::path log_dir = get_log_directory();
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create log directory " + log_dir.string() + ": " + ec.message());
    }

    const std::string log_file = (log_dir / kLogFileName).string();
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogFileSize, kMaxLogFiles);
    console_sink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

    const std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    const auto level = verbose ? spdlog::level::debug : spdlog::level::info;

    for (const char* name : {"core_logger", "ui_logger"}) {
        if (spdlog::get(name)) {
            spdlog::drop(name);
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
