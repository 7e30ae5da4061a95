#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

class Logger {
public:
    static void setup_loggers(bool verbose = false);
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static std::string get_log_directory();

private:
    static std::string get_cache_directory();
};

#endif
