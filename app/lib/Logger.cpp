#include "Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace {
constexpr const char* kLoggerNames[] = {"core_logger", "cli_logger"};
}


spdlog::level::level_enum Logger::level_from_env()
{
    const char* value = std::getenv("SYSTOOLKIT_LOG_LEVEL");
    if (!value || !*value) {
        return spdlog::level::info;
    }
    std::string name(value);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"; only honor an explicit "off"
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}


std::vector<spdlog::sink_ptr> Logger::make_sinks()
{
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level_from_env());
    console_sink->set_pattern("%^%l%$: %v");
    sinks.push_back(console_sink);

    const char* log_file = std::getenv("SYSTOOLKIT_LOG_FILE");
    if (log_file && *log_file) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }
    return sinks;
}


void Logger::setup_loggers()
{
    const auto sinks = make_sinks();
    for (const char* name : kLoggerNames) {
        if (spdlog::get(name)) {
            continue;
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
