#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

class Logger {
public:
    /**
     * @brief Create the named loggers (core_logger, cli_logger).
     *
     * Console output goes to stderr at the level named by SYSTOOLKIT_LOG_LEVEL
     * (default info). When SYSTOOLKIT_LOG_FILE is set, a file sink records
     * everything from debug upwards with timestamps.
     */
    static void setup_loggers();

    /**
     * @brief Return a registered logger, or nullptr when logging is not set up.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static spdlog::level::level_enum level_from_env();

private:
    static std::vector<spdlog::sink_ptr> make_sinks();
};

#endif
