#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

class Logger {
public:
    /**
     * @brief Registers the application loggers ("core_logger", "ui_logger").
     *
     * Each logger writes to a rotating file in the log directory and to the
     * console. Throws spdlog::spdlog_ex when the sinks cannot be created.
     */
    static void setup_loggers();

    /**
     * @brief Returns a registered logger, or nullptr when loggers were not set up.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

    static void set_development_mode(bool enabled);

private:
    static std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                       const std::string& log_file);
    static bool development_mode;
};

#endif
