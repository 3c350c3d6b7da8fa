#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}

bool Logger::development_mode = false;


std::string Logger::get_log_directory()
{
    std::filesystem::path base;
    if (const char* override_root = std::getenv("PHOTO_RENAMER_CONFIG_DIR")) {
        base = override_root;
    } else if (const char* home = std::getenv("HOME")) {
#if defined(__APPLE__)
        base = std::filesystem::path(home) / "Library" / "Application Support";
#else
        base = std::filesystem::path(home) / ".config";
#endif
    } else {
        base = std::filesystem::current_path();
    }
    return (base / "PhotoRenamer" / "logs").string();
}


void Logger::set_development_mode(bool enabled)
{
    development_mode = enabled;
    const auto level = enabled ? spdlog::level::debug : spdlog::level::info;
    for (const char* name : {"core_logger", "ui_logger"}) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}


std::shared_ptr<spdlog::logger> Logger::make_logger(const std::string& name,
                                                    const std::string& log_file)
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_level(spdlog::level::trace);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(development_mode ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    return logger;
}


void Logger::setup_loggers()
{
    const std::filesystem::path log_dir = get_log_directory();
    std::filesystem::create_directories(log_dir);

    for (const char* name : {"core_logger", "ui_logger"}) {
        if (spdlog::get(name)) {
            continue;
        }
        const std::string file_name = std::string(name) + ".log";
        spdlog::register_logger(make_logger(name, (log_dir / file_name).string()));
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
