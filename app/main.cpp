#include "AppException.hpp"
#include "Logger.hpp"
#include "PhotoCollection.hpp"
#include "PhotoManifest.hpp"
#include "Settings.hpp"

#include <QCoreApplication>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

constexpr int kExitBlocked = 2;

struct ParsedArguments {
    bool development_mode{false};
    bool show_help{false};
    std::string manifest_path;
    std::optional<std::string> output_directory;
    std::optional<std::string> prefix;
    std::optional<std::string> suffix;
    std::vector<char*> qt_args;
    std::string error;
};

void print_usage(const char* program)
{
    std::fprintf(stderr,
                 "Usage: %s <manifest.json> [--output-dir DIR] [--prefix TEXT] "
                 "[--suffix TEXT] [--development]\n",
                 program);
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    parsed.qt_args.reserve(static_cast<size_t>(argc) + 1);
    if (argc > 0) {
        parsed.qt_args.push_back(argv[0]);
    }

    const auto take_value = [&](int& i, std::optional<std::string>& target) {
        if (i + 1 >= argc) {
            parsed.error = std::string("Missing value for ") + argv[i];
            return;
        }
        target = argv[++i];
    };

    for (int i = 1; i < argc && parsed.error.empty(); ++i) {
        if (std::strcmp(argv[i], "--development") == 0) {
            parsed.development_mode = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            parsed.show_help = true;
        } else if (std::strcmp(argv[i], "--output-dir") == 0) {
            take_value(i, parsed.output_directory);
        } else if (std::strcmp(argv[i], "--prefix") == 0) {
            take_value(i, parsed.prefix);
        } else if (std::strcmp(argv[i], "--suffix") == 0) {
            take_value(i, parsed.suffix);
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            parsed.error = std::string("Unknown option ") + argv[i];
        } else if (parsed.manifest_path.empty()) {
            parsed.manifest_path = argv[i];
        } else {
            parsed.error = std::string("Unexpected argument ") + argv[i];
        }
    }
    if (parsed.error.empty() && !parsed.show_help && parsed.manifest_path.empty()) {
        parsed.error = "No manifest given";
    }
    parsed.qt_args.push_back(nullptr);
    return parsed;
}

void apply_overrides(Settings& settings, const ParsedArguments& args)
{
    if (args.output_directory && !settings.set_output_directory(*args.output_directory)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_INVALID, *args.output_directory);
    }
    if (settings.get_os_max_file_length() < kMinimumPath) {
        THROW_APP_ERROR(ErrorCodes::Code::PATH_TOO_LONG, settings.get_output_directory());
    }
    if (args.prefix) {
        settings.set_prefix(*args.prefix);
    }
    if (args.suffix) {
        settings.set_suffix(*args.suffix);
    }
}

int run_application(const ParsedArguments& args)
{
    auto logger = Logger::get_logger("core_logger");

    Settings settings;
    if (!settings.load() && logger) {
        logger->info("No configuration at '{}', using defaults", settings.define_config_path());
    }
    for (const auto& message : settings.get_load_messages()) {
        std::cerr << message << '\n';
    }
    apply_overrides(settings, args);

    PhotoCollection collection(PhotoManifest::load(args.manifest_path));
    collection.set_affixes_listener([&settings](const SanitizedAffixes& affixes) {
        settings.apply_sanitized_affixes(affixes);
    });
    const PhotoStatus worst_status = collection.process_descriptions(settings.snapshot());

    std::cout << PhotoManifest::to_naming_plan_json(collection.photos(),
                                                    collection.last_batch_result(),
                                                    collection.is_execution_blocked())
              << std::endl;

    if (logger) {
        logger->info("Named {} photo(s), worst status {}", collection.size(), to_string(worst_status));
    }
    if (collection.is_execution_blocked()) {
        const auto blocked = ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::NAMING_EXECUTION_BLOCKED);
        std::cerr << blocked.get_user_message() << std::endl;
        return kExitBlocked;
    }
    return EXIT_SUCCESS;
}

} // namespace


int main(int argc, char **argv) {
    ParsedArguments parsed_args = parse_command_line(argc, argv);
    if (parsed_args.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (!parsed_args.error.empty()) {
        std::fprintf(stderr, "%s\n", parsed_args.error.c_str());
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    Logger::set_development_mode(parsed_args.development_mode);
    if (!initialize_loggers()) {
        return EXIT_FAILURE;
    }

    int qt_argc = static_cast<int>(parsed_args.qt_args.size()) - 1;
    QCoreApplication app(qt_argc, parsed_args.qt_args.data());
    QCoreApplication::setApplicationName(QStringLiteral("PhotoRenamer"));

    try {
        return run_application(parsed_args);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("{}", ex.get_full_details());
        }
        std::fprintf(stderr, "%s\n", ex.get_full_details().c_str());
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
