#include "Settings.hpp"
#include "FilenameSanitizer.hpp"
#include "Types.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <QStandardPaths>
#include <QString>
#include <QByteArray>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif


namespace {
constexpr const char* kNamingSection = "Naming";
constexpr const char* kPathsSection = "Paths";

constexpr std::array<std::string_view, 9> kNamingKeys = {
    "Prefix", "Suffix", "UndescribedTitle", "ReplacementCharacter", "RemoveTrailingNumbers",
    "CorrectCaps", "IndexUniqueDescriptions", "OverLengthBehavior", "MaximumFilenameLength"
};
constexpr std::array<std::string_view, 1> kPathKeys = {"OutputDirectory"};

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

std::string to_upper_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

bool parse_bool(const std::string& value)
{
    return equals_ignore_case(value, "true");
}

std::string bool_to_string(bool value)
{
    return value ? "true" : "false";
}

std::optional<int> parse_int(const std::string& value)
{
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

template <std::size_t N>
bool is_known_key(const std::array<std::string_view, N>& keys, const std::string& key)
{
    return std::any_of(keys.begin(), keys.end(),
                       [&key](std::string_view known) { return equals_ignore_case(known, key); });
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }

    auto to_utf8 = [](const QString& value) -> std::string {
        const QByteArray bytes = value.toUtf8();
        return std::string(bytes.constData(), static_cast<std::size_t>(bytes.size()));
    };

    QString pictures = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    if (!pictures.isEmpty()) {
        default_output_directory = to_utf8(pictures);
    } else {
        QString home = QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
        if (!home.isEmpty()) {
            default_output_directory = to_utf8(home);
        }
    }

    if (default_output_directory.empty()) {
        default_output_directory = std::filesystem::current_path().string();
    }

    output_directory = default_output_directory;
    os_max_file_length = kOsMaxPath - FilenameSanitizer::length(output_directory);
}


std::string Settings::define_config_path()
{
    std::string AppName = "PhotoRenamer";
    if (const char* override_root = std::getenv("PHOTO_RENAMER_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / AppName / "config.ini").string();
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return std::string(appDataPath) + "\\" + AppName + "\\config.ini";
    }
#elif defined(__APPLE__)
    return std::string(getenv("HOME")) + "/Library/Application Support/" + AppName + "/config.ini";
#else
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + AppName + "/config.ini";
    }
#endif
    return "config.ini";
}


std::string Settings::get_config_dir()
{
    return config_dir.string();
}


const std::vector<std::string>& Settings::get_load_messages() const
{
    return load_messages;
}


bool Settings::load()
{
    load_messages.clear();
    if (!config.load(config_path)) {
        output_directory = default_output_directory;
        os_max_file_length = kOsMaxPath - FilenameSanitizer::length(output_directory);
        return false;
    }
    load_messages = config.getLoadMessages();

    prefix = config.getValue(kNamingSection, "Prefix", "");
    suffix = config.getValue(kNamingSection, "Suffix", "");

    const std::string undescribed_value = config.getValue(kNamingSection, "UndescribedTitle", "");
    if (!undescribed_value.empty()) {
        undescribed = undescribed_value;
    } else if (config.hasValue(kNamingSection, "UndescribedTitle")) {
        load_messages.push_back(fmt::format("Empty undescribed title, keeping \"{}\".", undescribed));
    }

    const std::string replacement_value = config.getValue(kNamingSection, "ReplacementCharacter", "HYPHEN");
    if (auto parsed = replacement_character_from_string(to_upper_copy(replacement_value))) {
        replacement_character = *parsed;
    } else {
        replacement_character = ReplacementCharacter::Hyphen;
        load_messages.push_back(fmt::format("Unknown replacement character \"{}\", using HYPHEN.", replacement_value));
    }

    const std::string over_length_value = config.getValue(kNamingSection, "OverLengthBehavior", "WARN");
    if (auto parsed = overlength_behavior_from_string(to_upper_copy(over_length_value))) {
        over_length_behavior = *parsed;
    } else {
        over_length_behavior = OverlengthBehavior::Refuse;
        load_messages.push_back(fmt::format("Unknown over-length behavior \"{}\", using REFUSE.", over_length_value));
    }

    remove_trailing_numbers = parse_bool(config.getValue(kNamingSection, "RemoveTrailingNumbers", "true"));
    correct_caps = parse_bool(config.getValue(kNamingSection, "CorrectCaps", "true"));
    index_unique = parse_bool(config.getValue(kNamingSection, "IndexUniqueDescriptions", "true"));

    const std::string length_value = config.getValue(kNamingSection, "MaximumFilenameLength", "64");
    if (auto parsed = parse_int(length_value)) {
        max_filename_length = *parsed;
    } else {
        load_messages.push_back(fmt::format("Invalid maximum filename length \"{}\", keeping {}.",
                                            length_value, max_filename_length));
    }

    const std::string directory_value = config.getValue(kPathsSection, "OutputDirectory", "");
    if (directory_value.empty() || !set_output_directory(directory_value)) {
        if (!directory_value.empty()) {
            load_messages.push_back(fmt::format("Output directory \"{}\" is not an accessible directory.",
                                                directory_value));
        }
        output_directory = default_output_directory;
        os_max_file_length = kOsMaxPath - FilenameSanitizer::length(output_directory);
    }

    for (const auto& key : config.getKeys(kNamingSection)) {
        if (!is_known_key(kNamingKeys, key)) {
            load_messages.push_back(fmt::format("Unknown option \"{}\".", key));
        }
    }
    for (const auto& key : config.getKeys(kPathsSection)) {
        if (!is_known_key(kPathKeys, key)) {
            load_messages.push_back(fmt::format("Unknown option \"{}\".", key));
        }
    }

    // IniConfig already logged its own line messages.
    const std::size_t ini_message_count = config.getLoadMessages().size();
    for (std::size_t i = ini_message_count; i < load_messages.size(); ++i) {
        settings_log(spdlog::level::warn, "{}", load_messages[i]);
    }
    return true;
}


bool Settings::save()
{
    config.setValue(kNamingSection, "Prefix", prefix);
    config.setValue(kNamingSection, "Suffix", suffix);
    config.setValue(kNamingSection, "UndescribedTitle", undescribed);
    config.setValue(kNamingSection, "ReplacementCharacter", to_string(replacement_character));
    config.setValue(kNamingSection, "RemoveTrailingNumbers", bool_to_string(remove_trailing_numbers));
    config.setValue(kNamingSection, "CorrectCaps", bool_to_string(correct_caps));
    config.setValue(kNamingSection, "IndexUniqueDescriptions", bool_to_string(index_unique));
    config.setValue(kNamingSection, "OverLengthBehavior", to_string(over_length_behavior));
    config.setValue(kNamingSection, "MaximumFilenameLength", std::to_string(max_filename_length));
    config.setValue(kPathsSection, "OutputDirectory", output_directory);

    if (!config.save(config_path)) {
        settings_log(spdlog::level::err, "Failed to save settings to {}", config_path);
        return false;
    }
    return true;
}


NamingConfig Settings::snapshot() const
{
    NamingConfig snapshot;
    snapshot.prefix = prefix;
    snapshot.suffix = suffix;
    snapshot.undescribed = undescribed;
    snapshot.replacement = replacement_character;
    snapshot.remove_trailing_numbers = remove_trailing_numbers;
    snapshot.correct_caps = correct_caps;
    snapshot.index_unique = index_unique;
    snapshot.over_length = over_length_behavior;
    snapshot.user_max_length = max_filename_length;
    snapshot.os_max_length = os_max_file_length;
    return snapshot;
}


bool Settings::apply_sanitized_affixes(const SanitizedAffixes& affixes)
{
    const bool changed = affixes.prefix != prefix
                      || affixes.suffix != suffix
                      || affixes.undescribed != undescribed;
    prefix = affixes.prefix;
    suffix = affixes.suffix;
    undescribed = affixes.undescribed;
    return changed;
}


std::string Settings::get_prefix() const
{
    return prefix;
}


void Settings::set_prefix(const std::string& value)
{
    prefix = value;
}


std::string Settings::get_suffix() const
{
    return suffix;
}


void Settings::set_suffix(const std::string& value)
{
    suffix = value;
}


std::string Settings::get_undescribed() const
{
    return undescribed;
}


void Settings::set_undescribed(const std::string& value)
{
    undescribed = value;
}


ReplacementCharacter Settings::get_replacement_character() const
{
    return replacement_character;
}


void Settings::set_replacement_character(ReplacementCharacter value)
{
    replacement_character = value;
}


bool Settings::get_remove_trailing_numbers() const
{
    return remove_trailing_numbers;
}


void Settings::set_remove_trailing_numbers(bool value)
{
    remove_trailing_numbers = value;
}


bool Settings::get_correct_caps() const
{
    return correct_caps;
}


void Settings::set_correct_caps(bool value)
{
    correct_caps = value;
}


bool Settings::get_index_unique() const
{
    return index_unique;
}


void Settings::set_index_unique(bool value)
{
    index_unique = value;
}


OverlengthBehavior Settings::get_over_length_behavior() const
{
    return over_length_behavior;
}


void Settings::set_over_length_behavior(OverlengthBehavior value)
{
    over_length_behavior = value;
}


int Settings::get_max_filename_length() const
{
    return max_filename_length;
}


void Settings::set_max_filename_length(int value)
{
    max_filename_length = value;
}


std::string Settings::get_output_directory() const
{
    return output_directory;
}


bool Settings::set_output_directory(const std::string& path)
{
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_directory(path, ec)) {
        settings_log(spdlog::level::warn, "Rejected output directory '{}'", path);
        return false;
    }
    output_directory = path;
    os_max_file_length = kOsMaxPath - FilenameSanitizer::length(output_directory);
    return true;
}


int Settings::get_os_max_file_length() const
{
    return os_max_file_length;
}
