#include <catch2/catch_test_macros.hpp>
#include "FilenameSanitizer.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace {
bool has_message(const std::vector<std::string>& messages, const std::string& text)
{
    return std::find(messages.begin(), messages.end(), text) != messages.end();
}
}

TEST_CASE("config path honors the override directory") {
    QtCoreContext context;
    TempDir temp;
    EnvVarGuard config_guard("PHOTO_RENAMER_CONFIG_DIR", temp.path().string());

    Settings settings;
    const auto expected = temp.path() / "PhotoRenamer" / "config.ini";
    REQUIRE(settings.define_config_path() == expected.string());
    REQUIRE(std::filesystem::is_directory(settings.get_config_dir()));
}

TEST_CASE("missing config file leaves the defaults in place") {
    QtCoreContext context;
    TempDir temp;
    EnvVarGuard config_guard("PHOTO_RENAMER_CONFIG_DIR", temp.path().string());

    Settings settings;
    REQUIRE_FALSE(settings.load());
    const NamingConfig config = settings.snapshot();
    REQUIRE(config.prefix.empty());
    REQUIRE(config.undescribed == "Undescribed");
    REQUIRE(config.replacement == ReplacementCharacter::Hyphen);
    REQUIRE(config.remove_trailing_numbers);
    REQUIRE(config.correct_caps);
    REQUIRE(config.index_unique);
    REQUIRE(config.over_length == OverlengthBehavior::Warn);
    REQUIRE(config.user_max_length == 64);
    REQUIRE(config.os_max_length == kOsMaxPath - FilenameSanitizer::length(settings.get_output_directory()));
}

TEST_CASE("settings survive a save and reload, edge spaces included") {
    QtCoreContext context;
    TempDir temp;
    EnvVarGuard config_guard("PHOTO_RENAMER_CONFIG_DIR", temp.path().string());
    const auto pictures = temp.path() / "pictures";
    std::filesystem::create_directories(pictures);

    {
        Settings settings;
        settings.set_prefix("Trip ");
        settings.set_suffix(" (scan)");
        settings.set_undescribed("Mystery");
        settings.set_replacement_character(ReplacementCharacter::Nothing);
        settings.set_remove_trailing_numbers(false);
        settings.set_correct_caps(false);
        settings.set_index_unique(false);
        settings.set_over_length_behavior(OverlengthBehavior::DropVowels);
        settings.set_max_filename_length(40);
        REQUIRE(settings.set_output_directory(pictures.string()));
        REQUIRE(settings.save());
    }

    Settings reloaded;
    REQUIRE(reloaded.load());
    REQUIRE(reloaded.get_load_messages().empty());
    REQUIRE(reloaded.get_prefix() == "Trip ");
    REQUIRE(reloaded.get_suffix() == " (scan)");
    REQUIRE(reloaded.get_undescribed() == "Mystery");
    REQUIRE(reloaded.get_replacement_character() == ReplacementCharacter::Nothing);
    REQUIRE_FALSE(reloaded.get_remove_trailing_numbers());
    REQUIRE_FALSE(reloaded.get_correct_caps());
    REQUIRE_FALSE(reloaded.get_index_unique());
    REQUIRE(reloaded.get_over_length_behavior() == OverlengthBehavior::DropVowels);
    REQUIRE(reloaded.get_max_filename_length() == 40);
    REQUIRE(reloaded.get_output_directory() == pictures.string());
    REQUIRE(reloaded.get_os_max_file_length() == kOsMaxPath - FilenameSanitizer::length(pictures.string()));
}

TEST_CASE("bad config lines are reported and fall back") {
    QtCoreContext context;
    TempDir temp;
    EnvVarGuard config_guard("PHOTO_RENAMER_CONFIG_DIR", temp.path().string());
    temp.write_file("PhotoRenamer/config.ini",
                    "[naming]\n"
                    "prefix = Garden\n"
                    "this line has no separator\n"
                    "OverLengthBehavior = shorten\n"
                    "ReplacementCharacter = tilde\n"
                    "MaximumFilenameLength = lots\n"
                    "UndescribedTitle =\n"
                    "Colour = blue\n");

    Settings settings;
    REQUIRE(settings.load());
    const auto& messages = settings.get_load_messages();
    REQUIRE(has_message(messages, "Configuration error on line 3: malformed option."));
    REQUIRE(has_message(messages, "Unknown option \"Colour\"."));
    REQUIRE(has_message(messages, "Empty undescribed title, keeping \"Undescribed\"."));
    REQUIRE(messages.size() == 6);

    REQUIRE(settings.get_prefix() == "Garden");
    REQUIRE(settings.get_over_length_behavior() == OverlengthBehavior::Refuse);
    REQUIRE(settings.get_replacement_character() == ReplacementCharacter::Hyphen);
    REQUIRE(settings.get_max_filename_length() == 64);
    REQUIRE(settings.get_undescribed() == "Undescribed");
}

TEST_CASE("output directory must exist and sets the platform budget") {
    QtCoreContext context;
    TempDir temp;
    EnvVarGuard config_guard("PHOTO_RENAMER_CONFIG_DIR", temp.path().string());

    Settings settings;
    const std::string before = settings.get_output_directory();
    REQUIRE_FALSE(settings.set_output_directory((temp.path() / "missing").string()));
    REQUIRE(settings.get_output_directory() == before);

    REQUIRE(settings.set_output_directory(temp.path().string()));
    REQUIRE(settings.snapshot().os_max_length == kOsMaxPath - FilenameSanitizer::length(temp.path().string()));
}

TEST_CASE("sanitized affixes are stored without reporting a second change") {
    QtCoreContext context;
    TempDir temp;
    EnvVarGuard config_guard("PHOTO_RENAMER_CONFIG_DIR", temp.path().string());

    Settings settings;
    settings.set_prefix("Trip: ");
    const SanitizedAffixes affixes{"Trip- ", "", "Undescribed"};
    REQUIRE(settings.apply_sanitized_affixes(affixes));
    REQUIRE(settings.get_prefix() == "Trip- ");
    REQUIRE_FALSE(settings.apply_sanitized_affixes(affixes));
}
