#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <string>
#include <filesystem>
#include <vector>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    /**
     * @brief Immutable naming options for one processing pass.
     */
    NamingConfig snapshot() const;

    /**
     * @brief Stores the sanitized prefix, suffix and fallback echoed by a pass.
     * @return True when any of the stored values changed.
     */
    bool apply_sanitized_affixes(const SanitizedAffixes& affixes);

    std::string get_prefix() const;
    void set_prefix(const std::string& value);

    std::string get_suffix() const;
    void set_suffix(const std::string& value);

    std::string get_undescribed() const;
    void set_undescribed(const std::string& value);

    ReplacementCharacter get_replacement_character() const;
    void set_replacement_character(ReplacementCharacter value);

    bool get_remove_trailing_numbers() const;
    void set_remove_trailing_numbers(bool value);

    bool get_correct_caps() const;
    void set_correct_caps(bool value);

    bool get_index_unique() const;
    void set_index_unique(bool value);

    OverlengthBehavior get_over_length_behavior() const;
    void set_over_length_behavior(OverlengthBehavior value);

    int get_max_filename_length() const;
    void set_max_filename_length(int value);

    std::string get_output_directory() const;
    /**
     * @brief Selects the download directory and derives the OS length budget.
     * @return False (and no change) when the path is not an existing directory.
     */
    bool set_output_directory(const std::string& path);
    int get_os_max_file_length() const;

    std::string define_config_path();
    std::string get_config_dir();
    const std::vector<std::string>& get_load_messages() const;

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;
    std::vector<std::string> load_messages;

    std::string prefix;
    std::string suffix;
    std::string undescribed{"Undescribed"};
    ReplacementCharacter replacement_character{ReplacementCharacter::Hyphen};
    bool remove_trailing_numbers{true};
    bool correct_caps{true};
    bool index_unique{true};
    OverlengthBehavior over_length_behavior{OverlengthBehavior::Warn};
    int max_filename_length{64};
    std::string default_output_directory;
    std::string output_directory;
    int os_max_file_length{kOsMaxPath};
};

#endif
