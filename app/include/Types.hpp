#ifndef TYPES_HPP
#define TYPES_HPP

#include <optional>
#include <string>

/**
 * @brief Readiness or error state of a photo, declared from best to worst.
 */
enum class PhotoStatus {
    Saved,           ///< Written to the file system.
    Ready,           ///< Default, starting state.
    WarningLength,   ///< Longer than the user limit; execution still allowed.
    ErrorMinor,
    RefuseLength,    ///< Too long for the platform or too short to index.
    RefuseSymbol,    ///< Contains a character that is invalid in file names.
    RefuseDuplicate, ///< Same name as another photo.
    ErrorSevere      ///< Writing to or modifying the file failed.
};

inline bool is_worse_than(PhotoStatus status, PhotoStatus other) {
    return static_cast<int>(status) > static_cast<int>(other);
}

inline bool is_at_least_as_bad_as(PhotoStatus status, PhotoStatus other) {
    return static_cast<int>(status) >= static_cast<int>(other);
}

// Returns the more severe status; `a` when both are equal.
inline PhotoStatus worst(PhotoStatus a, PhotoStatus b) {
    return is_worse_than(b, a) ? b : a;
}

inline std::string to_string(PhotoStatus status) {
    switch (status) {
        case PhotoStatus::Saved: return "SAVED";
        case PhotoStatus::Ready: return "READY";
        case PhotoStatus::WarningLength: return "WARNING_LENGTH";
        case PhotoStatus::ErrorMinor: return "ERROR_MINOR";
        case PhotoStatus::RefuseLength: return "REFUSE_LENGTH";
        case PhotoStatus::RefuseSymbol: return "REFUSE_SYMBOL";
        case PhotoStatus::RefuseDuplicate: return "REFUSE_DUPLICATE";
        case PhotoStatus::ErrorSevere: return "ERROR_SEVERE";
        default: return "UNKNOWN";
    }
}

enum class OverlengthBehavior {Refuse, Warn, Truncate, DropVowels, DoNothing};

inline std::string to_string(OverlengthBehavior behavior) {
    switch (behavior) {
        case OverlengthBehavior::Refuse: return "REFUSE";
        case OverlengthBehavior::Warn: return "WARN";
        case OverlengthBehavior::Truncate: return "TRUNCATE";
        case OverlengthBehavior::DropVowels: return "DROP_VOWELS";
        case OverlengthBehavior::DoNothing: return "DO_NOTHING";
        default: return "WARN";
    }
}

inline std::optional<OverlengthBehavior> overlength_behavior_from_string(const std::string& value) {
    if (value == "REFUSE") return OverlengthBehavior::Refuse;
    if (value == "WARN") return OverlengthBehavior::Warn;
    if (value == "TRUNCATE") return OverlengthBehavior::Truncate;
    if (value == "DROP_VOWELS") return OverlengthBehavior::DropVowels;
    if (value == "DO_NOTHING") return OverlengthBehavior::DoNothing;
    return std::nullopt;
}

enum class ReplacementCharacter {Hyphen, Comma, Nothing};

inline std::string to_string(ReplacementCharacter replacement) {
    switch (replacement) {
        case ReplacementCharacter::Hyphen: return "HYPHEN";
        case ReplacementCharacter::Comma: return "COMMA";
        case ReplacementCharacter::Nothing: return "NOTHING";
        default: return "HYPHEN";
    }
}

inline std::optional<ReplacementCharacter> replacement_character_from_string(const std::string& value) {
    if (value == "HYPHEN") return ReplacementCharacter::Hyphen;
    if (value == "COMMA") return ReplacementCharacter::Comma;
    if (value == "NOTHING") return ReplacementCharacter::Nothing;
    return std::nullopt;
}

// Text substituted for each invalid character.
inline std::string replacement_text(ReplacementCharacter replacement) {
    switch (replacement) {
        case ReplacementCharacter::Hyphen: return "-";
        case ReplacementCharacter::Comma: return ",";
        case ReplacementCharacter::Nothing:
        default: return "";
    }
}

/// Absolute path length ceiling; descriptions above it are always refused.
constexpr int kOsMaxPath = 254;

/// Room for " - 001" plus at least one character of content.
constexpr int kMinimumPath = 8;

/**
 * @brief Immutable snapshot of the naming options for one processing pass.
 */
struct NamingConfig {
    std::string prefix;
    std::string suffix;
    std::string undescribed{"Undescribed"};
    ReplacementCharacter replacement{ReplacementCharacter::Hyphen};
    bool remove_trailing_numbers{true};
    bool correct_caps{true};
    bool index_unique{true};
    OverlengthBehavior over_length{OverlengthBehavior::Warn};
    int user_max_length{64};
    int os_max_length{kOsMaxPath}; ///< kOsMaxPath minus the output directory path length.

    int length_limit() const {
        return user_max_length < os_max_length ? user_max_length : os_max_length;
    }
};

/**
 * @brief Prefix, suffix and fallback text after invalid-character treatment.
 *
 * Echoed back to the settings layer so the UI can show what will be used.
 */
struct SanitizedAffixes {
    std::string prefix;
    std::string suffix;
    std::string undescribed;
};

#endif
