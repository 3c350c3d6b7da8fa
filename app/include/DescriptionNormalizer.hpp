#ifndef DESCRIPTION_NORMALIZER_HPP
#define DESCRIPTION_NORMALIZER_HPP

#include "Photo.hpp"
#include "Types.hpp"

#include <cstddef>
#include <string>

/**
 * @brief Turns original photo descriptions into file name candidates.
 *
 * One normalizer serves one processing pass: the prefix, suffix and fallback
 * text are sanitized once at construction and shared by every photo.
 */
class DescriptionNormalizer {
public:
    DescriptionNormalizer(NamingConfig config, std::size_t batch_size);

    /**
     * @brief Rewrites the working description and status of a photo.
     *
     * The description becomes prefix + cleaned text + suffix, without the
     * index. Customized photos are left untouched and false is returned.
     */
    bool normalize(Photo& photo) const;

    /// Trailing numbers, capitalization, invalid characters and fallback.
    std::string clean_text(const std::string& original) const;

    const SanitizedAffixes& affixes() const { return affixes_; }
    int index_suffix_width() const { return index_suffix_width_; }

    static std::string strip_trailing_numbers(const std::string& text);
    static std::string correct_capitalization(const std::string& text);

    /// Length reserved for " - NN" (5) or " - NNN" (6).
    static int index_suffix_width_for(std::size_t batch_size);

private:
    struct NameParts {
        std::string prefix;
        std::string description;
        std::string suffix;
    };

    int total_length(const NameParts& parts) const;
    void enforce_length_limit(NameParts& parts) const;
    bool drop_vowels_once(NameParts& parts) const;
    bool truncate_once(NameParts& parts, int overflow) const;
    PhotoStatus classify_length(int total) const;

    NamingConfig config_;
    std::string replacement_;
    SanitizedAffixes affixes_;
    int index_suffix_width_;
};

#endif
