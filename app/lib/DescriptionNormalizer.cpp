#include "DescriptionNormalizer.hpp"
#include "FilenameSanitizer.hpp"

#include <QString>

#include <initializer_list>
#include <utility>

namespace {
bool is_digit(char ch)
{
    return ch >= '0' && ch <= '9';
}

}


DescriptionNormalizer::DescriptionNormalizer(NamingConfig config, std::size_t batch_size)
    : config_(std::move(config)),
      replacement_(replacement_text(config_.replacement)),
      index_suffix_width_(index_suffix_width_for(batch_size))
{
    affixes_.prefix = FilenameSanitizer::sanitize_affix(config_.prefix, config_.replacement);
    affixes_.suffix = FilenameSanitizer::sanitize_affix(config_.suffix, config_.replacement);
    affixes_.undescribed = FilenameSanitizer::sanitize_affix(config_.undescribed, config_.replacement);
}


int DescriptionNormalizer::index_suffix_width_for(std::size_t batch_size)
{
    return batch_size > 99 ? 6 : 5;
}


std::string DescriptionNormalizer::strip_trailing_numbers(const std::string& text)
{
    // Bare digits go first so "Bathroom 4 (51)" keeps its inner number.
    std::string result = text;
    std::size_t end = result.size();
    while (end > 0 && is_digit(result[end - 1])) {
        --end;
    }
    result.erase(end);

    if (!result.empty() && result.back() == ')') {
        std::size_t pos = result.size() - 1;
        const std::size_t close = pos;
        while (pos > 0 && is_digit(result[pos - 1])) {
            --pos;
        }
        if (pos < close && pos > 0 && result[pos - 1] == '(') {
            std::size_t cut = pos - 1;
            while (cut > 0 && result[cut - 1] == ' ') {
                --cut;
            }
            result.erase(cut);
        }
    }
    return result;
}


std::string DescriptionNormalizer::correct_capitalization(const std::string& text)
{
    if (text.empty()) {
        return text;
    }

    QString result = QString::fromStdString(text).toLower();
    for (qsizetype i = 0; i < result.size(); ++i) {
        if ((i == 0 || result.at(i - 1) == u' ') && result.at(i).isLower()) {
            result[i] = result.at(i).toUpper();
        }
    }
    return result.toStdString();
}


std::string DescriptionNormalizer::clean_text(const std::string& original) const
{
    std::string text = original;
    if (config_.remove_trailing_numbers) {
        text = strip_trailing_numbers(text);
    }
    if (config_.correct_caps) {
        text = correct_capitalization(text);
    }

    text = FilenameSanitizer::replace_invalid_characters(text, replacement_);
    if (config_.replacement == ReplacementCharacter::Nothing) {
        text = FilenameSanitizer::collapse_whitespace(std::move(text));
    }

    // Checked last so descriptions made only of spaces or symbols fall back too.
    if (text.empty()) {
        text = affixes_.undescribed;
    }
    return text;
}


int DescriptionNormalizer::total_length(const NameParts& parts) const
{
    return FilenameSanitizer::length(parts.prefix)
         + FilenameSanitizer::length(parts.description)
         + FilenameSanitizer::length(parts.suffix)
         + index_suffix_width_;
}


bool DescriptionNormalizer::drop_vowels_once(NameParts& parts) const
{
    for (std::string* part : {&parts.description, &parts.suffix, &parts.prefix}) {
        if (FilenameSanitizer::contains_vowel(*part)) {
            *part = FilenameSanitizer::drop_vowels(*part);
            return true;
        }
    }
    return false;
}


bool DescriptionNormalizer::truncate_once(NameParts& parts, int overflow) const
{
    for (std::string* part : {&parts.description, &parts.suffix, &parts.prefix}) {
        if (!part->empty()) {
            *part = FilenameSanitizer::truncate_by(*part, overflow);
            return true;
        }
    }
    return false;
}


void DescriptionNormalizer::enforce_length_limit(NameParts& parts) const
{
    const int limit = config_.length_limit();
    int total = total_length(parts);

    while (total > limit) {
        bool shortened = false;
        switch (config_.over_length) {
            case OverlengthBehavior::DropVowels:
                shortened = drop_vowels_once(parts) || truncate_once(parts, total - limit);
                break;
            case OverlengthBehavior::Truncate:
                shortened = truncate_once(parts, total - limit);
                break;
            case OverlengthBehavior::Refuse:
            case OverlengthBehavior::Warn:
            case OverlengthBehavior::DoNothing:
            default:
                // Left for the user to fix; the status reports the overflow.
                break;
        }
        if (!shortened) {
            return;
        }
        total = total_length(parts);
    }
}


PhotoStatus DescriptionNormalizer::classify_length(int total) const
{
    const int limit = config_.length_limit();
    if (total > kOsMaxPath) {
        return PhotoStatus::RefuseLength;
    }
    if (total > limit && config_.over_length == OverlengthBehavior::Refuse) {
        return PhotoStatus::RefuseLength;
    }
    if (total > limit && config_.over_length != OverlengthBehavior::DoNothing) {
        return PhotoStatus::WarningLength;
    }
    if (total < kMinimumPath) {
        return PhotoStatus::RefuseLength;
    }
    return PhotoStatus::Ready;
}


bool DescriptionNormalizer::normalize(Photo& photo) const
{
    if (photo.is_customized()) {
        return false;
    }

    NameParts parts{affixes_.prefix, clean_text(photo.original_description()), affixes_.suffix};
    enforce_length_limit(parts);

    photo.set_status(classify_length(total_length(parts)));
    photo.set_description(parts.prefix + parts.description + parts.suffix);
    photo.set_assigned_index(-1);
    return true;
}
