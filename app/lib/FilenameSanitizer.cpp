#include "FilenameSanitizer.hpp"

#include <QString>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace {
bool is_continuation_byte(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

bool is_vowel(char ch)
{
    switch (ch) {
        case 'A': case 'E': case 'I': case 'O': case 'U':
        case 'a': case 'e': case 'i': case 'o': case 'u':
            return true;
        default:
            return false;
    }
}

bool is_space(char ch)
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}
}

namespace FilenameSanitizer {

bool is_invalid_character(char ch)
{
    return kInvalidCharacters.find(ch) != std::string_view::npos;
}


bool contains_invalid_character(const std::string& text)
{
    return std::any_of(text.begin(), text.end(), is_invalid_character);
}


std::string substitute_invalid_characters(const std::string& text, const std::string& replacement)
{
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        if (is_invalid_character(ch)) {
            result += replacement;
        } else {
            result += ch;
        }
    }
    return result;
}


std::string replace_invalid_characters(const std::string& text, const std::string& replacement)
{
    return trim(substitute_invalid_characters(text, replacement));
}


std::string sanitize_affix(const std::string& text, ReplacementCharacter replacement)
{
    std::string result = substitute_invalid_characters(text, replacement_text(replacement));
    if (replacement == ReplacementCharacter::Nothing) {
        result = collapse_whitespace(std::move(result));
    }
    return result;
}


std::string collapse_whitespace(std::string text)
{
    std::size_t pos = text.find("  ");
    while (pos != std::string::npos) {
        text.erase(pos, 1);
        pos = text.find("  ", pos);
    }
    return text;
}


std::string trim(const std::string& text)
{
    const auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    const auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}


bool contains_vowel(const std::string& text)
{
    return std::any_of(text.begin(), text.end(), is_vowel);
}


std::string drop_vowels(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(result),
                 [](char ch) { return !is_vowel(ch); });
    return result;
}


std::string truncate_by(const std::string& text, int count)
{
    if (count <= 0) {
        return text;
    }
    const int total = length(text);
    if (count >= total) {
        return {};
    }

    int keep = total - count;
    std::size_t cut = 0;
    while (cut < text.size()) {
        if (!is_continuation_byte(text[cut])) {
            if (keep == 0) {
                break;
            }
            --keep;
        }
        ++cut;
    }
    return text.substr(0, cut);
}


int length(const std::string& text)
{
    return static_cast<int>(std::count_if(text.begin(), text.end(),
                                          [](char ch) { return !is_continuation_byte(ch); }));
}


std::string fold_case(const std::string& text)
{
    return QString::fromStdString(text).toCaseFolded().toStdString();
}

}
