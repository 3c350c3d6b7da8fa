#ifndef FILENAME_SANITIZER_HPP
#define FILENAME_SANITIZER_HPP

#include "Types.hpp"

#include <string>
#include <string_view>

/**
 * @brief Text helpers for turning descriptions into portable file names.
 *
 * Lengths and truncation count UTF-8 characters, not bytes. Case handling
 * is Unicode-aware through QString.
 */
namespace FilenameSanitizer {

/// Characters rejected in file names by at least one major platform.
inline constexpr std::string_view kInvalidCharacters = "#%&{}\\<>?/$!'\":@+`|=";

bool is_invalid_character(char ch);
bool contains_invalid_character(const std::string& text);

std::string substitute_invalid_characters(const std::string& text, const std::string& replacement);

// Substitutes invalid characters, then trims surrounding whitespace.
std::string replace_invalid_characters(const std::string& text, const std::string& replacement);

// Prefix, suffix and fallback text keep their edge spaces.
std::string sanitize_affix(const std::string& text, ReplacementCharacter replacement);

std::string collapse_whitespace(std::string text);
std::string trim(const std::string& text);

bool contains_vowel(const std::string& text);
std::string drop_vowels(const std::string& text);

std::string truncate_by(const std::string& text, int count);
int length(const std::string& text);

// Key for case-insensitive comparison; "CAFÉ" and "café" fold alike.
std::string fold_case(const std::string& text);

}

#endif
