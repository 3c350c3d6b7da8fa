#include "Photo.hpp"

#include <utility>

namespace {
bool is_digit(char ch)
{
    return ch >= '0' && ch <= '9';
}

std::size_t digit_run_start(const std::string& text, std::size_t end)
{
    std::size_t pos = end;
    while (pos > 0 && is_digit(text[pos - 1])) {
        --pos;
    }
    return pos;
}

int parse_capped(const std::string& text, std::size_t begin, std::size_t end)
{
    int value = 0;
    for (std::size_t i = begin; i < end; ++i) {
        value = value * 10 + (text[i] - '0');
        if (value > Photo::kMaxPreferredIndex) {
            return -1;
        }
    }
    return value;
}
}


Photo::Photo(std::string source_url, std::string original_description, std::string upload_date)
    : source_url_(std::move(source_url)),
      original_description_(std::move(original_description)),
      upload_date_(std::move(upload_date)),
      preferred_index_(parse_preferred_index(original_description_)),
      description_(original_description_)
{
}


void Photo::set_description(std::string description)
{
    description_ = std::move(description);
}


int Photo::parse_preferred_index(const std::string& description)
{
    if (description.empty()) {
        return -1;
    }

    // Parenthetical, e.g. "Kitchen (4)" or "Bathroom 4 (51)"
    if (description.back() == ')') {
        const std::size_t close = description.size() - 1;
        const std::size_t start = digit_run_start(description, close);
        if (start < close && start > 0 && description[start - 1] == '(') {
            return parse_capped(description, start, close);
        }
    }

    // Bare, e.g. "Kitchen4" or "Kitchen 14"
    const std::size_t start = digit_run_start(description, description.size());
    if (start < description.size()) {
        return parse_capped(description, start, description.size());
    }
    return -1;
}
