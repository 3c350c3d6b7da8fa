#include "IniConfig.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr const char* kBlank = " \t\r";

std::string strip(const std::string& input)
{
    const auto first = input.find_first_not_of(kBlank);
    if (first == std::string::npos) {
        return {};
    }
    return input.substr(first, input.find_last_not_of(kBlank) - first + 1);
}

std::string quote(const std::string& value)
{
    const bool padded = !value.empty() && (value.front() == ' ' || value.back() == ' ');
    return padded ? "\"" + value + "\"" : value;
}

std::string unquote(std::string value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

enum class LineKind { Ignored, Section, Option, Malformed };

// Only the first '=' separates key from value; prefixes may contain more.
LineKind classify(const std::string& line, std::string& first, std::string& second)
{
    if (line.empty() || line.front() == ';' || line.front() == '#') {
        return LineKind::Ignored;
    }
    if (line.front() == '[') {
        if (line.back() != ']') {
            return LineKind::Malformed;
        }
        first = strip(line.substr(1, line.size() - 2));
        return LineKind::Section;
    }

    const auto equals = line.find('=');
    if (equals == std::string::npos) {
        return LineKind::Malformed;
    }
    first = strip(line.substr(0, equals));
    second = unquote(strip(line.substr(equals + 1)));
    return first.empty() ? LineKind::Malformed : LineKind::Option;
}
}


bool IniConfig::CaseInsensitiveLess::operator()(const std::string &lhs, const std::string &rhs) const
{
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}


void IniConfig::read(std::istream &input, const std::string &origin)
{
    load_messages.clear();

    std::string raw_line;
    std::string section;
    int line_number = 0;
    while (std::getline(input, raw_line)) {
        ++line_number;
        std::string first;
        std::string second;
        switch (classify(strip(raw_line), first, second)) {
            case LineKind::Section:
                section = std::move(first);
                break;
            case LineKind::Option:
                data[section][first] = std::move(second);
                break;
            case LineKind::Malformed:
                load_messages.push_back(fmt::format("Configuration error on line {}: malformed option.", line_number));
                break;
            case LineKind::Ignored:
                break;
        }
    }

    for (const auto& message : load_messages) {
        ini_log(spdlog::level::warn, "{} ({})", message, origin);
    }
}


bool IniConfig::load(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        load_messages.clear();
        ini_log(spdlog::level::warn, "Failed to open config file: {}", filename);
        return false;
    }
    read(file, filename);
    return true;
}


void IniConfig::write(std::ostream &output) const
{
    for (const auto& [section, options] : data) {
        output << "[" << section << "]\n";
        for (const auto& [key, value] : options) {
            output << key << " = " << quote(value) << "\n";
        }
        output << "\n";
    }
}


bool IniConfig::save(const std::string &filename) const
{
    std::ofstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }
    write(file);
    return static_cast<bool>(file);
}


const std::string* IniConfig::find(const std::string &section, const std::string &key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return nullptr;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it == sec_it->second.end() ? nullptr : &key_it->second;
}


std::string IniConfig::getValue(const std::string &section, const std::string &key, const std::string &default_value) const
{
    const std::string* value = find(section, key);
    return value ? *value : default_value;
}


void IniConfig::setValue(const std::string &section, const std::string &key, const std::string &value)
{
    data[section][key] = value;
}


bool IniConfig::hasValue(const std::string &section, const std::string &key) const
{
    return find(section, key) != nullptr;
}


std::vector<std::string> IniConfig::getKeys(const std::string &section) const
{
    std::vector<std::string> keys;
    const auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        std::transform(sec_it->second.begin(), sec_it->second.end(), std::back_inserter(keys),
                       [](const auto& option) { return option.first; });
    }
    return keys;
}
