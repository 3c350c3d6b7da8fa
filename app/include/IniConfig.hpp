#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Minimal INI reader/writer. Section and key lookups ignore case.
 *
 * Values with leading or trailing spaces are written in double quotes and
 * unquoted again on load, so free text such as a file name prefix keeps its
 * edge spaces.
 */
class IniConfig
{
public:
    bool load(const std::string &filename);
    bool save(const std::string &filename) const;

    void read(std::istream &input, const std::string &origin);
    void write(std::ostream &output) const;

    std::string getValue(const std::string &section, const std::string &key, const std::string &default_value = "") const;
    void setValue(const std::string &section, const std::string &key, const std::string &value);
    bool hasValue(const std::string &section, const std::string &key) const;
    std::vector<std::string> getKeys(const std::string &section) const;

    // Problems found by the last load(), one entry per offending line.
    const std::vector<std::string>& getLoadMessages() const { return load_messages; }

private:
    struct CaseInsensitiveLess {
        bool operator()(const std::string &lhs, const std::string &rhs) const;
    };
    using Section = std::map<std::string, std::string, CaseInsensitiveLess>;

    const std::string* find(const std::string &section, const std::string &key) const;

    std::map<std::string, Section, CaseInsensitiveLess> data;
    std::vector<std::string> load_messages;
};

#endif
