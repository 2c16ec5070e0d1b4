/**
 * @file config_reader.cpp
 * @brief Configuration reader implementation
 */

#include <fsilink/io/config_reader.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fsl {
namespace io {

namespace {

bool is_quoted(const std::string& s) {
    return s.size() >= 2 &&
           ((s.front() == '"' && s.back() == '"') ||
            (s.front() == '\'' && s.back() == '\''));
}

bool parse_int(const std::string& s, Int& out) {
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (first != last && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

bool parse_real(const std::string& s, Real& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

} // namespace

// ============================================================================
// ConfigSection Implementation
// ============================================================================

void ConfigSection::type_mismatch(const std::string& key, const char* expected) const {
    throw InvalidArgumentError("Config key '" + name_ + "." + key +
                               "' does not hold a " + expected + " value");
}

std::string ConfigSection::get_string(const std::string& key, const std::string& default_val) const {
    if (!has(key)) return default_val;

    if (const auto* s = std::get_if<std::string>(&value(key))) {
        return *s;
    }
    type_mismatch(key, "string");
}

Real ConfigSection::get_real(const std::string& key, Real default_val) const {
    if (!has(key)) return default_val;

    const auto& val = value(key);
    if (const auto* r = std::get_if<Real>(&val)) return *r;
    if (const auto* i = std::get_if<Int>(&val)) return static_cast<Real>(*i);
    type_mismatch(key, "real");
}

Int ConfigSection::get_int(const std::string& key, Int default_val) const {
    if (!has(key)) return default_val;

    if (const auto* i = std::get_if<Int>(&value(key))) {
        return *i;
    }
    type_mismatch(key, "integer");
}

bool ConfigSection::get_bool(const std::string& key, bool default_val) const {
    if (!has(key)) return default_val;

    if (const auto* b = std::get_if<bool>(&value(key))) {
        return *b;
    }
    type_mismatch(key, "boolean");
}

std::vector<Real> ConfigSection::get_real_array(const std::string& key) const {
    if (!has(key)) return {};

    const auto& val = value(key);
    if (const auto* reals = std::get_if<std::vector<Real>>(&val)) {
        return *reals;
    }
    if (const auto* ints = std::get_if<std::vector<Int>>(&val)) {
        return std::vector<Real>(ints->begin(), ints->end());
    }
    type_mismatch(key, "real array");
}

std::vector<Int> ConfigSection::get_int_array(const std::string& key) const {
    if (!has(key)) return {};

    if (const auto* ints = std::get_if<std::vector<Int>>(&value(key))) {
        return *ints;
    }
    type_mismatch(key, "integer array");
}

std::vector<std::string> ConfigSection::get_string_array(const std::string& key) const {
    if (!has(key)) return {};

    if (const auto* strings = std::get_if<std::vector<std::string>>(&value(key))) {
        return *strings;
    }
    type_mismatch(key, "string array");
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& entry : values_) {
        result.push_back(entry.first);
    }
    return result;
}

ConfigSection& ConfigSection::subsection(const std::string& name) {
    auto& slot = subsections_[name];
    if (!slot) {
        slot = std::make_shared<ConfigSection>(name);
    }
    return *slot;
}

const ConfigSection& ConfigSection::subsection(const std::string& name) const {
    auto it = subsections_.find(name);
    if (it == subsections_.end()) {
        throw InvalidArgumentError("Subsection not found: " + name);
    }
    return *it->second;
}

std::vector<std::string> ConfigSection::subsection_names() const {
    std::vector<std::string> result;
    result.reserve(subsections_.size());
    for (const auto& entry : subsections_) {
        result.push_back(entry.first);
    }
    return result;
}

// ============================================================================
// ConfigReader Implementation
// ============================================================================

ConfigSection ConfigReader::read(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOError(filename, "open");
    }

    FSL_LOG_INFO("Reading config file: {}", filename);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return read_string(buffer.str());
}

ConfigSection ConfigReader::read_string(const std::string& content) {
    ConfigSection root("root");

    struct Level {
        int indent;
        ConfigSection* section;
    };
    std::vector<Level> stack{{-1, &root}};

    std::istringstream stream(content);
    std::string raw;
    int line_no = 0;

    while (std::getline(stream, raw)) {
        ++line_no;

        const std::string line = strip_comment(raw);
        if (trim(line).empty()) {
            continue;
        }

        const int indent = indent_of(line);
        while (stack.size() > 1 && indent <= stack.back().indent) {
            stack.pop_back();
        }

        const std::string content_part = trim(line);
        const auto colon = content_part.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw InvalidArgumentError("Config line " + std::to_string(line_no) +
                                       ": expected 'key: value', got '" + content_part + "'");
        }

        const std::string key = trim(content_part.substr(0, colon));
        const std::string rest = trim(content_part.substr(colon + 1));

        ConfigSection& current = *stack.back().section;
        if (rest.empty()) {
            stack.push_back({indent, &current.subsection(key)});
        } else {
            current.set(key, parse_value(rest));
        }
    }

    return root;
}

ConfigValue ConfigReader::parse_value(const std::string& text) {
    const std::string s = trim(text);

    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        std::vector<std::string> items;
        std::string inner = s.substr(1, s.size() - 2);
        std::stringstream ss(inner);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }

        bool all_int = true;
        bool all_numeric = true;
        std::vector<Int> ints;
        std::vector<Real> reals;
        for (const auto& it : items) {
            Int i = 0;
            Real r = 0.0;
            if (parse_int(it, i)) {
                ints.push_back(i);
                reals.push_back(static_cast<Real>(i));
            } else if (parse_real(it, r)) {
                all_int = false;
                reals.push_back(r);
            } else {
                all_int = false;
                all_numeric = false;
                break;
            }
        }

        if (all_int) return ints;
        if (all_numeric) return reals;

        std::vector<std::string> strings;
        strings.reserve(items.size());
        for (const auto& it : items) {
            strings.push_back(is_quoted(it) ? it.substr(1, it.size() - 2) : it);
        }
        return strings;
    }

    if (is_quoted(s)) {
        return s.substr(1, s.size() - 2);
    }

    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "no" || lower == "off") return false;

    Int i = 0;
    if (parse_int(s, i)) return i;

    Real r = 0.0;
    if (parse_real(s, r)) return r;

    return s;
}

std::string ConfigReader::trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ConfigReader::strip_comment(const std::string& line) {
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote != '\0') {
            if (c == quote) quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

int ConfigReader::indent_of(const std::string& line) {
    int indent = 0;
    for (char c : line) {
        if (c == ' ') {
            indent += 1;
        } else if (c == '\t') {
            indent += 4;
        } else {
            break;
        }
    }
    return indent;
}

} // namespace io
} // namespace fsl
