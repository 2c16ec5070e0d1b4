#pragma once

/**
 * @file config_reader.hpp
 * @brief Configuration file reader for coupling run parameters
 *
 * Supports a simple indentation-based key/value format:
 * ```
 * # fluid side of an FSI run
 * coupling:
 *   peer_type: "structure"
 *   max_time_steps: 200
 *   max_sub_iterations: 10
 *   tolerance: 1.0e-5
 *   reference_time_step: 1.0e-3
 *   reference_length: 0.25
 *
 * logging:
 *   level: "info"
 *   file: "fsi.log"
 *
 * surface:
 *   face_ids: [0, 1, 2, 3]
 * ```
 */

#include <fsilink/core/core.hpp>

#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace fsl {
namespace io {

/**
 * @brief Configuration value types
 */
using ConfigValue = std::variant<
    std::string,
    Real,
    Int,
    bool,
    std::vector<Real>,
    std::vector<Int>,
    std::vector<std::string>
>;

/**
 * @brief Configuration section (hierarchical key-value storage)
 */
class ConfigSection {
public:
    ConfigSection() = default;
    explicit ConfigSection(const std::string& name) : name_(name) {}

    const std::string& name() const { return name_; }

    bool has(const std::string& key) const {
        return values_.count(key) > 0;
    }

    /**
     * @brief Typed getters
     *
     * Missing keys return the default. A key holding a value of an
     * incompatible type raises InvalidArgumentError; integers are accepted
     * where reals are expected.
     */
    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    Real get_real(const std::string& key, Real default_val = 0.0) const;
    Int get_int(const std::string& key, Int default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;

    std::vector<Real> get_real_array(const std::string& key) const;
    std::vector<Int> get_int_array(const std::string& key) const;
    std::vector<std::string> get_string_array(const std::string& key) const;

    void set(const std::string& key, const ConfigValue& value) {
        values_[key] = value;
    }

    std::vector<std::string> keys() const;

    /// Get or create a subsection
    ConfigSection& subsection(const std::string& name);

    /// Get an existing subsection (throws InvalidArgumentError if absent)
    const ConfigSection& subsection(const std::string& name) const;

    bool has_subsection(const std::string& name) const {
        return subsections_.count(name) > 0;
    }

    std::vector<std::string> subsection_names() const;

private:
    const ConfigValue& value(const std::string& key) const { return values_.at(key); }

    [[noreturn]] void type_mismatch(const std::string& key, const char* expected) const;

    std::string name_;
    std::map<std::string, ConfigValue> values_;
    std::map<std::string, std::shared_ptr<ConfigSection>> subsections_;
};

/**
 * @brief Reader for the indentation-based configuration format
 */
class ConfigReader {
public:
    ConfigReader() = default;

    /// Read configuration from file (throws FileIOError)
    ConfigSection read(const std::string& filename);

    /// Read configuration from string (throws InvalidArgumentError on syntax errors)
    ConfigSection read_string(const std::string& content);

    /// Parse a single scalar or bracketed array literal
    static ConfigValue parse_value(const std::string& text);

private:
    static std::string trim(const std::string& str);
    static std::string strip_comment(const std::string& line);
    static int indent_of(const std::string& line);
};

} // namespace io
} // namespace fsl
