#pragma once

#include <exception>
#include <source_location>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fsl {

using SourceLocation = std::source_location;

// ============================================================================
// Exception Base Class
// ============================================================================

class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message,
                       const SourceLocation& location = SourceLocation::current())
        : std::runtime_error(format_message(message, location))
        , file_(location.file_name())
        , line_(location.line())
        , function_(location.function_name())
    {}

    const char* file() const noexcept { return file_; }
    int line() const noexcept { return static_cast<int>(line_); }
    const char* function() const noexcept { return function_; }

private:
    const char* file_;
    unsigned line_;
    const char* function_;

    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        std::ostringstream oss;
        oss << loc.file_name() << ":"
            << loc.line() << " in "
            << loc.function_name() << "(): "
            << msg;
        return oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message,
                        const SourceLocation& location = SourceLocation::current())
        : Exception(message, location) {}
};

class InvalidArgumentError : public Exception {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const SourceLocation& location = SourceLocation::current())
        : Exception(message, location) {}
};

class OutOfRangeError : public Exception {
public:
    explicit OutOfRangeError(const std::string& message,
                             const SourceLocation& location = SourceLocation::current())
        : Exception(message, location) {}
};

class FileIOError : public Exception {
public:
    explicit FileIOError(
        const std::string& filename,
        const std::string& operation = "access",
        const SourceLocation& location = SourceLocation::current())
        : Exception("Failed to " + operation + " file: " + filename, location)
    {}
};

/**
 * @brief Invalid or inconsistent coupling setup
 *
 * Raised for conditions that cannot be recovered at run time: a
 * non-positive reference length, a geometry registered twice, an
 * ambiguous peer topology or out-of-range run parameters. The message
 * names the offending parameter.
 */
class ConfigurationError : public Exception {
public:
    explicit ConfigurationError(const std::string& message,
                                const SourceLocation& location = SourceLocation::current())
        : Exception(message, location) {}
};

class MPIError : public Exception {
public:
    explicit MPIError(
        const std::string& operation,
        int error_code,
        const SourceLocation& location = SourceLocation::current())
        : Exception(format_mpi_message(operation, error_code), location)
        , error_code_(error_code)
    {}

    int error_code() const noexcept { return error_code_; }

private:
    int error_code_;

    static std::string format_mpi_message(const std::string& op, int code) {
        std::ostringstream oss;
        oss << "MPI error during " << op << " (error code: " << code << ")";
        return oss.str();
    }
};

// ============================================================================
// Assertion Macros
// ============================================================================

#define FSL_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::fsl::LogicError( \
                std::string("Assertion failed: ") + #condition + ": " + (message) \
            ); \
        } \
    } while (false)

#define FSL_REQUIRE(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::fsl::InvalidArgumentError( \
                std::string("Requirement failed: ") + #condition + ": " + (message) \
            ); \
        } \
    } while (false)

#define FSL_CHECK_RANGE(index, size) \
    do { \
        if ((index) >= (size)) { \
            throw ::fsl::OutOfRangeError( \
                "Index " + std::to_string(index) + " out of range [0, " + \
                std::to_string(size) + ")" \
            ); \
        } \
    } while (false)

} // namespace fsl
