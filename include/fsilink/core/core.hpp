#pragma once

// Core infrastructure headers
#include <fsilink/core/types.hpp>
#include <fsilink/core/exception.hpp>
#include <fsilink/core/logger.hpp>
#include <fsilink/core/mpi.hpp>
#include <fsilink/core/communicator.hpp>

#include <string>

namespace fsl {

// ============================================================================
// Version Information
// ============================================================================

namespace version {

inline constexpr int major = 0;
inline constexpr int minor = 1;
inline constexpr int patch = 0;

inline constexpr const char* string = "0.1.0";
inline constexpr const char* build_date = __DATE__;
inline constexpr const char* build_time = __TIME__;

} // namespace version

// ============================================================================
// Initialization and Finalization
// ============================================================================

struct InitOptions {
    Logger::Level log_level = Logger::Level::Info;
    bool log_to_console = true;
    bool log_to_file = false;
    std::string log_file = "fsilink.log";
    bool enable_mpi = true;
};

inline void initialize(int* argc = nullptr, char*** argv = nullptr,
                       const InitOptions& options = InitOptions{}) {
    // MPI first, so file logging can be restricted to rank 0
    if (options.enable_mpi) {
        MPIManager::instance().initialize(argc, argv);
    }

    const bool is_root = !options.enable_mpi || MPIManager::instance().is_root();

    if (is_root && options.log_to_file) {
        if (options.log_to_console) {
            Logger::instance().init_combined(options.log_file, options.log_level);
        } else {
            Logger::instance().init_file(options.log_file, options.log_level);
        }
    } else {
        Logger::instance().init_console(is_root ? options.log_level : Logger::Level::Warn);
    }

    if (is_root) {
        FSL_LOG_INFO("=================================================");
        FSL_LOG_INFO("FSILink v{} initializing...", version::string);
        FSL_LOG_INFO("Build date: {} {}", version::build_date, version::build_time);
        FSL_LOG_INFO("=================================================");
    }
}

inline void finalize() {
    if (!MPIManager::instance().is_initialized() || MPIManager::instance().is_root()) {
        FSL_LOG_INFO("FSILink shutting down...");
    }

    MPIManager::instance().finalize();

    Logger::instance().flush();
}

// ============================================================================
// RAII Wrapper for Initialization/Finalization
// ============================================================================

class Context {
public:
    explicit Context(int* argc = nullptr, char*** argv = nullptr,
                     const InitOptions& options = InitOptions{}) {
        initialize(argc, argv, options);
    }

    explicit Context(const InitOptions& options)
        : Context(nullptr, nullptr, options) {}

    ~Context() {
        finalize();
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;
};

} // namespace fsl
