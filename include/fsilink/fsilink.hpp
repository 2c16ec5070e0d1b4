#pragma once

/**
 * @file fsilink.hpp
 * @brief Main header for FSILink library
 *
 * Include this single header to get access to all FSILink functionality.
 */

// Core infrastructure
#include <fsilink/core/core.hpp>

// Configuration
#include <fsilink/io/config_reader.hpp>

// Coupling framework
#include <fsilink/coupling/coupling.hpp>

namespace fsl {

// Convenience function to get version string
inline const char* version_string() {
    return version::string;
}

namespace features {

inline void print_features() {
    int mpi_version = 0, mpi_subversion = 0;
    MPI_Get_version(&mpi_version, &mpi_subversion);

    FSL_LOG_INFO("FSILink Features:");
    FSL_LOG_INFO("  MPI standard: {}.{}", mpi_version, mpi_subversion);
    FSL_LOG_INFO("  spdlog: {}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
    FSL_LOG_INFO("  Precision: {} bytes", sizeof(Real));
}

} // namespace features

} // namespace fsl
