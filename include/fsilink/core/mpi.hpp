#pragma once

#include <fsilink/core/types.hpp>
#include <fsilink/core/exception.hpp>
#include <fsilink/core/logger.hpp>

#include <mpi.h>

#include <string>
#include <type_traits>

namespace fsl {

// ============================================================================
// MPI Manager
// ============================================================================

class MPIManager {
public:
    static MPIManager& instance() {
        static MPIManager manager;
        return manager;
    }

    void initialize(int* argc = nullptr, char*** argv = nullptr) {
        if (is_initialized_) {
            FSL_LOG_WARN("MPI already initialized");
            return;
        }

        int already = 0;
        MPI_Initialized(&already);
        if (already) {
            // Initialized by the host application, which also finalizes it
            owns_mpi_ = false;
        } else {
            int provided = 0;
            int err = MPI_Init_thread(argc, argv, MPI_THREAD_FUNNELED, &provided);
            if (err != MPI_SUCCESS) {
                throw MPIError("MPI_Init_thread", err);
            }
            owns_mpi_ = true;
        }

        is_initialized_ = true;

        MPI_Comm_rank(MPI_COMM_WORLD, &rank_);
        MPI_Comm_size(MPI_COMM_WORLD, &size_);

        if (rank_ == 0) {
            print_configuration();
        }
    }

    void finalize() {
        if (!is_initialized_) {
            return;
        }

        if (owns_mpi_) {
            int finalized = 0;
            MPI_Finalized(&finalized);
            if (!finalized) {
                MPI_Finalize();
            }
        }
        is_initialized_ = false;

        if (rank_ == 0) {
            FSL_LOG_INFO("MPI finalized");
        }
    }

    bool is_initialized() const { return is_initialized_; }

    int rank() const { return rank_; }
    int size() const { return size_; }
    bool is_root() const { return rank_ == 0; }

    MPI_Comm comm_world() const { return MPI_COMM_WORLD; }

    void barrier(MPI_Comm comm = MPI_COMM_WORLD) const {
        MPI_Barrier(comm);
    }

    void print_configuration() const {
        FSL_LOG_INFO("MPI Configuration:");
        FSL_LOG_INFO("  Number of processes: {}", size_);

        int version = 0, subversion = 0;
        MPI_Get_version(&version, &subversion);
        FSL_LOG_INFO("  MPI version: {}.{}", version, subversion);

        char lib_version[MPI_MAX_LIBRARY_VERSION_STRING];
        int len = 0;
        MPI_Get_library_version(lib_version, &len);
        FSL_LOG_DEBUG("  MPI library: {}", std::string(lib_version, len));
    }

private:
    MPIManager() = default;

    ~MPIManager() {
        if (is_initialized_) {
            finalize();
        }
    }

    MPIManager(const MPIManager&) = delete;
    MPIManager& operator=(const MPIManager&) = delete;

    bool is_initialized_ = false;
    bool owns_mpi_ = false;
    int rank_ = 0;
    int size_ = 1;
};

// ============================================================================
// Datatype Mapping
// ============================================================================

template<typename T>
inline MPI_Datatype mpi_datatype() {
    if constexpr (std::is_same_v<T, int>) {
        return MPI_INT;
    } else if constexpr (std::is_same_v<T, long>) {
        return MPI_LONG;
    } else if constexpr (std::is_same_v<T, long long>) {
        return MPI_LONG_LONG;
    } else if constexpr (std::is_same_v<T, unsigned long>) {
        return MPI_UNSIGNED_LONG;
    } else if constexpr (std::is_same_v<T, unsigned long long>) {
        return MPI_UNSIGNED_LONG_LONG;
    } else if constexpr (std::is_same_v<T, float>) {
        return MPI_FLOAT;
    } else if constexpr (std::is_same_v<T, double>) {
        return MPI_DOUBLE;
    } else if constexpr (std::is_same_v<T, char>) {
        return MPI_CHAR;
    } else {
        static_assert(std::is_arithmetic_v<T>, "Unsupported type for MPI operation");
        return MPI_BYTE;
    }
}

inline void check_mpi(int err, const char* operation) {
    if (err != MPI_SUCCESS) {
        throw MPIError(operation, err);
    }
}

// ============================================================================
// MPI Collective Operations
// ============================================================================

template<typename T>
inline void broadcast(T* buffer, int count, int root, MPI_Comm comm = MPI_COMM_WORLD) {
    check_mpi(MPI_Bcast(buffer, count, mpi_datatype<T>(), root, comm), "MPI_Bcast");
}

template<typename T>
inline void allreduce_sum(const T* sendbuf, T* recvbuf, int count,
                          MPI_Comm comm = MPI_COMM_WORLD) {
    check_mpi(MPI_Allreduce(sendbuf, recvbuf, count, mpi_datatype<T>(), MPI_SUM, comm),
              "MPI_Allreduce");
}

template<typename T>
inline void allreduce_max(const T* sendbuf, T* recvbuf, int count,
                          MPI_Comm comm = MPI_COMM_WORLD) {
    check_mpi(MPI_Allreduce(sendbuf, recvbuf, count, mpi_datatype<T>(), MPI_MAX, comm),
              "MPI_Allreduce");
}

template<typename T>
inline void allreduce_min(const T* sendbuf, T* recvbuf, int count,
                          MPI_Comm comm = MPI_COMM_WORLD) {
    check_mpi(MPI_Allreduce(sendbuf, recvbuf, count, mpi_datatype<T>(), MPI_MIN, comm),
              "MPI_Allreduce");
}

} // namespace fsl
