#pragma once

/**
 * @file communicator.hpp
 * @brief Local parallel group of one coupled application
 *
 * All ranks of the fluid solver form one group. Collective operations of
 * the coupling layer (residual reduction, broadcast of values obtained from
 * the peer by the coordinating rank) go through this interface so that the
 * coupling logic does not depend on how the group was built.
 */

#include <fsilink/core/types.hpp>
#include <fsilink/core/mpi.hpp>

namespace fsl {

// ============================================================================
// Communicator Interface
// ============================================================================

class Communicator {
public:
    virtual ~Communicator() = default;

    virtual int rank() const = 0;
    virtual int size() const = 0;

    /// Coordinating rank: the only rank that talks to the peer
    bool is_root() const { return rank() == 0; }

    virtual void allreduce_sum(const Real* sendbuf, Real* recvbuf, int count) = 0;
    virtual void allreduce_sum(const Int64* sendbuf, Int64* recvbuf, int count) = 0;
    virtual void allreduce_min(const Int* sendbuf, Int* recvbuf, int count) = 0;

    virtual void broadcast(Real* buffer, int count, int root) = 0;
    virtual void broadcast(Int* buffer, int count, int root) = 0;

    virtual void barrier() = 0;
};

// ============================================================================
// MPI Communicator
// ============================================================================

/**
 * @brief Communicator over an MPI communicator
 *
 * Does not own the MPI communicator unless constructed with
 * take_ownership = true, in which case it is freed on destruction
 * (if MPI is still active).
 */
class MPICommunicator : public Communicator {
public:
    explicit MPICommunicator(MPI_Comm comm = MPI_COMM_WORLD, bool take_ownership = false)
        : comm_(comm), owned_(take_ownership)
    {
        check_mpi(MPI_Comm_rank(comm_, &rank_), "MPI_Comm_rank");
        check_mpi(MPI_Comm_size(comm_, &size_), "MPI_Comm_size");
    }

    ~MPICommunicator() override {
        if (owned_ && comm_ != MPI_COMM_NULL) {
            int finalized = 0;
            MPI_Finalized(&finalized);
            if (!finalized) {
                MPI_Comm_free(&comm_);
            }
        }
    }

    MPICommunicator(const MPICommunicator&) = delete;
    MPICommunicator& operator=(const MPICommunicator&) = delete;

    int rank() const override { return rank_; }
    int size() const override { return size_; }

    MPI_Comm comm() const { return comm_; }

    void allreduce_sum(const Real* sendbuf, Real* recvbuf, int count) override {
        fsl::allreduce_sum(sendbuf, recvbuf, count, comm_);
    }

    void allreduce_sum(const Int64* sendbuf, Int64* recvbuf, int count) override {
        fsl::allreduce_sum(sendbuf, recvbuf, count, comm_);
    }

    void allreduce_min(const Int* sendbuf, Int* recvbuf, int count) override {
        fsl::allreduce_min(sendbuf, recvbuf, count, comm_);
    }

    void broadcast(Real* buffer, int count, int root) override {
        fsl::broadcast(buffer, count, root, comm_);
    }

    void broadcast(Int* buffer, int count, int root) override {
        fsl::broadcast(buffer, count, root, comm_);
    }

    void barrier() override {
        check_mpi(MPI_Barrier(comm_), "MPI_Barrier");
    }

private:
    MPI_Comm comm_;
    bool owned_;
    int rank_ = 0;
    int size_ = 1;
};

} // namespace fsl
