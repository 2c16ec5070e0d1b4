#pragma once

/**
 * @file mpi_transport.hpp
 * @brief Transport channel over MPI point-to-point messages
 *
 * Both applications share a joint communicator (MPI_COMM_WORLD of an MPMD
 * launch, or an inter-communicator). Every message is a fixed-size header
 * carrying the key (name, iteration), the value kind and the value count,
 * followed by the payload. Receives check the key and the count against
 * what the caller expects.
 *
 * Interface fields are gathered in local rank order on the local root,
 * exchanged root to root, then scattered back.
 *
 * Construction duplicates the joint communicator, so it is collective over
 * the joint communicator: both applications must create their transport at
 * the same point of their start-up sequence.
 */

#include <fsilink/core/core.hpp>
#include <fsilink/coupling/transport.hpp>

#include <array>
#include <string>
#include <vector>

namespace fsl {
namespace coupling {

class MpiTransport : public TransportChannel {
public:
    static constexpr int header_tag = 7101;
    static constexpr int data_tag = 7102;
    static constexpr std::size_t max_name_length = 31;

    /**
     * @param joint_comm Communicator containing both applications
     * @param local_comm Communicator of the local application
     */
    MpiTransport(MPI_Comm joint_comm, MPI_Comm local_comm);
    ~MpiTransport() override;

    MpiTransport(const MpiTransport&) = delete;
    MpiTransport& operator=(const MpiTransport&) = delete;

    int send_ints(int peer, int iteration, const std::string& name,
                  ConstSpan<Int> values) override;
    int send_reals(int peer, int iteration, const std::string& name,
                   ConstSpan<Real> values) override;

    int receive_ints(int peer, int iteration, const std::string& name,
                     Span<Int> values) override;
    int receive_reals(int peer, int iteration, const std::string& name,
                      Span<Real> values) override;

    int send_field(int peer, const std::string& name,
                   ConstSpan<Real> values) override;
    int receive_field(int peer, const std::string& name,
                      Span<Real> values) override;

    void close(int peer) override;

    bool is_local_root() const { return local_rank_ == 0; }

private:
    enum class Kind : Int {
        Ints = 1,
        Reals = 2,
        Field = 3,
        Termination = 4
    };

    struct MessageHeader {
        Int iteration;
        Int count;
        Int kind;
        std::array<char, max_name_length + 1> name;
    };

    int send_message(int peer, int iteration, const std::string& name, Kind kind,
                     const void* data, int count, MPI_Datatype type);

    int receive_message(int peer, int iteration, const std::string& name, Kind kind,
                        void* data, int expected_count, bool exact_count,
                        MPI_Datatype type, int type_size);

    void gather_layout(int local_count);

    MPI_Comm joint_comm_ = MPI_COMM_NULL;  // duplicated, owned
    MPI_Comm local_comm_;                  // borrowed
    int local_rank_ = 0;
    int local_size_ = 1;

    // Field staging on the local root, sized on first use of each layout
    std::vector<int> counts_;
    std::vector<int> displs_;
    std::vector<Real> staging_;
};

} // namespace coupling
} // namespace fsl
