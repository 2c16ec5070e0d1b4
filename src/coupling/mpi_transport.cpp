/**
 * @file mpi_transport.cpp
 * @brief MPI transport channel implementation
 */

#include <fsilink/coupling/mpi_transport.hpp>

#include <algorithm>
#include <cstring>

namespace fsl {
namespace coupling {

MpiTransport::MpiTransport(MPI_Comm joint_comm, MPI_Comm local_comm)
    : local_comm_(local_comm)
{
    check_mpi(MPI_Comm_dup(joint_comm, &joint_comm_), "MPI_Comm_dup");

    // Peer failures must surface as status codes, not abort the run
    check_mpi(MPI_Comm_set_errhandler(joint_comm_, MPI_ERRORS_RETURN),
              "MPI_Comm_set_errhandler");

    check_mpi(MPI_Comm_rank(local_comm_, &local_rank_), "MPI_Comm_rank");
    check_mpi(MPI_Comm_size(local_comm_, &local_size_), "MPI_Comm_size");

    counts_.assign(static_cast<std::size_t>(local_size_), 0);
    displs_.assign(static_cast<std::size_t>(local_size_), 0);
}

MpiTransport::~MpiTransport() {
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (!finalized && joint_comm_ != MPI_COMM_NULL) {
        MPI_Comm_free(&joint_comm_);
    }
}

// ============================================================================
// Message Layer
// ============================================================================

int MpiTransport::send_message(int peer, int iteration, const std::string& name, Kind kind,
                               const void* data, int count, MPI_Datatype type) {
    if (name.size() > max_name_length) {
        FSL_LOG_ERROR("Transport: variable name '{}' exceeds {} characters",
                      name, max_name_length);
        return transport_status::ProtocolError;
    }

    MessageHeader header{};
    header.iteration = iteration;
    header.count = count;
    header.kind = static_cast<Int>(kind);
    std::copy(name.begin(), name.end(), header.name.begin());

    int err = MPI_Send(&header, static_cast<int>(sizeof(MessageHeader)), MPI_BYTE,
                       peer, header_tag, joint_comm_);
    if (err != MPI_SUCCESS) {
        FSL_LOG_DEBUG("Transport: header send of '{}' failed (MPI error {})", name, err);
        return transport_status::Disconnected;
    }

    if (count > 0) {
        err = MPI_Send(data, count, type, peer, data_tag, joint_comm_);
        if (err != MPI_SUCCESS) {
            FSL_LOG_DEBUG("Transport: payload send of '{}' failed (MPI error {})", name, err);
            return transport_status::Disconnected;
        }
    }

    return count;
}

int MpiTransport::receive_message(int peer, int iteration, const std::string& name, Kind kind,
                                  void* data, int expected_count, bool exact_count,
                                  MPI_Datatype type, int type_size) {
    MessageHeader header{};
    int err = MPI_Recv(&header, static_cast<int>(sizeof(MessageHeader)), MPI_BYTE,
                       peer, header_tag, joint_comm_, MPI_STATUS_IGNORE);
    if (err != MPI_SUCCESS) {
        FSL_LOG_DEBUG("Transport: header receive for '{}' failed (MPI error {})", name, err);
        return transport_status::Disconnected;
    }

    if (header.kind == static_cast<Int>(Kind::Termination)) {
        return transport_status::Terminated;
    }

    header.name.back() = '\0';
    const std::string received_name(header.name.data());

    const bool key_matches = received_name == name &&
                             header.iteration == iteration &&
                             header.kind == static_cast<Int>(kind);
    const bool count_fits = exact_count ? header.count == expected_count
                                        : header.count <= expected_count;

    if (!key_matches || !count_fits || header.count < 0) {
        FSL_LOG_WARN("Transport: expected '{}' (iteration {}, {} values), "
                     "received '{}' (iteration {}, {} values)",
                     name, iteration, expected_count,
                     received_name, header.iteration, header.count);

        // Consume the payload so the channel stays aligned
        if (header.count > 0) {
            std::vector<char> discard(static_cast<std::size_t>(header.count) *
                                      static_cast<std::size_t>(type_size));
            MPI_Recv(discard.data(), header.count, type, peer, data_tag,
                     joint_comm_, MPI_STATUS_IGNORE);
        }
        return transport_status::ProtocolError;
    }

    if (header.count > 0) {
        err = MPI_Recv(data, header.count, type, peer, data_tag,
                       joint_comm_, MPI_STATUS_IGNORE);
        if (err != MPI_SUCCESS) {
            FSL_LOG_DEBUG("Transport: payload receive for '{}' failed (MPI error {})", name, err);
            return transport_status::Disconnected;
        }
    }

    return header.count;
}

// ============================================================================
// Control Values
// ============================================================================

int MpiTransport::send_ints(int peer, int iteration, const std::string& name,
                            ConstSpan<Int> values) {
    return send_message(peer, iteration, name, Kind::Ints, values.data(),
                        static_cast<int>(values.size()), mpi_datatype<Int>());
}

int MpiTransport::send_reals(int peer, int iteration, const std::string& name,
                             ConstSpan<Real> values) {
    return send_message(peer, iteration, name, Kind::Reals, values.data(),
                        static_cast<int>(values.size()), mpi_datatype<Real>());
}

int MpiTransport::receive_ints(int peer, int iteration, const std::string& name,
                               Span<Int> values) {
    return receive_message(peer, iteration, name, Kind::Ints, values.data(),
                           static_cast<int>(values.size()), false,
                           mpi_datatype<Int>(), static_cast<int>(sizeof(Int)));
}

int MpiTransport::receive_reals(int peer, int iteration, const std::string& name,
                                Span<Real> values) {
    return receive_message(peer, iteration, name, Kind::Reals, values.data(),
                           static_cast<int>(values.size()), false,
                           mpi_datatype<Real>(), static_cast<int>(sizeof(Real)));
}

// ============================================================================
// Interface Fields
// ============================================================================

void MpiTransport::gather_layout(int local_count) {
    check_mpi(MPI_Gather(&local_count, 1, MPI_INT, counts_.data(), 1, MPI_INT,
                         0, local_comm_), "MPI_Gather");

    if (local_rank_ == 0) {
        int offset = 0;
        for (int r = 0; r < local_size_; ++r) {
            displs_[r] = offset;
            offset += counts_[r];
        }
        staging_.resize(static_cast<std::size_t>(offset));
    }
}

int MpiTransport::send_field(int peer, const std::string& name,
                             ConstSpan<Real> values) {
    const int local_count = static_cast<int>(values.size());
    gather_layout(local_count);

    check_mpi(MPI_Gatherv(values.data(), local_count, mpi_datatype<Real>(),
                          staging_.data(), counts_.data(), displs_.data(),
                          mpi_datatype<Real>(), 0, local_comm_), "MPI_Gatherv");

    int status = transport_status::Ok;
    if (local_rank_ == 0) {
        status = send_message(peer, 0, name, Kind::Field, staging_.data(),
                              static_cast<int>(staging_.size()), mpi_datatype<Real>());
    }
    broadcast(&status, 1, 0, local_comm_);

    return transport_status::failed(status) ? status : local_count;
}

int MpiTransport::receive_field(int peer, const std::string& name,
                                Span<Real> values) {
    const int local_count = static_cast<int>(values.size());
    gather_layout(local_count);

    int status = transport_status::Ok;
    if (local_rank_ == 0) {
        status = receive_message(peer, 0, name, Kind::Field, staging_.data(),
                                 static_cast<int>(staging_.size()), true,
                                 mpi_datatype<Real>(), static_cast<int>(sizeof(Real)));
    }
    broadcast(&status, 1, 0, local_comm_);

    if (transport_status::failed(status)) {
        return status;
    }

    check_mpi(MPI_Scatterv(staging_.data(), counts_.data(), displs_.data(),
                           mpi_datatype<Real>(), values.data(), local_count,
                           mpi_datatype<Real>(), 0, local_comm_), "MPI_Scatterv");

    return local_count;
}

void MpiTransport::close(int peer) {
    if (local_rank_ != 0) {
        return;
    }

    int status = send_message(peer, -1, "end", Kind::Termination, nullptr, 0, MPI_BYTE);
    if (transport_status::failed(status)) {
        FSL_LOG_DEBUG("Transport: termination notice to rank {} not delivered", peer);
    }
}

} // namespace coupling
} // namespace fsl
