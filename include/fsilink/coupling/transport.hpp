#pragma once

/**
 * @file transport.hpp
 * @brief Named-value exchange with the peer solver process
 *
 * Control values (time steps, iteration bounds, convergence flags) are
 * scalars keyed by (peer rank, iteration, name) and are only exchanged by
 * the coordinating rank. Interface fields are arrays in the interface
 * ordering of the field mapper; field operations are collective over the
 * local group and every rank obtains the same status.
 *
 * Status convention: a negative value is a failure (disconnect, protocol
 * error, peer termination). Any other value is success and, for receives,
 * the number of values obtained.
 */

#include <fsilink/core/types.hpp>

#include <string>

namespace fsl {
namespace coupling {

namespace transport_status {

inline constexpr int Ok = 0;
inline constexpr int Disconnected = -1;   ///< Communication failure
inline constexpr int ProtocolError = -2;  ///< Unexpected name, iteration or count
inline constexpr int Terminated = -3;     ///< Peer announced the end of its run

inline bool failed(int status) { return status < 0; }

inline const char* to_string(int status) {
    switch (status) {
        case Disconnected: return "disconnected";
        case ProtocolError: return "protocol error";
        case Terminated: return "peer terminated";
        default: return status >= 0 ? "ok" : "unknown error";
    }
}

} // namespace transport_status

// ============================================================================
// Transport Channel Interface
// ============================================================================

class TransportChannel {
public:
    virtual ~TransportChannel() = default;

    // Control values, coordinating rank only

    virtual int send_ints(int peer, int iteration, const std::string& name,
                          ConstSpan<Int> values) = 0;
    virtual int send_reals(int peer, int iteration, const std::string& name,
                           ConstSpan<Real> values) = 0;

    virtual int receive_ints(int peer, int iteration, const std::string& name,
                             Span<Int> values) = 0;
    virtual int receive_reals(int peer, int iteration, const std::string& name,
                              Span<Real> values) = 0;

    // Interface fields, collective over the local group

    virtual int send_field(int peer, const std::string& name,
                           ConstSpan<Real> values) = 0;
    virtual int receive_field(int peer, const std::string& name,
                              Span<Real> values) = 0;

    /// Tell the peer no further messages will follow
    virtual void close(int peer) = 0;

    // Scalar helpers

    int send_scalar(int peer, int iteration, const std::string& name, Int value) {
        return send_ints(peer, iteration, name, ConstSpan<Int>(&value, 1));
    }

    int send_scalar(int peer, int iteration, const std::string& name, Real value) {
        return send_reals(peer, iteration, name, ConstSpan<Real>(&value, 1));
    }

    int receive_scalar(int peer, int iteration, const std::string& name, Int& value) {
        return receive_ints(peer, iteration, name, Span<Int>(&value, 1));
    }

    int receive_scalar(int peer, int iteration, const std::string& name, Real& value) {
        return receive_reals(peer, iteration, name, Span<Real>(&value, 1));
    }
};

} // namespace coupling
} // namespace fsl
