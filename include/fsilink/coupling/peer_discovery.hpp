#pragma once

/**
 * @file peer_discovery.hpp
 * @brief Locating the structural solver among the launched applications
 *
 * Discovery is pluggable: anything able to list the applications of the
 * run can serve (an MPI registry built at start-up, a static list from the
 * run configuration). Matching on the peer type yields one of three
 * outcomes; none is recoverable (dry run), one is the normal case, more
 * than one is a fatal configuration error.
 */

#include <fsilink/core/core.hpp>

#include <string>
#include <utility>
#include <vector>

namespace fsl {
namespace coupling {

/**
 * @brief Identity of the remote solver as seen by the session
 */
struct PeerInfo {
    int root_rank = -1;        ///< Peer root in the joint communicator, -1 if none
    std::string app_type;
    std::string app_name;

    bool found() const { return root_rank >= 0; }
};

/**
 * @brief Description of one launched application
 */
struct ApplicationInfo {
    int root_rank = -1;        ///< Lowest rank of the application
    int n_ranks = 0;
    std::string app_type;
    std::string app_name;
};

enum class DiscoveryOutcome {
    NoPeer,
    SinglePeer,
    AmbiguousPeers
};

struct DiscoveryResult {
    DiscoveryOutcome outcome = DiscoveryOutcome::NoPeer;
    PeerInfo peer;             ///< Valid for SinglePeer only
    Index n_matches = 0;
};

inline const char* to_string(DiscoveryOutcome outcome) {
    switch (outcome) {
        case DiscoveryOutcome::NoPeer: return "NoPeer";
        case DiscoveryOutcome::SinglePeer: return "SinglePeer";
        case DiscoveryOutcome::AmbiguousPeers: return "AmbiguousPeers";
        default: return "Unknown";
    }
}

// ============================================================================
// Discovery Interface
// ============================================================================

class PeerDiscovery {
public:
    virtual ~PeerDiscovery() = default;

    virtual std::vector<ApplicationInfo> applications() const = 0;

    /// Index of the calling application in applications(), -1 if not listed
    virtual int local_application() const = 0;
};

/**
 * @brief Fixed application list, e.g. from the run configuration
 */
class StaticPeerDiscovery : public PeerDiscovery {
public:
    explicit StaticPeerDiscovery(std::vector<ApplicationInfo> apps, int local_app = -1)
        : apps_(std::move(apps)), local_app_(local_app) {}

    std::vector<ApplicationInfo> applications() const override { return apps_; }
    int local_application() const override { return local_app_; }

private:
    std::vector<ApplicationInfo> apps_;
    int local_app_;
};

/**
 * @brief Application registry of an MPMD launch
 *
 * Every rank of every application declares its (type, name) pair; the
 * pairs are all-gathered over the world communicator and each distinct
 * pair becomes one application rooted at its lowest rank. The registry
 * also splits the world communicator into one local communicator per
 * application. Construction is collective over the world communicator.
 */
class MpiApplicationRegistry : public PeerDiscovery {
public:
    static constexpr std::size_t max_name_length = 63;

    MpiApplicationRegistry(MPI_Comm world, const std::string& app_type,
                           const std::string& app_name);
    ~MpiApplicationRegistry() override;

    MpiApplicationRegistry(const MpiApplicationRegistry&) = delete;
    MpiApplicationRegistry& operator=(const MpiApplicationRegistry&) = delete;

    std::vector<ApplicationInfo> applications() const override { return apps_; }
    int local_application() const override { return local_app_; }

    /// Communicator of the calling application (owned by the registry)
    MPI_Comm local_comm() const { return local_comm_; }

private:
    std::vector<ApplicationInfo> apps_;
    int local_app_ = -1;
    MPI_Comm local_comm_ = MPI_COMM_NULL;
};

// ============================================================================
// Matching
// ============================================================================

/**
 * @brief Match applications whose type starts with peer_type
 *
 * The calling application is never matched.
 */
DiscoveryResult find_peer(const PeerDiscovery& discovery, const std::string& peer_type);

/**
 * @brief Turn a discovery result into the session's peer identity
 *
 * NoPeer logs a warning and returns root_rank = -1 (dry run).
 * AmbiguousPeers throws ConfigurationError.
 */
PeerInfo resolve_peer(const DiscoveryResult& result, const std::string& peer_type);

} // namespace coupling
} // namespace fsl
