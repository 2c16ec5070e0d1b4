/**
 * @file peer_discovery.cpp
 * @brief Peer discovery and MPI application registry
 */

#include <fsilink/coupling/peer_discovery.hpp>

#include <algorithm>
#include <cstring>

namespace fsl {
namespace coupling {

// ============================================================================
// MPI Application Registry
// ============================================================================

MpiApplicationRegistry::MpiApplicationRegistry(MPI_Comm world,
                                               const std::string& app_type,
                                               const std::string& app_name) {
    if (app_type.size() > max_name_length || app_name.size() > max_name_length) {
        throw ConfigurationError("Application type and name are limited to " +
                                 std::to_string(max_name_length) + " characters");
    }

    int world_rank = 0, world_size = 1;
    check_mpi(MPI_Comm_rank(world, &world_rank), "MPI_Comm_rank");
    check_mpi(MPI_Comm_size(world, &world_size), "MPI_Comm_size");

    // Fixed-size record per rank: type then name, each NUL padded
    constexpr int field_size = static_cast<int>(max_name_length) + 1;
    constexpr int record_size = 2 * field_size;

    std::vector<char> local_record(record_size, '\0');
    std::copy(app_type.begin(), app_type.end(), local_record.begin());
    std::copy(app_name.begin(), app_name.end(), local_record.begin() + field_size);

    std::vector<char> all_records(static_cast<std::size_t>(record_size) * world_size, '\0');
    check_mpi(MPI_Allgather(local_record.data(), record_size, MPI_CHAR,
                            all_records.data(), record_size, MPI_CHAR, world),
              "MPI_Allgather");

    std::vector<int> app_of_rank(static_cast<std::size_t>(world_size), -1);

    for (int r = 0; r < world_size; ++r) {
        const char* record = all_records.data() + static_cast<std::size_t>(r) * record_size;
        std::string type(record, strnlen(record, field_size));
        std::string name(record + field_size, strnlen(record + field_size, field_size));

        auto it = std::find_if(apps_.begin(), apps_.end(), [&](const ApplicationInfo& a) {
            return a.app_type == type && a.app_name == name;
        });

        if (it == apps_.end()) {
            ApplicationInfo info;
            info.root_rank = r;
            info.n_ranks = 1;
            info.app_type = std::move(type);
            info.app_name = std::move(name);
            apps_.push_back(std::move(info));
            app_of_rank[r] = static_cast<int>(apps_.size()) - 1;
        } else {
            it->n_ranks += 1;
            app_of_rank[r] = static_cast<int>(it - apps_.begin());
        }
    }

    local_app_ = app_of_rank[world_rank];

    check_mpi(MPI_Comm_split(world, local_app_, world_rank, &local_comm_), "MPI_Comm_split");

    if (world_rank == 0) {
        FSL_LOG_INFO("Application registry: {} application(s)", apps_.size());
        for (const auto& app : apps_) {
            FSL_LOG_INFO("  {} ({}): root rank {}, {} rank(s)",
                         app.app_name, app.app_type, app.root_rank, app.n_ranks);
        }
    }
}

MpiApplicationRegistry::~MpiApplicationRegistry() {
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (!finalized && local_comm_ != MPI_COMM_NULL) {
        MPI_Comm_free(&local_comm_);
    }
}

// ============================================================================
// Matching
// ============================================================================

DiscoveryResult find_peer(const PeerDiscovery& discovery, const std::string& peer_type) {
    const auto apps = discovery.applications();
    const int self = discovery.local_application();

    DiscoveryResult result;

    for (std::size_t i = 0; i < apps.size(); ++i) {
        if (static_cast<int>(i) == self) {
            continue;
        }
        const auto& app = apps[i];
        if (app.app_type.compare(0, peer_type.size(), peer_type) != 0) {
            continue;
        }

        result.n_matches += 1;
        if (result.n_matches == 1) {
            result.peer.root_rank = app.root_rank;
            result.peer.app_type = app.app_type;
            result.peer.app_name = app.app_name;
        }
    }

    if (result.n_matches == 0) {
        result.outcome = DiscoveryOutcome::NoPeer;
    } else if (result.n_matches == 1) {
        result.outcome = DiscoveryOutcome::SinglePeer;
    } else {
        result.outcome = DiscoveryOutcome::AmbiguousPeers;
        result.peer = PeerInfo{};
    }

    return result;
}

PeerInfo resolve_peer(const DiscoveryResult& result, const std::string& peer_type) {
    switch (result.outcome) {
        case DiscoveryOutcome::SinglePeer:
            FSL_LOG_INFO("Coupled with {} '{}' (root rank {})",
                         result.peer.app_type, result.peer.app_name, result.peer.root_rank);
            return result.peer;

        case DiscoveryOutcome::NoPeer:
            FSL_LOG_WARN("No matching {} instance detected; dry run in coupling simulation mode",
                         peer_type);
            return PeerInfo{};

        case DiscoveryOutcome::AmbiguousPeers:
        default:
            throw ConfigurationError("Detected " + std::to_string(result.n_matches) + " " +
                                     peer_type + " instances; can handle exactly 1");
    }
}

} // namespace coupling
} // namespace fsl
