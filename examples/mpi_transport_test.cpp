/**
 * @file mpi_transport_test.cpp
 * @brief MPI transport, registry and communicator tests
 *
 * Run with two ranks: rank 0 plays the fluid solver, rank 1 the
 * structural solver.
 *
 *   mpiexec -n 2 ./mpi_transport_test
 */

#include <fsilink/fsilink.hpp>

#include <cmath>
#include <iostream>
#include <vector>

using namespace fsl;
using namespace fsl::coupling;

static int test_count = 0;
static int pass_count = 0;
static int world_rank = 0;

#define CHECK(cond, msg) do { \
    test_count++; \
    if (cond) { pass_count++; std::cout << "  [rank " << world_rank << "] PASS: " << msg << "\n"; } \
    else { std::cout << "  [rank " << world_rank << "] FAIL: " << msg << "\n"; } \
} while(0)

static constexpr int fluid_rank = 0;
static constexpr int structure_rank = 1;

// ============================================================================
// Test 1: Application registry
// ============================================================================
void test_registry(const MpiApplicationRegistry& registry) {
    const auto apps = registry.applications();
    CHECK(apps.size() == 2, "two applications registered");
    CHECK(apps.size() == 2 && apps[0].root_rank == 0 && apps[1].root_rank == 1,
          "roots in order of first rank");
    CHECK(registry.local_application() == world_rank, "local application index");

    int local_size = 0;
    MPI_Comm_size(registry.local_comm(), &local_size);
    CHECK(local_size == 1, "one rank per local communicator");

    if (world_rank == fluid_rank) {
        const PeerInfo peer = resolve_peer(find_peer(registry, "structure"), "structure");
        CHECK(peer.root_rank == structure_rank && peer.app_name == "beam",
              "structure found by prefix");
    } else {
        const DiscoveryResult result = find_peer(registry, "structure");
        CHECK(result.outcome == DiscoveryOutcome::NoPeer, "structure does not match itself");
    }
}

// ============================================================================
// Test 2: Control values
// ============================================================================
void test_control_values(MpiTransport& transport) {
    if (world_rank == fluid_rank) {
        CHECK(transport.send_scalar(structure_rank, 0, message::max_time_steps, Int(12)) == 1,
              "NBPDTM sent");
        CHECK(transport.send_scalar(structure_rank, 0, message::tolerance, Real(1.0e-4)) == 1,
              "EPSILO sent");

        Real dt = 0.0;
        CHECK(transport.receive_scalar(structure_rank, 1, message::peer_time_step, dt) == 1,
              "DTAST received");
        CHECK(dt == 0.025, "DTAST value");

        // Wrong iteration, then the right one: the channel must stay aligned
        CHECK(transport.receive_scalar(structure_rank, 3, message::peer_time_step, dt) ==
              transport_status::ProtocolError, "stale iteration rejected");
        CHECK(transport.receive_scalar(structure_rank, 3, message::peer_time_step, dt) == 1 &&
              dt == 0.03, "next message read after mismatch");
    } else {
        Int nbpdtm = 0;
        CHECK(transport.receive_scalar(fluid_rank, 0, message::max_time_steps, nbpdtm) == 1 &&
              nbpdtm == 12, "NBPDTM received");
        Real eps = 0.0;
        CHECK(transport.receive_scalar(fluid_rank, 0, message::tolerance, eps) == 1 &&
              eps == 1.0e-4, "EPSILO received");

        CHECK(transport.send_scalar(fluid_rank, 1, message::peer_time_step, Real(0.025)) == 1,
              "DTAST sent");
        CHECK(transport.send_scalar(fluid_rank, 2, message::peer_time_step, Real(0.02)) == 1 &&
              transport.send_scalar(fluid_rank, 3, message::peer_time_step, Real(0.03)) == 1,
              "stale and current DTAST sent");
    }
}

// ============================================================================
// Test 3: Interface fields
// ============================================================================
void test_fields(MpiTransport& transport) {
    const std::vector<Real> forces = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};

    if (world_rank == fluid_rank) {
        CHECK(transport.send_field(structure_rank, message::fluid_forces, forces) == 6,
              "forces sent");
        CHECK(transport.send_field(structure_rank, message::fluid_forces, forces) == 6,
              "forces sent again");

        std::vector<Real> displacement(3, 0.0);
        CHECK(transport.receive_field(structure_rank, message::mesh_displacement, displacement) == 3,
              "displacement received");
        CHECK(displacement[0] == 0.5 && displacement[2] == -0.5, "displacement values");
    } else {
        std::vector<Real> received(6, 0.0);
        CHECK(transport.receive_field(fluid_rank, message::fluid_forces, received) == 6,
              "forces received");
        CHECK(received == forces, "force values");

        std::vector<Real> too_small(3, 0.0);
        CHECK(transport.receive_field(fluid_rank, message::fluid_forces, too_small) ==
              transport_status::ProtocolError, "size mismatch rejected");

        const std::vector<Real> displacement = {0.5, 0.0, -0.5};
        CHECK(transport.send_field(fluid_rank, message::mesh_displacement, displacement) == 3,
              "displacement sent");
    }
}

// ============================================================================
// Test 4: Termination notice
// ============================================================================
void test_termination(MpiTransport& transport) {
    if (world_rank == fluid_rank) {
        transport.close(structure_rank);
        CHECK(true, "termination notice sent");
    } else {
        Int icv = 0;
        CHECK(transport.receive_scalar(fluid_rank, 1, message::convergence, icv) ==
              transport_status::Terminated, "peer termination reported");
    }
}

// ============================================================================
// Test 5: Communicator and distributed residual
// ============================================================================
void test_communicator() {
    MPICommunicator comm(MPI_COMM_WORLD);
    CHECK(comm.size() == 2 && comm.rank() == world_rank, "world communicator");

    const Real local[2] = {Real(world_rank + 1), 1.0};
    Real global[2] = {0.0, 0.0};
    comm.allreduce_sum(local, global, 2);
    CHECK(global[0] == 3.0 && global[1] == 2.0, "sum reduction");

    Int value = world_rank == 0 ? 17 : 0;
    comm.broadcast(&value, 1, 0);
    CHECK(value == 17, "broadcast from root");

    const Int flag = world_rank == 0 ? 1 : 0;
    Int all_converged = -1;
    comm.allreduce_min(&flag, &all_converged, 1);
    CHECK(all_converged == 0, "min reduction");
    comm.barrier();

    // Partition 0 contributes (4, 2), partition 1 contributes (0, 2)
    std::vector<Real> a(6, 0.0), b(6, 0.0);
    if (world_rank == 0) a[0] = 2.0;
    ConvergenceEvaluator evaluator(comm);
    CHECK(std::abs(evaluator.relative_residual(a, b, 1.0) - 1.0) < 1.0e-12,
          "distributed residual = 1");
}

int main(int argc, char** argv) {
    InitOptions options;
    options.log_level = Logger::Level::Warn;
    Context context(&argc, &argv, options);

    world_rank = MPIManager::instance().rank();
    if (MPIManager::instance().size() != 2) {
        if (world_rank == 0) {
            std::cerr << "mpi_transport_test requires exactly 2 ranks\n";
        }
        return 1;
    }

    if (world_rank == 0) {
        std::cout << "MPI Transport Tests\n";
        std::cout << "===================\n";
    }

    {
        const bool fluid = world_rank == fluid_rank;
        MpiApplicationRegistry registry(MPI_COMM_WORLD,
                                        fluid ? "fluid" : "structure_solver",
                                        fluid ? "cavity" : "beam");
        test_registry(registry);

        MpiTransport transport(MPI_COMM_WORLD, registry.local_comm());
        test_control_values(transport);
        test_fields(transport);
        test_termination(transport);
    }

    test_communicator();

    int failures = test_count - pass_count;
    int total_failures = 0;
    MPI_Allreduce(&failures, &total_failures, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);

    if (world_rank == 0) {
        std::cout << "\n===================\n";
        std::cout << "Results: " << (total_failures == 0 ? "all passed" : "failures")
                  << " (" << total_failures << " failed checks across ranks)\n";
    }

    return total_failures == 0 ? 0 : 1;
}
