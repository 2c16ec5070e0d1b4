/**
 * @file coupling_session_test.cpp
 * @brief Coupling session lifecycle and buffer tests
 */

#include <fsilink/coupling/coupling_session.hpp>
#include "coupling_test_support.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

using namespace fsl;
using namespace fsl::coupling;

static int test_count = 0;
static int pass_count = 0;

#define CHECK(cond, msg) do { \
    test_count++; \
    if (cond) { pass_count++; std::cout << "  PASS: " << msg << "\n"; } \
    else { std::cout << "  FAIL: " << msg << "\n"; } \
} while(0)

static CouplingParameters parameters() {
    CouplingParameters p;
    p.max_time_steps = 10;
    p.max_sub_iterations = 4;
    p.tolerance = 1.0e-6;
    p.dt_reference = 0.01;
    p.verbosity = 0;
    return p;
}

static bool all_zero(ConstSpan<Real> v) {
    return std::all_of(v.begin(), v.end(), [](Real x) { return x == 0.0; });
}

// ============================================================================
// Test 1: Reference length validation
// ============================================================================
void test_reference_length() {
    std::cout << "\n=== Test 1: Reference length validation ===\n";

    auto mapper = testing::make_strip_mapper(2);
    testing::PartitionedCommunicator comm;

    for (Real lref : {0.0, -1.0}) {
        CouplingSession session(parameters(), PeerInfo{});
        bool threw = false;
        try {
            session.register_geometry(mapper, lref, comm);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        CHECK(threw, "lref = " << lref << " raises ConfigurationError");
        CHECK(!session.is_registered(), "failed registration leaves session unregistered");
    }

    CouplingSession session(parameters(), PeerInfo{});
    session.register_geometry(mapper, 0.5, comm);
    CHECK(session.is_registered(), "positive lref accepted");
    CHECK(session.reference_length() == 0.5, "reference length stored");
}

// ============================================================================
// Test 2: Double registration
// ============================================================================
void test_double_registration() {
    std::cout << "\n=== Test 2: Double registration ===\n";

    auto mapper = testing::make_strip_mapper(2);
    testing::PartitionedCommunicator comm;
    CouplingSession session(parameters(), PeerInfo{});
    session.register_geometry(mapper, 1.0, comm);

    const Real* before = session.displacement_current().data();

    bool threw = false;
    try {
        session.register_geometry(mapper, 1.0, comm);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    CHECK(threw, "second registration raises ConfigurationError");
    CHECK(session.displacement_current().data() == before, "buffers not reallocated");
}

// ============================================================================
// Test 3: Buffer allocation and global counts
// ============================================================================
void test_buffers_and_counts() {
    std::cout << "\n=== Test 3: Buffers and global counts ===\n";

    auto mapper = testing::make_strip_mapper(3);    // 3 faces, 8 vertices
    testing::PartitionedCommunicator comm(2);
    comm.set_remote_counts({5, 7});

    CouplingSession session(parameters(), PeerInfo{});
    session.register_geometry(mapper, 1.0, comm);

    CHECK(session.n_faces() == 3, "local face count");
    CHECK(session.n_vertices() == 8, "local vertex count");
    CHECK(session.n_g_faces() == 8, "global face count 3 + 5");
    CHECK(session.n_g_vertices() == 15, "global vertex count 8 + 7");

    CHECK(session.displacement_current().size() == 24, "displacement 3 * n_vertices");
    CHECK(session.velocity_previous().size() == 24, "velocity 3 * n_vertices");
    CHECK(session.force_predicted().size() == 9, "forces 3 * n_faces");

    CHECK(all_zero(session.displacement_current()) && all_zero(session.displacement_predicted()) &&
          all_zero(session.velocity_current()) && all_zero(session.velocity_previous()) &&
          all_zero(session.force_current()) && all_zero(session.force_previous()) &&
          all_zero(session.force_predicted()),
          "all history buffers zero-initialized");
}

// ============================================================================
// Test 4: Owned vertices
// ============================================================================
void test_owned_vertices() {
    std::cout << "\n=== Test 4: Shared vertices counted once ===\n";

    // Two faces sharing vertex 1; vertex 2 is owned by another partition
    std::vector<Index> index = {0, 2, 4};
    std::vector<Index> ids = {0, 1, 1, 2};
    std::vector<bool> owned = {true, true, false};
    SurfaceFieldMapper mapper({0, 1}, index, ids, owned);

    testing::PartitionedCommunicator comm;
    CouplingSession session(parameters(), PeerInfo{});
    session.register_geometry(mapper, 1.0, comm);

    CHECK(session.n_vertices() == 3, "local vertices include shared ones");
    CHECK(session.n_g_vertices() == 2, "global count uses owned vertices only");
}

// ============================================================================
// Test 5: Time step record and explicit save
// ============================================================================
void test_dt_and_save() {
    std::cout << "\n=== Test 5: Time step record and previous values ===\n";

    auto mapper = testing::make_strip_mapper(1);
    testing::PartitionedCommunicator comm;
    CouplingSession session(parameters(), PeerInfo{});
    session.register_geometry(mapper, 1.0, comm);

    CHECK(session.dt_current() == 0.01, "dt starts at the reference step");
    session.set_dt(0.005);
    session.set_dt(0.002);
    CHECK(session.dt_current() == 0.002 && session.dt_previous() == 0.005,
          "negotiated step shifts into dt_previous");

    session.force_current()[1] = 4.0;
    session.velocity_current()[2] = -3.0;
    session.save_previous();
    CHECK(session.force_previous()[1] == 4.0, "forces saved");
    CHECK(session.velocity_previous()[2] == -3.0, "velocities saved");
    CHECK(session.displacement_predicted()[0] == 0.0, "displacements untouched");
}

// ============================================================================
// Test 6: Release
// ============================================================================
void test_release() {
    std::cout << "\n=== Test 6: Release ===\n";

    auto mapper = testing::make_strip_mapper(2);
    testing::PartitionedCommunicator comm;

    PeerInfo peer;
    peer.root_rank = 3;
    peer.app_type = "structure";
    peer.app_name = "beam";

    CouplingSession session(parameters(), peer);
    session.register_geometry(mapper, 1.0, comm);
    session.set_iteration(7);

    session.release();
    CHECK(session.is_released() && !session.is_registered(), "session released");
    CHECK(session.mapper() == nullptr, "mapper dropped");
    CHECK(session.force_current().empty(), "buffers freed");

    session.release();
    CHECK(session.is_released(), "second release is a no-op");

    CHECK(session.iteration() == 7, "iteration queryable after release");
    CHECK(session.peer().app_name == "beam" && !session.is_dry_run(),
          "peer identity queryable after release");
    CHECK(session.n_g_faces() == 2, "global counts queryable after release");

    bool threw = false;
    try {
        session.register_geometry(mapper, 1.0, comm);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    CHECK(threw, "registration after release rejected");
}

// ============================================================================
// Test 7: Scheme selection
// ============================================================================
void test_scheme() {
    std::cout << "\n=== Test 7: Scheme selection ===\n";

    CouplingParameters p = parameters();
    p.max_sub_iterations = 1;
    CHECK(CouplingSession(p, PeerInfo{}).scheme() == CouplingScheme::Explicit,
          "max_sub_iterations = 1 is explicit");
    p.max_sub_iterations = 0;
    CHECK(CouplingSession(p, PeerInfo{}).scheme() == CouplingScheme::Explicit,
          "max_sub_iterations = 0 is explicit");
    p.max_sub_iterations = 2;
    CHECK(CouplingSession(p, PeerInfo{}).is_implicit(), "max_sub_iterations = 2 is implicit");
    CHECK(CouplingSession(p, PeerInfo{}).is_dry_run(), "no peer means dry run");
}

int main() {
    Logger::instance().set_level(Logger::Level::Warn);

    std::cout << "Coupling Session Tests\n";
    std::cout << "======================\n";

    test_reference_length();
    test_double_registration();
    test_buffers_and_counts();
    test_owned_vertices();
    test_dt_and_save();
    test_release();
    test_scheme();

    std::cout << "\n======================\n";
    std::cout << "Results: " << pass_count << "/" << test_count << " passed\n";

    return (pass_count == test_count) ? 0 : 1;
}
