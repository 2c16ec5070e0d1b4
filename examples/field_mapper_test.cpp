/**
 * @file field_mapper_test.cpp
 * @brief Surface field mapper and scatter tests
 */

#include <fsilink/coupling/field_mapper.hpp>
#include "coupling_test_support.hpp"

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

// ============================================================================
// Test 1: Interface extraction
// ============================================================================
void test_interface_extraction() {
    std::cout << "\n=== Test 1: Interface extraction ===\n";

    // Four boundary faces (triangles); faces 1 and 3 are coupled
    std::vector<Index> index = {0, 3, 6, 9, 12};
    std::vector<Index> ids = {0, 1, 2,
                              2, 7, 5,
                              4, 4, 4,
                              5, 9, 7};

    SurfaceFieldMapper mapper({1, 3}, index, ids);

    CHECK(mapper.n_faces() == 2, "two coupled faces");
    CHECK(mapper.n_vertices() == 4, "shared vertices counted once");

    const auto v = mapper.vertex_ids();
    CHECK(v.size() == 4 && v[0] == 2 && v[1] == 5 && v[2] == 7 && v[3] == 9,
          "vertex ids sorted");
    CHECK(mapper.n_owned_vertices() == 4, "all vertices owned without mask");

    const auto f = mapper.face_ids();
    CHECK(f.size() == 2 && f[0] == 1 && f[1] == 3, "face ids kept in selection order");
}

// ============================================================================
// Test 2: Ownership mask
// ============================================================================
void test_ownership() {
    std::cout << "\n=== Test 2: Ownership mask ===\n";

    std::vector<Index> index = {0, 2, 4};
    std::vector<Index> ids = {0, 1, 1, 2};
    std::vector<bool> owned = {false, true, true};

    SurfaceFieldMapper mapper({0, 1}, index, ids, owned);
    CHECK(mapper.n_vertices() == 3, "all referenced vertices listed");
    CHECK(mapper.n_owned_vertices() == 2, "only owned vertices counted");
}

// ============================================================================
// Test 3: Invalid input
// ============================================================================
void test_invalid_faces() {
    std::cout << "\n=== Test 3: Invalid selection ===\n";

    std::vector<Index> index = {0, 2};
    std::vector<Index> ids = {0, 1};

    bool threw = false;
    try {
        SurfaceFieldMapper mapper({1}, index, ids);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "face id beyond boundary rejected");

    threw = false;
    try {
        std::vector<Index> empty_index;
        SurfaceFieldMapper mapper({}, empty_index, ids);
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "empty CSR index rejected");
}

// ============================================================================
// Test 4: Scatter
// ============================================================================
void test_scatter() {
    std::cout << "\n=== Test 4: Scatter onto parent arrays ===\n";

    std::vector<Index> elt_ids = {3, 0};
    std::vector<Real> in = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    std::vector<Real> out(12, 0.0);

    scatter_values_r3(elt_ids, in, out);
    CHECK(out[9] == 1.0 && out[10] == 2.0 && out[11] == 3.0, "first value to parent 3");
    CHECK(out[0] == 4.0 && out[1] == 5.0 && out[2] == 6.0, "second value to parent 0");
    CHECK(out[3] == 0.0 && out[8] == 0.0, "other parents untouched");

    std::vector<Real> copy(6, 0.0);
    scatter_values_r3({}, in, copy);
    CHECK(copy == in, "empty id list copies in order");

    bool threw = false;
    std::vector<Real> small(6, 0.0);
    try {
        scatter_values_r3(elt_ids, in, small);
    } catch (const OutOfRangeError&) {
        threw = true;
    }
    CHECK(threw, "parent array too small");

    auto strip = testing::make_strip_mapper(2);
    std::vector<Real> face_values = {1, 1, 1, 2, 2, 2};
    std::vector<Real> parent(6, 0.0);
    strip.scatter_faces(face_values, parent);
    CHECK(parent == face_values, "mapper scatters faces through its id list");
}

int main() {
    Logger::instance().set_level(Logger::Level::Warn);

    std::cout << "Field Mapper Tests\n";
    std::cout << "==================\n";

    test_interface_extraction();
    test_ownership();
    test_invalid_faces();
    test_scatter();

    std::cout << "\n==================\n";
    std::cout << "Results: " << pass_count << "/" << test_count << " passed\n";

    return (pass_count == test_count) ? 0 : 1;
}
