/**
 * @file config_reader_test.cpp
 * @brief Configuration reader and coupling parameter tests
 */

#include <fsilink/io/config_reader.hpp>
#include <fsilink/coupling/coupling_config.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace fsl;
using namespace fsl::io;
using namespace fsl::coupling;

static int test_count = 0;
static int pass_count = 0;

#define CHECK(cond, msg) do { \
    test_count++; \
    if (cond) { pass_count++; std::cout << "  PASS: " << msg << "\n"; } \
    else { std::cout << "  FAIL: " << msg << "\n"; } \
} while(0)

static const char* sample_config = R"(
# Fluid side of a flexible flap run
coupling:
  peer_type: "structure"
  max_time_steps: 200
  max_sub_iterations: 10      # implicit
  tolerance: 1.0e-5
  initial_time: 0
  reference_time_step: 1.0e-3
  reference_length: 0.25
  verbosity: 2

logging:
  level: debug
  to_file: yes
  file: "fsi # run.log"

surface:
  face_ids: [0, 1, 2, 3]
  origin: [0.0, 0.5, 1]
  groups: ["flap", tip]
)";

// ============================================================================
// Test 1: Value parsing
// ============================================================================
void test_parse_values() {
    std::cout << "\n=== Test 1: Value parsing ===\n";

    ConfigReader reader;
    ConfigSection root = reader.read_string(sample_config);

    CHECK(root.has_subsection("coupling") && root.has_subsection("logging") &&
          root.has_subsection("surface"), "three sections");

    const ConfigSection& coupling = root.subsection("coupling");
    CHECK(coupling.get_string("peer_type") == "structure", "quoted string");
    CHECK(coupling.get_int("max_time_steps") == 200, "integer");
    CHECK(coupling.get_int("max_sub_iterations") == 10, "trailing comment stripped");
    CHECK(coupling.get_real("tolerance") == 1.0e-5, "real in exponent notation");
    CHECK(coupling.get_real("initial_time", -1.0) == 0.0, "integer accepted as real");
    CHECK(coupling.get_int("missing", 42) == 42, "default for missing key");

    const ConfigSection& logging = root.subsection("logging");
    CHECK(logging.get_string("level") == "debug", "bare string");
    CHECK(logging.get_bool("to_file"), "yes is true");
    CHECK(logging.get_string("file") == "fsi # run.log", "# inside quotes kept");

    const ConfigSection& surface = root.subsection("surface");
    const auto ids = surface.get_int_array("face_ids");
    CHECK(ids.size() == 4 && ids[3] == 3, "integer array");
    const auto origin = surface.get_real_array("origin");
    CHECK(origin.size() == 3 && origin[1] == 0.5 && origin[2] == 1.0, "mixed numeric array as reals");
    const auto groups = surface.get_string_array("groups");
    CHECK(groups.size() == 2 && groups[0] == "flap" && groups[1] == "tip", "string array");
}

// ============================================================================
// Test 2: Errors
// ============================================================================
void test_errors() {
    std::cout << "\n=== Test 2: Errors ===\n";

    ConfigReader reader;

    bool threw = false;
    std::string what;
    try {
        reader.read_string("coupling:\n  tolerance 1e-5\n");
    } catch (const InvalidArgumentError& e) {
        threw = true;
        what = e.what();
    }
    CHECK(threw, "line without colon rejected");
    CHECK(what.find("line 2") != std::string::npos, "error names the line");

    threw = false;
    try {
        reader.read("/nonexistent/fsilink.yaml");
    } catch (const FileIOError&) {
        threw = true;
    }
    CHECK(threw, "missing file raises FileIOError");

    ConfigSection root = reader.read_string("a:\n  n: \"ten\"\n");
    threw = false;
    try {
        root.subsection("a").get_int("n");
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "type mismatch raises InvalidArgumentError");

    threw = false;
    try {
        static_cast<const ConfigSection&>(root).subsection("b");
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "missing subsection raises InvalidArgumentError");
}

// ============================================================================
// Test 3: File round trip
// ============================================================================
void test_read_file() {
    std::cout << "\n=== Test 3: Reading from file ===\n";

    const std::string path = "config_reader_test.yaml";
    {
        std::ofstream out(path);
        out << sample_config;
    }

    ConfigReader reader;
    ConfigSection root = reader.read(path);
    CHECK(root.subsection("coupling").get_real("reference_length") == 0.25, "value read from file");

    std::remove(path.c_str());
}

// ============================================================================
// Test 4: Coupling parameters
// ============================================================================
void test_coupling_parameters() {
    std::cout << "\n=== Test 4: Coupling parameters ===\n";

    ConfigReader reader;
    ConfigSection root = reader.read_string(sample_config);

    const CouplingParameters p = CouplingParameters::from_config(root);
    CHECK(p.max_time_steps == 200 && p.max_sub_iterations == 10, "iteration bounds");
    CHECK(p.tolerance == 1.0e-5 && p.dt_reference == 1.0e-3, "tolerance and reference step");
    CHECK(p.reference_length == 0.25 && p.verbosity == 2, "reference length and verbosity");
    CHECK(p.visualization == 1, "visualization defaults to 1");
    CHECK(p.peer_type == "structure", "peer type");
    CHECK(p.scheme() == CouplingScheme::Implicit, "implicit scheme");

    const CouplingParameters q = CouplingParameters::from_config(root.subsection("coupling"));
    CHECK(q.max_time_steps == 200, "section passed directly");

    ConfigSection minimal = reader.read_string("coupling:\n  max_time_steps: 5\n"
                                               "  reference_time_step: 0.01\n");
    const CouplingParameters m = CouplingParameters::from_config(minimal);
    CHECK(m.max_sub_iterations == 1 && m.scheme() == CouplingScheme::Explicit,
          "explicit coupling by default");
}

// ============================================================================
// Test 5: Invalid coupling parameters
// ============================================================================
void test_invalid_parameters() {
    std::cout << "\n=== Test 5: Invalid coupling parameters ===\n";

    const char* invalid[] = {
        "coupling:\n  reference_time_step: 0.01\n",                                   // missing steps
        "coupling:\n  max_time_steps: 10\n",                                          // missing dt
        "coupling:\n  max_time_steps: -1\n  reference_time_step: 0.01\n",
        "coupling:\n  max_time_steps: 10\n  reference_time_step: 0\n",
        "coupling:\n  max_time_steps: 10\n  reference_time_step: 0.01\n  tolerance: -1e-3\n",
        "coupling:\n  max_time_steps: 10\n  reference_time_step: 0.01\n  max_sub_iterations: -2\n",
        "coupling:\n  max_time_steps: ten\n  reference_time_step: 0.01\n",
    };

    ConfigReader reader;
    int index = 0;
    for (const char* text : invalid) {
        ConfigSection root = reader.read_string(text);
        bool threw = false;
        try {
            CouplingParameters::from_config(root);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        CHECK(threw, "invalid configuration " << index << " rejected");
        ++index;
    }
}

int main() {
    Logger::instance().set_level(Logger::Level::Warn);

    std::cout << "Config Reader Tests\n";
    std::cout << "===================\n";

    test_parse_values();
    test_errors();
    test_read_file();
    test_coupling_parameters();
    test_invalid_parameters();

    std::cout << "\n===================\n";
    std::cout << "Results: " << pass_count << "/" << test_count << " passed\n";

    return (pass_count == test_count) ? 0 : 1;
}
