/**
 * @file spring_structure_peer.cpp
 * @brief Structural side of the coupled flap simulation
 *
 * The flap is reduced to a single mass-spring-damper degree of freedom
 * driven by the resultant of the fluid forces; every interface vertex
 * moves with it. The program speaks the fluid session's protocol through
 * the same transport, which makes it both a demo partner for
 * fsi_coupling_driver and a reference for structural solver adapters.
 *
 *   mpiexec -n 2 ./fsi_coupling_driver configs/fsi_flap.yaml : \
 *           -n 1 ./spring_structure_peer configs/fsi_flap.yaml
 */

#include <fsilink/fsilink.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace fsl;
using namespace fsl::coupling;

namespace {

// ============================================================================
// Single Degree of Freedom Oscillator
// ============================================================================

struct SpringOscillator {
    Real mass = 1.0;
    Real damping = 0.0;
    Real stiffness = 1.0;

    Real x = 0.0;   ///< Displacement at the start of the step
    Real v = 0.0;   ///< Velocity at the start of the step

    /// Backward Euler step from the committed state, returns {x, v}
    std::pair<Real, Real> trial(Real force, Real dt) const {
        const Real v_new = (mass * v / dt + force - stiffness * x) /
                           (mass / dt + damping + stiffness * dt);
        return {x + dt * v_new, v_new};
    }

    void commit(const std::pair<Real, Real>& state) {
        x = state.first;
        v = state.second;
    }
};

struct RunParameters {
    Int max_time_steps = 0;
    Int max_sub_iterations = 0;
    Real tolerance = 0.0;
    Real initial_time = 0.0;
    Real dt_reference = 0.0;
};

bool receive_parameters(TransportChannel& transport, int fluid, RunParameters& p) {
    return !transport_status::failed(
               transport.receive_scalar(fluid, 0, message::max_time_steps, p.max_time_steps)) &&
           !transport_status::failed(
               transport.receive_scalar(fluid, 0, message::max_sub_iterations,
                                        p.max_sub_iterations)) &&
           !transport_status::failed(
               transport.receive_scalar(fluid, 0, message::tolerance, p.tolerance)) &&
           !transport_status::failed(
               transport.receive_scalar(fluid, 0, message::initial_time, p.initial_time)) &&
           !transport_status::failed(
               transport.receive_scalar(fluid, 0, message::reference_time_step, p.dt_reference));
}

} // namespace

int main(int argc, char** argv) {
    std::string config_file = "configs/fsi_flap.yaml";
    if (argc > 1) {
        config_file = argv[1];
    }

    InitOptions options;
    options.log_level = Logger::Level::Info;
    Context context(&argc, &argv, options);

    try {
        io::ConfigReader reader;
        const io::ConfigSection config = reader.read(config_file);
        const io::ConfigSection& structure = config.subsection("structure");
        const io::ConfigSection& flap = config.subsection("flap");

        MpiApplicationRegistry registry(MPI_COMM_WORLD, "structure", "spring");

        int local_size = 0;
        MPI_Comm_size(registry.local_comm(), &local_size);
        if (local_size != 1) {
            throw ConfigurationError("spring_structure_peer runs on exactly one rank");
        }

        const DiscoveryResult result = find_peer(registry, "fluid");
        if (result.outcome != DiscoveryOutcome::SinglePeer) {
            throw ConfigurationError(std::string("Expected exactly one fluid solver, found ") +
                                     to_string(result.outcome));
        }
        const int fluid = result.peer.root_rank;

        // Interface size follows from the fluid partitioning
        Index fluid_ranks = 0;
        for (const auto& app : registry.applications()) {
            if (app.root_rank == fluid) {
                fluid_ranks = static_cast<Index>(app.n_ranks);
            }
        }
        const Index faces_per_rank = static_cast<Index>(flap.get_int("faces_per_rank", 8));
        const Index n_g_faces = fluid_ranks * faces_per_rank;
        const Index n_g_vertices = fluid_ranks * 2 * (faces_per_rank + 1);

        SpringOscillator spring;
        spring.mass = structure.get_real("mass", 1.0);
        spring.damping = structure.get_real("damping", 0.0);
        spring.stiffness = structure.get_real("stiffness", 1.0);
        const Real dt_structure = structure.get_real("time_step", 1.0e-3);

        MpiTransport transport(MPI_COMM_WORLD, registry.local_comm());

        RunParameters p;
        if (!receive_parameters(transport, fluid, p)) {
            FSL_LOG_ERROR("Calculation parameters not received from fluid solver");
            return 1;
        }

        FSL_LOG_INFO("Structure '{}' coupled to '{}': {} steps, {} sub-iteration(s), "
                     "{} faces, {} vertices",
                     "spring", result.peer.app_name, p.max_time_steps, p.max_sub_iterations,
                     n_g_faces, n_g_vertices);

        std::vector<Real> forces(vec3_stride * n_g_faces, 0.0);
        std::vector<Real> displacement(vec3_stride * n_g_vertices, 0.0);
        std::vector<Real> velocity(vec3_stride * n_g_vertices, 0.0);

        const Int cap = std::max<Int>(1, p.max_sub_iterations);
        Real t = p.initial_time;
        bool connected = true;

        for (Int step = 1; step <= p.max_time_steps && connected; ++step) {
            Real dt = dt_structure;
            connected = !transport_status::failed(
                            transport.send_scalar(fluid, step, message::peer_time_step,
                                                  dt_structure)) &&
                        !transport_status::failed(
                            transport.receive_scalar(fluid, step, message::negotiated_time_step,
                                                     dt));

            std::pair<Real, Real> state{spring.x, spring.v};

            for (Int sub = 0; sub < cap && connected; ++sub) {
                if (transport_status::failed(
                        transport.receive_field(fluid, message::fluid_forces, forces))) {
                    connected = false;
                    break;
                }

                Real resultant = 0.0;
                for (Index f = 0; f < n_g_faces; ++f) {
                    resultant += forces[vec3_stride * f];
                }

                state = spring.trial(resultant, dt);
                for (Index v = 0; v < n_g_vertices; ++v) {
                    displacement[vec3_stride * v] = state.first;
                    velocity[vec3_stride * v] = state.second;
                }

                Int icv = 0;
                connected = !transport_status::failed(
                                transport.send_field(fluid, message::mesh_displacement,
                                                     displacement)) &&
                            !transport_status::failed(
                                transport.send_field(fluid, message::mesh_velocity, velocity)) &&
                            !transport_status::failed(
                                transport.receive_scalar(fluid, step, message::convergence, icv));

                if (icv == 1) {
                    break;
                }
            }

            if (!connected) {
                FSL_LOG_WARN("Fluid solver stopped exchanging at time step {}", step);
                break;
            }

            spring.commit(state);
            t += dt;

            FSL_LOG_DEBUG("Step {:4d}  t = {:.4e}  x = {:+.6e}  v = {:+.6e}",
                          step, t, spring.x, spring.v);
        }

        if (connected) {
            Int ignored = 0;
            const int status = transport.receive_scalar(fluid, p.max_time_steps + 1,
                                                        message::peer_time_step, ignored);
            if (status != transport_status::Terminated) {
                FSL_LOG_WARN("Fluid solver did not close the session ({})",
                             transport_status::to_string(status));
            }
        }

        FSL_LOG_INFO("Structure finished at t = {:.4e}, x = {:+.6e}", t, spring.x);

    } catch (const Exception& e) {
        FSL_LOG_CRITICAL("Structural peer failed: {}", e.what());
        MPI_Abort(MPI_COMM_WORLD, 1);
        return 1;
    }

    return 0;
}
