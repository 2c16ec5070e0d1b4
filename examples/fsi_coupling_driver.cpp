/**
 * @file fsi_coupling_driver.cpp
 * @brief Fluid side of a coupled flap simulation
 *
 * A toy fluid solver (uniform pulsating pressure on a strip of boundary
 * faces, relieved by the wall motion) coupled to a structural solver
 * through the FSILink session controller. Without a structural solver in
 * the launch the run proceeds in dry-run mode.
 *
 *   mpiexec -n 2 ./fsi_coupling_driver configs/fsi_flap.yaml : \
 *           -n 1 ./spring_structure_peer configs/fsi_flap.yaml
 */

#include <fsilink/fsilink.hpp>

#include <cmath>
#include <numbers>
#include <numeric>
#include <string>
#include <vector>

using namespace fsl;
using namespace fsl::coupling;

namespace {

Logger::Level parse_level(const std::string& name) {
    if (name == "trace") return Logger::Level::Trace;
    if (name == "debug") return Logger::Level::Debug;
    if (name == "warn") return Logger::Level::Warn;
    if (name == "error") return Logger::Level::Error;
    if (name == "off") return Logger::Level::Off;
    return Logger::Level::Info;
}

/**
 * @brief Strip of quadrilateral wall faces owned by this rank
 *
 * Face f spans vertices (f, f+1) at the bottom and (n+1+f, n+2+f) at the top.
 */
struct WallPatch {
    Index n_faces = 0;
    std::vector<Index> face_vertex_index;
    std::vector<Index> face_vertex_ids;

    explicit WallPatch(Index n) : n_faces(n) {
        face_vertex_index.reserve(n + 1);
        for (Index f = 0; f < n; ++f) {
            face_vertex_index.push_back(face_vertex_ids.size());
            face_vertex_ids.insert(face_vertex_ids.end(), {f, f + 1, n + 2 + f, n + 1 + f});
        }
        face_vertex_index.push_back(face_vertex_ids.size());
    }

    Index n_vertices() const { return 2 * (n_faces + 1); }
};

// ============================================================================
// Pulsating Channel Model
// ============================================================================

class PulsatingChannel : public CouplingHooks {
public:
    PulsatingChannel(const io::ConfigSection& flap, const RunControl& run,
                     const FieldMapper& mapper, Index n_parent_vertices)
        : run_(run)
        , mapper_(mapper)
        , face_area_(flap.get_real("face_area", 0.01))
        , amplitude_(flap.get_real("pressure_amplitude", 100.0))
        , frequency_(flap.get_real("frequency", 5.0))
        , added_stiffness_(flap.get_real("added_stiffness", 0.0))
        , wall_displacement_(vec3_stride * n_parent_vertices, 0.0)
    {}

    void compute_fluid_forces(const CouplingSession& session, Span<Real> forces) override {
        // Pressure at the end of the step being computed
        const Real t = run_.t_cur() + session.dt_current();
        const Real pressure = amplitude_ * std::sin(2.0 * std::numbers::pi * frequency_ * t)
                            - added_stiffness_ * mean_displacement_;

        for (Index i = 0; i < forces.size(); i += vec3_stride) {
            forces[i] = pressure * face_area_;
            forces[i + 1] = 0.0;
            forces[i + 2] = 0.0;
        }
    }

    void apply_mesh_displacement(const CouplingSession& session,
                                 ConstSpan<Real> displacement) override {
        mapper_.scatter_vertices(displacement, wall_displacement_);

        const Index n = session.n_vertices();
        Real sum = 0.0;
        for (Index v = 0; v < n; ++v) {
            sum += displacement[vec3_stride * v];
        }
        mean_displacement_ = n > 0 ? sum / static_cast<Real>(n) : 0.0;
    }

    Real mean_displacement() const { return mean_displacement_; }

private:
    const RunControl& run_;
    const FieldMapper& mapper_;

    Real face_area_;
    Real amplitude_;
    Real frequency_;
    Real added_stiffness_;

    Real mean_displacement_ = 0.0;
    std::vector<Real> wall_displacement_;
};

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
        // ====================================================================
        // Configuration
        // ====================================================================

        io::ConfigReader reader;
        const io::ConfigSection config = reader.read(config_file);

        if (config.has_subsection("logging")) {
            const auto& logging = config.subsection("logging");
            const Logger::Level level = parse_level(logging.get_string("level", "info"));
            if (MPIManager::instance().is_root()) {
                if (logging.get_bool("to_file", false)) {
                    Logger::instance().init_combined(logging.get_string("file", "fsilink.log"), level);
                } else {
                    Logger::instance().set_level(level);
                }
            }
        }

        const CouplingParameters params = CouplingParameters::from_config(config);

        // ====================================================================
        // Launch layout and peer
        // ====================================================================

        MpiApplicationRegistry registry(MPI_COMM_WORLD, "fluid", "pulsating_channel");
        MPICommunicator comm(registry.local_comm());

        const PeerInfo peer = resolve_peer(find_peer(registry, params.peer_type), params.peer_type);

        MpiTransport transport(MPI_COMM_WORLD, registry.local_comm());

        if (comm.is_root()) {
            features::print_features();
        }

        // ====================================================================
        // Wall patch and session
        // ====================================================================

        const Index faces_per_rank = static_cast<Index>(
            config.subsection("flap").get_int("faces_per_rank", 8));
        WallPatch patch(faces_per_rank);

        std::vector<Index> coupled(patch.n_faces);
        std::iota(coupled.begin(), coupled.end(), Index(0));
        SurfaceFieldMapper mapper(std::move(coupled), patch.face_vertex_index,
                                  patch.face_vertex_ids);

        CouplingSession session(params, peer);
        session.register_geometry(mapper, params.reference_length, comm);

        RunControl run(params.max_time_steps, params.initial_time);
        SessionController controller(session, run, transport, comm);

        PulsatingChannel channel(config.subsection("flap"), run, mapper, patch.n_vertices());

        std::vector<Real> out_displacement(vec3_stride * patch.n_vertices(), 0.0);
        std::vector<Real> out_velocity(vec3_stride * patch.n_vertices(), 0.0);
        std::vector<Real> out_forces(vec3_stride * patch.n_faces, 0.0);

        // ====================================================================
        // Time loop
        // ====================================================================

        controller.initialize();

        while (controller.state() == SessionState::Active) {
            // CFL-like candidate from the fluid solver
            const Real dt_fluid = 1.5 * params.dt_reference;

            controller.run_time_step(dt_fluid, channel);

            if (controller.scatter_output(out_displacement, out_velocity, out_forces) &&
                comm.is_root()) {
                FSL_LOG_DEBUG("Output: wall displacement {:.6e}, face force {:.6e}",
                              out_displacement[0], out_forces[0]);
            }

            controller.end_time_step();

            if (comm.is_root()) {
                FSL_LOG_INFO("Step {:4d}  t = {:.4e}  mean wall displacement = {:+.6e}",
                             run.nt_cur(), run.t_cur(), channel.mean_displacement());
            }
        }

        controller.finalize();

    } catch (const Exception& e) {
        FSL_LOG_CRITICAL("Coupled run failed: {}", e.what());
        MPI_Abort(MPI_COMM_WORLD, 1);
        return 1;
    }

    return 0;
}
