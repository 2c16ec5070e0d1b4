/**
 * @file coupling_config.cpp
 * @brief Coupling parameters from configuration
 */

#include <fsilink/coupling/coupling_config.hpp>

namespace fsl {
namespace coupling {

void CouplingParameters::validate() const {
    if (max_time_steps < 0) {
        throw ConfigurationError("coupling.max_time_steps must be non-negative, got " +
                                 std::to_string(max_time_steps));
    }
    if (max_sub_iterations < 0) {
        throw ConfigurationError("coupling.max_sub_iterations must be non-negative, got " +
                                 std::to_string(max_sub_iterations));
    }
    if (!(tolerance > 0.0)) {
        throw ConfigurationError("coupling.tolerance must be positive");
    }
    if (!(dt_reference > 0.0)) {
        throw ConfigurationError("coupling.reference_time_step must be positive");
    }
    if (reference_length < 0.0) {
        throw ConfigurationError("coupling.reference_length must not be negative");
    }
    if (verbosity < 0 || visualization < 0) {
        throw ConfigurationError("coupling.verbosity and coupling.visualization must be >= 0");
    }
    if (peer_type.empty()) {
        throw ConfigurationError("coupling.peer_type must not be empty");
    }
}

CouplingParameters CouplingParameters::from_config(const io::ConfigSection& config) {
    const io::ConfigSection& section =
        config.has_subsection("coupling") ? config.subsection("coupling") : config;

    for (const char* key : {"max_time_steps", "reference_time_step"}) {
        if (!section.has(key)) {
            throw ConfigurationError(std::string("Missing coupling parameter '") + key + "'");
        }
    }

    CouplingParameters params;

    try {
        params.max_time_steps = section.get_int("max_time_steps");
        params.max_sub_iterations = section.get_int("max_sub_iterations", params.max_sub_iterations);
        params.tolerance = section.get_real("tolerance", params.tolerance);
        params.initial_time = section.get_real("initial_time", params.initial_time);
        params.dt_reference = section.get_real("reference_time_step");
        params.reference_length = section.get_real("reference_length", params.reference_length);
        params.verbosity = section.get_int("verbosity", params.verbosity);
        params.visualization = section.get_int("visualization", params.visualization);
        params.peer_type = section.get_string("peer_type", params.peer_type);
    } catch (const InvalidArgumentError& e) {
        throw ConfigurationError(std::string("Invalid coupling section: ") + e.what());
    }

    params.validate();

    FSL_LOG_DEBUG("Coupling parameters: {} steps, {} sub-iterations ({}), tol {:.3e}, dt_ref {:.3e}",
                  params.max_time_steps, params.max_sub_iterations,
                  to_string(params.scheme()), params.tolerance, params.dt_reference);

    return params;
}

} // namespace coupling
} // namespace fsl
