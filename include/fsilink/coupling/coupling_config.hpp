#pragma once

/**
 * @file coupling_config.hpp
 * @brief Run parameters of a coupled simulation
 *
 * Read from the `coupling` section of the run configuration:
 * ```
 * coupling:
 *   peer_type: "structure"
 *   max_time_steps: 200
 *   max_sub_iterations: 10     # <= 1 selects explicit coupling
 *   tolerance: 1.0e-5
 *   initial_time: 0.0
 *   reference_time_step: 1.0e-3
 *   reference_length: 0.25
 *   verbosity: 1               # 0 silent, 1 step summaries, 2 exchange traces
 *   visualization: 1
 * ```
 */

#include <fsilink/core/core.hpp>
#include <fsilink/io/config_reader.hpp>

#include <string>

namespace fsl {
namespace coupling {

struct CouplingParameters {
    Int max_time_steps = 0;
    Int max_sub_iterations = 1;
    Real tolerance = 1.0e-5;
    Real initial_time = 0.0;
    Real dt_reference = 0.0;
    Real reference_length = 0.0;   ///< Validated at geometry registration
    Int verbosity = 1;
    Int visualization = 1;
    std::string peer_type = "structure";

    CouplingScheme scheme() const {
        return max_sub_iterations > 1 ? CouplingScheme::Implicit : CouplingScheme::Explicit;
    }

    /// Throws ConfigurationError on inconsistent values
    void validate() const;

    /**
     * @brief Build from a configuration tree
     *
     * Accepts either the root (reads its `coupling` subsection) or the
     * `coupling` section itself. `max_time_steps` and `reference_time_step`
     * are mandatory.
     */
    static CouplingParameters from_config(const io::ConfigSection& config);
};

} // namespace coupling
} // namespace fsl
