#pragma once

/**
 * @file protocol.hpp
 * @brief Names of the values exchanged with the structural solver
 *
 * Control values (fluid -> structure unless noted):
 *   NBPDTM  maximum number of time steps
 *   NBSSIT  maximum number of sub-iterations
 *   EPSILO  sub-iteration tolerance
 *   TTINIT  initial time
 *   PDTREF  reference time step
 *   DTAST   time step proposed by the structure (structure -> fluid)
 *   DTCALC  negotiated time step
 *   ICVAST  sub-iteration convergence flag (0/1)
 *
 * Per-step values are keyed by the coupling iteration.
 */

namespace fsl {
namespace coupling {

namespace message {

inline constexpr const char* max_time_steps = "NBPDTM";
inline constexpr const char* max_sub_iterations = "NBSSIT";
inline constexpr const char* tolerance = "EPSILO";
inline constexpr const char* initial_time = "TTINIT";
inline constexpr const char* reference_time_step = "PDTREF";
inline constexpr const char* peer_time_step = "DTAST";
inline constexpr const char* negotiated_time_step = "DTCALC";
inline constexpr const char* convergence = "ICVAST";

inline constexpr const char* fluid_forces = "fluid_forces";
inline constexpr const char* mesh_displacement = "mesh_displacement";
inline constexpr const char* mesh_velocity = "mesh_velocity";

} // namespace message

} // namespace coupling
} // namespace fsl
