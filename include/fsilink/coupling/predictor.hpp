#pragma once

/**
 * @file predictor.hpp
 * @brief Extrapolation of interface forces and displacements
 *
 * Forces sent to the structure are extrapolated from the last two values:
 *   F_pred = alpha * F_cur + (1 - alpha) * F_prev,   alpha = 2
 *
 * Displacements applied to the fluid mesh are predicted from the structure
 * velocities on the first sub-iteration of a step
 *   X_pred = X_cur + (alpha + beta) * dt_n * V_cur - beta * dt_{n-1} * V_prev
 * with alpha = 0.5, beta = 0, and relaxed on later sub-iterations
 *   X_pred = 0.5 * X_cur + 0.5 * X_pred.
 *
 * All predictions overwrite the output in place (aliasing an input is
 * allowed) and do not allocate.
 */

#include <fsilink/core/core.hpp>
#include <fsilink/coupling/coupling_session.hpp>

namespace fsl {
namespace coupling {

/**
 * @brief Coefficients of a three-term linear combination
 */
struct PredictionCoefficients {
    Real c1 = 0.0;
    Real c2 = 0.0;
    Real c3 = 0.0;
};

// ============================================================================
// Kernels
// ============================================================================

/// out = c1 * a + c2 * b
void predict2(Span<Real> out, ConstSpan<Real> a, ConstSpan<Real> b,
              Real c1, Real c2);

/// out = c1 * a + c2 * b + c3 * c
void predict3(Span<Real> out, ConstSpan<Real> a, ConstSpan<Real> b, ConstSpan<Real> c,
              Real c1, Real c2, Real c3);

// ============================================================================
// Predictor
// ============================================================================

class Predictor {
public:
    static constexpr Real force_alpha = 2.0;
    static constexpr Real displacement_alpha = 0.5;
    static constexpr Real displacement_beta = 0.0;
    static constexpr Real relaxation = 0.5;

    /// Fill force_predicted from force_current and force_previous
    static PredictionCoefficients predict_forces(CouplingSession& session);

    /**
     * @brief Fill displacement_predicted
     *
     * Velocity extrapolation with dt_current / dt_previous when
     * sub_iteration_id == 0, relaxation against the former prediction
     * otherwise.
     */
    static PredictionCoefficients predict_displacement(CouplingSession& session);
};

} // namespace coupling
} // namespace fsl
