#pragma once

/**
 * @file convergence.hpp
 * @brief Sub-iteration convergence test over the partitioned interface
 *
 * The residual is the root-mean-square distance between two interface
 * displacement fields, normalized by the reference length:
 *
 *   delta = sqrt( sum_i |a_i - b_i|^2 / N ) / lref
 *
 * where the sum and the point count N are reduced over all partitions in a
 * single all-reduce. Vertices shared between partitions are counted once
 * per partition holding them.
 */

#include <fsilink/core/core.hpp>
#include <fsilink/coupling/coupling_session.hpp>

namespace fsl {
namespace coupling {

class ConvergenceEvaluator {
public:
    explicit ConvergenceEvaluator(Communicator& comm) : comm_(comm) {}

    /**
     * @brief Global relative residual of two interlaced 3-vector fields
     *
     * Collective over the local group. Returns 0 when no partition holds
     * any point.
     */
    Real relative_residual(ConstSpan<Real> a, ConstSpan<Real> b, Real lref);

    /**
     * @brief Update the local convergence flag of the session
     *
     * Explicit coupling is always converged and computes no residual.
     * Otherwise the received displacement is compared with the current
     * prediction. Collective over the local group in implicit mode.
     *
     * @return Local convergence flag
     */
    bool evaluate(CouplingSession& session);

    /// Residual of the last implicit evaluation
    Real last_residual() const { return last_residual_; }

private:
    Communicator& comm_;
    Real last_residual_ = 0.0;
};

} // namespace coupling
} // namespace fsl
