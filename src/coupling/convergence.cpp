/**
 * @file convergence.cpp
 * @brief Convergence evaluator implementation
 */

#include <fsilink/coupling/convergence.hpp>

#include <cmath>

namespace fsl {
namespace coupling {

Real ConvergenceEvaluator::relative_residual(ConstSpan<Real> a, ConstSpan<Real> b, Real lref) {
    FSL_REQUIRE(a.size() == b.size(), "residual operands differ in size");
    FSL_REQUIRE(lref > 0.0, "reference length must be positive");

    Real local[2] = {0.0, static_cast<Real>(a.size() / vec3_stride)};
    for (Index i = 0; i < a.size(); ++i) {
        const Real d = a[i] - b[i];
        local[0] += d * d;
    }

    Real global[2] = {0.0, 0.0};
    comm_.allreduce_sum(local, global, 2);

    if (global[1] <= 0.0) {
        return 0.0;
    }
    return std::sqrt(global[0] / global[1]) / lref;
}

bool ConvergenceEvaluator::evaluate(CouplingSession& session) {
    if (!session.is_implicit()) {
        session.set_local_convergence(true);
        return true;
    }

    last_residual_ = relative_residual(session.displacement_current(),
                                       session.displacement_predicted(),
                                       session.reference_length());

    const bool converged = last_residual_ <= session.tolerance();
    session.set_local_convergence(converged);

    if (comm_.is_root() && session.verbosity() > 0) {
        FSL_LOG_INFO("Sub-iteration {}: residual {:.4e} (tolerance {:.2e}){}",
                     session.sub_iteration_id(), last_residual_, session.tolerance(),
                     converged ? ", converged" : "");
    }

    return converged;
}

} // namespace coupling
} // namespace fsl
