/**
 * @file predictor.cpp
 * @brief Force and displacement prediction
 */

#include <fsilink/coupling/predictor.hpp>

namespace fsl {
namespace coupling {

void predict2(Span<Real> out, ConstSpan<Real> a, ConstSpan<Real> b,
              Real c1, Real c2) {
    FSL_REQUIRE(a.size() == out.size() && b.size() == out.size(),
                "prediction operands differ in size");

    const Index n = out.size();
    for (Index i = 0; i < n; ++i) {
        out[i] = c1 * a[i] + c2 * b[i];
    }
}

void predict3(Span<Real> out, ConstSpan<Real> a, ConstSpan<Real> b, ConstSpan<Real> c,
              Real c1, Real c2, Real c3) {
    FSL_REQUIRE(a.size() == out.size() && b.size() == out.size() && c.size() == out.size(),
                "prediction operands differ in size");

    const Index n = out.size();
    for (Index i = 0; i < n; ++i) {
        out[i] = c1 * a[i] + c2 * b[i] + c3 * c[i];
    }
}

PredictionCoefficients Predictor::predict_forces(CouplingSession& session) {
    PredictionCoefficients coef;
    coef.c1 = force_alpha;
    coef.c2 = 1.0 - force_alpha;

    predict2(session.force_predicted(), session.force_current(), session.force_previous(),
             coef.c1, coef.c2);

    if (session.verbosity() > 1) {
        FSL_LOG_DEBUG("Force prediction: c1 = {}, c2 = {}", coef.c1, coef.c2);
    }
    return coef;
}

PredictionCoefficients Predictor::predict_displacement(CouplingSession& session) {
    PredictionCoefficients coef;

    if (session.sub_iteration_id() == 0) {
        coef.c1 = 1.0;
        coef.c2 = (displacement_alpha + displacement_beta) * session.dt_current();
        coef.c3 = -displacement_beta * session.dt_previous();

        predict3(session.displacement_predicted(),
                 session.displacement_current(),
                 session.velocity_current(),
                 session.velocity_previous(),
                 coef.c1, coef.c2, coef.c3);
    } else {
        coef.c1 = relaxation;
        coef.c2 = 1.0 - relaxation;

        Span<Real> predicted = session.displacement_predicted();
        predict2(predicted, session.displacement_current(), predicted, coef.c1, coef.c2);
    }

    if (session.verbosity() > 1) {
        FSL_LOG_DEBUG("Displacement prediction (sub-iteration {}): c1 = {}, c2 = {}, c3 = {}",
                      session.sub_iteration_id(), coef.c1, coef.c2, coef.c3);
    }
    return coef;
}

} // namespace coupling
} // namespace fsl
