#pragma once

/**
 * @file run_control.hpp
 * @brief Time-step status of the driving simulation
 *
 * Owned by the fluid driver. The coupling layer reads the current step
 * number and may move the final step forward when the peer goes away.
 */

#include <fsilink/core/types.hpp>
#include <fsilink/core/exception.hpp>

namespace fsl {
namespace coupling {

class RunControl {
public:
    RunControl(Int nt_max, Real t_initial = 0.0)
        : nt_max_(nt_max), t_prev_(t_initial), t_cur_(t_initial)
    {
        if (nt_max < 0) {
            throw InvalidArgumentError("Maximum number of time steps must be non-negative");
        }
    }

    Int nt_prev() const { return nt_prev_; }
    Int nt_cur() const { return nt_cur_; }
    Int nt_max() const { return nt_max_; }

    Real t_prev() const { return t_prev_; }
    Real t_cur() const { return t_cur_; }
    Real dt() const { return dt_; }

    /// Move to the next step number (time is advanced once dt is known)
    void advance_step() {
        nt_prev_ = nt_cur_;
        nt_cur_ += 1;
    }

    /// Advance time with the step actually taken
    void complete_step(Real dt) {
        dt_ = dt;
        t_prev_ = t_cur_;
        t_cur_ += dt;
    }

    void schedule_stop(Int nt) { nt_max_ = nt; }

    bool is_last_step() const { return nt_cur_ >= nt_max_; }

private:
    Int nt_prev_ = 0;
    Int nt_cur_ = 0;
    Int nt_max_;
    Real t_prev_;
    Real t_cur_;
    Real dt_ = 0.0;
};

} // namespace coupling
} // namespace fsl
