// SPDX-License-Identifier: MIT
#include "spreadomatic/math/root_finding.hpp"

namespace spreadomatic {

RootFindingOutcome BrentMethod::solve(const ScalarFunction& f,
                                      double initial_guess,
                                      std::optional<Bounds> bounds) const {
    return brent_solve(f, initial_guess, bounds, config_);
}

RootFindingOutcome NewtonRaphsonRobust::solve(const ScalarFunction& f,
                                              double initial_guess,
                                              std::optional<Bounds> bounds) const {
    if (derivative_) {
        return newton_raphson_robust(f, derivative_, initial_guess, bounds, config_);
    }
    return newton_raphson_robust(f, initial_guess, bounds, config_);
}

}  // namespace spreadomatic
