// SPDX-License-Identifier: MIT
/**
 * @file numerical_config.hpp
 * @brief Solver configuration shared by every root-finding call
 */

#pragma once

#include "spreadomatic/support/error_types.hpp"
#include <cmath>
#include <cstddef>
#include <expected>

namespace spreadomatic {

/// Configuration for all root-finding methods
///
/// Plain value object passed explicitly into every solver call.
/// There is no global or mutable solver configuration.
struct NumericalConfig {
    /// Absolute convergence tolerance on |f(x)| (and bracket half-width)
    double tolerance = 1e-8;

    /// Maximum iterations for any method
    size_t max_iterations = 100;

    /// Geometric growth factor for bracket auto-discovery
    double bracket_expansion_factor = 2.0;

    /// Initial half-width of the bracket searched around the initial guess
    double initial_bracket_size = 0.01;
};

/// Maximum symmetric expansions when no bracket is supplied
inline constexpr size_t kMaxAutoBracketExpansions = 20;

/// Maximum asymmetric expansions when a supplied bracket has no sign change
inline constexpr size_t kMaxBracketRepairs = 10;

/// Validate solver configuration
inline std::expected<void, ValidationError>
validate_numerical_config(const NumericalConfig& config) {
    if (!std::isfinite(config.tolerance) || config.tolerance <= 0.0) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidTolerance, config.tolerance));
    }
    if (config.max_iterations == 0) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidIterationLimit, 0.0));
    }
    if (!std::isfinite(config.bracket_expansion_factor) ||
        config.bracket_expansion_factor <= 1.0) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidBracketConfig, config.bracket_expansion_factor));
    }
    if (!std::isfinite(config.initial_bracket_size) ||
        config.initial_bracket_size <= 0.0) {
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidBracketConfig, config.initial_bracket_size, 1));
    }
    return {};
}

}  // namespace spreadomatic
