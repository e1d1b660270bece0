// SPDX-License-Identifier: MIT
/**
 * @file root_finding.hpp
 * @brief Bracketed bisection for monotone scalar functions
 *
 * Used by the implied interest rate solve. Convergence and failure are
 * reported through the result struct and the convergence trace probes.
 */

#pragma once

#include "src/support/hypo_trace.h"

#include <cmath>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace hypo {

/// Configuration for bracketed root finding
struct RootFindingConfig {
    /// Maximum bisection steps
    size_t max_iter = 50;

    /// Absolute tolerance on |f(x)| (for payment solves: euros)
    double tolerance = 0.01;
};

/// Result from a root-finding run
struct RootFindingResult {
    /// Convergence status
    bool converged;

    /// Number of iterations performed
    size_t iterations;

    /// |f(root)| at the last evaluated point
    double final_error;

    /// Optional failure diagnostic message
    std::optional<std::string> failure_reason;

    /// Last midpoint (set even without convergence, empty on invalid input)
    std::optional<double> root;
};

/// Concept for objective functions (scalar functions f: R -> R)
template<typename F>
concept ObjectiveFunction = requires(F f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Find a root of a monotone function by bisection
///
/// Halves [lo, hi] until |f(mid)| < tolerance, keeping [lo, mid] when f
/// changes sign there and [mid, hi] otherwise. A root outside the bracket
/// is reported as non-convergence after max_iter steps.
///
/// @param f Function to find root of
/// @param lo Left bracket
/// @param hi Right bracket
/// @param config Iteration limit and tolerance
template<ObjectiveFunction F>
RootFindingResult bisect_find_root(F&& f, double lo, double hi,
                                   const RootFindingConfig& config) {
    if (!(lo < hi) || !std::isfinite(lo) || !std::isfinite(hi)) {
        return RootFindingResult{
            .converged = false,
            .iterations = 0,
            .final_error = std::numeric_limits<double>::quiet_NaN(),
            .failure_reason = "Invalid bracket: lo must be < hi",
            .root = std::nullopt
        };
    }

    HYPO_TRACE_ALGO_START(MODULE_ROOT_FINDING, config.max_iter, lo, hi);

    double f_lo = f(lo);
    double mid = 0.5 * (lo + hi);
    double f_mid = std::numeric_limits<double>::quiet_NaN();

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        mid = 0.5 * (lo + hi);
        f_mid = f(mid);

        if (!std::isfinite(f_mid)) {
            HYPO_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, iter + 1, f_mid);
            return RootFindingResult{
                .converged = false,
                .iterations = iter + 1,
                .final_error = std::numeric_limits<double>::quiet_NaN(),
                .failure_reason = "Function returned non-finite value (NaN or Inf)",
                .root = std::nullopt
            };
        }

        if (std::abs(f_mid) < config.tolerance) {
            HYPO_TRACE_CONVERGENCE_SUCCESS(MODULE_ROOT_FINDING, iter + 1, std::abs(f_mid));
            return RootFindingResult{
                .converged = true,
                .iterations = iter + 1,
                .final_error = std::abs(f_mid),
                .failure_reason = std::nullopt,
                .root = mid
            };
        }

        const bool sign_change_left = (f_lo < 0.0) != (f_mid < 0.0);
        if (sign_change_left) {
            hi = mid;
        } else {
            lo = mid;
            f_lo = f_mid;
        }
    }

    HYPO_TRACE_CONVERGENCE_FAILED(MODULE_ROOT_FINDING, config.max_iter, std::abs(f_mid));
    return RootFindingResult{
        .converged = false,
        .iterations = config.max_iter,
        .final_error = std::abs(f_mid),
        .failure_reason = "Max iterations reached",
        .root = mid
    };
}

}  // namespace hypo
