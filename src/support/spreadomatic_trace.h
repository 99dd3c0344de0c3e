// SPDX-License-Identifier: MIT
/**
 * @file spreadomatic_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the spreadomatic library
 *
 * Tracing points that can be enabled at runtime with bpftrace, systemtap or
 * perf. When tracing is disabled (default), probes compile to nothing.
 * This is the library's only diagnostics channel: solvers never print.
 *
 * Example usage with bpftrace:
 *   # Every solve that ran out of iterations (non-convergence warnings)
 *   sudo bpftrace -e 'usdt:./lib*.so:spreadomatic:convergence_failed { ... }'
 *
 *   # Every Newton -> Brent fallback with the break reason
 *   sudo bpftrace -e 'usdt:./lib*.so:spreadomatic:newton_fallback { ... }'
 */

#ifndef SPREADOMATIC_TRACE_H
#define SPREADOMATIC_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all spreadomatic probes
 */
#define SPREADOMATIC_PROVIDER spreadomatic

/**
 * Module identifiers passed as the first parameter to most probes
 */
#define MODULE_BRENT_ROOT       1
#define MODULE_NEWTON_ROOT      2
#define MODULE_INTEGRATION      3
#define MODULE_ZERO_CURVE       4
#define MODULE_CASHFLOWS        5
#define MODULE_YIELD_SOLVER     6
#define MODULE_SENSITIVITY      7
#define MODULE_OAS              8
#define MODULE_BOND_ANALYTICS   9

/**
 * Newton break reasons reported by SPREADOMATIC_TRACE_NEWTON_FALLBACK
 */
#define NEWTON_BREAK_DERIVATIVE_TOO_SMALL  1
#define NEWTON_BREAK_STEP_TOO_LARGE        2
#define NEWTON_BREAK_NON_FINITE            3
#define NEWTON_BREAK_MAX_ITERATIONS        4
#define NEWTON_BREAK_OUT_OF_BOUNDS         5

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., max_iter, n_cashflows)
 * @param param2: Module-specific parameter (e.g., tolerance, price)
 * @param param3: Module-specific parameter
 */
#define SPREADOMATIC_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(SPREADOMATIC_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Number of iterations completed
 * @param final_metric: Final metric value (e.g., root, integral)
 */
#define SPREADOMATIC_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(SPREADOMATIC_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired when an iteration budget is exhausted without meeting tolerance.
 * The best estimate is still returned to the caller.
 * @param module_id: Module identifier
 * @param max_iter: Iterations attempted
 * @param best_x: Best estimate returned
 * @param final_error: |f(best_x)|
 */
#define SPREADOMATIC_TRACE_CONVERGENCE_FAILED(module_id, max_iter, best_x, final_error) \
    DTRACE_PROBE4(SPREADOMATIC_PROVIDER, convergence_failed, module_id, max_iter, best_x, final_error)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode as int
 * @param param1: Offending value
 * @param param2: Offending index or threshold
 */
#define SPREADOMATIC_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(SPREADOMATIC_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a solve fails outright
 * @param module_id: Module identifier
 * @param error_code: RootFindingErrorCode or AnalyticsErrorCode as int
 * @param context: Context value (e.g., last abscissa)
 */
#define SPREADOMATIC_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(SPREADOMATIC_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Module-Specific Probes: Root Finding
 * ============================================================================
 */

/**
 * Fired when Brent iteration begins on a sign-changing bracket
 */
#define SPREADOMATIC_TRACE_BRENT_START(a, b, tolerance, max_iter) \
    SPREADOMATIC_TRACE_ALGO_START(MODULE_BRENT_ROOT, max_iter, tolerance, (b - a))

/**
 * Fired on each Brent iteration
 * @param iter: Iteration number
 * @param x: Current best point
 * @param fx: Function value at x
 * @param interval_width: Current bracket width
 */
#define SPREADOMATIC_TRACE_BRENT_ITER(iter, x, fx, interval_width) \
    DTRACE_PROBE4(SPREADOMATIC_PROVIDER, brent_iter, iter, x, fx, interval_width)

/**
 * Fired when Brent converges
 */
#define SPREADOMATIC_TRACE_BRENT_COMPLETE(root, iterations) \
    SPREADOMATIC_TRACE_ALGO_COMPLETE(MODULE_BRENT_ROOT, iterations, root)

/**
 * Fired on every bracket expansion attempt
 * @param attempt: Expansion number (0-based)
 * @param a: Left end
 * @param b: Right end
 */
#define SPREADOMATIC_TRACE_BRACKET_EXPAND(attempt, a, b) \
    DTRACE_PROBE3(SPREADOMATIC_PROVIDER, bracket_expand, attempt, a, b)

/**
 * Fired when safeguarded Newton breaks out and hands over to Brent
 * @param reason: NEWTON_BREAK_* code
 * @param iterations: Newton iterations performed
 * @param x: Last Newton iterate
 */
#define SPREADOMATIC_TRACE_NEWTON_FALLBACK(reason, iterations, x) \
    DTRACE_PROBE4(SPREADOMATIC_PROVIDER, newton_fallback, MODULE_NEWTON_ROOT, reason, iterations, x)

/**
 * ============================================================================
 * Module-Specific Probes: Integration
 * ============================================================================
 */

/**
 * Fired when adaptive quadrature fails and the trapezoid rule is used
 * @param a: Lower limit
 * @param b: Upper limit
 * @param subdivisions: Subdivisions reached before failure
 */
#define SPREADOMATIC_TRACE_INTEGRATION_FALLBACK(a, b, subdivisions) \
    DTRACE_PROBE4(SPREADOMATIC_PROVIDER, integration_fallback, MODULE_INTEGRATION, a, b, subdivisions)

#endif // SPREADOMATIC_TRACE_H
