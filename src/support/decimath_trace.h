// SPDX-License-Identifier: MIT
/**
 * @file decimath_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the decimath library
 *
 * Probes compile to single NOP instructions unless a tracer attaches. They
 * let iterative kernels (square root, root finding, matrix inversion) be
 * inspected in production builds without logging in the hot path.
 *
 * Probe arguments are integers or doubles. Decimal metrics are passed through
 * Decimal::to_double(), which is only evaluated when the probe site is built
 * with HAVE_SYSTEMTAP_SDT.
 *
 * Example usage with bpftrace:
 *   # Every convergence failure with its module and residual
 *   sudo bpftrace -e 'usdt:./lib*.so:decimath:convergence_failed { ... }'
 */

#ifndef DECIMATH_TRACE_H
#define DECIMATH_TRACE_H

#include <stddef.h>

/**
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
 * Provider name for all decimath probes
 */
#define DECIMATH_PROVIDER decimath

/**
 * Module identifiers, passed as the first parameter to most probes
 */
#define DECIMATH_MODULE_SQRT               1
#define DECIMATH_MODULE_EXP                2
#define DECIMATH_MODULE_LN                 3
#define DECIMATH_MODULE_TRIG               4
#define DECIMATH_MODULE_NORMAL_DIST        5
#define DECIMATH_MODULE_POW_FRACTION       6
#define DECIMATH_MODULE_CASHFLOW_ROOT      7
#define DECIMATH_MODULE_MATRIX_INVERSE     8
#define DECIMATH_MODULE_CHOLESKY           9
#define DECIMATH_MODULE_BOND_YIELD         10
#define DECIMATH_MODULE_BLACK_LITTERMAN    11
#define DECIMATH_MODULE_OPTIMAL_EXECUTION  12
#define DECIMATH_MODULE_BATCH_SOLVER       13
#define DECIMATH_MODULE_TIME_VALUE         14

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (DECIMATH_MODULE_* constant)
 * @param param1: Module-specific parameter (e.g. problem size, max_iter)
 * @param param2: Module-specific parameter (e.g. tolerance)
 */
#define DECIMATH_TRACE_ALGO_START(module_id, param1, param2) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, algo_start, module_id, param1, param2)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Number of iterations/steps completed
 * @param final_metric: Final metric value (e.g. residual)
 */
#define DECIMATH_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Tracking Probes
 * ============================================================================
 */

/**
 * Fired on each iteration of a convergence loop
 * @param module_id: Module identifier
 * @param iter: Current iteration number
 * @param error: Current error metric
 * @param tolerance: Convergence threshold
 */
#define DECIMATH_TRACE_CONVERGENCE_ITER(module_id, iter, error, tolerance) \
    DTRACE_PROBE4(DECIMATH_PROVIDER, convergence_iter, module_id, iter, error, tolerance)

/**
 * Fired when convergence is achieved
 * @param module_id: Module identifier
 * @param final_iter: Number of iterations required
 * @param final_error: Final error achieved
 */
#define DECIMATH_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_error) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, convergence_success, module_id, final_iter, final_error)

/**
 * Fired when convergence fails
 * @param module_id: Module identifier
 * @param max_iter: Maximum iterations attempted
 * @param final_error: Final error at failure
 */
#define DECIMATH_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_error) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, convergence_failed, module_id, max_iter, final_error)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: Error code (KernelErrorCode or ValidationErrorCode as int)
 * @param value: Offending value
 */
#define DECIMATH_TRACE_VALIDATION_ERROR(module_id, error_code, value) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, validation_error, module_id, error_code, value)

/**
 * Fired when a runtime error occurs (overflow, singular pivot, ...)
 * @param module_id: Module identifier
 * @param error_code: Error code
 * @param context: Context value (e.g. row index, iteration)
 */
#define DECIMATH_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Module-Specific Convenience Probes
 * ============================================================================
 */

/**
 * Cash-flow root finder start
 * @param n_flows: Number of cash flows
 * @param guess: Initial rate guess
 * @param max_iter: Iteration ceiling
 */
#define DECIMATH_TRACE_CASHFLOW_START(n_flows, guess, max_iter) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, cashflow_start, n_flows, guess, max_iter)

/**
 * Rate clamped to the configured bracket during a Newton step
 * @param iter: Iteration number
 * @param unclamped: Rate before clamping
 * @param clamped: Rate after clamping
 */
#define DECIMATH_TRACE_CASHFLOW_CLAMP(iter, unclamped, clamped) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, cashflow_clamp, iter, unclamped, clamped)

/**
 * Pivot selected during Gauss-Jordan elimination
 * @param column: Column being eliminated
 * @param row: Row chosen as pivot
 * @param magnitude: |pivot|
 */
#define DECIMATH_TRACE_MATRIX_PIVOT(column, row, magnitude) \
    DTRACE_PROBE3(DECIMATH_PROVIDER, matrix_pivot, column, row, magnitude)

/**
 * Batch root finder start/complete
 * @param batch_size: Number of problems
 * @param failed: Number of failed problems (complete only)
 */
#define DECIMATH_TRACE_BATCH_START(batch_size) \
    DTRACE_PROBE1(DECIMATH_PROVIDER, batch_start, batch_size)

#define DECIMATH_TRACE_BATCH_COMPLETE(batch_size, failed) \
    DTRACE_PROBE2(DECIMATH_PROVIDER, batch_complete, batch_size, failed)

#endif // DECIMATH_TRACE_H
