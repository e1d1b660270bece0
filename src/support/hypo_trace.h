// SPDX-License-Identifier: MIT
/**
 * @file hypo_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the hypo library
 *
 * Probes compile to single NOP instructions unless a tracing tool attaches
 * to them, so they stay in release builds. Every rejected factory input and
 * every engine failure fires a probe; the long-running loops (schedule
 * generation, rate solving, portfolio batches) report start/complete.
 *
 * Example usage with bpftrace:
 *   # Count validation failures per module and error code
 *   sudo bpftrace -e 'usdt:./libhypo.so:hypo:validation_error { @[arg0, arg1] = count(); }'
 *
 *   # Watch schedule lengths
 *   sudo bpftrace -e 'usdt:./libhypo.so:hypo:algo_complete /arg0 == 4/ { @months = hist(arg1); }'
 */

#ifndef HYPO_TRACE_H
#define HYPO_TRACE_H

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
#endif

/**
 * Provider name for all hypo probes
 */
#define HYPO_PROVIDER hypo

/**
 * Module identifiers, passed as the first parameter to most probes
 */
#define MODULE_VALUE_TYPES        1
#define MODULE_LOAN               2
#define MODULE_LOAN_CALCULATIONS  3
#define MODULE_AMORTIZATION       4
#define MODULE_PROPERTY           5
#define MODULE_LOAN_TO_VALUE      6
#define MODULE_SONDERTILGUNG      7
#define MODULE_PORTFOLIO          8
#define MODULE_ROOT_FINDING       9

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., term in months, batch size)
 * @param param2: Module-specific parameter (e.g., amount in euros)
 * @param param3: Module-specific parameter (e.g., annual rate in percent)
 */
#define HYPO_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(HYPO_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired periodically during algorithm execution
 * @param module_id: Module identifier
 * @param current: Current progress (e.g., month number)
 * @param total: Total work (e.g., term in months)
 * @param metric: Module-specific metric (e.g., remaining balance)
 */
#define HYPO_TRACE_ALGO_PROGRESS(module_id, current, total, metric) \
    DTRACE_PROBE4(HYPO_PROVIDER, algo_progress, module_id, current, total, metric)

/**
 * Fired when an algorithm completes
 * @param module_id: Module identifier
 * @param iterations: Iterations performed (months, bisection steps, loans)
 * @param final_metric: Module-specific result (e.g., total interest)
 */
#define HYPO_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(HYPO_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Probes
 * ============================================================================
 */

#define HYPO_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_error) \
    DTRACE_PROBE3(HYPO_PROVIDER, convergence_success, module_id, final_iter, final_error)

#define HYPO_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_error) \
    DTRACE_PROBE3(HYPO_PROVIDER, convergence_failed, module_id, max_iter, final_error)

/**
 * ============================================================================
 * Error Probes
 * ============================================================================
 */

/**
 * Fired when a factory or rule check rejects its input
 * @param module_id: Module identifier
 * @param error_code: Integer value of the module's error code enum
 * @param param1: Rejected value
 * @param param2: Bound or comparison value (0 if not applicable)
 */
#define HYPO_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(HYPO_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a calculation fails on inputs that passed validation
 * @param module_id: Module identifier
 * @param error_code: Integer value of the module's error code enum
 * @param context: Module-specific context (e.g., month number)
 */
#define HYPO_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(HYPO_PROVIDER, runtime_error, module_id, error_code, context)

#endif // HYPO_TRACE_H
