// SPDX-License-Identifier: MIT
/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Usage:
 *   HYPO_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * The macros expand to nothing when the library is built without OpenMP,
 * so every loop they annotate must also be correct sequentially.
 */

#pragma once

#if defined(_OPENMP)
    #define HYPO_PRAGMA_PARALLEL_FOR                    _Pragma("omp parallel for")
    #define HYPO_PRAGMA_PARALLEL_FOR_DYNAMIC            _Pragma("omp parallel for schedule(dynamic, 16)")
    #define HYPO_PRAGMA_ATOMIC                          _Pragma("omp atomic")
#else
    #define HYPO_PRAGMA_PARALLEL_FOR
    #define HYPO_PRAGMA_PARALLEL_FOR_DYNAMIC
    #define HYPO_PRAGMA_ATOMIC
#endif

/**
 * Available macros:
 * - HYPO_PRAGMA_PARALLEL_FOR: Parallelize a loop with uniform iteration cost
 * - HYPO_PRAGMA_PARALLEL_FOR_DYNAMIC: Parallelize a loop whose iterations vary
 *   in cost (e.g. schedules of different lengths)
 * - HYPO_PRAGMA_ATOMIC: Atomic update of a shared counter
 *
 * _Pragma is used instead of #pragma so the directives can live in macros.
 */
