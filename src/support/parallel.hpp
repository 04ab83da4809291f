// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Usage:
 *   DECIMATH_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t i = 0; i < n; ++i) { ... }
 *
 * Kernels stay deterministic under either backend: every loop body writes
 * only its own output slot and reads shared inputs.
 */

#if defined(_OPENMP)
    #define DECIMATH_PRAGMA_PARALLEL_FOR_DYNAMIC        _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    #define DECIMATH_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif

/**
 * Available macros:
 * - DECIMATH_PRAGMA_PARALLEL_FOR_DYNAMIC: Parallelize single loop with dynamic
 *   scheduling (root finding converges in very different iteration counts)
 */
