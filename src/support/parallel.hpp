// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP or sequential execution
 *
 * Usage:
 *   SPREADOMATIC_PRAGMA_PARALLEL_FOR
 *   for (size_t i = 0; i < n; ++i) { ... }
 */

#if defined(_OPENMP)
    #define SPREADOMATIC_PRAGMA_PARALLEL_FOR           _Pragma("omp parallel for schedule(dynamic, 1)")
    #define SPREADOMATIC_PRAGMA_ATOMIC                 _Pragma("omp atomic")
#else
    #define SPREADOMATIC_PRAGMA_PARALLEL_FOR
    #define SPREADOMATIC_PRAGMA_ATOMIC
#endif

/**
 * Design notes:
 *
 * 1. Bond analytics requests are independent and vary widely in cost (a
 *    Newton solve that falls back to Brent costs several times a clean
 *    one), so the batch loop uses dynamic scheduling with chunk size 1.
 *
 * 2. Sequential: the macros expand to nothing when OpenMP is not enabled,
 *    which keeps results bit-identical between the two builds.
 *
 * 3. Why _Pragma instead of #pragma: the _Pragma operator allows using
 *    pragmas in macro definitions.
 */
