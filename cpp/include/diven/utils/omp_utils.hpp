// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <diven/config.hpp>

#ifdef DIVEN_ENABLE_OPENMP
#include <omp.h>
#else

extern "C" {

/**
 * @brief Serial stand-in for `omp_get_thread_num` when DivEn is built
 * without OpenMP
 * @returns 0
 */
int omp_get_thread_num();

/**
 * @brief Serial stand-in for `omp_get_num_threads`
 * @returns 1
 */
int omp_get_num_threads();

/**
 * @brief Serial stand-in for `omp_get_max_threads`
 * @returns 1
 */
int omp_get_max_threads();

/**
 * @brief Serial stand-in for `omp_set_num_threads`
 * @param[in] n Requested thread count (ignored)
 */
void omp_set_num_threads(int n);
}

#endif  // DIVEN_ENABLE_OPENMP
