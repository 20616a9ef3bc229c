/**
 * @file omp_config.h
 * @ingroup ssdet_platform
 * @brief OpenMP thread configuration for the data-parallel anchor and loss loops.
 *
 * @note Internal header; not installed.
 */

#pragma once

#include "config.h"
#include "status.h"

namespace ssdet::platform {

/**
 * @brief Applies @ref ssdet::RuntimePolicy to OpenMP and OpenCV.
 *
 * - @c omp_threads > 0: fixed OpenMP team size, dynamic adjustment disabled;
 *   0 keeps the runtime default.
 * - @c suppress_opencv: @c cv::setNumThreads(0) so OpenCV does not compete with OpenMP.
 *
 * @param policy Runtime knobs.
 * @param verbose Print the effective configuration to stdout.
 * @return Status::Invalid for negative thread counts.
 *
 * @warning Both settings are process-global.
 */
Status apply_runtime_policy(const RuntimePolicy& policy, bool verbose) noexcept;

/** @brief Current OpenMP team size for parallel regions (1 when built without OpenMP). */
int omp_max_threads() noexcept;

} // namespace ssdet::platform
