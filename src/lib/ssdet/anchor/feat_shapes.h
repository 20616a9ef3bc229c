/**
 * @file feat_shapes.h
 * @ingroup ssdet_anchor
 * @brief Refine configured feature shapes from the shapes of prediction tensors.
 */

#pragma once

#include "config.h"
#include "status.h"
#include "tensor.h"

#include <vector>

namespace ssdet::anchor {

/**
 * @brief Read (H, W, K) back from per-layer prediction tensors shaped [B, H, W, K, ...].
 *
 * @details
 * Per layer, independently:
 * - dimensions 1..3 all known: the layer's shape becomes {H, W, K};
 * - otherwise (unknown dimension or rank < 4): the layer keeps @p fallback_shapes[i] unchanged.
 *
 * Partially known shapes are never completed from the fallback, and one layer's outcome has no
 * effect on another's.
 *
 * @param predictions Per-layer prediction descriptors (data may be empty).
 * @param fallback_shapes Configured shapes, index-aligned with @p predictions.
 * @retval Status::Invalid if the two lists differ in length.
 */
Result<std::vector<FeatShape>> update_shapes_from_predictions(const std::vector<Tensor>& predictions,
                                                              const std::vector<FeatShape>& fallback_shapes) noexcept;

} // namespace ssdet::anchor
