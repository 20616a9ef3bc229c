/**
 * @file select.h
 * @ingroup ssdet_algo
 * @brief Per-class score thresholding and top-k truncation of decoded boxes.
 */

#pragma once

#include "types.h"

#include <vector>

namespace ssdet::algo {

/**
 * @brief Splits the anchors of one image into per-class candidates.
 *
 * @param probs Row-major [N, num_classes] class probabilities.
 * @param boxes N decoded boxes, same anchor order as @p probs.
 * @param num_classes Classes including background; class 0 is never selected.
 * @param threshold Keep (anchor, class) pairs with probability strictly above this value.
 *
 * @return Classes with at least one candidate, boxes in anchor order.
 */
ImageDetections select(const std::vector<float>& probs, const std::vector<BBox>& boxes, int num_classes,
                       float threshold);

/**
 * @brief Sorts every class by descending score (stable) and keeps the first @p top_k boxes.
 *
 * @param top_k <= 0 keeps every box.
 */
ImageDetections sort_top_k(ImageDetections dets, int top_k);

} // namespace ssdet::algo
