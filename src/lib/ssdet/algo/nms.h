/**
 * @file nms.h
 * @ingroup ssdet_algo
 * @brief Greedy per-class non-maximum suppression for axis-aligned boxes.
 */

#pragma once

#include "types.h"

#include <vector>

namespace ssdet::algo {

/**
 * @brief Greedy NMS over boxes of one class.
 *
 * @param boxes Input boxes (any order).
 * @param iou_thr A box is suppressed if its IoU with a kept, higher-scored box is strictly above this value.
 * @param keep_top_k Maximum boxes returned; <= 0 keeps every survivor.
 *
 * @return Survivors in descending score order. Equal scores keep their input order.
 *
 * @par Special cases
 *  - iou_thr >= 1 : no suppression (IoU never exceeds 1), output is sorted and truncated.
 */
std::vector<ScoredBox> nms(const std::vector<ScoredBox>& boxes, float iou_thr, int keep_top_k);

/** @brief @ref nms applied independently to every class of @p dets. Classes left empty are dropped. */
ImageDetections nms_per_class(const ImageDetections& dets, float iou_thr, int keep_top_k);

} // namespace ssdet::algo
