/**
 * @file bbox.h
 * @ingroup ssdet_algo
 * @brief Axis-aligned box helpers in normalised [ymin, xmin, ymax, xmax] coordinates.
 */

#pragma once

#include "internal/opencv_headers.h" // IWYU pragma: keep
#include "types.h"

namespace ssdet::algo {

/** @brief Same box as an OpenCV rectangle (x = xmin, y = ymin). */
cv::Rect2f to_rect(const BBox& b) noexcept;

/** @brief Inverse of @ref to_rect. */
BBox from_rect(const cv::Rect2f& r) noexcept;

/**
 * @brief Intersection over union.
 *
 * @return IoU in [0,1]; 0 for non-finite input or an empty union.
 */
float iou(const BBox& a, const BBox& b) noexcept;

/**
 * @brief Clips @p box to @p window side by side.
 *
 * @details
 * ymin = max(ymin, window.ymin), xmin = max(xmin, window.xmin),
 * ymax = min(ymax, window.ymax), xmax = min(xmax, window.xmax).
 * A box entirely outside the window comes back inverted (height or width < 0); callers that
 * need non-empty boxes filter on @ref BBox::height / @ref BBox::width.
 */
BBox clip(const BBox& box, const BBox& window) noexcept;

} // namespace ssdet::algo
