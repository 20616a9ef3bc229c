/**
 * @file anchor_generator.h
 * @ingroup ssdet_anchor
 * @brief Multi-scale anchor geometry: per-layer center grids and per-anchor sizes.
 *
 * @details
 * For a feature map of H x W cells with stride @c step pixels, cell (i, j) is centered at
 * - cy = (i + offset) * step / img_h,
 * - cx = (j + offset) * step / img_w.
 *
 * Each cell carries K = len(sizes) + len(ratios) anchors, in this fixed order:
 * 1. ratio 1, small scale:   h = sizes[0] / img_h, w = sizes[0] / img_w;
 * 2. ratio 1, large scale (only with a second size): h = w = sqrt(sizes[0] * sizes[1]) / img_{h,w};
 * 3. one anchor per ratio r: h = sizes[0] / img_h / sqrt(r), w = sizes[0] / img_w * sqrt(r).
 *
 * The anchor order defined here is the order of the K axis in every prediction and target tensor.
 */

#pragma once

#include "config.h"
#include "status.h"
#include "types.h"

#include <array>
#include <vector>

namespace ssdet::anchor {

/**
 * @brief Anchors of one feature layer.
 *
 * @param img_shape Network input size in pixels.
 * @param feat_shape Feature map size; both dimensions must be known and > 0.
 * @param sizes One or two reference sizes in pixels.
 * @param ratios Aspect ratios (> 0).
 * @param step Feature stride in pixels (> 0).
 * @param offset Center offset inside a cell, 0.5 for cell centers.
 *
 * @retval Status::Invalid on empty/oversized @p sizes, non-positive ratios, step or shape.
 */
Result<LayerAnchors> generate_layer(const ImageShape& img_shape, const FeatShape& feat_shape,
                                    const std::vector<float>& sizes, const std::vector<float>& ratios, float step,
                                    float offset = 0.5f) noexcept;

/**
 * @brief Anchors for every configured layer, in configuration order.
 *
 * @param img_shape Network input size in pixels.
 * @param cfg Configuration; validated before use.
 */
Result<AnchorSet> generate_all_layers(const ImageShape& img_shape, const NetConfig& cfg) noexcept;

/**
 * @brief Converts relative (min, max) size bounds into absolute per-layer (min, max) sizes.
 *
 * @details
 * Bounds are turned into integer percentages by truncation. The first layer receives
 * (img * bmin / 2, img * bmin). The remaining pairs follow a linear schedule in percent with
 * step = floor((max_pct - min_pct) / (num_layers - 2)), one pair per pct in
 * [min_pct, max_pct]: (img * pct / 100, img * (pct + step) / 100).
 *
 * For (0.15, 0.90), 6 layers, 300 px:
 * (22.5,45) (45,99) (99,153) (153,207) (207,261) (261,315).
 *
 * @retval Status::Invalid if the image is not square, @p num_layers <= 2 or the
 *         percentage range is empty or too narrow for a positive step.
 */
Result<std::vector<std::vector<float>>> size_bounds_to_absolute(const std::array<double, 2>& relative_bounds,
                                                                int num_layers, const ImageShape& img_shape) noexcept;

} // namespace ssdet::anchor
