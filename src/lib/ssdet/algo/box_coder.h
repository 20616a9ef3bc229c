/**
 * @file box_coder.h
 * @ingroup ssdet_algo
 * @brief Ground-truth matching / offset encoding and the inverse decoding, one layer at a time.
 *
 * @details
 * Offsets are expressed in (cy, cx, h, w) order relative to an anchor (yref, xref, href, wref)
 * and divided by the prior scaling (s0..s3):
 * - t_cy = (cy - yref) / href / s0
 * - t_cx = (cx - xref) / wref / s1
 * - t_h  = log(h / href) / s2
 * - t_w  = log(w / wref) / s3
 *
 * Decoding inverts the transform and returns [ymin, xmin, ymax, xmax] boxes.
 */

#pragma once

#include "status.h"
#include "types.h"

#include <array>
#include <vector>

namespace ssdet::algo {

/**
 * @brief Matches ground truth against the anchors of one layer and encodes regression targets.
 *
 * @details
 * For every anchor, ground-truth boxes are visited in order; the anchor takes box g when
 * IoU(anchor, g) is strictly above the anchor's current score (initially 0) and above -0.5,
 * and label(g) is below @p num_classes and differs from @p ignore_label. Unmatched anchors
 * keep class 0, score 0 and the reference box [0,0,1,1].
 *
 * @param batch One ground-truth record per image; gives B.
 * @param anchors Layer anchors (H, W, K).
 * @param num_classes Classes including background.
 * @param ignore_label Label of boxes without a usable annotation; never matched.
 * @param prior_scaling (s0, s1, s2, s3).
 *
 * @return classes [B,H,W,K], localisations [B,H,W,K,4], scores [B,H,W,K].
 *
 * @retval Status::Invalid on empty @p batch, label/box count mismatch or negative labels.
 */
Result<LayerTargets> encode_layer(const std::vector<GroundTruth>& batch, const LayerAnchors& anchors, int num_classes,
                                  int ignore_label, const std::array<float, 4>& prior_scaling) noexcept;

/**
 * @brief Decodes offsets [B,H,W,K,4] of one layer into boxes of the same shape.
 *
 * @retval Status::Invalid if the tensor does not match the anchor grid (H, W, K) or is not 5-D.
 */
Result<Tensor> decode_layer(const Tensor& localisations, const LayerAnchors& anchors,
                            const std::array<float, 4>& prior_scaling) noexcept;

} // namespace ssdet::algo
