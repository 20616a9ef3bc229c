/**
 * @file ssd_losses.h
 * @ingroup ssdet_loss
 * @brief Training loss of the multibox head with hard-negative mining.
 *
 * @details
 * Inputs are per-layer lists aligned with the anchor set:
 * - logits         [B,H,W,K,C]
 * - localisations  [B,H,W,K,4]
 * - gclasses       [B,H,W,K]   (int32)
 * - glocalisations [B,H,W,K,4]
 * - gscores        [B,H,W,K]
 *
 * Every list is viewed as one flat anchor sequence: layer 0 (all images, row-major), then
 * layer 1, and so on. An anchor is
 * - positive when gscore > match_threshold,
 * - an eligible negative when it is not positive and gscore > ignore_score.
 *
 * The hard negatives are the n_neg eligible anchors with the lowest background probability
 * (softmax class 0), where n_neg = min(int(negative_ratio * n_pos) + B, n_eligible). The
 * selection is an exact top-k over the whole batch; equal probabilities are resolved by the
 * flat anchor index (lower first).
 *
 * All three terms are sums divided by B:
 * - positive:     cross-entropy(logits, gclass) over positives,
 * - negative:     cross-entropy(logits, 0) over selected hard negatives,
 * - localization: alpha * sum of smooth-L1(loc - gloc) over the 4 coordinates of positives.
 */

#pragma once

#include "status.h"
#include "tensor.h"
#include "types.h"

#include <vector>

namespace ssdet::loss {

/**
 * @brief Computes the three loss terms for one batch.
 *
 * @retval Status::Invalid when the lists differ in length, shapes disagree between the five
 *         inputs, the batch size is 0, the class count cannot be read from the logits
 *         (unknown or < 2 last dimension, or different across layers), or a positive anchor
 *         carries a label outside [0, C).
 *
 * @note Inputs are never modified.
 */
Result<LossTerms> compute_losses(const std::vector<Tensor>& logits, const std::vector<Tensor>& localisations,
                                 const std::vector<IntTensor>& gclasses, const std::vector<Tensor>& glocalisations,
                                 const std::vector<Tensor>& gscores, const LossParams& params = {}) noexcept;

/** @brief 0.5 x^2 for |x| < 1, |x| - 0.5 otherwise. */
inline float smooth_l1(float x) noexcept {
    const float a = x < 0.f ? -x : x;
    return a < 1.f ? 0.5f * x * x : a - 0.5f;
}

} // namespace ssdet::loss
