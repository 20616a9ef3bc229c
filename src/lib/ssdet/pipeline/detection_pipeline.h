/**
 * @file detection_pipeline.h
 * @ingroup ssdet_pipeline
 * @brief Inference post-processing in a fixed order: decode, select, sort/top-k, NMS, clip.
 *
 * @details
 * Step order per image:
 *  1) decode localisations against the anchor set (all layers),
 *  2) per-class threshold selection over the concatenated anchors,
 *  3) descending sort and top_k truncation,
 *  4) per-class NMS and keep_top_k truncation,
 *  5) clip to @ref ssdet::DetectionParams::clip when one is given.
 *
 * Clipping runs after NMS: IoU is measured on the unclipped boxes.
 */

#pragma once

#include "pipeline/box_ops.h"
#include "status.h"
#include "types.h"

#include <array>
#include <vector>

namespace ssdet::pipeline {

class DetectionPipeline final {
  public:
    /** @param ops Box routines; must outlive the pipeline. */
    explicit DetectionPipeline(const IBoxOps& ops) noexcept : ops_(&ops) {}

    /**
     * @brief Runs the pipeline for every image of the batch.
     *
     * @param predictions Per-layer class probabilities [B,H,W,K,C].
     * @param localisations Per-layer offsets [B,H,W,K,4].
     * @param anchors Anchor set, same layer order.
     * @param prior_scaling Decoder scaling.
     * @param params Thresholds and limits.
     *
     * @return One @ref ImageDetections per image.
     *
     * @retval Status::Invalid when layer counts or shapes disagree.
     */
    Result<std::vector<ImageDetections>> run(const std::vector<Tensor>& predictions,
                                             const std::vector<Tensor>& localisations, const AnchorSet& anchors,
                                             const std::array<float, 4>& prior_scaling,
                                             const DetectionParams& params) const noexcept;

  private:
    const IBoxOps* ops_;
};

} // namespace ssdet::pipeline
