/**
 * @file box_ops.h
 * @ingroup ssdet_pipeline
 * @brief Box operations consumed by the detection pipeline.
 *
 * @details
 * The pipeline only fixes the order of the steps; the numeric routines sit behind
 * @ref ssdet::pipeline::IBoxOps so that they can be replaced (or observed in tests) without
 * touching the orchestration. @ref ssdet::pipeline::DefaultBoxOps forwards to the
 * implementations in @c algo/.
 */

#pragma once

#include "status.h"
#include "types.h"

#include <array>
#include <vector>

namespace ssdet::pipeline {

/**
 * @brief Abstract decode / select / sort / NMS / clip routines.
 */
class IBoxOps {
  public:
    virtual ~IBoxOps() = default;

    /**
     * @brief Per-layer offsets [B,H,W,K,4] -> per-layer boxes [B,H,W,K,4] in [ymin,xmin,ymax,xmax].
     */
    virtual Result<std::vector<Tensor>> decode(const std::vector<Tensor>& localisations, const AnchorSet& anchors,
                                               const std::array<float, 4>& prior_scaling) const = 0;

    /**
     * @brief Per-class candidates of one image.
     *
     * @param probs [N, num_classes] probabilities, flat anchor order.
     * @param boxes N boxes, same order.
     */
    virtual ImageDetections select(const std::vector<float>& probs, const std::vector<BBox>& boxes, int num_classes,
                                   float threshold) const = 0;

    virtual ImageDetections sort_top_k(ImageDetections dets, int top_k) const = 0;

    virtual ImageDetections nms(ImageDetections dets, float nms_threshold, int keep_top_k) const = 0;

    virtual ImageDetections clip(ImageDetections dets, const BBox& window) const = 0;
};

/**
 * @brief Routines from @c algo/ (SSD decoding, greedy NMS, side-wise clipping).
 */
class DefaultBoxOps : public IBoxOps {
  public:
    Result<std::vector<Tensor>> decode(const std::vector<Tensor>& localisations, const AnchorSet& anchors,
                                       const std::array<float, 4>& prior_scaling) const override;

    ImageDetections select(const std::vector<float>& probs, const std::vector<BBox>& boxes, int num_classes,
                           float threshold) const override;

    ImageDetections sort_top_k(ImageDetections dets, int top_k) const override;

    ImageDetections nms(ImageDetections dets, float nms_threshold, int keep_top_k) const override;

    ImageDetections clip(ImageDetections dets, const BBox& window) const override;
};

} // namespace ssdet::pipeline
