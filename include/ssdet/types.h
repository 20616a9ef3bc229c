/**
 * @file types.h
 * @brief Value types exchanged between anchors, encoder/decoder, loss and detection pipeline.
 *
 * @ingroup ssdet_api
 */

#pragma once

#include "tensor.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ssdet {

/** @brief Box in normalised image coordinates, [ymin, xmin, ymax, xmax] convention. */
struct BBox {
    float ymin = 0.f;
    float xmin = 0.f;
    float ymax = 0.f;
    float xmax = 0.f;

    float height() const noexcept {
        return ymax - ymin;
    }
    float width() const noexcept {
        return xmax - xmin;
    }
};

/**
 * @brief Anchor geometry of one feature layer.
 *
 * @details
 * Centers form an H x W grid shared by the K anchors of a cell (the broadcast dimension of
 * the [H,W,1] grids); heights and widths are per-anchor vectors of length K. All values are
 * normalised to the input image, i.e. in [0,1] for anchors inside the image.
 *
 * Anchor order inside a cell is fixed: ratio-1 small, ratio-1 large (when two sizes are
 * configured), then one anchor per configured ratio.
 */
struct LayerAnchors {
    int H = 0;
    int W = 0;

    /** @brief Center y, row-major [H*W] (same value along a row). */
    std::vector<float> cy;

    /** @brief Center x, row-major [H*W]. */
    std::vector<float> cx;

    /** @brief Anchor heights, [K]. */
    std::vector<float> h;

    /** @brief Anchor widths, [K]. */
    std::vector<float> w;

    int num_per_cell() const noexcept {
        return static_cast<int>(h.size());
    }

    /** @brief Total anchors in this layer: H*W*K. */
    std::size_t size() const noexcept {
        return static_cast<std::size_t>(H) * static_cast<std::size_t>(W) * h.size();
    }

    /** @brief Box of anchor @p k at cell (@p i, @p j). */
    BBox box(int i, int j, int k) const noexcept;
};

inline BBox LayerAnchors::box(int i, int j, int k) const noexcept {
    const std::size_t c = static_cast<std::size_t>(i) * static_cast<std::size_t>(W) + static_cast<std::size_t>(j);
    const float hh = 0.5f * h[static_cast<std::size_t>(k)];
    const float hw = 0.5f * w[static_cast<std::size_t>(k)];
    return {cy[c] - hh, cx[c] - hw, cy[c] + hh, cx[c] + hw};
}

/** @brief Per-layer anchors, index-aligned with the configured layer list. */
using AnchorSet = std::vector<LayerAnchors>;

struct ScoredBox {
    BBox box;
    float score = 0.f;
};

/** @brief Final detections of one image: class id (>= 1) -> boxes in descending score order. */
using ImageDetections = std::map<int, std::vector<ScoredBox>>;

/** @brief Matched targets of one layer as produced by the encoder. */
struct LayerTargets {
    /** @brief [B,H,W,K] class ids. */
    IntTensor classes;

    /** @brief [B,H,W,K,4] regression targets, (cy, cx, h, w) order. */
    Tensor localisations;

    /** @brief [B,H,W,K] match scores (IoU of the assigned ground truth). */
    Tensor scores;
};

/** @brief Ground truth of one image: labels and [ymin,xmin,ymax,xmax] normalised boxes. */
struct GroundTruth {
    std::vector<int> labels;
    std::vector<BBox> boxes;
};

/** @brief Raw network output of one forward pass (per layer, index-aligned with the config). */
struct ForwardOutput {
    /** @brief Softmax probabilities, [B,H,W,K,C] per layer. */
    std::vector<Tensor> predictions;

    /** @brief Regression outputs, [B,H,W,K,4] per layer. */
    std::vector<Tensor> localisations;

    /** @brief Class logits, [B,H,W,K,C] per layer. */
    std::vector<Tensor> logits;

    /** @brief Named intermediate feature maps [B,H,W,C] exported by the model (may be empty). */
    std::map<std::string, Tensor> feature_maps;
};

/** @brief Hard-negative mining parameters and localisation weight. */
struct LossParams {
    /** @brief Anchors with match score strictly above this value are positives. */
    float match_threshold = 0.5f;

    /** @brief Hard negatives per positive. */
    float negative_ratio = 3.f;

    /** @brief Weight of the localisation term. */
    float alpha = 1.f;

    /**
     * @brief Anchors scored at or below this value are excluded from both classification terms.
     *
     * @note The band is wider than "not positive" (0.5); kept at -0.5 as in the reference model.
     */
    float ignore_score = -0.5f;
};

/** @brief Counts observed while mining, whole batch. */
struct MiningStats {
    std::int64_t n_positives = 0;
    std::int64_t n_eligible_negatives = 0;
    std::int64_t n_negatives = 0;
};

/** @brief Loss terms of one invocation, already divided by the batch size. */
struct LossTerms {
    float positive = 0.f;
    float negative = 0.f;
    float localization = 0.f;
    MiningStats stats{};

    float total() const noexcept {
        return positive + negative + localization;
    }
};

/** @brief Inference post-processing parameters. */
struct DetectionParams {
    /** @brief Per-class probability threshold, strict (p > threshold); < 0 keeps every anchor. */
    float select_threshold = 0.01f;

    /** @brief IoU above which a lower-scored box of the same class is suppressed. */
    float nms_threshold = 0.5f;

    /** @brief Boxes kept per class before NMS. */
    int top_k = 400;

    /** @brief Boxes kept per class after NMS. */
    int keep_top_k = 200;

    /** @brief Optional clipping rectangle applied last. */
    std::optional<BBox> clip{};
};

} // namespace ssdet
