/**
 * @file config.h
 * @brief Network configuration record: image shape, feature layers and anchor parameters.
 *
 * @details
 * @ref ssdet::NetConfig is the single configuration value passed to every operation. It is never
 * mutated by the library: shape refinement after a forward pass produces a new record through
 * @ref ssdet::NetConfig::with_feat_shapes.
 *
 * All per-layer lists (@c feat_layers, @c feat_shapes, @c anchor_sizes, @c anchor_ratios,
 * @c anchor_steps, @c normalizations) are index-aligned; layer @c i of every list describes the
 * same feature map. This order is the anchor order used by the head, the encoder, the decoder
 * and the loss.
 *
 * @ingroup ssdet_api
 */

#pragma once

#include "export.h"
#include "status.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace ssdet {

/** @brief Image extent in pixels (height, width). */
struct ImageShape {
    int64_t h = 300;
    int64_t w = 300;

    bool square() const noexcept {
        return h == w;
    }
};

/**
 * @brief Spatial shape of one feature layer.
 *
 * @details
 * @c anchors is the per-cell anchor count when it was read back from a prediction tensor
 * (see @ref ssdet::anchor::update_shapes_from_predictions); configured defaults leave it at 0.
 */
struct FeatShape {
    int64_t h = 0;
    int64_t w = 0;
    int64_t anchors = 0;

    friend bool operator==(const FeatShape& a, const FeatShape& b) noexcept {
        return a.h == b.h && a.w == b.w && a.anchors == b.anchors;
    }
    friend bool operator!=(const FeatShape& a, const FeatShape& b) noexcept {
        return !(a == b);
    }
};

/**
 * @brief Runtime threading knobs.
 *
 * @note Values <= 0 leave the corresponding runtime default untouched.
 */
struct RuntimePolicy {
    /** @brief ONNX Runtime intra-op thread count. */
    int ort_intra_threads = 1;

    /** @brief ONNX Runtime inter-op thread count. */
    int ort_inter_threads = 1;

    /** @brief OpenMP threads for anchor / loss loops. */
    int omp_threads = 0;

    /** @brief Disable OpenCV's internal thread pool (process-global). */
    bool suppress_opencv = true;
};

/**
 * @brief Per-layer view assembled from the index-aligned lists of @ref NetConfig.
 */
struct LayerConfig {
    std::string name;
    FeatShape shape;

    /** @brief One or two absolute reference sizes in pixels (s_min[, s_max]). */
    std::vector<float> sizes;

    /** @brief Aspect ratios, in anchor order. */
    std::vector<float> ratios;

    /** @brief Feature stride in pixels at input resolution. */
    float step = 0.f;

    /** @brief L2-normalisation initial scale; <= 0 disables normalisation for the layer. */
    float normalization = -1.f;

    /** @brief Anchors per cell: K = len(sizes) + len(ratios). */
    int num_anchors() const noexcept {
        return static_cast<int>(sizes.size() + ratios.size());
    }

    bool normalized() const noexcept {
        return normalization > 0.f;
    }
};

/**
 * @brief Immutable network configuration.
 *
 * Typical workflow:
 *  1) start from @ref ssd300 or @ref ssd512 (or fill the struct),
 *  2) call @ref validate,
 *  3) pass by const reference to anchors/forward/losses/detected_boxes.
 */
struct SSDET_API NetConfig final {
    ImageShape img_shape{300, 300};

    /** @brief Number of classes including background (class 0). */
    int num_classes = 21;

    /** @brief Label used by annotations without a class; labels >= num_classes are never matched. */
    int no_annotation_label = 21;

    std::vector<std::string> feat_layers;
    std::vector<FeatShape> feat_shapes;

    /** @brief Relative (min, max) reference sizes used by @ref anchor::size_bounds_to_absolute. */
    std::array<double, 2> anchor_size_bounds{0.15, 0.90};

    std::vector<std::vector<float>> anchor_sizes;
    std::vector<std::vector<float>> anchor_ratios;
    std::vector<float> anchor_steps;
    float anchor_offset = 0.5f;
    std::vector<float> normalizations;

    /** @brief Regression scaling in (cy, cx, h, w) order. */
    std::array<float, 4> prior_scaling{0.1f, 0.1f, 0.2f, 0.2f};

    /** @brief Exported ONNX graph executed by the forward engine (may be empty for training-only use). */
    std::string model_path{};

    RuntimePolicy runtime{};

    /** @brief Print diagnostics to stdout. */
    bool verbose = false;

    std::size_t num_layers() const noexcept {
        return feat_layers.size();
    }

    /**
     * @brief Checks list alignment and value ranges.
     *
     * @retval Status::Invalid naming the first offending field.
     */
    [[nodiscard]] Status validate() const noexcept;

    /** @brief Per-layer record for layer @p i. @pre i < num_layers(). */
    LayerConfig layer(std::size_t i) const;

    /** @brief Copy of this record with @c feat_shapes replaced. */
    NetConfig with_feat_shapes(std::vector<FeatShape> shapes) const;

    /** @brief Default SSD 300x300 VGG configuration (6 layers). */
    static NetConfig ssd300();

    /** @brief Default SSD 512x512 VGG configuration (7 layers). */
    static NetConfig ssd512();
};

/**
 * @brief Writes a human-readable configuration dump (one row per layer).
 *
 * @param cfg Configuration to describe.
 * @param os Output stream.
 * @param color Use ANSI colors.
 */
SSDET_API void describe(const NetConfig& cfg, std::ostream& os, bool color = false);

} // namespace ssdet
