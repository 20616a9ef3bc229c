/**
 * @file multibox_head.h
 * @ingroup ssdet_head
 * @brief Multibox prediction head: feature map -> per-anchor class logits and box offsets.
 *
 * @details
 * The head of one layer emits two convolution outputs of K*4 and K*num_classes channels
 * (K = anchors per cell). Turning them into anchor-indexed arrays is a pure reshape:
 * - [B,H,W,K*4] -> [B,H,W,K,4]
 * - [B,H,W,K*C] -> [B,H,W,K,C]
 *
 * No value is resampled or reordered; the K axis follows the anchor order of
 * @ref ssdet::anchor::generate_layer.
 *
 * @ref ssdet::head::MultiboxHead::predict is a CPU reference path (3x3 SAME convolutions with
 * caller-provided weights). Production inference goes through the ONNX engine, which reuses
 * @ref reshape_predictions and @ref softmax_predictions on the model outputs.
 */

#pragma once

#include "config.h"
#include "status.h"
#include "tensor.h"

#include <vector>

namespace ssdet::head {

/** @brief Anchors per cell of @p layer: len(sizes) + len(ratios). */
int num_anchors(const LayerConfig& layer) noexcept;

/** @brief Anchor-indexed predictions of one layer. */
struct LayerPrediction {
    /** @brief [B,H,W,K,4]. */
    Tensor localisations;

    /** @brief [B,H,W,K,C] raw logits. */
    Tensor logits;
};

/**
 * @brief Re-lays a channels-first tensor [B,C,H,W] out as channels-last [B,H,W,C].
 *
 * @retval Status::Invalid if the tensor is not rank 4 with known dims.
 */
Result<Tensor> channels_to_last(const Tensor& nchw) noexcept;

/**
 * @brief Reshapes channels-last conv outputs into anchor-indexed predictions.
 *
 * @param loc_conv [B,H,W,K*4].
 * @param cls_conv [B,H,W,K*num_classes].
 * @param layer Layer whose anchor count gives K.
 * @param num_classes Classes including background.
 *
 * @retval Status::Invalid on rank/shape mismatch or a channel count that is not K*4 / K*C.
 */
Result<LayerPrediction> reshape_predictions(const Tensor& loc_conv, const Tensor& cls_conv, const LayerConfig& layer,
                                            int num_classes) noexcept;

/**
 * @brief L2-normalises every spatial position over channels and multiplies by a per-channel scale.
 *
 * @param feature [B,H,W,C].
 * @param scale C learned scales (or a single value broadcast to every channel).
 */
Result<Tensor> l2_normalize(const Tensor& feature, const std::vector<float>& scale) noexcept;

/** @brief Softmax over the last axis of @p logits (class probabilities). */
Result<Tensor> softmax_predictions(const Tensor& logits) noexcept;

/**
 * @brief Weights of one layer's head in HWIO layout.
 */
struct HeadWeights {
    /** @brief [3,3,Cin,K*4]. */
    Tensor loc_kernel;
    std::vector<float> loc_bias;

    /** @brief [3,3,Cin,K*C]. */
    Tensor cls_kernel;
    std::vector<float> cls_bias;

    /** @brief Per-channel L2 scale, [Cin]; only read when the layer is normalised. Empty = initial value. */
    std::vector<float> norm_scale;
};

/**
 * @brief 3x3 convolution, stride 1, SAME zero padding, channels-last.
 *
 * @param x [B,H,W,Cin].
 * @param kernel [3,3,Cin,Cout].
 * @param bias Cout values, or empty for no bias.
 */
Result<Tensor> conv3x3_same(const Tensor& x, const Tensor& kernel, const std::vector<float>& bias) noexcept;

/**
 * @brief Reference multibox head of a single layer.
 */
class MultiboxHead final {
  public:
    MultiboxHead(LayerConfig layer, int num_classes);

    int num_anchors() const noexcept {
        return head::num_anchors(layer_);
    }

    const LayerConfig& layer() const noexcept {
        return layer_;
    }

    /**
     * @brief Optional L2 normalisation, both convolutions, reshape.
     *
     * @param feature [B,H,W,Cin].
     * @param w Weights for this layer.
     */
    Result<LayerPrediction> predict(const Tensor& feature, const HeadWeights& w) const noexcept;

  private:
    LayerConfig layer_;
    int num_classes_ = 0;
};

} // namespace ssdet::head
