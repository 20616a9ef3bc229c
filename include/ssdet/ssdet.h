/**
 * @file ssdet.h
 * @brief Public API for ssdet: anchors, forward pass, target encoding, decoding, detection and loss.
 *
 * This header is the primary public interface of ssdet. It defines:
 * - the network facade @ref ssdet::SsdNet (owns the ONNX Runtime session used by @c forward),
 * - free functions over an immutable @ref ssdet::NetConfig:
 *   @ref ssdet::anchors, @ref ssdet::encode, @ref ssdet::decode, @ref ssdet::detected_boxes,
 *   @ref ssdet::losses and @ref ssdet::refine_feat_shapes,
 * - @ref ssdet::setup_runtime_policy for process-wide threading knobs.
 *
 * Ordering contract:
 * every per-layer list produced or consumed here (anchors, predictions, localisations, logits,
 * targets) is index-aligned with @ref ssdet::NetConfig::feat_layers.
 *
 * Error handling:
 * - all entry points are @c noexcept and return @ref ssdet::Status or @ref ssdet::Result<T>,
 * - configuration errors are @ref ssdet::Status::Code::InvalidArgument.
 *
 * @ingroup ssdet_api
 */

/**
 * @defgroup ssdet_api ssdet Public API
 * @brief Public API types and entry points for ssdet.
 * @{
 */

#pragma once

#include "config.h"
#include "export.h"
#include "image.h"
#include "status.h"
#include "tensor.h"
#include "types.h"

#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ssdet {

namespace detail {
class SsdNetImpl;
} // namespace detail

/**
 * @brief Network facade: configuration snapshot plus the optional inference session.
 *
 * Creation:
 * - @ref create validates the configuration; when @c model_path is set it also opens the
 *   ONNX model and resolves its outputs.
 * - Without a model the instance is still valid; only @ref forward is unavailable.
 *
 * Copying is disabled; move is supported.
 *
 * @thread_safety Concurrent @ref forward calls on one instance are not supported.
 */
class SSDET_API SsdNet final {
  public:
    /** @brief Constructs an empty (invalid) instance. */
    SsdNet() noexcept;
    ~SsdNet() noexcept;

    SsdNet(SsdNet&& other) noexcept;
    SsdNet& operator=(SsdNet&& other) noexcept;

    SsdNet(const SsdNet&) = delete;
    SsdNet& operator=(const SsdNet&) = delete;

    /**
     * @brief Throwing convenience constructor around @ref create.
     *
     * @throws std::runtime_error with the status message on failure.
     */
    explicit SsdNet(const NetConfig& config);

    static Result<SsdNet> create(const NetConfig& config) noexcept;

    explicit operator bool() const noexcept;

    /** @brief True if an ONNX session is attached. */
    bool has_model() const noexcept;

    /** @brief Configuration snapshot. @pre the instance is valid. */
    const NetConfig& config() const noexcept;

    /**
     * @brief Runs the network on a batch of images.
     *
     * Images are resized to @c config().img_shape and mean-subtracted in RGB order.
     *
     * @retval Status::Unsupported if no model is attached.
     * @retval Status::DecodeError on an invalid image view.
     */
    Result<ForwardOutput> forward(const std::vector<ImageView>& images) noexcept;

    /** @brief Runs the network on a preprocessed [B,3,H,W] tensor. */
    Result<ForwardOutput> forward(const Tensor& nchw) noexcept;

  private:
    explicit SsdNet(std::unique_ptr<detail::SsdNetImpl> impl) noexcept;

    std::unique_ptr<detail::SsdNetImpl> impl_;
};

/**
 * @brief Anchors of every configured layer at @p img_shape.
 */
[[nodiscard]] SSDET_API Result<AnchorSet> anchors(const ImageShape& img_shape, const NetConfig& cfg) noexcept;

/**
 * @brief Writes one table per layer: grid, anchors per cell, then relative and pixel (h, w) per anchor.
 *
 * @param anchor_set Anchors from @ref anchors, same layer order as @p cfg.
 * @param cfg Configuration providing the layer names.
 * @param os Output stream.
 * @param color Use ANSI colors.
 */
SSDET_API void describe_anchors(const AnchorSet& anchor_set, const NetConfig& cfg, std::ostream& os,
                                bool color = false);

/**
 * @brief New configuration whose @c feat_shapes come from the forward output where known.
 *
 * Each layer independently takes (H, W, K) from its prediction tensor when those dimensions
 * are known, and keeps the configured shape otherwise.
 */
[[nodiscard]] SSDET_API Result<NetConfig> refine_feat_shapes(const ForwardOutput& out, const NetConfig& cfg) noexcept;

/**
 * @brief Encodes ground truth against every layer of @p anchor_set.
 *
 * Boxes labelled @c cfg.no_annotation_label (or any label >= num_classes) are never matched.
 */
[[nodiscard]] SSDET_API Result<std::vector<LayerTargets>> encode(const std::vector<GroundTruth>& batch,
                                                                 const AnchorSet& anchor_set,
                                                                 const NetConfig& cfg) noexcept;

/** @brief Decodes per-layer offsets into [ymin, xmin, ymax, xmax] boxes, same shapes. */
[[nodiscard]] SSDET_API Result<std::vector<Tensor>> decode(const std::vector<Tensor>& localisations,
                                                           const AnchorSet& anchor_set, const NetConfig& cfg) noexcept;

/**
 * @brief Final detections per image: decode, select, sort/top-k, NMS, clip.
 */
[[nodiscard]] SSDET_API Result<std::vector<ImageDetections>>
detected_boxes(const std::vector<Tensor>& predictions, const std::vector<Tensor>& localisations,
               const AnchorSet& anchor_set, const NetConfig& cfg, const DetectionParams& params = {}) noexcept;

/**
 * @brief Training loss with hard-negative mining (see @c loss/ssd_losses.h for the exact terms).
 */
[[nodiscard]] SSDET_API Result<LossTerms> losses(const std::vector<Tensor>& logits,
                                                 const std::vector<Tensor>& localisations,
                                                 const std::vector<IntTensor>& gclasses,
                                                 const std::vector<Tensor>& glocalisations,
                                                 const std::vector<Tensor>& gscores,
                                                 const LossParams& params = {}) noexcept;

/**
 * @brief Applies OpenMP / OpenCV threading settings.
 *
 * @warning Process-global.
 */
[[nodiscard]] SSDET_API Status setup_runtime_policy(const RuntimePolicy& policy, bool verbose = true) noexcept;

} // namespace ssdet

/** @} */
