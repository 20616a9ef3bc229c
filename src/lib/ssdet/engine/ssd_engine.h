/**
 * @file ssd_engine.h
 * @ingroup ssdet_engine
 * @brief ONNX Runtime engine running an exported SSD graph (backbone + multibox convolutions).
 *
 * @details
 * The engine owns the ORT session and turns its raw outputs into @ref ssdet::ForwardOutput:
 * - input: [B,3,H,W] float, RGB planes minus the VGG means (123, 117, 104),
 * - outputs: two convolution maps per configured layer (K*4 and K*C channels),
 *   channels-first or channels-last,
 * - result: per-layer localisations [B,H,W,K,4], logits [B,H,W,K,C] and softmax predictions.
 *
 * Outputs are assigned to layers by @ref ssdet::engine::map_outputs once after session creation;
 * outputs no layer consumes are exported as named feature maps.
 *
 * @note Internal header; not part of the installed API.
 */

#pragma once

#include "config.h"
#include "engine/output_map.h"
#include "internal/opencv_headers.h" // IWYU pragma: keep
#include "internal/ort_headers.h"    // IWYU pragma: keep
#include "status.h"
#include "types.h"

#include <memory>
#include <string>
#include <vector>

namespace ssdet::engine {

class SsdEngine final {
  public:
    ~SsdEngine() noexcept = default;

    SsdEngine(const SsdEngine&) = delete;
    SsdEngine& operator=(const SsdEngine&) = delete;

    /**
     * @brief Creates the session for @p cfg.model_path and resolves the output mapping.
     *
     * @retval Status::NotFound if the model path is empty.
     * @retval Status::Unsupported if the outputs cannot be mapped to the configured layers.
     */
    static Result<std::unique_ptr<SsdEngine>> create(const NetConfig& cfg) noexcept;

    const NetConfig& config() const noexcept {
        return cfg_;
    }

    /** @brief Runs a batch of BGR @c CV_8UC3 images; each is resized to the configured input shape. */
    Result<ForwardOutput> forward(const std::vector<cv::Mat>& bgr) noexcept;

    /** @brief Runs an already preprocessed [B,3,H,W] input. */
    Result<ForwardOutput> forward_tensor(const Tensor& nchw) noexcept;

  private:
    explicit SsdEngine(const NetConfig& cfg);

    static Ort::Env& global_env_() {
        static Ort::Env env(ORT_LOGGING_LEVEL_ERROR, "ssdet");
        return env;
    }

    Status create_session_() noexcept;
    void init_io_names_();
    Status resolve_outputs_() noexcept;

    /// Converts one ORT output into a dense channels-last [B,H,W,C] tensor.
    Result<Tensor> to_channels_last_(Ort::Value& v, int64_t expected_channels) const noexcept;

    NetConfig cfg_;

    Ort::Env& env_;
    Ort::SessionOptions so_;
    Ort::Session session_{nullptr};
    Ort::AllocatorWithDefaultOptions alloc_;

    std::string in_name_;
    std::vector<std::string> out_names_;

    OutputMap map_;
};

} // namespace ssdet::engine
