/**
 * @file ssdet.cpp
 * @brief Public facade: @ref ssdet::SsdNet and the free entry points.
 *
 * @details
 * The facade validates inputs against the configuration, then forwards to the internal modules:
 * - anchors           -> anchor/anchor_generator
 * - describe_anchors  -> internal/printer
 * - refine_feat_shapes -> anchor/feat_shapes
 * - encode / decode   -> algo/box_coder
 * - detected_boxes    -> pipeline/detection_pipeline with pipeline::DefaultBoxOps
 * - losses            -> loss/ssd_losses
 * - forward           -> engine/ssd_engine
 */

#include "ssdet.h"

#include "anchor/anchor_generator.h"
#include "anchor/feat_shapes.h"
#include "algo/box_coder.h"
#include "engine/ssd_engine.h"
#include "internal/cv_bgr.h"
#include "internal/printer.h"
#include "loss/ssd_losses.h"
#include "pipeline/box_ops.h"
#include "pipeline/detection_pipeline.h"
#include "platform/omp_config.h"

#include <exception>
#include <iostream>
#include <new>
#include <ostream>
#include <string>
#include <utility>

namespace ssdet {

namespace detail {

class SsdNetImpl final {
  public:
    explicit SsdNetImpl(NetConfig cfg) : cfg_(std::move(cfg)) {}

    Status init() noexcept {
        Status st = Status::Ok();
        SSDET_STATUS_TRY(st, cfg_.validate());
        SSDET_STATUS_TRY(st, print_config_());
        SSDET_STATUS_TRY(st, attach_engine_());
        return st;
    }

    const NetConfig& config() const noexcept {
        return cfg_;
    }

    bool has_model() const noexcept {
        return engine_ != nullptr;
    }

    Result<ForwardOutput> forward(const std::vector<ImageView>& images) noexcept {
        using R = Result<ForwardOutput>;
        if (!engine_) return R::Err(Status::Unsupported("SsdNet::forward: no model attached (model_path is empty)"));

        try {
            std::vector<cv::Mat> mats;
            mats.reserve(images.size());
            for (std::size_t i = 0; i < images.size(); ++i) {
                auto m = internal::to_bgr_mat(images[i]);
                if (!m.ok()) return R::Err(Status{m.status().code, "image " + std::to_string(i) + ": " + m.status().message});
                mats.push_back(std::move(m).value());
            }
            return engine_->forward(mats);
        } catch (const std::bad_alloc&) {
            return R::Err(Status::OutOfMemory("SsdNet::forward: bad_alloc"));
        }
    }

    Result<ForwardOutput> forward(const Tensor& nchw) noexcept {
        if (!engine_) {
            return Result<ForwardOutput>::Err(
                Status::Unsupported("SsdNet::forward: no model attached (model_path is empty)"));
        }
        return engine_->forward_tensor(nchw);
    }

  private:
    Status print_config_() const noexcept {
        if (!cfg_.verbose) return Status::Ok();
        try {
            describe(cfg_, std::cout);
            std::cout << "[SsdNet] OpenMP threads = " << platform::omp_max_threads() << "\n";
            return Status::Ok();
        } catch (const std::exception& e) {
            return Status::Internal(std::string("SsdNet: describe failed: ") + e.what());
        }
    }

    /// No-op without a model path.
    Status attach_engine_() noexcept {
        if (cfg_.model_path.empty()) return Status::Ok();
        auto r = engine::SsdEngine::create(cfg_);
        if (!r.ok()) return r.status();
        engine_ = std::move(r).value();
        return Status::Ok();
    }

    NetConfig cfg_;
    std::unique_ptr<engine::SsdEngine> engine_;
};

} // namespace detail

SsdNet::SsdNet() noexcept = default;
SsdNet::~SsdNet() noexcept = default;
SsdNet::SsdNet(SsdNet&& other) noexcept = default;
SsdNet& SsdNet::operator=(SsdNet&& other) noexcept = default;

SsdNet::SsdNet(const NetConfig& config) {
    auto r = SsdNet::create(config);
    if (!r.ok()) throw std::runtime_error(r.status().message);
    *this = std::move(r.value());
}

SsdNet::SsdNet(std::unique_ptr<detail::SsdNetImpl> impl) noexcept : impl_(std::move(impl)) {}

SsdNet::operator bool() const noexcept {
    return impl_ != nullptr;
}

bool SsdNet::has_model() const noexcept {
    return impl_ && impl_->has_model();
}

const NetConfig& SsdNet::config() const noexcept {
    return impl_->config();
}

Result<SsdNet> SsdNet::create(const NetConfig& cfg) noexcept {
    using R = Result<SsdNet>;

    try {
        auto impl = std::make_unique<detail::SsdNetImpl>(cfg);
        const Status st = impl->init();
        if (!st.ok()) return R::Err(st);
        return R::Ok(SsdNet(std::move(impl)));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("SsdNet::create: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("SsdNet::create: ") + e.what()));
    }
}

Result<ForwardOutput> SsdNet::forward(const std::vector<ImageView>& images) noexcept {
    if (!impl_) return Result<ForwardOutput>::Err(Status::Invalid("SsdNet::forward: invalid instance"));
    if (images.empty()) return Result<ForwardOutput>::Err(Status::Invalid("SsdNet::forward: empty batch"));
    return impl_->forward(images);
}

Result<ForwardOutput> SsdNet::forward(const Tensor& nchw) noexcept {
    if (!impl_) return Result<ForwardOutput>::Err(Status::Invalid("SsdNet::forward: invalid instance"));
    return impl_->forward(nchw);
}

Result<AnchorSet> anchors(const ImageShape& img_shape, const NetConfig& cfg) noexcept {
    auto r = anchor::generate_all_layers(img_shape, cfg);
    if (r.ok() && cfg.verbose) {
        try {
            describe_anchors(r.value(), cfg, std::cout);
        } catch (const std::exception& e) {
            return Result<AnchorSet>::Err(Status::Internal(std::string("anchors: describe failed: ") + e.what()));
        }
    }
    return r;
}

void describe_anchors(const AnchorSet& anchor_set, const NetConfig& cfg, std::ostream& os, bool color) {
    internal::Printer p{os};
    p.a.enable = color;

    p.section("Anchors");
    std::size_t total = 0;
    for (std::size_t l = 0; l < anchor_set.size(); ++l) {
        const LayerAnchors& a = anchor_set[l];
        p.section(l < cfg.feat_layers.size() ? cfg.feat_layers[l] : "layer " + std::to_string(l), 2);
        p.kv("grid", std::to_string(a.H) + "x" + std::to_string(a.W), 4);
        p.kv("anchors/cell", a.num_per_cell(), 4);
        p.kv("total", a.size(), 4);
        p.header({"k", "h", "w", "h_px", "w_px"}, 4, 8);
        for (int k = 0; k < a.num_per_cell(); ++k) {
            const float h = a.h[(std::size_t)k];
            const float w = a.w[(std::size_t)k];
            p.row(4, 4, k, h, w, h * (float)cfg.img_shape.h, w * (float)cfg.img_shape.w);
        }
        total += a.size();
    }
    p.kv("all layers", total, 2);
}

Result<NetConfig> refine_feat_shapes(const ForwardOutput& out, const NetConfig& cfg) noexcept {
    using R = Result<NetConfig>;
    try {
        auto r = anchor::update_shapes_from_predictions(out.predictions, cfg.feat_shapes);
        if (!r.ok()) return R::Err(r.status());
        return R::Ok(cfg.with_feat_shapes(std::move(r).value()));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("refine_feat_shapes: bad_alloc"));
    }
}

Result<std::vector<LayerTargets>> encode(const std::vector<GroundTruth>& batch, const AnchorSet& anchor_set,
                                         const NetConfig& cfg) noexcept {
    using R = Result<std::vector<LayerTargets>>;
    if (anchor_set.size() != cfg.num_layers()) {
        return R::Err(Status::Invalid("encode: " + std::to_string(anchor_set.size()) + " anchor layers, config has " +
                                      std::to_string(cfg.num_layers())));
    }

    try {
        std::vector<LayerTargets> out;
        out.reserve(anchor_set.size());
        for (std::size_t l = 0; l < anchor_set.size(); ++l) {
            auto r = algo::encode_layer(batch, anchor_set[l], cfg.num_classes, cfg.no_annotation_label,
                                        cfg.prior_scaling);
            if (!r.ok()) return R::Err(Status{r.status().code, "layer '" + cfg.feat_layers[l] + "': " + r.status().message});
            out.push_back(std::move(r).value());
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("encode: bad_alloc"));
    }
}

Result<std::vector<Tensor>> decode(const std::vector<Tensor>& localisations, const AnchorSet& anchor_set,
                                   const NetConfig& cfg) noexcept {
    using R = Result<std::vector<Tensor>>;
    try {
        const pipeline::DefaultBoxOps ops{};
        return ops.decode(localisations, anchor_set, cfg.prior_scaling);
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("decode: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("decode: ") + e.what()));
    }
}

Result<std::vector<ImageDetections>> detected_boxes(const std::vector<Tensor>& predictions,
                                                    const std::vector<Tensor>& localisations,
                                                    const AnchorSet& anchor_set, const NetConfig& cfg,
                                                    const DetectionParams& params) noexcept {
    const pipeline::DefaultBoxOps ops{};
    const pipeline::DetectionPipeline pipe(ops);
    return pipe.run(predictions, localisations, anchor_set, cfg.prior_scaling, params);
}

Result<LossTerms> losses(const std::vector<Tensor>& logits, const std::vector<Tensor>& localisations,
                         const std::vector<IntTensor>& gclasses, const std::vector<Tensor>& glocalisations,
                         const std::vector<Tensor>& gscores, const LossParams& params) noexcept {
    return loss::compute_losses(logits, localisations, gclasses, glocalisations, gscores, params);
}

Status setup_runtime_policy(const RuntimePolicy& policy, bool verbose) noexcept {
    return platform::apply_runtime_policy(policy, verbose);
}

} // namespace ssdet
