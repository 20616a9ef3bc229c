/**
 * @file ssd_engine.cpp
 * @ingroup ssdet_engine
 * @brief ORT session setup, output mapping and forward pass for SSD graphs.
 */

#include "engine/ssd_engine.h"

#include "head/multibox_head.h"
#include "internal/chw_preprocess.h"

#include <exception>
#include <iostream>
#include <new>
#include <string>
#include <utility>

namespace ssdet::engine {

SsdEngine::SsdEngine(const NetConfig& cfg) : cfg_(cfg), env_(global_env_()) {}

Result<std::unique_ptr<SsdEngine>> SsdEngine::create(const NetConfig& cfg) noexcept {
    using R = Result<std::unique_ptr<SsdEngine>>;

    const Status vs = cfg.validate();
    if (!vs.ok()) return R::Err(vs);
    if (cfg.model_path.empty()) return R::Err(Status::NotFound("SsdEngine: model_path is empty"));

    try {
        std::unique_ptr<SsdEngine> e(new SsdEngine(cfg));

        const Status cs = e->create_session_();
        if (!cs.ok()) return R::Err(cs);
        e->init_io_names_();
        const Status rs = e->resolve_outputs_();
        if (!rs.ok()) return R::Err(rs);

        return R::Ok(std::move(e));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("SsdEngine::create: bad_alloc"));
    } catch (const Ort::Exception& e) {
        return R::Err(Status::Internal(std::string("SsdEngine::create: ORT exception: ") + e.what()));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("SsdEngine::create: ") + e.what()));
    }
}

Status SsdEngine::create_session_() noexcept {
    try {
        so_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        so_.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        so_.EnableCpuMemArena();
        so_.EnableMemPattern();
        so_.SetLogSeverityLevel(3);

        if (cfg_.runtime.ort_intra_threads > 0) so_.SetIntraOpNumThreads(cfg_.runtime.ort_intra_threads);
        if (cfg_.runtime.ort_inter_threads > 0) so_.SetInterOpNumThreads(cfg_.runtime.ort_inter_threads);

        session_ = Ort::Session(env_, cfg_.model_path.c_str(), so_);
        return Status::Ok();
    } catch (const std::bad_alloc&) {
        return Status::OutOfMemory("create_session: bad_alloc");
    } catch (const Ort::Exception& e) {
        return Status::Invalid(std::string("create_session: ORT exception: ") + e.what());
    } catch (const std::exception& e) {
        return Status::Invalid(std::string("create_session: ") + e.what());
    }
}

void SsdEngine::init_io_names_() {
    Ort::AllocatedStringPtr in0 = session_.GetInputNameAllocated(0, alloc_);
    in_name_ = in0 ? in0.get() : std::string("input");

    const std::size_t nout = session_.GetOutputCount();
    out_names_.clear();
    out_names_.reserve(nout);
    for (std::size_t i = 0; i < nout; ++i) {
        Ort::AllocatedStringPtr on = session_.GetOutputNameAllocated(i, alloc_);
        out_names_.push_back(on ? on.get() : ("out_" + std::to_string(i)));
    }
}

Status SsdEngine::resolve_outputs_() noexcept {
    auto r = map_outputs(out_names_, cfg_.feat_layers);
    if (!r.ok()) return r.status();
    map_ = std::move(r).value();

    if (cfg_.verbose) {
        try {
            std::cout << "[SsdEngine] input '" << in_name_ << "', " << out_names_.size() << " outputs"
                      << (map_.by_name ? " (matched by name)" : " (positional fallback)") << "\n";
            for (std::size_t l = 0; l < cfg_.num_layers(); ++l) {
                std::cout << "  " << cfg_.feat_layers[l] << ": cls='" << out_names_[(std::size_t)map_.cls[l]]
                          << "' loc='" << out_names_[(std::size_t)map_.loc[l]] << "'\n";
            }
            for (int i : map_.extra)
                std::cout << "  feature map: '" << out_names_[(std::size_t)i] << "'\n";
        } catch (const std::exception& e) {
            return Status::Internal(std::string("resolve_outputs: ") + e.what());
        }
    }
    return Status::Ok();
}

Result<Tensor> SsdEngine::to_channels_last_(Ort::Value& v, int64_t expected_channels) const noexcept {
    using R = Result<Tensor>;
    try {
        const auto info = v.GetTensorTypeAndShapeInfo();
        std::vector<int64_t> shape = info.GetShape();
        const std::size_t n = info.GetElementCount();
        const float* src = v.GetTensorData<float>();

        Tensor t(shape, std::vector<float>(src, src + n));
        if (shape.size() != 4) return R::Ok(std::move(t));

        if (!is_channels_first(shape, expected_channels)) return R::Ok(std::move(t));
        return head::channels_to_last(t);
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("to_channels_last: bad_alloc"));
    } catch (const Ort::Exception& e) {
        return R::Err(Status::Internal(std::string("to_channels_last: ORT exception: ") + e.what()));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("to_channels_last: ") + e.what()));
    }
}

Result<ForwardOutput> SsdEngine::forward(const std::vector<cv::Mat>& bgr) noexcept {
    using R = Result<ForwardOutput>;
    if (bgr.empty()) return R::Err(Status::Invalid("SsdEngine::forward: empty batch"));

    try {
        const int H = (int)cfg_.img_shape.h;
        const int W = (int)cfg_.img_shape.w;
        const std::size_t plane = (std::size_t)3 * (std::size_t)H * (std::size_t)W;

        Tensor in = Tensor::zeros({(int64_t)bgr.size(), 3, H, W});
        for (std::size_t b = 0; b < bgr.size(); ++b) {
            if (bgr[b].empty() || bgr[b].type() != CV_8UC3)
                return R::Err(Status::DecodeError("SsdEngine::forward: image " + std::to_string(b) + " is not CV_8UC3 BGR"));
            internal::bgr_u8_to_rgb_chw_f32_resize(bgr[b], W, H, in.ptr() + b * plane);
        }
        return forward_tensor(in);
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("SsdEngine::forward: bad_alloc"));
    } catch (const cv::Exception& e) {
        return R::Err(Status::DecodeError(std::string("SsdEngine::forward: OpenCV: ") + e.what()));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("SsdEngine::forward: ") + e.what()));
    }
}

Result<ForwardOutput> SsdEngine::forward_tensor(const Tensor& nchw) noexcept {
    using R = Result<ForwardOutput>;
    if (nchw.rank() != 4 || nchw.shape[1] != 3 || !nchw.query().fully_known() || nchw.data.size() != nchw.numel())
        return R::Err(Status::Invalid("SsdEngine::forward_tensor: expected a dense [B,3,H,W] input"));

    try {
        static Ort::MemoryInfo cpu_mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        Ort::Value in_tensor = Ort::Value::CreateTensor<float>(cpu_mem, const_cast<float*>(nchw.ptr()), nchw.data.size(),
                                                               nchw.shape.data(), nchw.shape.size());

        std::vector<const char*> out_names_c;
        out_names_c.reserve(out_names_.size());
        for (auto& s : out_names_)
            out_names_c.push_back(s.c_str());
        const char* in_names[] = {in_name_.c_str()};

        auto outs =
            session_.Run(Ort::RunOptions{nullptr}, in_names, &in_tensor, 1, out_names_c.data(), out_names_c.size());
        if (outs.size() != out_names_.size()) return R::Err(Status::Internal("SsdEngine: output count mismatch"));

        ForwardOutput fo;
        const std::size_t L = cfg_.num_layers();
        fo.localisations.reserve(L);
        fo.logits.reserve(L);
        fo.predictions.reserve(L);

        for (std::size_t l = 0; l < L; ++l) {
            const LayerConfig layer = cfg_.layer(l);
            const int64_t K = layer.num_anchors();

            auto loc = to_channels_last_(outs[(std::size_t)map_.loc[l]], K * 4);
            if (!loc.ok()) return R::Err(loc.status());
            auto cls = to_channels_last_(outs[(std::size_t)map_.cls[l]], K * cfg_.num_classes);
            if (!cls.ok()) return R::Err(cls.status());

            auto pr = head::reshape_predictions(loc.value(), cls.value(), layer, cfg_.num_classes);
            if (!pr.ok()) return R::Err(pr.status());
            auto lp = std::move(pr).value();

            auto sm = head::softmax_predictions(lp.logits);
            if (!sm.ok()) return R::Err(sm.status());

            fo.predictions.push_back(std::move(sm).value());
            fo.localisations.push_back(std::move(lp.localisations));
            fo.logits.push_back(std::move(lp.logits));
        }

        for (int i : map_.extra) {
            auto fm = to_channels_last_(outs[(std::size_t)i], -1);
            if (!fm.ok()) return R::Err(fm.status());
            fo.feature_maps.emplace(out_names_[(std::size_t)i], std::move(fm).value());
        }

        return R::Ok(std::move(fo));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("SsdEngine::forward_tensor: bad_alloc"));
    } catch (const Ort::Exception& e) {
        return R::Err(Status::Internal(std::string("SsdEngine::forward_tensor: ORT exception: ") + e.what()));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("SsdEngine::forward_tensor: ") + e.what()));
    }
}

} // namespace ssdet::engine
