/**
 * @file multibox_head.cpp
 * @ingroup ssdet_head
 * @brief Multibox head reshape, normalisation, softmax and the reference convolution path.
 */

#include "head/multibox_head.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <new>
#include <string>
#include <utility>

namespace ssdet::head {

namespace {

/// tf.nn.l2_normalize epsilon on the squared sum.
constexpr float kL2Eps = 1e-12f;

std::string shape_str_(const std::vector<int64_t>& s) {
    std::string out = "[";
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i) out += ",";
        out += std::to_string(s[i]);
    }
    return out + "]";
}

bool known_rank4_(const Tensor& t) noexcept {
    return t.rank() == 4 && t.query().fully_known() && t.data.size() == t.numel();
}

} // namespace

int num_anchors(const LayerConfig& layer) noexcept {
    return layer.num_anchors();
}

Result<Tensor> channels_to_last(const Tensor& nchw) noexcept {
    using R = Result<Tensor>;
    if (!known_rank4_(nchw)) return R::Err(Status::Invalid("channels_to_last: expected known [B,C,H,W], got " + shape_str_(nchw.shape)));

    try {
        const int64_t B = nchw.shape[0], C = nchw.shape[1], H = nchw.shape[2], W = nchw.shape[3];
        Tensor out = Tensor::zeros({B, H, W, C});
        const std::size_t plane = (std::size_t)H * (std::size_t)W;
        for (int64_t b = 0; b < B; ++b) {
            const float* src = nchw.ptr() + (std::size_t)b * (std::size_t)C * plane;
            float* dst = out.ptr() + (std::size_t)b * plane * (std::size_t)C;
            for (int64_t c = 0; c < C; ++c) {
                const float* sc = src + (std::size_t)c * plane;
                for (std::size_t p = 0; p < plane; ++p)
                    dst[p * (std::size_t)C + (std::size_t)c] = sc[p];
            }
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("channels_to_last: bad_alloc"));
    }
}

Result<LayerPrediction> reshape_predictions(const Tensor& loc_conv, const Tensor& cls_conv, const LayerConfig& layer,
                                            int num_classes) noexcept {
    using R = Result<LayerPrediction>;

    const int K = num_anchors(layer);
    if (K <= 0) return R::Err(Status::Invalid("reshape_predictions: layer '" + layer.name + "' has no anchors"));
    if (num_classes < 2) return R::Err(Status::Invalid("reshape_predictions: num_classes must be >= 2"));
    if (!known_rank4_(loc_conv) || !known_rank4_(cls_conv)) {
        return R::Err(Status::Invalid("reshape_predictions: expected known [B,H,W,C] conv outputs, got loc " +
                                      shape_str_(loc_conv.shape) + " cls " + shape_str_(cls_conv.shape)));
    }
    for (int d = 0; d < 3; ++d) {
        if (loc_conv.shape[(std::size_t)d] != cls_conv.shape[(std::size_t)d]) {
            return R::Err(Status::Invalid("reshape_predictions: loc/cls disagree on [B,H,W]: " +
                                          shape_str_(loc_conv.shape) + " vs " + shape_str_(cls_conv.shape)));
        }
    }
    if (loc_conv.last_dim() != (int64_t)K * 4) {
        return R::Err(Status::Invalid("reshape_predictions: layer '" + layer.name + "' loc conv has " +
                                      std::to_string(loc_conv.last_dim()) + " channels, expected K*4 = " +
                                      std::to_string(K * 4)));
    }
    if (cls_conv.last_dim() != (int64_t)K * num_classes) {
        return R::Err(Status::Invalid("reshape_predictions: layer '" + layer.name + "' cls conv has " +
                                      std::to_string(cls_conv.last_dim()) + " channels, expected K*C = " +
                                      std::to_string(K * num_classes)));
    }

    try {
        LayerPrediction p;
        const auto& s = loc_conv.shape;
        p.localisations = Tensor({s[0], s[1], s[2], (int64_t)K, 4}, loc_conv.data);
        p.logits = Tensor({s[0], s[1], s[2], (int64_t)K, (int64_t)num_classes}, cls_conv.data);
        return R::Ok(std::move(p));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("reshape_predictions: bad_alloc"));
    }
}

Result<Tensor> l2_normalize(const Tensor& feature, const std::vector<float>& scale) noexcept {
    using R = Result<Tensor>;
    if (!known_rank4_(feature)) return R::Err(Status::Invalid("l2_normalize: expected known [B,H,W,C], got " + shape_str_(feature.shape)));

    const std::size_t C = (std::size_t)feature.last_dim();
    if (scale.size() != C && scale.size() != 1) {
        return R::Err(Status::Invalid("l2_normalize: scale has " + std::to_string(scale.size()) + " values, expected 1 or " +
                                      std::to_string(C)));
    }

    try {
        Tensor out = feature;
        const std::size_t positions = C ? feature.numel() / C : 0;
        float* d = out.ptr();
        const bool broadcast = scale.size() == 1;

#pragma omp parallel for schedule(static) if (positions > 4096)
        for (long long p = 0; p < (long long)positions; ++p) {
            float* v = d + (std::size_t)p * C;
            float ss = 0.f;
            for (std::size_t c = 0; c < C; ++c)
                ss += v[c] * v[c];
            const float inv = 1.f / std::sqrt(std::max(ss, kL2Eps));
            for (std::size_t c = 0; c < C; ++c)
                v[c] = v[c] * inv * (broadcast ? scale[0] : scale[c]);
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("l2_normalize: bad_alloc"));
    }
}

Result<Tensor> softmax_predictions(const Tensor& logits) noexcept {
    using R = Result<Tensor>;
    if (logits.rank() == 0 || !logits.query().fully_known() || logits.data.size() != logits.numel())
        return R::Err(Status::Invalid("softmax_predictions: logits must have a known shape, got " + shape_str_(logits.shape)));
    if (logits.last_dim() <= 0) return R::Err(Status::Invalid("softmax_predictions: empty class axis"));

    try {
        Tensor out = logits;
        const std::size_t C = (std::size_t)logits.last_dim();
        const std::size_t rows = logits.numel() / C;
        float* d = out.ptr();

#pragma omp parallel for schedule(static) if (rows > 4096)
        for (long long r = 0; r < (long long)rows; ++r) {
            float* v = d + (std::size_t)r * C;
            const float m = *std::max_element(v, v + C);
            float sum = 0.f;
            for (std::size_t c = 0; c < C; ++c) {
                v[c] = std::exp(v[c] - m);
                sum += v[c];
            }
            for (std::size_t c = 0; c < C; ++c)
                v[c] /= sum;
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("softmax_predictions: bad_alloc"));
    }
}

Result<Tensor> conv3x3_same(const Tensor& x, const Tensor& kernel, const std::vector<float>& bias) noexcept {
    using R = Result<Tensor>;
    if (!known_rank4_(x)) return R::Err(Status::Invalid("conv3x3_same: expected known [B,H,W,Cin], got " + shape_str_(x.shape)));
    if (!known_rank4_(kernel) || kernel.shape[0] != 3 || kernel.shape[1] != 3 || kernel.shape[2] != x.shape[3]) {
        return R::Err(Status::Invalid("conv3x3_same: kernel must be [3,3," + std::to_string(x.shape[3]) + ",Cout], got " +
                                      shape_str_(kernel.shape)));
    }
    const int64_t B = x.shape[0], H = x.shape[1], W = x.shape[2], Ci = x.shape[3], Co = kernel.shape[3];
    if (!bias.empty() && (int64_t)bias.size() != Co)
        return R::Err(Status::Invalid("conv3x3_same: bias has " + std::to_string(bias.size()) + " values, expected " + std::to_string(Co)));

    try {
        Tensor y = Tensor::zeros({B, H, W, Co});
        const float* xs = x.ptr();
        const float* ks = kernel.ptr();
        float* ys = y.ptr();
        const long long rows = (long long)(B * H);

#pragma omp parallel for schedule(static) if (rows > 64)
        for (long long r = 0; r < rows; ++r) {
            const int64_t b = r / H;
            const int64_t i = r % H;
            for (int64_t j = 0; j < W; ++j) {
                float* out = ys + (((std::size_t)b * H + i) * W + j) * (std::size_t)Co;
                for (int64_t o = 0; o < Co; ++o)
                    out[o] = bias.empty() ? 0.f : bias[(std::size_t)o];

                for (int64_t dy = 0; dy < 3; ++dy) {
                    const int64_t yi = i + dy - 1;
                    if (yi < 0 || yi >= H) continue;
                    for (int64_t dx = 0; dx < 3; ++dx) {
                        const int64_t xj = j + dx - 1;
                        if (xj < 0 || xj >= W) continue;
                        const float* in = xs + (((std::size_t)b * H + yi) * W + xj) * (std::size_t)Ci;
                        const float* kk = ks + ((std::size_t)dy * 3 + dx) * (std::size_t)Ci * (std::size_t)Co;
                        for (int64_t c = 0; c < Ci; ++c) {
                            const float v = in[c];
                            if (v == 0.f) continue;
                            const float* kc = kk + (std::size_t)c * (std::size_t)Co;
                            for (int64_t o = 0; o < Co; ++o)
                                out[o] += v * kc[o];
                        }
                    }
                }
            }
        }
        return R::Ok(std::move(y));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("conv3x3_same: bad_alloc"));
    }
}

MultiboxHead::MultiboxHead(LayerConfig layer, int num_classes) : layer_(std::move(layer)), num_classes_(num_classes) {}

Result<LayerPrediction> MultiboxHead::predict(const Tensor& feature, const HeadWeights& w) const noexcept {
    using R = Result<LayerPrediction>;

    try {
        const Tensor* in = &feature;
        Tensor normed;
        if (layer_.normalized()) {
            const std::vector<float> initial{layer_.normalization};
            auto nr = l2_normalize(feature, w.norm_scale.empty() ? initial : w.norm_scale);
            if (!nr.ok()) return R::Err(nr.status());
            normed = std::move(nr).value();
            in = &normed;
        }

        auto loc = conv3x3_same(*in, w.loc_kernel, w.loc_bias);
        if (!loc.ok()) return R::Err(Status{loc.status().code, "layer '" + layer_.name + "' loc: " + loc.status().message});
        auto cls = conv3x3_same(*in, w.cls_kernel, w.cls_bias);
        if (!cls.ok()) return R::Err(Status{cls.status().code, "layer '" + layer_.name + "' cls: " + cls.status().message});

        return reshape_predictions(loc.value(), cls.value(), layer_, num_classes_);
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("MultiboxHead::predict: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("MultiboxHead::predict: ") + e.what()));
    }
}

} // namespace ssdet::head
