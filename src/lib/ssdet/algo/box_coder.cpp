/**
 * @file box_coder.cpp
 * @ingroup ssdet_algo
 * @brief Jaccard matching, offset encoding and decoding.
 */

#include "algo/box_coder.h"

#include "algo/bbox.h"

#include <cmath>
#include <exception>
#include <new>
#include <string>
#include <utility>

namespace ssdet::algo {

Result<LayerTargets> encode_layer(const std::vector<GroundTruth>& batch, const LayerAnchors& anchors, int num_classes,
                                  int ignore_label, const std::array<float, 4>& prior_scaling) noexcept {
    using R = Result<LayerTargets>;

    if (batch.empty()) return R::Err(Status::Invalid("encode_layer: empty batch"));
    if (num_classes < 2) return R::Err(Status::Invalid("encode_layer: num_classes must be >= 2"));
    if (anchors.H <= 0 || anchors.W <= 0 || anchors.h.empty() || anchors.w.size() != anchors.h.size())
        return R::Err(Status::Invalid("encode_layer: anchors are empty or inconsistent"));
    for (std::size_t b = 0; b < batch.size(); ++b) {
        if (batch[b].labels.size() != batch[b].boxes.size()) {
            return R::Err(Status::Invalid("encode_layer: image " + std::to_string(b) + " has " +
                                          std::to_string(batch[b].labels.size()) + " labels for " +
                                          std::to_string(batch[b].boxes.size()) + " boxes"));
        }
        for (int l : batch[b].labels)
            if (l < 0) return R::Err(Status::Invalid("encode_layer: negative label in image " + std::to_string(b)));
    }

    try {
        const int64_t B = (int64_t)batch.size();
        const int64_t H = anchors.H, W = anchors.W, K = anchors.num_per_cell();

        LayerTargets t;
        t.classes = IntTensor::zeros({B, H, W, K});
        t.scores = Tensor::zeros({B, H, W, K});
        t.localisations = Tensor::zeros({B, H, W, K, 4});

        const std::size_t per_image = (std::size_t)(H * W * K);

#pragma omp parallel for schedule(static) if (per_image * batch.size() > 4096)
        for (long long n = 0; n < (long long)(per_image * batch.size()); ++n) {
            const std::size_t b = (std::size_t)n / per_image;
            const std::size_t a = (std::size_t)n % per_image;
            const std::size_t k = a % (std::size_t)K;
            const std::size_t cell = a / (std::size_t)K;
            const int i = (int)(cell / (std::size_t)W);
            const int j = (int)(cell % (std::size_t)W);

            const BBox ref = anchors.box(i, j, (int)k);
            const GroundTruth& gt = batch[b];

            int label = 0;
            float score = 0.f;
            BBox match{0.f, 0.f, 1.f, 1.f};
            for (std::size_t g = 0; g < gt.boxes.size(); ++g) {
                if (gt.labels[g] >= num_classes || gt.labels[g] == ignore_label) continue;
                const float jac = iou(ref, gt.boxes[g]);
                if (jac > score && jac > -0.5f) {
                    label = gt.labels[g];
                    score = jac;
                    match = gt.boxes[g];
                }
            }

            const float yref = anchors.cy[cell];
            const float xref = anchors.cx[cell];
            const float href = anchors.h[k];
            const float wref = anchors.w[k];

            const float cy = 0.5f * (match.ymin + match.ymax);
            const float cx = 0.5f * (match.xmin + match.xmax);
            const float h = match.height();
            const float w = match.width();

            const std::size_t idx = b * per_image + a;
            t.classes.data[idx] = label;
            t.scores.data[idx] = score;
            float* loc = t.localisations.ptr() + idx * 4;
            loc[0] = (cy - yref) / href / prior_scaling[0];
            loc[1] = (cx - xref) / wref / prior_scaling[1];
            loc[2] = std::log(h / href) / prior_scaling[2];
            loc[3] = std::log(w / wref) / prior_scaling[3];
        }

        return R::Ok(std::move(t));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("encode_layer: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("encode_layer: ") + e.what()));
    }
}

Result<Tensor> decode_layer(const Tensor& localisations, const LayerAnchors& anchors,
                            const std::array<float, 4>& prior_scaling) noexcept {
    using R = Result<Tensor>;

    const auto q = localisations.query();
    if (localisations.rank() != 5 || !q.fully_known() || localisations.data.size() != localisations.numel())
        return R::Err(Status::Invalid("decode_layer: localisations must be a known [B,H,W,K,4] tensor"));
    const auto& s = localisations.shape;
    if (s[1] != anchors.H || s[2] != anchors.W || s[3] != anchors.num_per_cell() || s[4] != 4) {
        return R::Err(Status::Invalid("decode_layer: localisations [" + std::to_string(s[1]) + "," + std::to_string(s[2]) +
                                      "," + std::to_string(s[3]) + "] do not match anchors [" + std::to_string(anchors.H) +
                                      "," + std::to_string(anchors.W) + "," + std::to_string(anchors.num_per_cell()) + "]"));
    }

    try {
        Tensor out = Tensor::zeros(s);
        const std::size_t K = (std::size_t)s[3];
        const std::size_t cells = (std::size_t)s[1] * (std::size_t)s[2];
        const std::size_t per_image = cells * K;
        const std::size_t total = per_image * (std::size_t)s[0];
        const float* src = localisations.ptr();
        float* dst = out.ptr();

#pragma omp parallel for schedule(static) if (total > 4096)
        for (long long n = 0; n < (long long)total; ++n) {
            const std::size_t a = (std::size_t)n % per_image;
            const std::size_t k = a % K;
            const std::size_t cell = a / K;
            const float* l = src + (std::size_t)n * 4;

            const float cy = l[0] * anchors.h[k] * prior_scaling[0] + anchors.cy[cell];
            const float cx = l[1] * anchors.w[k] * prior_scaling[1] + anchors.cx[cell];
            const float h = anchors.h[k] * std::exp(l[2] * prior_scaling[2]);
            const float w = anchors.w[k] * std::exp(l[3] * prior_scaling[3]);

            float* o = dst + (std::size_t)n * 4;
            o[0] = cy - 0.5f * h;
            o[1] = cx - 0.5f * w;
            o[2] = cy + 0.5f * h;
            o[3] = cx + 0.5f * w;
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("decode_layer: bad_alloc"));
    }
}

} // namespace ssdet::algo
