/**
 * @file detection_pipeline.cpp
 * @ingroup ssdet_pipeline
 */

#include "pipeline/detection_pipeline.h"

#include <exception>
#include <new>
#include <string>
#include <utility>

namespace ssdet::pipeline {

Result<std::vector<ImageDetections>> DetectionPipeline::run(const std::vector<Tensor>& predictions,
                                                            const std::vector<Tensor>& localisations,
                                                            const AnchorSet& anchors,
                                                            const std::array<float, 4>& prior_scaling,
                                                            const DetectionParams& params) const noexcept {
    using R = Result<std::vector<ImageDetections>>;

    const std::size_t L = anchors.size();
    if (L == 0) return R::Err(Status::Invalid("detection: empty anchor set"));
    if (predictions.size() != L || localisations.size() != L) {
        return R::Err(Status::Invalid("detection: " + std::to_string(predictions.size()) + " prediction / " +
                                      std::to_string(localisations.size()) + " localisation layers for " +
                                      std::to_string(L) + " anchor layers"));
    }

    int64_t B = -1;
    int64_t C = -1;
    for (std::size_t l = 0; l < L; ++l) {
        const Tensor& p = predictions[l];
        if (p.rank() != 5 || !p.query().fully_known() || p.data.size() != p.numel())
            return R::Err(Status::Invalid("detection: layer " + std::to_string(l) + " predictions must be [B,H,W,K,C]"));
        if (p.shape[1] != anchors[l].H || p.shape[2] != anchors[l].W || p.shape[3] != anchors[l].num_per_cell())
            return R::Err(Status::Invalid("detection: layer " + std::to_string(l) + " predictions do not match anchors"));
        if (B < 0) B = p.shape[0];
        if (C < 0) C = p.shape[4];
        if (p.shape[0] != B || p.shape[4] != C)
            return R::Err(Status::Invalid("detection: layer " + std::to_string(l) + " disagrees on batch or class count"));
    }
    if (C < 2) return R::Err(Status::Invalid("detection: num_classes must be >= 2"));

    try {
        // (a) decode
        auto dr = ops_->decode(localisations, anchors, prior_scaling);
        if (!dr.ok()) return R::Err(dr.status());
        const std::vector<Tensor>& boxes = dr.value();
        if (boxes.size() != L) return R::Err(Status::Internal("detection: decode returned a different layer count"));

        std::vector<ImageDetections> out;
        out.reserve((std::size_t)B);

        std::vector<float> probs;
        std::vector<BBox> flat;
        for (int64_t b = 0; b < B; ++b) {
            probs.clear();
            flat.clear();
            for (std::size_t l = 0; l < L; ++l) {
                const std::size_t n = anchors[l].size();
                if (boxes[l].data.size() != (std::size_t)B * n * 4)
                    return R::Err(Status::Internal("detection: decoded layer " + std::to_string(l) + " has wrong size"));

                const float* pb = predictions[l].ptr() + (std::size_t)b * n * (std::size_t)C;
                probs.insert(probs.end(), pb, pb + n * (std::size_t)C);

                const float* bb = boxes[l].ptr() + (std::size_t)b * n * 4;
                for (std::size_t i = 0; i < n; ++i)
                    flat.push_back({bb[i * 4 + 0], bb[i * 4 + 1], bb[i * 4 + 2], bb[i * 4 + 3]});
            }

            // (b) select, (c) sort + top_k, (d) NMS + keep_top_k, (e) clip
            ImageDetections dets = ops_->select(probs, flat, (int)C, params.select_threshold);
            dets = ops_->sort_top_k(std::move(dets), params.top_k);
            dets = ops_->nms(std::move(dets), params.nms_threshold, params.keep_top_k);
            if (params.clip) dets = ops_->clip(std::move(dets), *params.clip);

            out.push_back(std::move(dets));
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("detection: bad_alloc"));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("detection: ") + e.what()));
    }
}

} // namespace ssdet::pipeline
