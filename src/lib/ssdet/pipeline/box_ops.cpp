/**
 * @file box_ops.cpp
 * @ingroup ssdet_pipeline
 */

#include "pipeline/box_ops.h"

#include "algo/bbox.h"
#include "algo/box_coder.h"
#include "algo/nms.h"
#include "algo/select.h"

#include <string>
#include <utility>

namespace ssdet::pipeline {

Result<std::vector<Tensor>> DefaultBoxOps::decode(const std::vector<Tensor>& localisations, const AnchorSet& anchors,
                                                  const std::array<float, 4>& prior_scaling) const {
    using R = Result<std::vector<Tensor>>;
    if (localisations.size() != anchors.size()) {
        return R::Err(Status::Invalid("decode: " + std::to_string(localisations.size()) + " localisation layers for " +
                                      std::to_string(anchors.size()) + " anchor layers"));
    }

    std::vector<Tensor> out;
    out.reserve(anchors.size());
    for (std::size_t l = 0; l < anchors.size(); ++l) {
        auto r = algo::decode_layer(localisations[l], anchors[l], prior_scaling);
        if (!r.ok()) return R::Err(Status{r.status().code, "layer " + std::to_string(l) + ": " + r.status().message});
        out.push_back(std::move(r).value());
    }
    return R::Ok(std::move(out));
}

ImageDetections DefaultBoxOps::select(const std::vector<float>& probs, const std::vector<BBox>& boxes, int num_classes,
                                      float threshold) const {
    return algo::select(probs, boxes, num_classes, threshold);
}

ImageDetections DefaultBoxOps::sort_top_k(ImageDetections dets, int top_k) const {
    return algo::sort_top_k(std::move(dets), top_k);
}

ImageDetections DefaultBoxOps::nms(ImageDetections dets, float nms_threshold, int keep_top_k) const {
    return algo::nms_per_class(dets, nms_threshold, keep_top_k);
}

ImageDetections DefaultBoxOps::clip(ImageDetections dets, const BBox& window) const {
    for (auto& [cls, boxes] : dets) {
        (void)cls;
        for (ScoredBox& sb : boxes)
            sb.box = algo::clip(sb.box, window);
    }
    return dets;
}

} // namespace ssdet::pipeline
