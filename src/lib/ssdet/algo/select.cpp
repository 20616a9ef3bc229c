/**
 * @file select.cpp
 * @ingroup ssdet_algo
 */

#include "algo/select.h"

#include <algorithm>
#include <utility>

namespace ssdet::algo {

ImageDetections select(const std::vector<float>& probs, const std::vector<BBox>& boxes, int num_classes,
                       float threshold) {
    ImageDetections out;
    if (num_classes < 2) return out;

    const std::size_t C = (std::size_t)num_classes;
    const std::size_t N = std::min(boxes.size(), probs.size() / C);

    for (std::size_t n = 0; n < N; ++n) {
        const float* p = probs.data() + n * C;
        for (std::size_t c = 1; c < C; ++c) {
            if (p[c] > threshold) out[(int)c].push_back({boxes[n], p[c]});
        }
    }
    return out;
}

ImageDetections sort_top_k(ImageDetections dets, int top_k) {
    for (auto& [cls, boxes] : dets) {
        (void)cls;
        std::stable_sort(boxes.begin(), boxes.end(),
                         [](const ScoredBox& a, const ScoredBox& b) { return a.score > b.score; });
        if (top_k > 0 && boxes.size() > (std::size_t)top_k) boxes.resize((std::size_t)top_k);
    }
    return dets;
}

} // namespace ssdet::algo
