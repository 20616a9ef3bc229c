/**
 * @file nms.cpp
 * @ingroup ssdet_algo
 * @brief Greedy NMS for axis-aligned detections.
 *
 * @details
 * Boxes are visited in descending score order; every kept box suppresses the lower-ranked
 * boxes it overlaps by more than the threshold. Box counts per class are bounded by
 * @ref ssdet::DetectionParams::top_k, so the quadratic scan stays cheap and no spatial
 * acceleration structure is used.
 */

#include "algo/nms.h"

#include "algo/bbox.h"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <utility>

namespace ssdet::algo {

/**
 * @brief Axis-aligned overlap test used as a cheap reject before computing IoU.
 */
static inline bool overlap(const BBox& a, const BBox& b) noexcept {
    return !(a.xmax <= b.xmin || b.xmax <= a.xmin || a.ymax <= b.ymin || b.ymax <= a.ymin);
}

std::vector<ScoredBox> nms(const std::vector<ScoredBox>& boxes, float iou_thr, int keep_top_k) {
    const int N = (int)boxes.size();
    if (N == 0) return {};

    // Sort by descending score; order[] is the processing permutation.
    std::vector<int> order(N);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b) { return boxes[a].score > boxes[b].score; });

    const std::size_t cap = keep_top_k > 0 ? (std::size_t)keep_top_k : (std::size_t)N;

    std::vector<std::uint8_t> suppressed((std::size_t)N, 0);
    std::vector<ScoredBox> keep;
    keep.reserve(std::min(cap, (std::size_t)N));

    for (int p = 0; p < N && keep.size() < cap; ++p) {
        const int i = order[p];
        if (suppressed[(std::size_t)i]) continue;

        keep.push_back(boxes[(std::size_t)i]);
        if (iou_thr >= 1.0f) continue;

        const BBox& bi = boxes[(std::size_t)i].box;
        for (int q = p + 1; q < N; ++q) {
            const int j = order[q];
            if (suppressed[(std::size_t)j]) continue;
            const BBox& bj = boxes[(std::size_t)j].box;
            // Disjoint boxes have IoU 0 and are only suppressed by a negative threshold.
            if (iou_thr >= 0.f && !overlap(bi, bj)) continue;
            if (iou(bi, bj) > iou_thr) suppressed[(std::size_t)j] = 1;
        }
    }

    return keep;
}

ImageDetections nms_per_class(const ImageDetections& dets, float iou_thr, int keep_top_k) {
    ImageDetections out;
    for (const auto& [cls, boxes] : dets) {
        auto kept = nms(boxes, iou_thr, keep_top_k);
        if (!kept.empty()) out.emplace(cls, std::move(kept));
    }
    return out;
}

} // namespace ssdet::algo
