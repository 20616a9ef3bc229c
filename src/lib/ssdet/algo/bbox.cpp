/**
 * @file bbox.cpp
 * @ingroup ssdet_algo
 * @brief Box IoU and clipping.
 */

#include "algo/bbox.h"

#include <algorithm>
#include <cmath>

namespace ssdet::algo {

cv::Rect2f to_rect(const BBox& b) noexcept {
    return cv::Rect2f(b.xmin, b.ymin, b.width(), b.height());
}

BBox from_rect(const cv::Rect2f& r) noexcept {
    return {r.y, r.x, r.y + r.height, r.x + r.width};
}

float iou(const BBox& a, const BBox& b) noexcept {
    auto finite = [](const BBox& q) noexcept {
        return std::isfinite(q.ymin) && std::isfinite(q.xmin) && std::isfinite(q.ymax) && std::isfinite(q.xmax);
    };
    if (!finite(a) || !finite(b)) return 0.f;

    const cv::Rect2f ra = to_rect(a);
    const cv::Rect2f rb = to_rect(b);
    const float area_a = std::max(0.f, ra.width) * std::max(0.f, ra.height);
    const float area_b = std::max(0.f, rb.width) * std::max(0.f, rb.height);

    const float ih = std::max(0.f, std::min(a.ymax, b.ymax) - std::max(a.ymin, b.ymin));
    const float iw = std::max(0.f, std::min(a.xmax, b.xmax) - std::max(a.xmin, b.xmin));
    const float inter = ih * iw;

    const float uni = area_a + area_b - inter;
    if (!(uni > 0.f)) return 0.f;
    return inter / uni;
}

BBox clip(const BBox& box, const BBox& window) noexcept {
    BBox out;
    out.ymin = std::max(box.ymin, window.ymin);
    out.xmin = std::max(box.xmin, window.xmin);
    out.ymax = std::min(box.ymax, window.ymax);
    out.xmax = std::min(box.xmax, window.xmax);
    return out;
}

} // namespace ssdet::algo
