/**
 * @file feat_shapes.cpp
 * @ingroup ssdet_anchor
 * @brief Per-layer shape refinement with explicit fallback.
 */

#include "anchor/feat_shapes.h"

#include <new>
#include <string>
#include <utility>

namespace ssdet::anchor {

Result<std::vector<FeatShape>> update_shapes_from_predictions(const std::vector<Tensor>& predictions,
                                                              const std::vector<FeatShape>& fallback_shapes) noexcept {
    using R = Result<std::vector<FeatShape>>;

    if (predictions.size() != fallback_shapes.size()) {
        return R::Err(Status::Invalid("update_shapes_from_predictions: " + std::to_string(predictions.size()) +
                                      " predictions vs " + std::to_string(fallback_shapes.size()) +
                                      " fallback shapes"));
    }

    try {
        std::vector<FeatShape> out;
        out.reserve(predictions.size());
        for (std::size_t i = 0; i < predictions.size(); ++i) {
            const ShapeQuery q = predictions[i].query();
            if (!q.range_known(1, 4)) {
                out.push_back(fallback_shapes[i]);
                continue;
            }
            out.push_back(FeatShape{*q.dim(1), *q.dim(2), *q.dim(3)});
        }
        return R::Ok(std::move(out));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("update_shapes_from_predictions: bad_alloc"));
    }
}

} // namespace ssdet::anchor
