/**
 * @file tensor.h
 * @brief Dense row-major tensors and the shape capability used by anchor/shape refinement.
 *
 * Tensors are plain contiguous buffers with an explicit shape. Dimensions that are not known
 * (for example dynamic axes reported by ONNX Runtime) are stored as @c -1 and are surfaced
 * through @ref ssdet::ShapeQuery, which exposes two query modes:
 * - @ref ssdet::ShapeQuery::fully_known: every dimension is known,
 * - @ref ssdet::ShapeQuery::dim: per-dimension query returning an empty optional when unknown.
 *
 * Layout conventions used across the library (channels-last, batch first):
 * - per-layer logits:        [B, H, W, K, num_classes]
 * - per-layer localisations: [B, H, W, K, 4]
 * - per-layer gclasses:      [B, H, W, K]   (int32)
 * - per-layer gscores:       [B, H, W, K]
 *
 * @ingroup ssdet_api
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace ssdet {

/** @brief Marker stored in a shape for a dimension whose extent is not known. */
inline constexpr int64_t kUnknownDim = -1;

/**
 * @brief Read-only view over a shape vector answering "is this dimension known?".
 *
 * @details
 * A dimension is known iff it is >= 0. A shape is fully known iff all of its dimensions are.
 * Callers never guess or interpolate unknown dimensions; they either use a known value or
 * apply an explicit fallback.
 */
class ShapeQuery final {
  public:
    explicit ShapeQuery(const std::vector<int64_t>& dims) noexcept : dims_(&dims) {}

    std::size_t rank() const noexcept {
        return dims_->size();
    }

    /** @brief True iff every dimension is known (>= 0). An empty shape is fully known. */
    bool fully_known() const noexcept {
        for (int64_t d : *dims_)
            if (d < 0) return false;
        return true;
    }

    /** @brief True iff dimensions [first, last) are all present and known. */
    bool range_known(std::size_t first, std::size_t last) const noexcept {
        if (last > dims_->size() || first > last) return false;
        for (std::size_t i = first; i < last; ++i)
            if ((*dims_)[i] < 0) return false;
        return true;
    }

    /** @brief Extent of dimension @p i, or empty if out of range or unknown. */
    std::optional<int64_t> dim(std::size_t i) const noexcept {
        if (i >= dims_->size()) return std::nullopt;
        const int64_t d = (*dims_)[i];
        if (d < 0) return std::nullopt;
        return d;
    }

  private:
    const std::vector<int64_t>* dims_;
};

/**
 * @brief Contiguous row-major tensor.
 *
 * @tparam T Element type (float for activations/targets, int32 for class ids).
 *
 * @note
 * The buffer size is expected to equal @ref numel() whenever the shape is fully known.
 * Tensors with unknown dimensions carry no data and only serve as shape descriptors.
 */
template <class T> struct BasicTensor {
    std::vector<int64_t> shape;
    std::vector<T> data;

    BasicTensor() = default;

    BasicTensor(std::vector<int64_t> s, std::vector<T> d) : shape(std::move(s)), data(std::move(d)) {}

    /** @brief Allocate a tensor of @p s filled with @p fill; unknown dims allocate nothing. */
    static BasicTensor filled(std::vector<int64_t> s, T fill) {
        BasicTensor t;
        t.shape = std::move(s);
        t.data.assign(element_count(t.shape), fill);
        return t;
    }

    static BasicTensor zeros(std::vector<int64_t> s) {
        return filled(std::move(s), T(0));
    }

    /** @brief Product of dimensions; 0 if any dimension is unknown. */
    static std::size_t element_count(const std::vector<int64_t>& s) noexcept {
        std::size_t n = 1;
        for (int64_t d : s) {
            if (d < 0) return 0;
            n *= static_cast<std::size_t>(d);
        }
        return n;
    }

    std::size_t numel() const noexcept {
        return element_count(shape);
    }

    std::size_t rank() const noexcept {
        return shape.size();
    }

    ShapeQuery query() const noexcept {
        return ShapeQuery(shape);
    }

    /** @brief Extent of the last dimension (the channel axis in channels-last layouts), -1 if absent. */
    int64_t last_dim() const noexcept {
        return shape.empty() ? kUnknownDim : shape.back();
    }

    T* ptr() noexcept {
        return data.data();
    }

    const T* ptr() const noexcept {
        return data.data();
    }
};

using Tensor = BasicTensor<float>;
using IntTensor = BasicTensor<std::int32_t>;

} // namespace ssdet
