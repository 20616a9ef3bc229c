/**
 * @file image.h
 * @brief Non-owning 8-bit image view accepted by @ref ssdet::SsdNet::forward.
 *
 * @ingroup ssdet_api
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace ssdet {

/** @brief Interleaved 8-bit pixel layouts. */
enum class PixelFormat : std::uint8_t {
    BGR_U8 = 0,
    RGB_U8 = 1,
};

/**
 * @brief Read-only view over an interleaved 3-channel U8 image.
 *
 * @warning The view does not own @ref data; the buffer must outlive every call that receives it.
 */
struct ImageView final {
    const std::uint8_t* data = nullptr;
    int width = 0;
    int height = 0;

    /** @brief Bytes between the starts of two rows (>= width * 3). */
    std::size_t stride_bytes = 0;

    PixelFormat format = PixelFormat::BGR_U8;

    [[nodiscard]] constexpr bool empty() const noexcept {
        return data == nullptr || width <= 0 || height <= 0;
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return !empty() && stride_bytes >= static_cast<std::size_t>(width) * 3u;
    }
};

} // namespace ssdet
