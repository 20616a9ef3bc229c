/**
 * @file chw_preprocess.h
 * @ingroup ssdet_internal
 * @brief Convert BGR U8 images into the CHW float32 batch layout expected by the SSD graph.
 *
 * The VGG backbone is trained on mean-subtracted RGB input with no variance scaling:
 * @c out[c] = value[c] - mean[c], channels written in R, G, B order.
 *
 * @note Internal header; not installed.
 */

#pragma once

#include "internal/opencv_headers.h" // IWYU pragma: keep

#include <cstddef>
#include <cstdint>

namespace ssdet::internal {

/** @brief VGG channel means in R, G, B order. */
inline constexpr float kVggMeanRgb[3] = {123.f, 117.f, 104.f};

/**
 * @brief Writes one image into a CHW plane triple (R, G, B) with mean subtraction.
 *
 * @param bgr Source image, @c CV_8UC3, already at the destination size.
 * @param dst_chw Destination of @c 3*H*W floats.
 */
inline void bgr_u8_to_rgb_chw_f32(const cv::Mat& bgr, float* dst_chw) noexcept {
    const int H = bgr.rows;
    const int W = bgr.cols;

    const std::size_t plane = (std::size_t)H * (std::size_t)W;
    float* R = dst_chw + 0 * plane;
    float* G = dst_chw + 1 * plane;
    float* B = dst_chw + 2 * plane;

    for (int y = 0; y < H; ++y) {
        const std::uint8_t* p = bgr.ptr<std::uint8_t>(y);
        for (int x = 0; x < W; ++x) {
            const std::size_t idx = (std::size_t)y * (std::size_t)W + (std::size_t)x;
            R[idx] = float(p[2]) - kVggMeanRgb[0];
            G[idx] = float(p[1]) - kVggMeanRgb[1];
            B[idx] = float(p[0]) - kVggMeanRgb[2];
            p += 3;
        }
    }
}

/**
 * @brief Resizes (when needed) and writes one image into a CHW slot of a batch buffer.
 *
 * @throws cv::Exception if resizing fails.
 */
inline void bgr_u8_to_rgb_chw_f32_resize(const cv::Mat& bgr, int dst_w, int dst_h, float* dst_chw) {
    if (bgr.cols == dst_w && bgr.rows == dst_h) {
        bgr_u8_to_rgb_chw_f32(bgr, dst_chw);
        return;
    }
    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(dst_w, dst_h), 0, 0, cv::INTER_LINEAR);
    bgr_u8_to_rgb_chw_f32(resized, dst_chw);
}

} // namespace ssdet::internal
