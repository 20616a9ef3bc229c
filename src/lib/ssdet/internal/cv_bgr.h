/**
 * @file cv_bgr.h
 * @ingroup ssdet_internal
 * @brief @ref ssdet::ImageView -> BGR @c cv::Mat conversion for the preprocessing path.
 *
 * BGR input is wrapped without a copy; RGB input is converted with @c cv::cvtColor into an
 * owning matrix.
 *
 * @note Internal header; not installed.
 */

#pragma once

#include "image.h"
#include "internal/opencv_headers.h" // IWYU pragma: keep
#include "status.h"

#include <exception>
#include <new>
#include <string>
#include <utility>

namespace ssdet::internal {

/**
 * @brief BGR @c CV_8UC3 matrix over (or converted from) @p img.
 *
 * @warning For BGR input the matrix aliases the caller's buffer; treat it as read-only.
 */
inline Result<cv::Mat> to_bgr_mat(const ImageView& img) noexcept {
    using R = Result<cv::Mat>;
    if (!img.is_valid()) return R::Err(Status::DecodeError("to_bgr_mat: empty image or stride < width*3"));

    try {
        cv::Mat view(img.height, img.width, CV_8UC3, const_cast<std::uint8_t*>(img.data), img.stride_bytes);
        if (img.format == PixelFormat::BGR_U8) return R::Ok(view);

        cv::Mat bgr;
        cv::cvtColor(view, bgr, cv::COLOR_RGB2BGR);
        return R::Ok(std::move(bgr));
    } catch (const std::bad_alloc&) {
        return R::Err(Status::OutOfMemory("to_bgr_mat: bad_alloc"));
    } catch (const cv::Exception& e) {
        return R::Err(Status::DecodeError(std::string("to_bgr_mat: OpenCV: ") + e.what()));
    } catch (const std::exception& e) {
        return R::Err(Status::Internal(std::string("to_bgr_mat: ") + e.what()));
    }
}

} // namespace ssdet::internal
