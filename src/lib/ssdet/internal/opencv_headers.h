/**
 * @file opencv_headers.h
 * @ingroup ssdet_internal
 * @brief Single include point for the OpenCV modules used by ssdet (core, imgproc).
 *
 * Supports both installation layouts (@c <opencv2/...> and @c <opencv4/opencv2/...>).
 *
 * @note Internal header; not installed.
 */

#pragma once

#if defined(__has_include) && __has_include(<opencv4/opencv2/core.hpp>)
    #include <opencv4/opencv2/core.hpp>
#elif defined(__has_include) && __has_include(<opencv2/core.hpp>)
    #include <opencv2/core.hpp>
#else
    #error "[ssdet] OpenCV header not found: opencv2/core.hpp (or opencv4/opencv2/core.hpp)"
#endif

#if defined(__has_include) && __has_include(<opencv4/opencv2/imgproc.hpp>)
    #include <opencv4/opencv2/imgproc.hpp>
#elif defined(__has_include) && __has_include(<opencv2/imgproc.hpp>)
    #include <opencv2/imgproc.hpp>
#else
    #error "[ssdet] OpenCV header not found: opencv2/imgproc.hpp (or opencv4/opencv2/imgproc.hpp)"
#endif
