/**
 * @file ort_headers.h
 * @ingroup ssdet_internal
 * @brief Single include point for the ONNX Runtime C++ API.
 *
 * Handles the source-tree layout (@c onnxruntime/core/session/...), the packaged
 * @c onnxruntime/ prefix and flat installs exposing @c onnxruntime_cxx_api.h directly.
 *
 * @note Internal header; not installed.
 */

#pragma once

#if defined(__has_include) && __has_include(<onnxruntime/core/session/onnxruntime_cxx_api.h>)
    #include <onnxruntime/core/session/onnxruntime_cxx_api.h>
#elif defined(__has_include) && __has_include(<onnxruntime/onnxruntime_cxx_api.h>)
    #include <onnxruntime/onnxruntime_cxx_api.h>
#elif defined(__has_include) && __has_include(<onnxruntime_cxx_api.h>)
    #include <onnxruntime_cxx_api.h>
#else
    #error "[ssdet] ONNX Runtime header not found: onnxruntime_cxx_api.h"
#endif
