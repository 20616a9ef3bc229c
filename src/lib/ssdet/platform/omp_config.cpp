/**
 * @file omp_config.cpp
 * @ingroup ssdet_platform
 * @brief OpenMP / OpenCV threading setup.
 */

#include "platform/omp_config.h"

#include "internal/opencv_headers.h" // IWYU pragma: keep

#include <iostream>
#include <string>

#if defined(_OPENMP)
    #include <omp.h>
#endif

namespace ssdet::platform {

int omp_max_threads() noexcept {
#if defined(_OPENMP)
    return omp_get_max_threads();
#else
    return 1;
#endif
}

Status apply_runtime_policy(const RuntimePolicy& policy, bool verbose) noexcept {
    if (policy.omp_threads < 0) return Status::Invalid("RuntimePolicy: omp_threads must be >= 0");
    if (policy.ort_intra_threads < 0 || policy.ort_inter_threads < 0)
        return Status::Invalid("RuntimePolicy: ORT thread counts must be >= 0");

    try {
#if defined(_OPENMP)
        if (policy.omp_threads > 0) {
            omp_set_dynamic(0);
            omp_set_num_threads(policy.omp_threads);
        }
#endif
        if (policy.suppress_opencv) cv::setNumThreads(0);
    } catch (const cv::Exception& e) {
        return Status::Internal(std::string("apply_runtime_policy: OpenCV: ") + e.what());
    }

    if (verbose) {
#if defined(_OPENMP)
        std::cout << "[OMP] _OPENMP = " << _OPENMP << ", max_threads = " << omp_max_threads() << "\n";
#else
        std::cout << "[OMP] OpenMP is not enabled in this build (_OPENMP not defined)\n";
#endif
        std::cout << "[OpenCV] threads = " << cv::getNumThreads() << "\n" << std::flush;
    }
    return Status::Ok();
}

} // namespace ssdet::platform
