/**
 * @file export.h
 * @brief Symbol visibility macro for the ssdet library (static and shared builds).
 *
 * - static build (@c SSDET_BUILD_STATIC): @c SSDET_API expands to nothing;
 * - shared build on Windows: @c __declspec(dllexport) / @c __declspec(dllimport);
 * - shared build on ELF with GCC/Clang: default visibility, intended to be combined with
 *   @c -fvisibility=hidden so that only annotated entities are exported.
 *
 * The build system defines @c SSDET_BUILD_SHARED when compiling the library as a shared object
 * and consumers define @c SSDET_USE_SHARED when linking against it.
 */

#pragma once

#if defined(SSDET_BUILD_STATIC)
    #define SSDET_API
#else
    #if defined(_WIN32) || defined(__CYGWIN__)
        #if defined(SSDET_BUILD_SHARED)
            #define SSDET_API __declspec(dllexport)
        #elif defined(SSDET_USE_SHARED)
            #define SSDET_API __declspec(dllimport)
        #else
            #define SSDET_API
        #endif
    #else
        #if defined(SSDET_BUILD_SHARED) && (defined(__GNUC__) || defined(__clang__))
            #define SSDET_API __attribute__((visibility("default")))
        #else
            #define SSDET_API
        #endif
    #endif
#endif
