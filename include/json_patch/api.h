// api.h - Symbol visibility for the json_patch library

#pragma once

/// @file api.h
/// @brief JSON_PATCH_API marks every symbol the library exports.
///
/// - Static build: JSON_PATCH_API expands to nothing
/// - Shared build: CMake defines JSON_PATCH_SHARED (public) and
///   JSON_PATCH_EXPORTS (private, only while compiling json_patch itself)

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSON_PATCH_SHARED
        #ifdef JSON_PATCH_EXPORTS
            #define JSON_PATCH_API __declspec(dllexport)
        #else
            #define JSON_PATCH_API __declspec(dllimport)
        #endif
    #else
        #define JSON_PATCH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // Shared builds compile with -fvisibility=hidden
    #if defined(JSON_PATCH_SHARED) && defined(JSON_PATCH_EXPORTS)
        #define JSON_PATCH_API __attribute__((visibility("default")))
    #else
        #define JSON_PATCH_API
    #endif
#else
    #define JSON_PATCH_API
#endif
