// api.h - DLL export/import macros for opack

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the opack library.
///
/// Usage:
/// - When building opack as a SHARED library:
///   - CMake defines OPACK_EXPORTS (private) and OPACK_SHARED (public)
///   - Functions/classes marked with OPACK_API will be exported
///
/// - When using opack as a SHARED library:
///   - Link against the opack target (CMake propagates OPACK_SHARED)
///   - Functions/classes marked with OPACK_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, OPACK_API expands to nothing
///
/// Example:
/// @code
/// class OPACK_API Baker { ... };           // Export entire class
/// OPACK_API void register_builtin_types(); // Export free function
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OPACK_SHARED
        #ifdef OPACK_EXPORTS
            #define OPACK_API __declspec(dllexport)
        #else
            #define OPACK_API __declspec(dllimport)
        #endif
    #else
        #define OPACK_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OPACK_SHARED) && defined(OPACK_EXPORTS)
        #define OPACK_API __attribute__((visibility("default")))
    #else
        #define OPACK_API
    #endif
#else
    #define OPACK_API
#endif
