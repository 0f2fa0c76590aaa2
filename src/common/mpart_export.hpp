/**
 * @file mpart_export.hpp
 * @brief Unified export/import macros for the mpart libraries
 *
 * This header provides cross-platform support for building shared libraries.
 * On Windows, it handles __declspec(dllexport/dllimport).
 * On other platforms, it uses visibility attributes for optimization.
 */

#ifndef MPART_EXPORT_HPP
#define MPART_EXPORT_HPP

// =============================================================================
// mpart Library Export Macros
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
// Windows platform
#if defined(MPART_STATIC)
// Static library - no export/import needed
#define MPART_API
#elif defined(MPART_EXPORTS)
// Building the DLL - export symbols
#define MPART_API __declspec(dllexport)
#else
// Using the DLL - import symbols
#define MPART_API __declspec(dllimport)
#endif
#else
// Non-Windows platforms (Linux, macOS, etc.)
#if defined(MPART_EXPORTS) && defined(__GNUC__) && __GNUC__ >= 4
// Use visibility attribute for GCC/Clang
#define MPART_API __attribute__((visibility("default")))
#else
#define MPART_API
#endif
#endif

// =============================================================================
// Input Restore Verification
// =============================================================================
//
// MPART_VERIFY_RESTORE_DEFAULT controls whether new partition requests compare
// their adjacency arrays before and after the METIS call. It defaults to on in
// builds without NDEBUG. Define it to 0 or 1 before including mpart headers to
// override.
//

#ifndef MPART_VERIFY_RESTORE_DEFAULT
#ifdef NDEBUG
#define MPART_VERIFY_RESTORE_DEFAULT 0
#else
#define MPART_VERIFY_RESTORE_DEFAULT 1
#endif
#endif

#endif // MPART_EXPORT_HPP
