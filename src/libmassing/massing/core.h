// =====================================================================
//  src/libmassing/massing/core.h — Library initialization and export macros
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef MASSING_CORE_H
#define MASSING_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libmassing as a shared library, MASSING_SHARED and
// MASSING_BUILDING are defined.  Consumers linking against the shared
// library only see MASSING_SHARED (set as a PUBLIC compile definition).

#if defined(MASSING_SHARED)
  #if defined(MASSING_BUILDING)
    #if defined(_WIN32)
      #define MASSING_EXPORT __declspec(dllexport)
    #else
      #define MASSING_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define MASSING_EXPORT __declspec(dllimport)
    #else
      #define MASSING_EXPORT
    #endif
  #endif
#else
  #define MASSING_EXPORT
#endif

namespace massing {

/// Library version string (e.g., "0.1.0").
MASSING_EXPORT const char* version();

/// Initialize library-wide state (logging filter rules).
/// Call once at application startup before using other functions.
/// Returns true on success.
///
/// Debug output is off unless MASSING_LOG_DEBUG is set to 1/true/yes/on,
/// or MASSING_LOG_DEBUG_CATEGORIES lists category patterns, e.g.
/// @code
///     MASSING_LOG_DEBUG_CATEGORIES=massing.tools.*,massing.io.cadimport
/// @endcode
MASSING_EXPORT bool initialize();

/// Shut down the library and release resources.
/// Call once at application exit.
MASSING_EXPORT void shutdown();

/// Whether initialize() enabled debug output for every category.
MASSING_EXPORT bool debugLoggingEnabled();

}  // namespace massing

#endif  // MASSING_CORE_H
