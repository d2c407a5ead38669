/**
 * svgview - Version Management
 *
 * Version numbers and build information for the viewer. Update the numbers
 * here; the startup banner and --version output pick them up.
 *
 * Version Format: MAJOR.MINOR.PATCH
 */

#ifndef SVGVIEW_VERSION_H
#define SVGVIEW_VERSION_H

// =============================================================================
// VERSION NUMBERS - Update these for releases
// =============================================================================

#define SVGVIEW_VERSION_MAJOR 0
#define SVGVIEW_VERSION_MINOR 3
#define SVGVIEW_VERSION_PATCH 0

// =============================================================================
// DERIVED VERSION STRINGS - Do not edit manually
// =============================================================================

#define SVGVIEW_STRINGIFY_(x) #x
#define SVGVIEW_STRINGIFY(x) SVGVIEW_STRINGIFY_(x)

// Core version string: "0.3.0"
#define SVGVIEW_VERSION_CORE \
    SVGVIEW_STRINGIFY(SVGVIEW_VERSION_MAJOR) "." \
    SVGVIEW_STRINGIFY(SVGVIEW_VERSION_MINOR) "." \
    SVGVIEW_STRINGIFY(SVGVIEW_VERSION_PATCH)

#define SVGVIEW_VERSION SVGVIEW_VERSION_CORE

// =============================================================================
// BUILD INFORMATION
// =============================================================================

#define SVGVIEW_BUILD_DATE __DATE__
#define SVGVIEW_BUILD_TIME __TIME__

#if defined(__aarch64__) || defined(_M_ARM64)
    #define SVGVIEW_ARCH "arm64"
#elif defined(__x86_64__) || defined(_M_X64)
    #define SVGVIEW_ARCH "x64"
#elif defined(__i386__) || defined(_M_IX86)
    #define SVGVIEW_ARCH "x86"
#elif defined(__arm__) || defined(_M_ARM)
    #define SVGVIEW_ARCH "arm"
#else
    #define SVGVIEW_ARCH "unknown"
#endif

#if defined(__clang__)
    #define SVGVIEW_COMPILER "Clang " __clang_version__
#elif defined(__GNUC__)
    #define SVGVIEW_COMPILER "GCC " SVGVIEW_STRINGIFY(__GNUC__) "." SVGVIEW_STRINGIFY(__GNUC_MINOR__)
#else
    #define SVGVIEW_COMPILER "Unknown"
#endif

#ifdef NDEBUG
    #define SVGVIEW_BUILD_TYPE "Release"
#else
    #define SVGVIEW_BUILD_TYPE "Debug"
#endif

// Combined build info string for display
#define SVGVIEW_BUILD_INFO \
    PLATFORM_NAME "/" SVGVIEW_ARCH " " SVGVIEW_BUILD_TYPE \
    " (" SVGVIEW_BUILD_DATE " " SVGVIEW_BUILD_TIME ")"

// =============================================================================
// PROJECT INFORMATION
// =============================================================================

#define SVGVIEW_NAME "svgview"
#define SVGVIEW_DESCRIPTION "Minimal SVG viewer that re-renders when the file changes"
#define SVGVIEW_LICENSE "MIT License"

#include <sstream>
#include <string>

#include "platform.h"

namespace SVGViewVersion {

// Full version banner (for --version output)
inline std::string getVersionBanner() {
    std::ostringstream oss;
    oss << SVGVIEW_NAME << " v" << SVGVIEW_VERSION << "\n"
        << SVGVIEW_DESCRIPTION << "\n"
        << "\n"
        << "Build:    " << SVGVIEW_BUILD_TYPE << " (" << SVGVIEW_BUILD_DATE << " " << SVGVIEW_BUILD_TIME << ")\n"
        << "Platform: " << PLATFORM_NAME << " " << SVGVIEW_ARCH << "\n"
        << "Compiler: " << SVGVIEW_COMPILER << "\n"
        << "\n"
        << SVGVIEW_LICENSE;
    return oss.str();
}

// Short version line (for startup banner)
inline std::string getStartupBanner() {
    std::ostringstream oss;
    oss << SVGVIEW_NAME << " v" << SVGVIEW_VERSION << " [" << PLATFORM_NAME << "/" << SVGVIEW_ARCH << "]";
    return oss.str();
}

}  // namespace SVGViewVersion

#endif  // SVGVIEW_VERSION_H
