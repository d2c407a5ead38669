// platform.h - Platform abstraction for svgview
// Platform detection and the platform font manager used for SVG <text>

#pragma once

//==============================================================================
// Platform Detection
//==============================================================================

#if defined(__APPLE__)
    #include <TargetConditionals.h>
    #define PLATFORM_MACOS 1
    #define PLATFORM_NAME "macOS"
#elif defined(__linux__)
    #define PLATFORM_LINUX 1
    #define PLATFORM_NAME "Linux"
#elif defined(_WIN32)
    #define PLATFORM_WINDOWS 1
    #define PLATFORM_NAME "Windows"
#else
    #define PLATFORM_UNKNOWN 1
    #define PLATFORM_NAME "Unknown"
#endif

//==============================================================================
// Font Manager Creation
//==============================================================================

#include "include/core/SkFontMgr.h"
#include "modules/skshaper/include/SkShaper_factory.h"
#include "modules/skshaper/utils/FactoryHelpers.h"

#if defined(PLATFORM_MACOS)
    #include "include/ports/SkFontMgr_mac_ct.h"
    inline sk_sp<SkFontMgr> createPlatformFontMgr() {
        return SkFontMgr_New_CoreText(nullptr);
    }
#elif defined(PLATFORM_LINUX)
    #include "include/ports/SkFontMgr_fontconfig.h"
    #include "include/ports/SkFontScanner_FreeType.h"  // FreeType scanner for FontConfig
    inline sk_sp<SkFontMgr> createPlatformFontMgr() {
        // FontConfig requires a FreeType font scanner as second parameter
        return SkFontMgr_New_FontConfig(nullptr, SkFontScanner_Make_FreeType());
    }
#elif defined(PLATFORM_WINDOWS)
    #include "include/ports/SkTypeface_win.h"
    inline sk_sp<SkFontMgr> createPlatformFontMgr() {
        return SkFontMgr_New_DirectWrite();
    }
#else
    inline sk_sp<SkFontMgr> createPlatformFontMgr() {
        return SkFontMgr::RefEmpty();
    }
#endif

// Best available text shaper (HarfBuzz when Skia was built with it)
inline sk_sp<SkShapers::Factory> createTextShapingFactory() {
    return SkShapers::BestAvailable();
}
