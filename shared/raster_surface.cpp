// raster_surface.cpp - RGBA pixel buffer the document is painted into

#include "raster_surface.h"

#include "svg_document.h"
#include "viewer_error.h"

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkColorSpace.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkSurface.h"
#include "modules/svg/include/SkSVGDOM.h"

#include <algorithm>
#include <limits>
#include <new>
#include <string>
#include <utility>

namespace svgview {

RasterSurface::RasterSurface(uint32_t width, uint32_t height, std::vector<uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {}

RasterSurface RasterSurface::allocate(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        throw ViewerError(ErrorKind::Allocation, "Cannot allocate a " + std::to_string(width) + "x" +
                                                     std::to_string(height) + " pixel buffer");
    }

    // Skia addresses rows with int dimensions
    constexpr uint64_t maxDimension = static_cast<uint64_t>(std::numeric_limits<int>::max());
    uint64_t byteCount = static_cast<uint64_t>(width) * height * BYTES_PER_PIXEL;
    if (width > maxDimension || height > maxDimension ||
        byteCount > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        throw ViewerError(ErrorKind::Allocation, "Pixel buffer size overflows: " + std::to_string(width) + "x" +
                                                     std::to_string(height));
    }

    try {
        std::vector<uint8_t> pixels(static_cast<size_t>(byteCount), 0);
        return RasterSurface(width, height, std::move(pixels));
    } catch (const std::bad_alloc&) {
        throw ViewerError(ErrorKind::Allocation, "Could not allocate memory for display (" +
                                                     std::to_string(byteCount) + " bytes)");
    }
}

void RasterSurface::rasterize(const SvgDocument& document, uint32_t width, uint32_t height) {
    if (width != width_ || height != height_) {
        throw ViewerError(ErrorKind::Rasterize, "Rasterize target " + std::to_string(width) + "x" +
                                                    std::to_string(height) + " does not match surface " +
                                                    std::to_string(width_) + "x" + std::to_string(height_));
    }

    SkSVGDOM* dom = document.dom();
    SkSize intrinsic = document.intrinsicSize();
    if (!dom || intrinsic.isEmpty()) {
        throw ViewerError(ErrorKind::Rasterize, "Document has nothing to render");
    }

    // Full clear first: no stale pixels survive, even if Skia bails out early
    std::fill(pixels_.begin(), pixels_.end(), 0);

    SkImageInfo imageInfo = SkImageInfo::Make(static_cast<int>(width), static_cast<int>(height),
                                              kRGBA_8888_SkColorType, kPremul_SkAlphaType, SkColorSpace::MakeSRGB());

    // Surface that wraps our pixel buffer, Skia writes directly into it
    sk_sp<SkSurface> surface = SkSurfaces::WrapPixels(imageInfo, pixels_.data(), rowBytes());
    if (!surface) {
        throw ViewerError(ErrorKind::Rasterize, "Failed to create rendering surface");
    }

    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(SK_ColorTRANSPARENT);

    // Fit-to-size: independent X/Y scale, aspect ratio is not preserved
    canvas->scale(static_cast<float>(width) / intrinsic.width(), static_cast<float>(height) / intrinsic.height());
    dom->render(canvas);
}

std::array<uint8_t, 4> RasterSurface::pixelAt(uint32_t x, uint32_t y) const {
    size_t offset = static_cast<size_t>(y) * rowBytes() + static_cast<size_t>(x) * BYTES_PER_PIXEL;
    return {pixels_[offset], pixels_[offset + 1], pixels_[offset + 2], pixels_[offset + 3]};
}

}  // namespace svgview
