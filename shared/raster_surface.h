// raster_surface.h - RGBA pixel buffer the document is painted into
//
// The buffer is always exactly width * height * 4 bytes (RGBA, premultiplied,
// 8 bits per channel, tightly packed rows). Every rasterize() clears the whole
// buffer before painting, so nothing from a previous frame or size survives.

#ifndef SVGVIEW_RASTER_SURFACE_H
#define SVGVIEW_RASTER_SURFACE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace svgview {

class SvgDocument;

class RasterSurface {
public:
    static constexpr size_t BYTES_PER_PIXEL = 4;

    // Throws ViewerError(Allocation) for a zero dimension or when the buffer
    // cannot be obtained
    static RasterSurface allocate(uint32_t width, uint32_t height);

    // Clear to transparent, then render document stretched to width x height.
    // width/height must match the surface. Throws ViewerError(Rasterize).
    void rasterize(const SvgDocument& document, uint32_t width, uint32_t height);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    size_t rowBytes() const { return static_cast<size_t>(width_) * BYTES_PER_PIXEL; }
    size_t byteSize() const { return pixels_.size(); }

    const uint8_t* data() const { return pixels_.data(); }
    const std::vector<uint8_t>& pixels() const { return pixels_; }

    // {R, G, B, A} at (x, y). Unchecked: x and y must lie inside the surface
    std::array<uint8_t, 4> pixelAt(uint32_t x, uint32_t y) const;

private:
    RasterSurface(uint32_t width, uint32_t height, std::vector<uint8_t> pixels);

    uint32_t width_;
    uint32_t height_;
    std::vector<uint8_t> pixels_;
};

}  // namespace svgview

#endif  // SVGVIEW_RASTER_SURFACE_H
