// viewer_state.h - Application state of the viewer
//
// Holds the document, the viewport and the raster surface, and the watch
// bridge when the document came from a file. All methods run on the UI
// thread; the watch thread only reaches this class indirectly, through the
// event it asks the UI loop to deliver.
//
// Transitions:
//   construct          -> rasterize at the initial viewport, then start the watch
//   resize(w, h)       -> new surface + rasterize, only if the size changed
//   handleFileChanged  -> re-parse with the captured options, replace, rasterize

#ifndef SVGVIEW_VIEWER_STATE_H
#define SVGVIEW_VIEWER_STATE_H

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "file_watch_bridge.h"
#include "raster_surface.h"
#include "svg_document.h"
#include "viewer_config.h"

namespace svgview {

struct Viewport {
    uint32_t width = 0;
    uint32_t height = 0;

    // A minimized window reports an empty drawable
    bool empty() const { return width == 0 || height == 0; }

    bool operator==(const Viewport& other) const { return width == other.width && height == other.height; }
    bool operator!=(const Viewport& other) const { return !(*this == other); }
};

// Largest initial window dimension, in pixels
static constexpr float MAX_INITIAL_WINDOW_SIZE = 1200.0f;

// Document's intrinsic size scaled down so neither side exceeds
// MAX_INITIAL_WINDOW_SIZE, never smaller than 1x1
Viewport initialWindowSize(SkSize intrinsicSize);

// First raster size: the renderer's drawable when it has one, otherwise the
// window size that was requested
Viewport startupViewport(Viewport drawable, Viewport windowSize);

enum class ReloadResult {
    Reloaded,      // New document parsed and rasterized
    KeptPrevious,  // Reload failed, previous document still shown
    NotWatched     // Standard input source, nothing to reload
};

class ViewerState {
public:
    // Throws ViewerError; any failure here is a startup failure
    ViewerState(LoadedSource source, Viewport viewport, const ViewerOptions& options, ChangeNotifier notifier);

    ViewerState(const ViewerState&) = delete;
    ViewerState& operator=(const ViewerState&) = delete;

    // Returns true if the buffer was re-rasterized. Throws on allocation or
    // raster failure.
    bool resize(uint32_t width, uint32_t height);

    // Called on the UI thread for every "file changed" event
    ReloadResult handleFileChanged();

    const RasterSurface& surface() const { return surface_; }
    const SvgDocument& document() const { return document_; }
    Viewport viewport() const { return viewport_; }

    bool isFileBacked() const { return std::holds_alternative<FileBacked>(source_); }
    // Null for standard input
    const FileWatchBridge* watch() const;

    uint64_t rasterizeCount() const { return rasterizeCount_; }

private:
    struct FileBacked {
        std::string path;
        std::unique_ptr<FileWatchBridge> watch;
    };
    struct StdinBacked {};
    using Source = std::variant<FileBacked, StdinBacked>;

    static Source makeSource(const SourceOrigin& origin);
    void rasterize();

    Source source_;
    SvgDocument document_;
    Viewport viewport_;
    RasterSurface surface_;
    ReloadErrorPolicy reloadErrorPolicy_;
    uint64_t rasterizeCount_ = 0;
};

}  // namespace svgview

#endif  // SVGVIEW_VIEWER_STATE_H
