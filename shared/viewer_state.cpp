// viewer_state.cpp - Application state of the viewer

#include "viewer_state.h"

#include "viewer_error.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace svgview {

Viewport initialWindowSize(SkSize intrinsicSize) {
    float width = intrinsicSize.width() > 0 ? intrinsicSize.width() : SvgDocument::DEFAULT_WIDTH;
    float height = intrinsicSize.height() > 0 ? intrinsicSize.height() : SvgDocument::DEFAULT_HEIGHT;

    float largest = std::max(width, height);
    if (largest > MAX_INITIAL_WINDOW_SIZE) {
        float scale = MAX_INITIAL_WINDOW_SIZE / largest;
        width *= scale;
        height *= scale;
    }
    return Viewport{static_cast<uint32_t>(std::max(1.0f, std::round(width))),
                    static_cast<uint32_t>(std::max(1.0f, std::round(height)))};
}

Viewport startupViewport(Viewport drawable, Viewport windowSize) {
    if (!drawable.empty()) {
        return drawable;
    }
    std::cerr << "[Viewer] Warning: window has no drawable area yet, rendering at " << windowSize.width << "x"
              << windowSize.height << std::endl;
    return windowSize;
}

ViewerState::Source ViewerState::makeSource(const SourceOrigin& origin) {
    if (const auto* file = std::get_if<FileOrigin>(&origin)) {
        return FileBacked{file->path, nullptr};
    }
    return StdinBacked{};
}

ViewerState::ViewerState(LoadedSource source, Viewport viewport, const ViewerOptions& options,
                         ChangeNotifier notifier)
    : source_(makeSource(source.origin)),
      document_(std::move(source.document)),
      viewport_(viewport),
      surface_(RasterSurface::allocate(viewport.width, viewport.height)),
      reloadErrorPolicy_(options.reloadErrorPolicy) {
    rasterize();

    // Watch only after the first frame exists, so a write racing startup
    // still finds a complete state to reload into
    if (auto* file = std::get_if<FileBacked>(&source_)) {
        file->watch = std::make_unique<FileWatchBridge>(file->path, std::move(notifier), options.debounce);
    } else {
        std::cout << "[Viewer] Reading from standard input, file watching disabled" << std::endl;
    }
}

const FileWatchBridge* ViewerState::watch() const {
    if (const auto* file = std::get_if<FileBacked>(&source_)) {
        return file->watch.get();
    }
    return nullptr;
}

void ViewerState::rasterize() {
    surface_.rasterize(document_, viewport_.width, viewport_.height);
    ++rasterizeCount_;
}

bool ViewerState::resize(uint32_t width, uint32_t height) {
    Viewport requested{width, height};
    if (requested == viewport_) {
        return false;
    }

    // Allocate first: if it throws, viewport and surface still agree
    RasterSurface surface = RasterSurface::allocate(width, height);
    surface_ = std::move(surface);
    viewport_ = requested;
    rasterize();
    return true;
}

ReloadResult ViewerState::handleFileChanged() {
    auto* file = std::get_if<FileBacked>(&source_);
    if (!file) {
        return ReloadResult::NotWatched;
    }

    try {
        // Parse fully before touching document_: the swap is all-or-nothing
        SvgDocument reloaded = reloadDocument(file->path, document_);
        document_ = std::move(reloaded);
    } catch (const ViewerError& e) {
        if (reloadErrorPolicy_ == ReloadErrorPolicy::Abort) {
            throw;
        }
        std::cerr << "[Viewer] Warning: reload of " << file->path << " failed (" << errorKindName(e.kind())
                  << ": " << e.what() << "), keeping previous document" << std::endl;
        return ReloadResult::KeptPrevious;
    }

    rasterize();
    std::cout << "[Viewer] Reloaded " << file->path << std::endl;
    return ReloadResult::Reloaded;
}

}  // namespace svgview
