// svgview_main.cpp - Minimal SVG viewer with live reload
// Usage: svgview [OPTIONS] [input.svg | -]
//
// SDL2 owns the window and presentation; Skia (via the svgview core) parses
// and rasterizes. The UI thread blocks in SDL_WaitEvent. A background inotify
// thread wakes it with a registered SDL user event when the file is written.

#include <SDL.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <utility>

#include "../shared/svg_document.h"
#include "../shared/version.h"
#include "../shared/viewer_config.h"
#include "../shared/viewer_error.h"
#include "../shared/viewer_state.h"

using namespace svgview;

namespace {

static constexpr const char* WINDOW_TITLE = "svgview";

// =============================================================================
// SDL resource ownership
// =============================================================================

struct SdlSession {
    ~SdlSession() { SDL_Quit(); }
};

struct WindowDeleter {
    void operator()(SDL_Window* window) const { SDL_DestroyWindow(window); }
};
struct RendererDeleter {
    void operator()(SDL_Renderer* renderer) const { SDL_DestroyRenderer(renderer); }
};
struct TextureDeleter {
    void operator()(SDL_Texture* texture) const { SDL_DestroyTexture(texture); }
};

using WindowPtr = std::unique_ptr<SDL_Window, WindowDeleter>;
using RendererPtr = std::unique_ptr<SDL_Renderer, RendererDeleter>;
using TexturePtr = std::unique_ptr<SDL_Texture, TextureDeleter>;

// =============================================================================
// Presentation
// =============================================================================

// Streaming texture matching the raster surface's RGBA byte order.
// Pixels are premultiplied, so blend with ONE / ONE_MINUS_SRC_ALPHA.
TexturePtr createTexture(SDL_Renderer* renderer, const RasterSurface& surface) {
    TexturePtr texture(SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                         static_cast<int>(surface.width()), static_cast<int>(surface.height())));
    if (!texture) {
        throw ViewerError(ErrorKind::Allocation, std::string("Texture creation failed: ") + SDL_GetError());
    }

    SDL_BlendMode premultiplied =
        SDL_ComposeCustomBlendMode(SDL_BLENDFACTOR_ONE, SDL_BLENDFACTOR_ONE_MINUS_SRC_ALPHA, SDL_BLENDOPERATION_ADD,
                                   SDL_BLENDFACTOR_ONE, SDL_BLENDFACTOR_ONE_MINUS_SRC_ALPHA, SDL_BLENDOPERATION_ADD);
    if (SDL_SetTextureBlendMode(texture.get(), premultiplied) < 0) {
        std::cerr << "[Viewer] Warning: premultiplied blending unsupported (" << SDL_GetError()
                  << "), edges may look darker" << std::endl;
        SDL_SetTextureBlendMode(texture.get(), SDL_BLENDMODE_BLEND);
    }
    return texture;
}

// Upload the raster buffer and present it over a white background.
// Returns false on any SDL failure.
bool present(SDL_Renderer* renderer, SDL_Texture* texture, const RasterSurface& surface) {
    if (SDL_UpdateTexture(texture, nullptr, surface.data(), static_cast<int>(surface.rowBytes())) < 0) {
        std::cerr << "[Viewer] Rendering failed: SDL_UpdateTexture: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
    if (SDL_RenderClear(renderer) < 0 || SDL_RenderCopy(renderer, texture, nullptr, nullptr) < 0) {
        std::cerr << "[Viewer] Rendering failed: " << SDL_GetError() << std::endl;
        return false;
    }
    SDL_RenderPresent(renderer);
    return true;
}

// Renderer output size in real pixels (HiDPI aware). Returns false on SDL
// failure; the result may be empty while the window is minimized.
bool queryRendererSize(SDL_Renderer* renderer, Viewport& size) {
    int width = 0;
    int height = 0;
    if (SDL_GetRendererOutputSize(renderer, &width, &height) < 0) {
        std::cerr << "[Viewer] Rendering failed: cannot query renderer size: " << SDL_GetError() << std::endl;
        return false;
    }
    size = Viewport{static_cast<uint32_t>(width > 0 ? width : 0), static_cast<uint32_t>(height > 0 ? height : 0)};
    return true;
}

// =============================================================================
// Viewer
// =============================================================================

int runViewer(const ViewerOptions& options) {
    LoadedSource source = options.inputPath ? loadFromFile(*options.inputPath) : loadFromStdin();
    SkSize svgSize = source.document.intrinsicSize();
    std::cout << "SVG dimensions: " << svgSize.width() << "x" << svgSize.height() << std::endl;

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        throw ViewerError(ErrorKind::Present, std::string("SDL init failed: ") + SDL_GetError());
    }
    SdlSession session;

    // Wake-up event injected by the watch thread
    Uint32 fileChangedEvent = SDL_RegisterEvents(1);
    if (fileChangedEvent == static_cast<Uint32>(-1)) {
        throw ViewerError(ErrorKind::Watch, "No SDL user events left for file notifications");
    }

    Viewport windowSize = initialWindowSize(svgSize);
    WindowPtr window(SDL_CreateWindow(WINDOW_TITLE, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                      static_cast<int>(windowSize.width), static_cast<int>(windowSize.height),
                                      SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI));
    if (!window) {
        throw ViewerError(ErrorKind::Present, std::string("Window creation failed: ") + SDL_GetError());
    }

    RendererPtr renderer(SDL_CreateRenderer(window.get(), -1, SDL_RENDERER_ACCELERATED));
    if (!renderer) {
        std::cerr << "[Viewer] Accelerated renderer unavailable (" << SDL_GetError() << "), using software"
                  << std::endl;
        renderer.reset(SDL_CreateRenderer(window.get(), -1, SDL_RENDERER_SOFTWARE));
    }
    if (!renderer) {
        throw ViewerError(ErrorKind::Present, std::string("Renderer creation failed: ") + SDL_GetError());
    }

    // Runs on the watch thread: SDL_PushEvent is thread-safe
    ChangeNotifier notifier = [fileChangedEvent]() {
        SDL_Event event;
        SDL_zero(event);
        event.type = fileChangedEvent;
        if (SDL_PushEvent(&event) != 1) {
            std::cerr << "[Viewer] Warning: could not queue file change event: " << SDL_GetError() << std::endl;
            return false;
        }
        return true;
    };

    Viewport drawable;
    if (!queryRendererSize(renderer.get(), drawable)) {
        drawable = Viewport{};
    }
    ViewerState state(std::move(source), startupViewport(drawable, windowSize), options, notifier);
    TexturePtr texture = createTexture(renderer.get(), state.surface());

    std::cout << "Render size: " << state.viewport().width << "x" << state.viewport().height << std::endl;
    std::cout << "Reload on error: " << reloadErrorPolicyName(options.reloadErrorPolicy) << std::endl;
    std::cout << "\nControls:\n  ESC - Quit" << std::endl;

    bool running = true;
    bool redrawPending = true;
    SDL_Event event;

    while (running) {
        if (redrawPending) {
            if (!present(renderer.get(), texture.get(), state.surface())) {
                break;  // PresentError: orderly exit
            }
            redrawPending = false;
        }

        if (SDL_WaitEvent(&event) == 0) {
            std::cerr << "[Viewer] Event wait failed: " << SDL_GetError() << std::endl;
            break;
        }

        // Handle everything already queued before presenting again
        do {
            if (event.type == SDL_QUIT) {
                running = false;
            } else if (event.type == SDL_KEYDOWN) {
                if (event.key.keysym.sym == SDLK_ESCAPE) {
                    running = false;
                }
            } else if (event.type == SDL_WINDOWEVENT) {
                if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED ||
                    event.window.event == SDL_WINDOWEVENT_RESIZED) {
                    Viewport size;
                    if (!queryRendererSize(renderer.get(), size)) {
                        running = false;  // PresentError: orderly exit
                        break;
                    }
                    // Minimized windows report an empty drawable; nothing to show
                    if (!size.empty() && state.resize(size.width, size.height)) {
                        texture = createTexture(renderer.get(), state.surface());
                    }
                    redrawPending = true;
                } else if (event.window.event == SDL_WINDOWEVENT_EXPOSED) {
                    redrawPending = true;
                }
            } else if (event.type == fileChangedEvent) {
                if (state.handleFileChanged() == ReloadResult::Reloaded) {
                    redrawPending = true;
                }
            }
        } while (running && SDL_PollEvent(&event));
    }

    std::cout << "Exiting" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    CommandLine cli = parseCommandLine(argc, argv);
    switch (cli.action) {
        case CliAction::Help:
            printHelp(std::cerr, argv[0]);
            return 0;
        case CliAction::Version:
            std::cerr << SVGViewVersion::getVersionBanner() << std::endl;
            std::cerr << "Build: " << SVGVIEW_BUILD_INFO << std::endl;
            return 0;
        case CliAction::Usage:
            printUsage(std::cout);
            return 0;
        case CliAction::Invalid:
            std::cerr << cli.error << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
            return 1;
        case CliAction::Run:
            break;
    }

    std::cerr << SVGViewVersion::getStartupBanner() << std::endl;

    try {
        return runViewer(cli.options);
    } catch (const ViewerError& e) {
        std::cerr << "Error: " << errorKindName(e.kind()) << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return 1;
}
