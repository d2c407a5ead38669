// test_viewer_state.cpp - Application state tests for svgview
//
// Drives ViewerState the way the SDL loop does, without a window: the
// notifier counts signals and the test thread plays the UI thread.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../shared/svg_document.h"
#include "../shared/viewer_config.h"
#include "../shared/viewer_error.h"
#include "../shared/viewer_state.h"
#include "test_framework.h"

using namespace svgview;

static const char* RED_SVG = R"(<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100" viewBox="0 0 100 100">
  <rect width="100" height="100" fill="#ff0000"/>
</svg>
)";

static const char* BLUE_SVG = R"(<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100" viewBox="0 0 100 100">
  <rect width="100" height="100" fill="#0000ff"/>
</svg>
)";

static const char* BROKEN_SVG = R"(<svg xmlns="http://www.w3.org/2000/svg" viewBox="0 0 100 100"><rect width=)";

struct SignalCounter {
    std::atomic<int> signals{0};

    ChangeNotifier make() {
        return [this]() {
            signals.fetch_add(1);
            return true;
        };
    }
};

static ViewerOptions optionsWithPolicy(ReloadErrorPolicy policy) {
    ViewerOptions options;
    options.reloadErrorPolicy = policy;
    return options;
}

// =============================================================================
// Initial window size
// =============================================================================

TEST(initial_window_size_clamps) {
    ASSERT_TRUE(initialWindowSize(SkSize::Make(100, 100)) == (Viewport{100, 100}));
    ASSERT_TRUE(initialWindowSize(SkSize::Make(1200, 1200)) == (Viewport{1200, 1200}));
    ASSERT_TRUE(initialWindowSize(SkSize::Make(2400, 1200)) == (Viewport{1200, 600}));
    ASSERT_TRUE(initialWindowSize(SkSize::Make(1200, 3000)) == (Viewport{480, 1200}));
    ASSERT_TRUE(initialWindowSize(SkSize::Make(0.2f, 0.2f)) == (Viewport{1, 1}));
    ASSERT_TRUE(initialWindowSize(SkSize::Make(0, 0)) == (Viewport{800, 600}));
}

TEST(empty_drawable_uses_window_size) {
    ASSERT_TRUE((Viewport{0, 480}).empty());
    ASSERT_TRUE((Viewport{640, 0}).empty());
    ASSERT_TRUE(Viewport{}.empty());
    ASSERT_FALSE((Viewport{1, 1}).empty());

    Viewport windowSize{640, 480};
    ASSERT_TRUE(startupViewport(Viewport{1280, 960}, windowSize) == (Viewport{1280, 960}));
    ASSERT_TRUE(startupViewport(Viewport{0, 960}, windowSize) == windowSize);
    ASSERT_TRUE(startupViewport(Viewport{}, windowSize) == windowSize);
}

TEST(minimized_startup_still_rasterizes) {
    std::istringstream in(RED_SVG);
    SignalCounter counter;
    Viewport windowSize = initialWindowSize(SkSize::Make(100, 100));
    ViewerState state(loadFromStream(in), startupViewport(Viewport{0, 0}, windowSize), ViewerOptions(),
                      counter.make());

    ASSERT_TRUE(state.viewport() == windowSize);
    ASSERT_EQ(state.rasterizeCount(), 1u);
}

// =============================================================================
// Startup and resize
// =============================================================================

TEST(startup_rasterizes_once) {
    TempDir dir("svgview_state_start");
    std::string path = dir.file("drawing.svg");
    writeFile(path, RED_SVG);

    SignalCounter counter;
    ViewerState state(loadFromFile(path), Viewport{200, 200}, ViewerOptions(), counter.make());

    ASSERT_EQ(state.rasterizeCount(), 1u);
    ASSERT_TRUE(state.viewport() == (Viewport{200, 200}));
    ASSERT_EQ(state.surface().width(), 200u);
    ASSERT_EQ(state.surface().height(), 200u);
    ASSERT_EQ(state.surface().byteSize(), size_t(200 * 200 * 4));
    ASSERT_TRUE(state.isFileBacked());
    ASSERT_NOT_NULL(state.watch());
    ASSERT_TRUE(state.watch()->isRunning());
}

TEST(resize_same_size_is_noop) {
    std::istringstream in(RED_SVG);
    SignalCounter counter;
    ViewerState state(loadFromStream(in), Viewport{64, 64}, ViewerOptions(), counter.make());

    ASSERT_FALSE(state.resize(64, 64));
    ASSERT_EQ(state.rasterizeCount(), 1u);
}

TEST(resize_reallocates_and_rasterizes) {
    std::istringstream in(RED_SVG);
    SignalCounter counter;
    ViewerState state(loadFromStream(in), Viewport{64, 64}, ViewerOptions(), counter.make());

    std::vector<Viewport> sizes = {{120, 80}, {1, 1}, {800, 600}, {33, 17}};
    uint64_t expectedCount = 1;
    for (const Viewport& size : sizes) {
        ASSERT_TRUE(state.resize(size.width, size.height));
        expectedCount++;
        ASSERT_EQ(state.rasterizeCount(), expectedCount);
        ASSERT_TRUE(state.viewport() == size);
        ASSERT_EQ(state.surface().byteSize(), size_t(size.width) * size.height * 4);
        // Stretched, so the last pixel is still covered
        ASSERT_EQ(state.surface().pixelAt(size.width - 1, size.height - 1)[3], 0xff);
    }
}

TEST(resize_to_zero_keeps_previous_surface) {
    std::istringstream in(RED_SVG);
    SignalCounter counter;
    ViewerState state(loadFromStream(in), Viewport{50, 40}, ViewerOptions(), counter.make());

    ASSERT_THROWS_KIND(state.resize(0, 40), ErrorKind::Allocation);
    ASSERT_TRUE(state.viewport() == (Viewport{50, 40}));
    ASSERT_EQ(state.surface().byteSize(), size_t(50 * 40 * 4));
}

// =============================================================================
// Reload
// =============================================================================

TEST(file_change_reloads_document) {
    TempDir dir("svgview_state_reload");
    std::string path = dir.file("drawing.svg");
    writeFile(path, RED_SVG);

    SignalCounter counter;
    ViewerState state(loadFromFile(path), Viewport{40, 40}, ViewerOptions(), counter.make());
    auto before = state.surface().pixelAt(20, 20);
    ASSERT_EQ(before[0], 0xff);
    ASSERT_EQ(before[2], 0x00);

    writeFile(path, BLUE_SVG);
    ASSERT_TRUE(waitFor([&]() { return counter.signals.load() >= 1; }));

    ASSERT_TRUE(state.handleFileChanged() == ReloadResult::Reloaded);
    ASSERT_EQ(state.rasterizeCount(), 2u);

    auto after = state.surface().pixelAt(20, 20);
    ASSERT_EQ(after[0], 0x00);
    ASSERT_EQ(after[2], 0xff);
    ASSERT_EQ(after[3], 0xff);
    ASSERT_TRUE(state.viewport() == (Viewport{40, 40}));
}

TEST(reload_keeps_parse_options) {
    TempDir dir("svgview_state_options");
    std::string path = dir.file("drawing.svg");
    writeFile(path, RED_SVG);

    SignalCounter counter;
    ViewerState state(loadFromFile(path), Viewport{10, 10}, ViewerOptions(), counter.make());
    auto options = state.document().options();

    writeFile(path, BLUE_SVG);
    ASSERT_TRUE(state.handleFileChanged() == ReloadResult::Reloaded);
    ASSERT_TRUE(state.document().options() == options);
}

TEST(broken_reload_keeps_last_good) {
    TempDir dir("svgview_state_keep");
    std::string path = dir.file("drawing.svg");
    writeFile(path, RED_SVG);

    SignalCounter counter;
    ViewerState state(loadFromFile(path), Viewport{30, 30}, optionsWithPolicy(ReloadErrorPolicy::KeepLastGood),
                      counter.make());
    std::vector<uint8_t> before = state.surface().pixels();
    const SkSVGDOM* domBefore = state.document().dom();

    writeFile(path, BROKEN_SVG);
    ASSERT_TRUE(state.handleFileChanged() == ReloadResult::KeptPrevious);
    ASSERT_EQ(state.rasterizeCount(), 1u);
    ASSERT_TRUE(state.surface().pixels() == before);
    ASSERT_TRUE(state.document().dom() == domBefore);

    // A later good write recovers
    writeFile(path, BLUE_SVG);
    ASSERT_TRUE(state.handleFileChanged() == ReloadResult::Reloaded);
    ASSERT_EQ(state.surface().pixelAt(15, 15)[2], 0xff);
}

TEST(broken_reload_aborts_when_configured) {
    TempDir dir("svgview_state_abort");
    std::string path = dir.file("drawing.svg");
    writeFile(path, RED_SVG);

    SignalCounter counter;
    ViewerState state(loadFromFile(path), Viewport{30, 30}, optionsWithPolicy(ReloadErrorPolicy::Abort),
                      counter.make());

    writeFile(path, BROKEN_SVG);
    ASSERT_THROWS_KIND(state.handleFileChanged(), ErrorKind::Parse);
}

TEST(stdin_source_is_never_watched) {
    std::istringstream in(RED_SVG);
    SignalCounter counter;
    ViewerState state(loadFromStream(in), Viewport{20, 20}, ViewerOptions(), counter.make());

    ASSERT_FALSE(state.isFileBacked());
    ASSERT_NULL(state.watch());
    ASSERT_TRUE(state.handleFileChanged() == ReloadResult::NotWatched);
    ASSERT_EQ(state.rasterizeCount(), 1u);
    ASSERT_EQ(counter.signals.load(), 0);
}

TEST(debounce_option_reaches_watch) {
    TempDir dir("svgview_state_debounce");
    std::string path = dir.file("drawing.svg");
    writeFile(path, RED_SVG);

    ViewerOptions options;
    options.debounce = std::chrono::milliseconds(200);
    SignalCounter counter;
    ViewerState state(loadFromFile(path), Viewport{10, 10}, options, counter.make());

    writeFile(path, BLUE_SVG);
    writeFile(path, RED_SVG);
    writeFile(path, BLUE_SVG);
    ASSERT_TRUE(waitFor([&]() { return counter.signals.load() >= 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    ASSERT_EQ(counter.signals.load(), 1);

    ASSERT_TRUE(state.handleFileChanged() == ReloadResult::Reloaded);
    ASSERT_EQ(state.surface().pixelAt(5, 5)[2], 0xff);
}

int main() {
    return runTests("Viewer State Tests");
}
