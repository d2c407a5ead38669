// file_watch_bridge.h - Background inotify watcher feeding the UI event loop
//
// A dedicated thread blocks on an inotify descriptor for one file and calls
// the notifier once per completed write (IN_CLOSE_WRITE). The notifier runs on
// the watch thread and must only enqueue a wake-up for the UI thread (in the
// viewer: SDL_PushEvent of a registered user event). The watch thread never
// touches the document or the pixel buffer. Renaming, deleting or unmounting
// the file ends the watch; attribute changes are ignored.
//
// Lifetime: the bridge owns the descriptors and the thread. stop() (also run
// by the destructor) wakes the thread through an eventfd and joins it.

#ifndef SVGVIEW_FILE_WATCH_BRIDGE_H
#define SVGVIEW_FILE_WATCH_BRIDGE_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace svgview {

// Returns false if the wake-up could not be delivered (UI loop gone)
using ChangeNotifier = std::function<bool()>;

class FileWatchBridge {
public:
    // coalesceWindow == 0 delivers one signal per write. A positive window
    // turns every burst starting with a write into one signal sent when the
    // window, measured from the first write, has elapsed.
    // Throws ViewerError(Watch) if the watch cannot be established.
    FileWatchBridge(std::string path, ChangeNotifier notifier,
                    std::chrono::milliseconds coalesceWindow = std::chrono::milliseconds(0));
    ~FileWatchBridge();

    // Non-copyable, non-movable (owns thread)
    FileWatchBridge(const FileWatchBridge&) = delete;
    FileWatchBridge& operator=(const FileWatchBridge&) = delete;

    // Cancel and join the watch thread; safe to call more than once
    void stop();

    // False once stopped or after the watch died (degraded mode)
    bool isRunning() const { return running_.load(); }

    const std::string& path() const { return path_; }
    uint64_t signalsDelivered() const { return signalsDelivered_.load(); }

private:
    void watchThread();
    void deliver();
    void closeDescriptors();

    std::string path_;
    ChangeNotifier notifier_;
    std::chrono::milliseconds coalesceWindow_;

    int inotifyFd_ = -1;
    int watchDescriptor_ = -1;
    int cancelFd_ = -1;  // eventfd written by stop()

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> signalsDelivered_{0};
};

}  // namespace svgview

#endif  // SVGVIEW_FILE_WATCH_BRIDGE_H
