// file_watch_bridge.cpp - Background inotify watcher feeding the UI event loop

#include "file_watch_bridge.h"

#include "viewer_error.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

// Uncomment to trace every inotify event
// #define SVGVIEW_WATCH_DEBUG 1

namespace svgview {

FileWatchBridge::FileWatchBridge(std::string path, ChangeNotifier notifier, std::chrono::milliseconds coalesceWindow)
    : path_(std::move(path)), notifier_(std::move(notifier)), coalesceWindow_(coalesceWindow) {
    if (!notifier_) {
        throw ViewerError(ErrorKind::Watch, "No change notifier supplied for " + path_);
    }
    if (coalesceWindow_.count() < 0) {
        coalesceWindow_ = std::chrono::milliseconds(0);
    }

    inotifyFd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0) {
        throw ViewerError(ErrorKind::Watch, std::string("Could not create filesystem watcher: ") + strerror(errno));
    }

    // Only completed writes produce signals; *_SELF events end the watch
    watchDescriptor_ = inotify_add_watch(inotifyFd_, path_.c_str(), IN_CLOSE_WRITE | IN_DELETE_SELF | IN_MOVE_SELF);
    if (watchDescriptor_ < 0) {
        int err = errno;
        closeDescriptors();
        throw ViewerError(ErrorKind::Watch, "Could not start filesystem watcher on " + path_ + ": " + strerror(err));
    }

    cancelFd_ = eventfd(0, EFD_CLOEXEC);
    if (cancelFd_ < 0) {
        int err = errno;
        closeDescriptors();
        throw ViewerError(ErrorKind::Watch, std::string("Could not create watcher cancel channel: ") + strerror(err));
    }

    running_.store(true);
    thread_ = std::thread(&FileWatchBridge::watchThread, this);

    std::cout << "[FileWatch] Watching " << path_;
    if (coalesceWindow_.count() > 0) {
        std::cout << " (coalescing writes within " << coalesceWindow_.count() << " ms)";
    }
    std::cout << std::endl;
}

FileWatchBridge::~FileWatchBridge() {
    stop();
}

void FileWatchBridge::stop() {
    if (thread_.joinable()) {
        uint64_t one = 1;
        if (write(cancelFd_, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
            std::cerr << "[FileWatch] Warning: could not signal watch thread: " << strerror(errno) << std::endl;
        }
        thread_.join();
    }
    running_.store(false);
    closeDescriptors();
}

void FileWatchBridge::closeDescriptors() {
    if (inotifyFd_ >= 0) {
        if (watchDescriptor_ >= 0) {
            inotify_rm_watch(inotifyFd_, watchDescriptor_);
        }
        close(inotifyFd_);
    }
    if (cancelFd_ >= 0) {
        close(cancelFd_);
    }
    inotifyFd_ = -1;
    watchDescriptor_ = -1;
    cancelFd_ = -1;
}

void FileWatchBridge::deliver() {
    bool delivered = false;
    try {
        delivered = notifier_();
    } catch (const std::exception& e) {
        std::cerr << "[FileWatch] Warning: change notifier threw: " << e.what() << std::endl;
    }

    if (delivered) {
        signalsDelivered_.fetch_add(1);
#ifdef SVGVIEW_WATCH_DEBUG
        std::cout << "[FileWatch] Signal delivered (" << signalsDelivered_.load() << " total)" << std::endl;
#endif
    } else {
        std::cerr << "[FileWatch] Warning: failed to notify UI of file write to " << path_ << std::endl;
    }
}

void FileWatchBridge::watchThread() {
    using Clock = std::chrono::steady_clock;

    bool pending = false;  // A write seen inside the current coalescing window
    Clock::time_point deadline;

    alignas(struct inotify_event) char buffer[4096];

    while (true) {
        int timeoutMs = -1;
        if (pending) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            timeoutMs = remaining > 0 ? static_cast<int>(remaining) : 0;
        }

        struct pollfd fds[2];
        fds[0] = {inotifyFd_, POLLIN, 0};
        fds[1] = {cancelFd_, POLLIN, 0};

        int ready = poll(fds, 2, timeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[FileWatch] Warning: watch error on " << path_ << ": " << strerror(errno)
                      << " - no further reloads" << std::endl;
            break;
        }

        if (fds[1].revents & POLLIN) {
            break;  // stop() requested
        }

        if (ready == 0) {
            // Coalescing window elapsed
            pending = false;
            deliver();
            continue;
        }

        if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            std::cerr << "[FileWatch] Warning: watch channel for " << path_ << " failed - no further reloads"
                      << std::endl;
            break;
        }
        if (!(fds[0].revents & POLLIN)) continue;

        ssize_t length = read(inotifyFd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::cerr << "[FileWatch] Warning: watch read failed on " << path_ << ": " << strerror(errno)
                      << " - no further reloads" << std::endl;
            break;
        }

        bool watchLost = false;
        for (char* ptr = buffer; ptr < buffer + length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

#ifdef SVGVIEW_WATCH_DEBUG
            std::cout << "[FileWatch] Event mask=0x" << std::hex << event->mask << std::dec << std::endl;
#endif
            if (event->mask & IN_CLOSE_WRITE) {
                if (coalesceWindow_.count() == 0) {
                    deliver();
                } else if (!pending) {
                    pending = true;
                    deadline = Clock::now() + coalesceWindow_;
                }
            }
            // File deleted, its filesystem unmounted, or the file moved away
            // from the path reloads read
            if (event->mask & (IN_IGNORED | IN_UNMOUNT | IN_MOVE_SELF)) {
                watchLost = true;
            }
        }

        if (watchLost) {
            if (pending) {
                pending = false;
                deliver();
            }
            std::cerr << "[FileWatch] Warning: watched file " << path_
                      << " was moved or removed - no further reloads" << std::endl;
            break;
        }
    }

    running_.store(false);
}

}  // namespace svgview
