// viewer_error.h - Error kinds reported by the svgview core
//
// Fatal failures are thrown as ViewerError. Expected outcomes (a resize that
// changes nothing, a reload that kept the previous document) are returned
// as values instead.

#ifndef SVGVIEW_VIEWER_ERROR_H
#define SVGVIEW_VIEWER_ERROR_H

#include <stdexcept>
#include <string>

namespace svgview {

enum class ErrorKind {
    Usage,       // Bad command line
    IO,          // Cannot open/read file or stdin
    Parse,       // Not a well-formed SVG
    Allocation,  // Pixel buffer cannot be sized
    Rasterize,   // Skia could not render into the buffer
    Watch,       // inotify watch could not be established
    Present      // SDL upload/present failed
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Usage:
            return "UsageError";
        case ErrorKind::IO:
            return "IOError";
        case ErrorKind::Parse:
            return "ParseError";
        case ErrorKind::Allocation:
            return "AllocationError";
        case ErrorKind::Rasterize:
            return "RasterizeError";
        case ErrorKind::Watch:
            return "WatchError";
        case ErrorKind::Present:
            return "PresentError";
    }
    return "Error";
}

class ViewerError : public std::runtime_error {
public:
    ViewerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace svgview

#endif  // SVGVIEW_VIEWER_ERROR_H
