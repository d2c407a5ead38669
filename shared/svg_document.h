// svg_document.h - SVG loading and parsing for svgview
//
// A document is loaded once from a file or from standard input and parsed
// into a Skia SVG DOM. The parser configuration is captured alongside the
// document so that a reload of the same file resolves fonts and linked
// resources exactly as the first load did.

#ifndef SVGVIEW_SVG_DOCUMENT_H
#define SVGVIEW_SVG_DOCUMENT_H

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <variant>

#include "include/core/SkFontMgr.h"
#include "include/core/SkRefCnt.h"
#include "include/core/SkSize.h"
#include "modules/skresources/include/SkResources.h"
#include "modules/skshaper/include/SkShaper_factory.h"

class SkSVGDOM;

namespace svgview {

// Parser configuration shared by the initial load and every reload
struct ParseOptions {
    std::string resourcesDir;  // Base directory for relative hrefs, empty for stdin
    sk_sp<SkFontMgr> fontMgr;
    sk_sp<SkShapers::Factory> shaperFactory;
    sk_sp<skresources::ResourceProvider> resourceProvider;  // data: URIs only when resourcesDir is empty

    static std::shared_ptr<const ParseOptions> forFile(const std::string& resourcesDir);
    static std::shared_ptr<const ParseOptions> forStdin();
};

// Parsed SVG, immutable once constructed
class SvgDocument {
public:
    // Intrinsic size used when the SVG declares neither viewBox nor absolute size
    static constexpr float DEFAULT_WIDTH = 800.0f;
    static constexpr float DEFAULT_HEIGHT = 600.0f;

    // Throws ViewerError(Parse) when data is not a well-formed SVG
    static SvgDocument parse(const std::string& data, std::shared_ptr<const ParseOptions> options);

    SkSVGDOM* dom() const { return dom_.get(); }
    SkSize intrinsicSize() const { return intrinsicSize_; }
    const std::shared_ptr<const ParseOptions>& options() const { return options_; }

private:
    SvgDocument(sk_sp<SkSVGDOM> dom, SkSize intrinsicSize, std::shared_ptr<const ParseOptions> options);

    sk_sp<SkSVGDOM> dom_;
    SkSize intrinsicSize_;
    std::shared_ptr<const ParseOptions> options_;
};

// Where the document came from. Only a file origin can ever be watched.
struct FileOrigin {
    std::string path;  // Canonical absolute path
};
struct StdinOrigin {};
using SourceOrigin = std::variant<FileOrigin, StdinOrigin>;

struct LoadedSource {
    SourceOrigin origin;
    SvgDocument document;
};

// Maximum accepted SVG size (files and stdin)
static constexpr size_t MAX_SVG_FILE_SIZE = 256 * 1024 * 1024;

// Throw ViewerError(IO) or ViewerError(Parse)
LoadedSource loadFromFile(const std::string& path);
LoadedSource loadFromStdin();
LoadedSource loadFromStream(std::istream& in);

// Read a whole SVG file, throws ViewerError(IO)
std::string readSourceFile(const std::string& path);

// Re-read path and parse it with the options captured by previous
SvgDocument reloadDocument(const std::string& path, const SvgDocument& previous);

// Basic structural check performed before handing bytes to Skia
bool validateSVGContent(const std::string& content);

}  // namespace svgview

#endif  // SVGVIEW_SVG_DOCUMENT_H
