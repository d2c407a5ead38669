// svg_document.cpp - SVG loading and parsing for svgview

#include "svg_document.h"

#include "platform.h"
#include "viewer_error.h"

#include "include/core/SkStream.h"
#include "include/core/SkString.h"
#include "modules/svg/include/SkSVGDOM.h"
#include "modules/svg/include/SkSVGRenderContext.h"
#include "modules/svg/include/SkSVGSVG.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace svgview {

namespace fs = std::filesystem;

// =============================================================================
// Parser configuration
// =============================================================================

std::shared_ptr<const ParseOptions> ParseOptions::forFile(const std::string& resourcesDir) {
    auto options = std::make_shared<ParseOptions>();
    options->resourcesDir = resourcesDir;
    options->fontMgr = createPlatformFontMgr();
    options->shaperFactory = createTextShapingFactory();
    // Relative hrefs (linked images) resolve against the document's directory;
    // data: URIs are decoded by the proxy
    options->resourceProvider = skresources::DataURIResourceProviderProxy::Make(
        skresources::FileResourceProvider::Make(SkString(resourcesDir.c_str())));
    return options;
}

std::shared_ptr<const ParseOptions> ParseOptions::forStdin() {
    auto options = std::make_shared<ParseOptions>();
    options->fontMgr = createPlatformFontMgr();
    options->shaperFactory = createTextShapingFactory();
    // No base directory: only embedded data: URIs can be resolved
    options->resourceProvider = skresources::DataURIResourceProviderProxy::Make(nullptr);
    return options;
}

// =============================================================================
// Parsing
// =============================================================================

bool validateSVGContent(const std::string& content) {
    if (content.length() < 20) {
        return false;
    }
    return content.find("<svg") != std::string::npos || content.find("<SVG") != std::string::npos;
}

namespace {

// viewBox size if present, explicit absolute width/height override it.
// Units are resolved to pixels with the same length context the DOM renders
// with, so a "210mm" wide root fills the container it is given.
SkSize resolveIntrinsicSize(const SkSVGSVG& root) {
    SkSize size = SkSize::Make(SvgDocument::DEFAULT_WIDTH, SvgDocument::DEFAULT_HEIGHT);

    if (const auto& viewBox = root.getViewBox()) {
        if (viewBox->width() > 0 && viewBox->height() > 0) {
            size = SkSize::Make(viewBox->width(), viewBox->height());
        }
    }

    // Percentages give no intrinsic size; em/ex use the default font size
    SkSVGLengthContext lengthContext(SkSize::Make(SvgDocument::DEFAULT_WIDTH, SvgDocument::DEFAULT_HEIGHT));
    const SkSVGLength& width = root.getWidth();
    const SkSVGLength& height = root.getHeight();
    if (width.unit() != SkSVGLength::Unit::kPercentage) {
        SkScalar px = lengthContext.resolve(width, SkSVGLengthContext::LengthType::kHorizontal);
        if (px > 0) size.fWidth = px;
    }
    if (height.unit() != SkSVGLength::Unit::kPercentage) {
        SkScalar px = lengthContext.resolve(height, SkSVGLengthContext::LengthType::kVertical);
        if (px > 0) size.fHeight = px;
    }
    return size;
}

}  // namespace

SvgDocument::SvgDocument(sk_sp<SkSVGDOM> dom, SkSize intrinsicSize, std::shared_ptr<const ParseOptions> options)
    : dom_(std::move(dom)), intrinsicSize_(intrinsicSize), options_(std::move(options)) {}

SvgDocument SvgDocument::parse(const std::string& data, std::shared_ptr<const ParseOptions> options) {
    if (!options) {
        throw ViewerError(ErrorKind::Parse, "No parser configuration supplied");
    }
    if (!validateSVGContent(data)) {
        throw ViewerError(ErrorKind::Parse, "Input does not appear to be an SVG document");
    }

    SkMemoryStream stream(data.data(), data.size(), /*copyData=*/false);

    SkSVGDOM::Builder builder;
    builder.setFontManager(options->fontMgr);
    builder.setTextShapingFactory(options->shaperFactory);
    if (options->resourceProvider) {
        builder.setResourceProvider(options->resourceProvider);
    }

    sk_sp<SkSVGDOM> dom = builder.make(stream);
    if (!dom) {
        throw ViewerError(ErrorKind::Parse, "Failed to parse SVG document");
    }

    SkSVGSVG* root = dom->getRoot();
    if (!root) {
        throw ViewerError(ErrorKind::Parse, "SVG has no root element");
    }

    SkSize size = resolveIntrinsicSize(*root);
    dom->setContainerSize(size);

    return SvgDocument(std::move(dom), size, std::move(options));
}

// =============================================================================
// Sources
// =============================================================================

std::string readSourceFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ViewerError(ErrorKind::IO, "File not found: " + path);
    }

    auto fileSize = fs::file_size(path, ec);
    if (ec) {
        throw ViewerError(ErrorKind::IO, "Cannot stat " + path + ": " + ec.message());
    }
    if (fileSize > MAX_SVG_FILE_SIZE) {
        throw ViewerError(ErrorKind::IO, "File too large (" + std::to_string(fileSize / (1024 * 1024)) +
                                             " MB): " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ViewerError(ErrorKind::IO, "Failed to open: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ViewerError(ErrorKind::IO, "Failed to read: " + path);
    }
    return buffer.str();
}

LoadedSource loadFromFile(const std::string& path) {
    std::error_code ec;
    fs::path canonicalPath = fs::canonical(path, ec);
    if (ec) {
        throw ViewerError(ErrorKind::IO, "Failed to interpret path as file: " + path + " (" + ec.message() + ")");
    }

    std::string content = readSourceFile(canonicalPath.string());
    auto options = ParseOptions::forFile(canonicalPath.parent_path().string());

    std::cout << "[Document] Loaded " << canonicalPath.string() << " (" << content.size() << " bytes)"
              << std::endl;
    return LoadedSource{FileOrigin{canonicalPath.string()}, SvgDocument::parse(content, std::move(options))};
}

LoadedSource loadFromStream(std::istream& in) {
    std::string content;
    char chunk[64 * 1024];
    while (in.read(chunk, sizeof(chunk)) || in.gcount() > 0) {
        content.append(chunk, static_cast<size_t>(in.gcount()));
        if (content.size() > MAX_SVG_FILE_SIZE) {
            throw ViewerError(ErrorKind::IO, "Standard input exceeds the maximum SVG size");
        }
    }
    if (in.bad()) {
        throw ViewerError(ErrorKind::IO, "Failed to read SVG from standard input");
    }

    std::cout << "[Document] Read " << content.size() << " bytes from standard input" << std::endl;
    return LoadedSource{StdinOrigin{}, SvgDocument::parse(content, ParseOptions::forStdin())};
}

LoadedSource loadFromStdin() {
    return loadFromStream(std::cin);
}

SvgDocument reloadDocument(const std::string& path, const SvgDocument& previous) {
    return SvgDocument::parse(readSourceFile(path), previous.options());
}

}  // namespace svgview
