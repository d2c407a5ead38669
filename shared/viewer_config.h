// viewer_config.h - Command-line configuration for svgview
//
// Usage: svgview [OPTIONS] [path|-]
// No positional argument, or "-", reads the SVG from standard input.

#ifndef SVGVIEW_VIEWER_CONFIG_H
#define SVGVIEW_VIEWER_CONFIG_H

#include <chrono>
#include <optional>
#include <ostream>
#include <string>

namespace svgview {

// What to do when a reload finds a broken file
enum class ReloadErrorPolicy {
    KeepLastGood,  // Warn and keep showing the previous document
    Abort          // Treat as fatal
};

const char* reloadErrorPolicyName(ReloadErrorPolicy policy);

struct ViewerOptions {
    std::optional<std::string> inputPath;  // Empty means standard input
    std::chrono::milliseconds debounce{0};  // 0 disables write coalescing
    ReloadErrorPolicy reloadErrorPolicy = ReloadErrorPolicy::KeepLastGood;
};

enum class CliAction {
    Run,      // Open the viewer with the parsed options
    Help,     // Print help, exit 0
    Version,  // Print version, exit 0
    Usage,    // Too many positional arguments: usage on stdout, exit 0
    Invalid   // Unknown option or bad value: message on stderr, exit 1
};

struct CommandLine {
    CliAction action = CliAction::Run;
    ViewerOptions options;
    std::string error;  // Set for CliAction::Invalid
};

// Upper bound for --debounce
static constexpr long MAX_DEBOUNCE_MS = 10000;

CommandLine parseCommandLine(int argc, const char* const argv[]);

void printUsage(std::ostream& out);
void printHelp(std::ostream& out, const char* programName);

}  // namespace svgview

#endif  // SVGVIEW_VIEWER_CONFIG_H
