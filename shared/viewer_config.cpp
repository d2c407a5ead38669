// viewer_config.cpp - Command-line configuration for svgview

#include "viewer_config.h"

#include "version.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace svgview {

const char* reloadErrorPolicyName(ReloadErrorPolicy policy) {
    switch (policy) {
        case ReloadErrorPolicy::KeepLastGood:
            return "keep-last-good";
        case ReloadErrorPolicy::Abort:
            return "abort";
    }
    return "unknown";
}

namespace {

bool parseDebounce(const char* text, std::chrono::milliseconds& out) {
    if (!text || !*text) return false;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < 0 || value > MAX_DEBOUNCE_MS) {
        return false;
    }
    out = std::chrono::milliseconds(value);
    return true;
}

CommandLine invalid(const std::string& message) {
    CommandLine result;
    result.action = CliAction::Invalid;
    result.error = message;
    return result;
}

}  // namespace

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    CommandLine result;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            result.action = CliAction::Help;
            return result;
        }
        if (strcmp(arg, "--version") == 0 || strcmp(arg, "-v") == 0) {
            result.action = CliAction::Version;
            return result;
        }
        if (strcmp(arg, "--debounce") == 0) {
            if (i + 1 >= argc) {
                return invalid("Missing value for --debounce");
            }
            if (!parseDebounce(argv[++i], result.options.debounce)) {
                return invalid(std::string("Invalid --debounce value: ") + argv[i] + " (expected 0-" +
                               std::to_string(MAX_DEBOUNCE_MS) + " ms)");
            }
        } else if (strcmp(arg, "--keep-on-error") == 0) {
            result.options.reloadErrorPolicy = ReloadErrorPolicy::KeepLastGood;
        } else if (strcmp(arg, "--abort-on-error") == 0) {
            result.options.reloadErrorPolicy = ReloadErrorPolicy::Abort;
        } else if (arg[0] != '-' || strcmp(arg, "-") == 0) {
            // Non-option argument is the input ("-" is standard input)
            positional.push_back(arg);
        } else {
            return invalid(std::string("Unknown option: ") + arg);
        }
    }

    if (positional.size() > 1) {
        result.action = CliAction::Usage;
        return result;
    }
    if (positional.size() == 1 && positional[0] != "-") {
        result.options.inputPath = positional[0];
    }
    return result;
}

void printUsage(std::ostream& out) {
    out << "Usage:\n\tsvgview <path-to-svg>" << std::endl;
}

void printHelp(std::ostream& out, const char* programName) {
    out << SVGViewVersion::getVersionBanner() << "\n\n";
    out << "USAGE:\n";
    out << "    " << programName << " [OPTIONS] [input.svg | -]\n\n";
    out << "DESCRIPTION:\n";
    out << "    Displays one SVG stretched to the window and re-renders it\n";
    out << "    whenever the file is written. Without a path, or with \"-\",\n";
    out << "    the SVG is read from standard input and is not watched.\n\n";
    out << "OPTIONS:\n";
    out << "    -h, --help            Show this help message and exit\n";
    out << "    -v, --version         Show version information and exit\n";
    out << "    --debounce <ms>       Merge writes within <ms> into one reload (default 0, off)\n";
    out << "    --keep-on-error       Keep the last good document if a reload fails (default)\n";
    out << "    --abort-on-error      Exit if a reload fails\n\n";
    out << "KEYBOARD CONTROLS:\n";
    out << "    Escape        Quit\n\n";
    out << "EXAMPLES:\n";
    out << "    " << programName << " drawing.svg\n";
    out << "    " << programName << " --debounce 50 drawing.svg\n";
    out << "    generate_svg | " << programName << " -\n";
}

}  // namespace svgview
