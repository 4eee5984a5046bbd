// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "filescanner/cli.hpp"

#include "filescanner/platform.hpp"

#include <cstring>

namespace filescanner::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE =
    "Usage: filescanner [-c CONFIG] -r ROOT [-o OUTPUT] [-v] [-q] [--jsonl]\n";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + USAGE + "\nFor more information, try '--help'.\n";
}

/// Значение опции: "--opt=value" или следующий аргумент
/// @return nullopt, если значение отсутствует
std::optional<std::string> take_value(int argc, char** argv, int& i, const char* short_name,
                                      const char* long_name) {
    const char* arg = argv[i];
    std::string long_eq = std::string(long_name) + "=";
    if (starts_with(arg, long_eq.c_str())) {
        return std::string(arg + long_eq.size());
    }
    if (str_eq(arg, short_name) || str_eq(arg, long_name)) {
        if (i + 1 < argc) {
            ++i;
            return std::string(argv[i]);
        }
    }
    return std::nullopt;
}

bool is_option(const char* arg, const char* short_name, const char* long_name) {
    std::string long_eq = std::string(long_name) + "=";
    return str_eq(arg, short_name) || str_eq(arg, long_name) || starts_with(arg, long_eq.c_str());
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("filescanner ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n" +
           USAGE +
           "\n"
           "Options:\n"
           "  -c, --config <CONFIG>  Path to config file (default: ./filescanner.config)\n"
           "  -r, --root <ROOT>      Root directory to search from (REQUIRED)\n"
           "  -o, --output <OUTPUT>  Path to output file (default: findings_YYYYMMDD_HHMMSS.txt)\n"
           "  -v, --verbose          Show commands being run and metadata\n"
           "  -q, --quiet            Suppress informational messages\n"
           "      --jsonl            Write the report as JSON lines\n"
           "  -h, --help             Print help\n"
           "  -V, --version          Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Search /var/www with default config (quiet mode):\n"
           "        filescanner -r /var/www\n"
           "\n"
           "    Verbose mode - shows commands and metadata:\n"
           "        filescanner -r /var/www -v\n"
           "\n"
           "    Specify all parameters:\n"
           "        filescanner -c my_config.txt -r /home/user -o results/scan.txt\n"
           "\n"
           "Config file format:\n"
           "\n"
           "    [Section Name]\n"
           "    Command: command_with_KEYWORDS_EXTENSIONS_FILES_placeholders\n"
           "    Example: actual_command_example (auto-updated each run)\n"
           "    Keywords: keyword1, keyword2, keyword3\n"
           "    Extensions: *.ext1, *.ext2\n"
           "    Files: file1, file2\n"
           "\n"
           "    KEYWORDS is replaced with pipe-separated keywords, EXTENSIONS with\n"
           "    extension patterns, FILES with file name patterns.\n";
}

std::string default_output_name() {
    return "findings_" + platform::format_local_time("%Y%m%d_%H%M%S") + ".txt";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    ScanCommand scan_cmd;
    bool have_root = false;
    bool have_output = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
            result.global.verbose = true;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--jsonl")) {
            scan_cmd.jsonl = true;
        } else if (is_option(arg, "-c", "--config")) {
            auto value = take_value(argc, argv, i, "-c", "--config");
            if (!value.has_value()) {
                result.diagnostic.stderr_message =
                    render_usage_error("error: a value is required for '--config <CONFIG>'");
                return result;
            }
            scan_cmd.config = platform::path_from_utf8(*value);
        } else if (is_option(arg, "-r", "--root")) {
            auto value = take_value(argc, argv, i, "-r", "--root");
            if (!value.has_value()) {
                result.diagnostic.stderr_message =
                    render_usage_error("error: a value is required for '--root <ROOT>'");
                return result;
            }
            scan_cmd.root = platform::path_from_utf8(*value);
            have_root = true;
        } else if (is_option(arg, "-o", "--output")) {
            auto value = take_value(argc, argv, i, "-o", "--output");
            if (!value.has_value()) {
                result.diagnostic.stderr_message =
                    render_usage_error("error: a value is required for '--output <OUTPUT>'");
                return result;
            }
            scan_cmd.output = platform::path_from_utf8(*value);
            have_output = true;
        } else {
            // Позиционных аргументов нет
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        }
    }

    if (!have_root) {
        result.diagnostic.stderr_message = render_usage_error(
            "error: the following required arguments were not provided:\n  --root <ROOT>");
        return result;
    }

    if (!have_output) {
        scan_cmd.output = default_output_name();
    }

    result.ok = true;
    result.command = scan_cmd;
    return result;
}

}  // namespace filescanner::cli
