// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: std::endl не используется, сброс буферов явный.
//
// ==============================================================================

#include "filescanner/output.hpp"

#include "filescanner/platform.hpp"

namespace filescanner::output {

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    std::fwrite(bytes.data(), 1, bytes.size(), f);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    write_colored(Stream::Stderr, prefix, color);
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (!config_.verbose) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (color != Color::Default && supports_color(s)) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace filescanner::output
