// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "filescanner/platform.hpp"

#include <csignal>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace filescanner::platform {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_interrupt_signal(int) {
    g_interrupted = 1;
}

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

std::string format_local_time(const char* format) {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    char buf[64];
    std::size_t n = std::strftime(buf, sizeof(buf), format, &tm_buf);
    return std::string(buf, n);
}

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

void replace_file_contents(const std::filesystem::path& target, std::string_view bytes) {
    std::filesystem::path tmp = target;
    tmp += ".tmp";

#ifdef _WIN32
    FILE* f = _wfopen(tmp.c_str(), L"wb");
#else
    FILE* f = std::fopen(tmp.c_str(), "wb");
#endif
    if (f == nullptr) {
        throw std::runtime_error("failed to open file for writing - " + path_to_utf8(tmp));
    }

    bool ok = std::fwrite(bytes.data(), 1, bytes.size(), f) == bytes.size();
    ok = (std::fflush(f) == 0) && ok;
    ok = (std::fclose(f) == 0) && ok;

    std::error_code ec;
    if (!ok) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("failed to write file - " + path_to_utf8(tmp));
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp, rm_ec);
        throw std::runtime_error("failed to replace file '" + path_to_utf8(target) + "' - " +
                                 ec.message());
    }
}

// ----------------------------------------------------------------------------
// Прерывание
// ----------------------------------------------------------------------------

void install_interrupt_handler() {
    std::signal(SIGINT, on_interrupt_signal);
    std::signal(SIGTERM, on_interrupt_signal);
}

bool interrupted() {
    return g_interrupted != 0;
}

void reset_interrupted() {
    g_interrupted = 0;
}

void request_interrupt() {
    g_interrupted = 1;
}

void throw_if_interrupted() {
    if (g_interrupted != 0) {
        throw ScanInterrupted();
    }
}

}  // namespace filescanner::platform
