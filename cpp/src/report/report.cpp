// ==============================================================================
// report.cpp - Отчёт о сканировании
// ==============================================================================

#include "filescanner/report.hpp"

#include "filescanner/platform.hpp"

#include <cstdint>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <system_error>

namespace filescanner::report {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void put(JsonWriter& w, const char* key, std::string_view value) {
    w.Key(key);
    w.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void put(JsonWriter& w, const char* key, std::size_t value) {
    w.Key(key);
    w.Uint64(static_cast<std::uint64_t>(value));
}

/// Собрать однострочный JSON объект {"type": <type>, ...}
template <typename Fn>
std::string json_object(const char* type, Fn&& fill) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    put(w, "type", type);
    fill(w);
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace

// ----------------------------------------------------------------------------
// ScanResult
// ----------------------------------------------------------------------------

ScanResult ScanResult::content_match(std::filesystem::path p, std::size_t line, std::string text) {
    ScanResult r;
    r.kind = Kind::ContentMatch;
    r.path = std::move(p);
    r.line_number = line;
    r.text = std::move(text);
    return r;
}

ScanResult ScanResult::file_match(std::filesystem::path p) {
    ScanResult r;
    r.kind = Kind::FileMatch;
    r.path = std::move(p);
    return r;
}

ScanResult ScanResult::file_dump(std::filesystem::path p, std::string content) {
    ScanResult r;
    r.kind = Kind::FileDump;
    r.path = std::move(p);
    r.text = std::move(content);
    return r;
}

std::string ScanResult::render() const {
    std::string p = platform::path_to_utf8(path);
    switch (kind) {
    case Kind::ContentMatch:
        return p + ":" + std::to_string(line_number) + ":" + text;
    case Kind::FileDump:
        return "=== " + p + " ===\n" + text;
    case Kind::FileMatch:
    default:
        return p;
    }
}

const char* kind_name(ScanResult::Kind kind) {
    switch (kind) {
    case ScanResult::Kind::ContentMatch:
        return "content";
    case ScanResult::Kind::FileDump:
        return "dump";
    case ScanResult::Kind::FileMatch:
    default:
        return "file";
    }
}

// ----------------------------------------------------------------------------
// ReportSink
// ----------------------------------------------------------------------------

ReportSink::ReportSink(ReportOptions opt, output::Writer& console)
    : options_(std::move(opt)), console_(console) {}

ReportSink::~ReportSink() {
    close();
}

void ReportSink::open() {
    const auto& path = options_.output_path;

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ReportError("failed to create output directory '" +
                              platform::path_to_utf8(path.parent_path()) + "' - " + ec.message());
        }
    }

#ifdef _WIN32
    file_ = _wfopen(path.c_str(), L"wb");
#else
    file_ = std::fopen(path.c_str(), "wb");
#endif

    if (file_ == nullptr) {
        throw ReportError("failed to open output file - " + platform::path_to_utf8(path));
    }

    current_section_.clear();
    result_count_ = 0;
}

void ReportSink::close() {
    if (file_ != nullptr) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

void ReportSink::append(std::string_view line) {
    if (file_ == nullptr) {
        throw ReportError("output file is not open - " +
                          platform::path_to_utf8(options_.output_path));
    }
    bool ok = std::fwrite(line.data(), 1, line.size(), file_) == line.size();
    ok = std::fputc('\n', file_) != EOF && ok;
    ok = std::fflush(file_) == 0 && ok;
    if (!ok) {
        throw ReportError("failed to write output file - " +
                          platform::path_to_utf8(options_.output_path));
    }
}

void ReportSink::mirror(std::string_view line) {
    if (options_.verbose) {
        console_.write_line(output::Stream::Stdout, line);
    }
}

void ReportSink::header(const std::filesystem::path& root, const std::filesystem::path& config,
                        std::string_view started) {
    std::string root_str = platform::path_to_utf8(root);
    std::string config_str = platform::path_to_utf8(config);

    const std::string lines[] = {
        "Starting search from: " + root_str,
        "Config: " + config_str,
        "Started: " + std::string(started),
        std::string(SEPARATOR),
    };

    if (options_.format == Format::Jsonl) {
        append(json_object("header", [&](JsonWriter& w) {
            put(w, "root", root_str);
            put(w, "config", config_str);
            put(w, "started", started);
        }));
    } else {
        for (const auto& line : lines) {
            append(line);
        }
    }
    for (const auto& line : lines) {
        mirror(line);
    }
}

void ReportSink::begin_section(std::string_view name) {
    current_section_ = std::string(name);
    std::string title = "=== " + current_section_ + " ===";

    if (options_.format == Format::Jsonl) {
        append(json_object("section", [&](JsonWriter& w) { put(w, "name", name); }));
    } else {
        append("");
        append(title);
    }
    mirror("");
    mirror(title);
}

void ReportSink::meta(std::string_view label, std::string_view value) {
    std::string line = std::string(label) + ": " + std::string(value);

    if (options_.format == Format::Jsonl) {
        append(json_object("meta", [&](JsonWriter& w) {
            put(w, "section", current_section_);
            put(w, "label", label);
            put(w, "value", value);
        }));
    } else {
        append(line);
    }
    mirror(line);
}

void ReportSink::blank() {
    if (options_.format == Format::Text) {
        append("");
    }
    mirror("");
}

void ReportSink::status(std::string_view text) {
    if (options_.format == Format::Jsonl) {
        append(json_object("status", [&](JsonWriter& w) {
            put(w, "section", current_section_);
            put(w, "text", text);
        }));
    } else {
        append(text);
    }
    mirror(text);
}

void ReportSink::result(const ScanResult& r) {
    ++result_count_;

    if (options_.format == Format::Jsonl) {
        append(json_object("match", [&](JsonWriter& w) {
            put(w, "section", current_section_);
            put(w, "kind", kind_name(r.kind));
            put(w, "path", platform::path_to_utf8(r.path));
            if (r.kind == ScanResult::Kind::ContentMatch) {
                put(w, "line", r.line_number);
            }
            if (r.kind != ScanResult::Kind::FileMatch) {
                put(w, "text", r.text);
            }
        }));
    } else {
        append(r.render());
    }
    mirror(r.render());
}

void ReportSink::footer(std::string_view completed) {
    std::string line = "Completed: " + std::string(completed);

    if (options_.format == Format::Jsonl) {
        append(json_object("footer", [&](JsonWriter& w) {
            put(w, "completed", completed);
            put(w, "results", result_count_);
        }));
    } else {
        append("");
        append(SEPARATOR);
        append(line);
    }
    mirror("");
    mirror(SEPARATOR);
    mirror(line);
}

}  // namespace filescanner::report
