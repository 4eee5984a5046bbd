// ==============================================================================
// scan.cpp - Выполнение секций сканирования
// ==============================================================================

#include "filescanner/scan.hpp"

#include "filescanner/pattern.hpp"
#include "filescanner/platform.hpp"
#include "filescanner/text.hpp"

#include <type_traits>

namespace filescanner::scan {

namespace {

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return;
    }
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out.append(sep);
        }
        out.append(items[i]);
    }
    return out;
}

/// --include="a" --include="b"
std::string include_flags(const std::vector<std::string>& globs) {
    std::vector<std::string> flags;
    flags.reserve(globs.size());
    for (const auto& g : globs) {
        flags.push_back("--include=\"" + g + "\"");
    }
    return join(flags, " ");
}

/// \( -name "a" -o -name "b" \)
std::string name_clause(const std::vector<std::string>& globs) {
    std::vector<std::string> names;
    names.reserve(globs.size());
    for (const auto& g : globs) {
        names.push_back("-name \"" + g + "\"");
    }
    return "\\( " + join(names, " -o ") + " \\)";
}

pattern::GlobSet build_globs(const std::vector<std::string>& globs) {
    auto built = pattern::GlobSet::build(globs);
    if (!built.ok) {
        throw PatternError(built.error);
    }
    return std::move(*built.value);
}

std::string file_name(const std::filesystem::path& p) {
    return platform::path_to_utf8(p.filename());
}

}  // namespace

// ----------------------------------------------------------------------------
// SearchMode
// ----------------------------------------------------------------------------

SearchMode classify(std::string_view command) {
    if (contains(command, CONTENT_MARKER)) {
        return ContentSearch{};
    }
    if (contains(command, LOCATE_MARKER) && contains(command, DUMP_MARKER)) {
        return LocateAndDump{};
    }
    if (contains(command, LOCATE_MARKER)) {
        return Locate{};
    }
    return NoSearch{};
}

const char* mode_name(const SearchMode& mode) {
    return std::visit(
        [](auto&& m) -> const char* {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, ContentSearch>) {
                return "content search";
            } else if constexpr (std::is_same_v<T, LocateAndDump>) {
                return "locate and dump";
            } else if constexpr (std::is_same_v<T, Locate>) {
                return "locate";
            } else {
                return "none";
            }
        },
        mode);
}

// ----------------------------------------------------------------------------
// resolve_command
// ----------------------------------------------------------------------------

std::string resolve_command(const config::ScanSection& section) {
    std::string cmd = section.command;

    if (!section.keywords.empty() && contains(cmd, "KEYWORDS")) {
        replace_all(cmd, "KEYWORDS", pattern::join_alternation(section.keywords));
    }

    if (!section.extensions.empty() && contains(cmd, "EXTENSIONS")) {
        if (contains(cmd, CONTENT_MARKER)) {
            replace_all(cmd, "EXTENSIONS", include_flags(section.extensions));
        } else if (contains(cmd, LOCATE_MARKER)) {
            replace_all(cmd, "EXTENSIONS", name_clause(section.extensions));
        }
    }

    if (!section.files.empty() && contains(cmd, "FILES")) {
        replace_all(cmd, "FILES", name_clause(section.files));
    }

    replace_all(cmd, "\\\\", "\\");
    return cmd;
}

// ----------------------------------------------------------------------------
// Поиски
// ----------------------------------------------------------------------------

bool search_content(const std::filesystem::path& root, const std::vector<std::string>& keywords,
                    const std::vector<std::string>& extensions, const io::WalkOptions& walk,
                    const ResultVisitor& visit) {
    auto matcher = pattern::KeywordMatcher::build(keywords);
    if (!matcher.ok) {
        throw PatternError(matcher.error);
    }
    const auto& keyword_matcher = *matcher.value;
    pattern::GlobSet globs = build_globs(extensions);

    return io::walk_files(root, walk, [&](const std::filesystem::path& path) {
        if (!globs.empty() && !globs.matches_any(file_name(path))) {
            return;
        }

        // Построчно: файл целиком в память не читается.
        // Нечитаемый файл пропускается молча, уже найденные строки остаются.
        io::for_each_file_line(path, [&](std::size_t line_no, std::string_view line) {
            if (walk.check_interrupt) {
                platform::throw_if_interrupted();
            }
            if (keyword_matcher.search(line)) {
                visit(report::ScanResult::content_match(path, line_no, std::string(line)));
            }
        });
    });
}

bool locate_files(const std::filesystem::path& root, const std::vector<std::string>& extensions,
                  const std::vector<std::string>& files, const io::WalkOptions& walk,
                  const ResultVisitor& visit) {
    if (!extensions.empty()) {
        pattern::GlobSet globs = build_globs(extensions);
        return io::walk_files(root, walk, [&](const std::filesystem::path& path) {
            if (globs.matches_any(file_name(path))) {
                visit(report::ScanResult::file_match(path));
            }
        });
    }

    if (!files.empty()) {
        pattern::GlobSet globs = build_globs(files);
        return io::walk_files(root, walk, [&](const std::filesystem::path& path) {
            std::size_t hits = globs.count_matches(file_name(path));
            for (std::size_t i = 0; i < hits; ++i) {
                visit(report::ScanResult::file_match(path));
            }
        });
    }

    return true;
}

bool locate_and_dump(const std::filesystem::path& root, const std::vector<std::string>& patterns,
                     const io::WalkOptions& walk, const ResultVisitor& visit) {
    if (patterns.empty()) {
        return true;
    }
    pattern::GlobSet globs = build_globs(patterns);

    return io::walk_files(root, walk, [&](const std::filesystem::path& path) {
        if (!globs.matches_any(file_name(path))) {
            return;
        }
        auto text = io::read_text_file(path);
        if (walk.check_interrupt) {
            platform::throw_if_interrupted();
        }
        if (!text.has_value() || io::is_blank(*text)) {
            return;
        }
        visit(report::ScanResult::file_dump(path, std::move(*text)));
    });
}

// ----------------------------------------------------------------------------
// SectionExecutor
// ----------------------------------------------------------------------------

SectionExecutor::SectionExecutor(std::filesystem::path root, bool verbose,
                                 report::ReportSink& sink, output::Writer& console)
    : root_(std::move(root)), verbose_(verbose), sink_(sink), console_(console) {}

SectionOutcome SectionExecutor::execute(const config::ScanSection& section) {
    SectionOutcome outcome;

    sink_.begin_section(section.name);
    outcome.resolved_command = resolve_command(section);

    SearchMode mode = classify(section.command);
    console_.debug("Section '" + section.name + "': " + mode_name(mode));

    if (verbose_) {
        sink_.meta("Command template", section.command);
        if (!section.keywords.empty()) {
            sink_.meta("Keywords", join(section.keywords, ", "));
        }
        if (!section.extensions.empty()) {
            sink_.meta("Extensions", join(section.extensions, ", "));
        }
        if (!section.files.empty()) {
            sink_.meta("Files", join(section.files, ", "));
        }
        sink_.blank();
        sink_.status("> Running search...");
    }

    outcome.walk_complete = run_mode(section, mode, outcome.result_count);

    if (verbose_ && outcome.result_count == 0) {
        sink_.status("No matches found");
    }

    return outcome;
}

bool SectionExecutor::run_mode(const config::ScanSection& section, const SearchMode& mode,
                               std::size_t& count) {
    // Ошибка уровня корня: в отчёт только при verbose
    io::WalkOptions walk;
    if (verbose_) {
        walk.on_error = [this](const std::string& message) {
            sink_.status("Error during search: " + message);
        };
    }

    ResultVisitor visit = [&](report::ScanResult r) {
        sink_.result(r);
        ++count;
    };

    try {
        return std::visit(
            [&](auto&& m) -> bool {
                using T = std::decay_t<decltype(m)>;
                if constexpr (std::is_same_v<T, ContentSearch>) {
                    if (section.keywords.empty()) {
                        return true;
                    }
                    return search_content(root_, section.keywords, section.extensions, walk,
                                          visit);
                } else if constexpr (std::is_same_v<T, LocateAndDump>) {
                    const auto& patterns =
                        section.files.empty() ? section.extensions : section.files;
                    return locate_and_dump(root_, patterns, walk, visit);
                } else if constexpr (std::is_same_v<T, Locate>) {
                    return locate_files(root_, section.extensions, section.files, walk, visit);
                } else {
                    return true;
                }
            },
            mode);
    } catch (const PatternError& e) {
        // Некорректный шаблон секции не прерывает весь запуск
        console_.warn("Section '" + section.name + "' skipped: " + e.what());
        if (verbose_) {
            sink_.status(std::string("Error during search: ") + e.what());
        }
        return false;
    }
}

}  // namespace filescanner::scan
