// ==============================================================================
// scanner.cpp - Один запуск сканирования
// ==============================================================================

#include "filescanner/scanner.hpp"

#include "filescanner/platform.hpp"
#include "filescanner/scan.hpp"

namespace filescanner {

namespace {

constexpr const char* TIMESTAMP_FORMAT = "%Y-%m-%d %H:%M:%S";

}  // namespace

Scanner::Scanner(ScanOptions opt, output::Writer& console)
    : options_(std::move(opt)), console_(console) {}

ScanSummary Scanner::run() {
    ScanSummary summary;
    summary.output_path = options_.output_path;
    config::ResolvedCommands resolved;

    report::ReportOptions report_opt;
    report_opt.output_path = options_.output_path;
    report_opt.format = options_.format;
    report_opt.verbose = options_.verbose;

    report::ReportSink sink(report_opt, console_);
    sink.open();
    sink.header(options_.root, options_.config_path,
                platform::format_local_time(TIMESTAMP_FORMAT));

    auto sections = config::load_config(options_.config_path);
    summary.sections_total = sections.size();
    console_.info("Loaded " + std::to_string(sections.size()) + " sections from " +
                  platform::path_to_utf8(options_.config_path));

    scan::SectionExecutor executor(options_.root, options_.verbose, sink, console_);
    for (const auto& section : sections) {
        if (!section.executable()) {
            continue;
        }
        platform::throw_if_interrupted();

        auto outcome = executor.execute(section);
        resolved[section.name] = outcome.resolved_command;
        ++summary.sections_executed;
        if (!outcome.walk_complete) {
            ++summary.sections_incomplete;
        }
        if (options_.on_section) {
            options_.on_section(section.name, outcome.result_count);
        }
    }

    // Сигнал, пришедший во время последней секции, тоже отменяет запуск
    platform::throw_if_interrupted();

    sink.footer(platform::format_local_time(TIMESTAMP_FORMAT));
    summary.results = sink.result_count();
    sink.close();

    // Только после полного прохода; прерванный запуск конфигурацию не трогает
    platform::throw_if_interrupted();
    config::rewrite_config_file(options_.config_path, resolved);
    if (options_.verbose) {
        console_.write_line(output::Stream::Stdout, "Config file updated with actual commands");
    }

    if (summary.sections_incomplete > 0) {
        console_.warn(std::to_string(summary.sections_incomplete) +
                      " section(s) did not complete, results may be partial");
    }
    console_.debug("Executed " + std::to_string(summary.sections_executed) + " of " +
                   std::to_string(summary.sections_total) + " sections, " +
                   std::to_string(summary.results) + " results");
    return summary;
}

}  // namespace filescanner
