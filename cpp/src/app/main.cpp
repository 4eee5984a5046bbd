// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Проверка корня и конфигурации
// 4. Запуск Scanner
// 5. Возврат exit code
//
// Исключения перехватываются только здесь.
//
// ==============================================================================

#include "filescanner/cli.hpp"
#include "filescanner/output.hpp"
#include "filescanner/platform.hpp"
#include "filescanner/report.hpp"
#include "filescanner/scanner.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// Проверка входных путей
// ----------------------------------------------------------------------------

/// @return 0, если всё в порядке, иначе exit code
int validate_inputs(const filescanner::cli::ScanCommand& cmd,
                    filescanner::output::Writer& writer) {
    using filescanner::platform::path_to_utf8;

    std::error_code ec;
    if (!std::filesystem::exists(cmd.root, ec)) {
        writer.error("Search root directory does not exist: " + path_to_utf8(cmd.root));
        return 1;
    }
    if (!std::filesystem::is_directory(cmd.root, ec)) {
        writer.error("Search root is not a directory: " + path_to_utf8(cmd.root));
        return 1;
    }
    if (!std::filesystem::exists(cmd.config, ec)) {
        writer.error("Config file not found: " + path_to_utf8(cmd.config));
        writer.write_line(filescanner::output::Stream::Stderr,
                          "Run 'filescanner --help' for usage information");
        return 1;
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Сканирование
// ----------------------------------------------------------------------------

int run_scan(const filescanner::cli::ScanCommand& cmd,
             const filescanner::cli::GlobalOptions& global, filescanner::output::Writer& writer) {
    using namespace filescanner;

    if (int rc = validate_inputs(cmd, writer); rc != 0) {
        return rc;
    }

    ScanOptions opt;
    opt.root = cmd.root;
    opt.config_path = cmd.config;
    opt.output_path = cmd.output;
    opt.format = cmd.jsonl ? report::Format::Jsonl : report::Format::Text;
    opt.verbose = global.verbose;
    opt.on_section = [&writer](const std::string& name, std::size_t results) {
        writer.info(name + ": " + std::to_string(results) + " result(s)");
    };

    platform::install_interrupt_handler();

    Scanner scanner(opt, writer);
    try {
        auto summary = scanner.run();
        writer.write_line(output::Stream::Stdout,
                          "Results saved to: " + platform::path_to_utf8(summary.output_path));
        return 0;
    } catch (const platform::ScanInterrupted&) {
        writer.write(output::Stream::Stdout, "\n\n");
        writer.write_line(output::Stream::Stdout, "Scan interrupted by user");
        return 1;
    }
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace filescanner;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Сообщение парсера выводится без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_scan(cmd, parse_result.global, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] Error during scan: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
