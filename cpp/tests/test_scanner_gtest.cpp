// ==============================================================================
// test_scanner_gtest.cpp - Сквозные тесты запуска сканирования (GoogleTest)
// ==============================================================================

#include "filescanner/scanner.hpp"
#include "filescanner/platform.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace filescanner::test {

namespace {

const char* CONFIG_TEXT = "# audit rules\n"
                          "[Tokens]\n"
                          "Command: grep -rniE \"KEYWORDS\" .\n"
                          "Example: stale grep\n"
                          "Keywords: secret, token\n"
                          "\n"
                          "[Backups]\n"
                          "Command: find . -type f EXTENSIONS\n"
                          "Example: stale find\n"
                          "Extensions: *.bak\n"
                          "\n"
                          "[Disabled]\n"
                          "Example: keep me\n"
                          "Keywords: ignored\n";

}  // namespace

class ScannerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::filesystem::path root_;
    std::filesystem::path config_;
    std::filesystem::path report_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("filescanner_scanner_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        test_dir_ = std::filesystem::temp_directory_path() / unique_name;
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);

        root_ = test_dir_ / "tree";
        config_ = test_dir_ / "filescanner.config";
        report_ = test_dir_ / "out" / "findings.txt";

        write_file(root_ / "app" / ".env", "PATH=/bin\nexport TOKEN=abc\n");
        write_file(root_ / "a" / "b" / "config.bak", "old");
        write_file(config_, CONFIG_TEXT);

        platform::reset_interrupted();
    }

    void TearDown() override {
        platform::reset_interrupted();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    ScanOptions options() const {
        ScanOptions opt;
        opt.root = root_;
        opt.config_path = config_;
        opt.output_path = report_;
        return opt;
    }
};

// ==============================================================================
// Полный запуск
// ==============================================================================

TEST_F(ScannerTest, Run_WritesReportWithAllSections) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    Scanner scanner(options(), console);
    auto summary = scanner.run();

    EXPECT_EQ(summary.sections_total, 3u);
    EXPECT_EQ(summary.sections_executed, 2u);
    EXPECT_EQ(summary.results, 2u);
    EXPECT_EQ(summary.output_path, report_);

    std::string report = read_file(report_);
    EXPECT_EQ(report.rfind("Starting search from: " + platform::path_to_utf8(root_) + "\n", 0), 0u);
    EXPECT_NE(report.find("Config: " + platform::path_to_utf8(config_) + "\n"), std::string::npos);
    EXPECT_NE(report.find("Started: "), std::string::npos);
    EXPECT_NE(report.find("Completed: "), std::string::npos);

    auto tokens = report.find("=== Tokens ===");
    auto backups = report.find("=== Backups ===");
    ASSERT_NE(tokens, std::string::npos);
    ASSERT_NE(backups, std::string::npos);
    EXPECT_LT(tokens, backups);
    EXPECT_EQ(report.find("=== Disabled ==="), std::string::npos);

    EXPECT_NE(report.find(platform::path_to_utf8(root_ / "app" / ".env") + ":2:export TOKEN=abc\n"),
              std::string::npos);
    EXPECT_NE(report.find(platform::path_to_utf8(root_ / "a" / "b" / "config.bak") + "\n"),
              std::string::npos);
}

TEST_F(ScannerTest, Run_RewritesExamplesOfExecutedSections) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    Scanner scanner(options(), console);
    scanner.run();

    std::string expected = "# audit rules\n"
                           "[Tokens]\n"
                           "Command: grep -rniE \"KEYWORDS\" .\n"
                           "Example: grep -rniE \"secret|token\" .\n"
                           "Keywords: secret, token\n"
                           "\n"
                           "[Backups]\n"
                           "Command: find . -type f EXTENSIONS\n"
                           "Example: find . -type f \\( -name \"*.bak\" \\)\n"
                           "Extensions: *.bak\n"
                           "\n"
                           "[Disabled]\n"
                           "Example: keep me\n"
                           "Keywords: ignored\n";
    EXPECT_EQ(read_file(config_), expected);
}

TEST_F(ScannerTest, Run_SecondRunIsStable) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    Scanner(options(), console).run();
    std::string after_first = read_file(config_);
    Scanner(options(), console).run();

    EXPECT_EQ(read_file(config_), after_first);
}

TEST_F(ScannerTest, Run_Jsonl_ReportFormat) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    auto opt = options();
    opt.format = report::Format::Jsonl;
    Scanner(opt, console).run();

    std::string report = read_file(report_);
    EXPECT_EQ(report.rfind("{\"type\":\"header\"", 0), 0u);
    EXPECT_NE(report.find("{\"type\":\"footer\""), std::string::npos);
    EXPECT_NE(report.find("\"results\":2"), std::string::npos);
}

TEST_F(ScannerTest, Run_Verbose_AnnouncesConfigUpdate) {
    output::OutputConfig out_cfg;
    out_cfg.verbose = true;
    output::Writer console(out_cfg);

    auto opt = options();
    opt.verbose = true;

    testing::internal::CaptureStdout();
    Scanner(opt, console).run();
    console.flush();
    std::string captured = testing::internal::GetCapturedStdout();

    EXPECT_NE(captured.find("=== Tokens ==="), std::string::npos);
    EXPECT_NE(captured.find("Command template: grep -rniE \"KEYWORDS\" ."), std::string::npos);
    EXPECT_NE(captured.find("Config file updated with actual commands"), std::string::npos);
}

TEST_F(ScannerTest, Run_InfoOnStderr_QuietSuppresses) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    testing::internal::CaptureStderr();
    Scanner(options(), console).run();
    console.flush();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[+] Loaded 3 sections from "), std::string::npos);

    output::OutputConfig quiet_cfg;
    quiet_cfg.quiet = true;
    output::Writer quiet_console(quiet_cfg);

    testing::internal::CaptureStderr();
    Scanner(options(), quiet_console).run();
    quiet_console.flush();
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST_F(ScannerTest, Run_OnSectionCalledInFileOrder) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    std::vector<std::pair<std::string, std::size_t>> seen;
    auto opt = options();
    opt.on_section = [&seen](const std::string& name, std::size_t results) {
        seen.emplace_back(name, results);
    };
    Scanner(opt, console).run();

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, "Tokens");
    EXPECT_EQ(seen[0].second, 1u);
    EXPECT_EQ(seen[1].first, "Backups");
    EXPECT_EQ(seen[1].second, 1u);
}

// ==============================================================================
// Ошибки и прерывание
// ==============================================================================

TEST_F(ScannerTest, Run_Interrupted_ConfigUntouched) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    platform::request_interrupt();
    Scanner scanner(options(), console);
    EXPECT_THROW(scanner.run(), platform::ScanInterrupted);

    EXPECT_EQ(read_file(config_), CONFIG_TEXT);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "filescanner.config.tmp"));
}

TEST_F(ScannerTest, Run_InterruptDuringLastSection_ConfigUntouched) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    // Флаг выставляется по завершении последней выполняемой секции
    std::vector<std::string> seen;
    auto opt = options();
    opt.on_section = [&seen](const std::string& name, std::size_t) {
        seen.push_back(name);
        if (name == "Backups") {
            platform::request_interrupt();
        }
    };

    EXPECT_THROW(Scanner(opt, console).run(), platform::ScanInterrupted);

    EXPECT_EQ(seen, (std::vector<std::string>{"Tokens", "Backups"}));
    EXPECT_EQ(read_file(config_), CONFIG_TEXT);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "filescanner.config.tmp"));
    // Отчёт содержит находки, но не подвал
    std::string report = read_file(report_);
    EXPECT_NE(report.find("=== Backups ==="), std::string::npos);
    EXPECT_EQ(report.find("Completed: "), std::string::npos);
}

TEST_F(ScannerTest, Run_MissingConfig_Throws) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    auto opt = options();
    opt.config_path = test_dir_ / "missing.config";
    EXPECT_THROW(Scanner(opt, console).run(), config::ConfigError);
}

TEST_F(ScannerTest, Run_MissingRoot_SectionsRecordedAsIncomplete) {
    output::OutputConfig out_cfg;
    output::Writer console(out_cfg);

    auto opt = options();
    opt.root = test_dir_ / "no_such_root";
    opt.verbose = true;

    testing::internal::CaptureStdout();
    auto summary = Scanner(opt, console).run();
    console.flush();
    testing::internal::GetCapturedStdout();

    EXPECT_EQ(summary.results, 0u);
    EXPECT_EQ(summary.sections_incomplete, 2u);
    EXPECT_NE(read_file(report_).find("Error during search: "), std::string::npos);
}

}  // namespace filescanner::test
