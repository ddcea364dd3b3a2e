#include <catch2/catch_test_macros.hpp>
#include "config/ScanConfig.hpp"
#include "labelscan/Extractor.hpp"
#include "processing/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <plog/Log.h>

using utils::LogManager;

namespace
{

std::string readFile(const std::string& path)
{
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

TEST_CASE("LogManager - registration requires initialization", "[logging]")
{
    LogManager::Shutdown();
    utils::ErrorReporter::ClearErrors();

    LogManager::LoggerConfig cfg;
    cfg.name = "early";
    cfg.filepath = "unused.log";
    REQUIRE_FALSE(LogManager::RegisterLogger(cfg));

    auto report = utils::ErrorReporter::GetLastError();
    REQUIRE(report.category == utils::ErrorCategory::Initialization);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("LogManager - diagnostics logger receives extraction traces", "[logging]")
{
    auto dir = std::filesystem::temp_directory_path() / "labelscan_log_test";
    std::filesystem::remove_all(dir);

    config::ScanConfig scan_config;
    REQUIRE(scan_config.loadString("[logging]\nlevel = 6\nappend = false\ndirectory = \"" +
                                   dir.generic_string() + "\"\n[diagnostics]\nverbose = true\n"));

    REQUIRE(LogManager::Initialize(scan_config));
    REQUIRE(LogManager::IsInitialized());
    REQUIRE_FALSE(LogManager::IsAppendMode());
    REQUIRE(LogManager::GetDefaultLogLevel() == plog::verbose);
    REQUIRE(std::filesystem::is_directory(dir));

    LogManager::LoggerConfig diag;
    diag.name = "diagnostics";
    diag.filepath = LogManager::LogFilePath("diagnostics.log");
    REQUIRE(LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(diag));

    scan_config.applyDiagnostics();
    std::vector<labelscan::DecodedLine> lines;
    lines.emplace_back("[tag:traced]");
    lines.emplace_back(std::nullopt);
    auto labels = labelscan::extract(labelscan::PatternSet::defaults(), "traced.md", lines);
    REQUIRE(labels.tags.size() == 1);

    auto contents = readFile(diag.filepath);
    REQUIRE(contents.find("[tag:traced] @ traced.md:1") != std::string::npos);
    REQUIRE(contents.find("Skipping undecodable line traced.md:2") != std::string::npos);

    config::ScanConfig().applyDiagnostics();
    LogManager::Shutdown();
    REQUIRE_FALSE(LogManager::IsInitialized());

    labelscan::extract(labelscan::PatternSet::defaults(), "silent.md", lines);
    REQUIRE(readFile(diag.filepath).find("silent.md") == std::string::npos);
}

TEST_CASE("LogManager - console setting attaches a console appender", "[logging]")
{
    LogManager::Shutdown();

    auto dir = std::filesystem::temp_directory_path() / "labelscan_console_test";
    std::filesystem::remove_all(dir);

    config::ScanConfig scan_config;
    REQUIRE(scan_config.loadString("[logging]\nconsole = true\ndirectory = \"" + dir.generic_string() + "\"\n"));
    REQUIRE(LogManager::Initialize(scan_config));
    REQUIRE(LogManager::UseConsole());

    LogManager::LoggerConfig cfg;
    cfg.name = "main";
    cfg.filepath = LogManager::LogFilePath("main.log");
    cfg.add_console_appender = false;

    auto before = LogManager::ConsoleAppenderCount();
    REQUIRE(LogManager::RegisterLogger(cfg));
    REQUIRE(LogManager::ConsoleAppenderCount() == before + 1);

    LogManager::Shutdown();

    SECTION("Without the setting no console appender is added") {
        REQUIRE(scan_config.loadString("[logging]\nconsole = false\ndirectory = \"" + dir.generic_string() + "\"\n"));
        REQUIRE(LogManager::Initialize(scan_config));
        REQUIRE_FALSE(LogManager::UseConsole());

        before = LogManager::ConsoleAppenderCount();
        REQUIRE(LogManager::RegisterLogger(cfg));
        REQUIRE(LogManager::ConsoleAppenderCount() == before);

        LogManager::Shutdown();
    }
}
