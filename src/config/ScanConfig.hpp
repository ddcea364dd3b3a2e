#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <toml++/toml.h>

namespace labelscan
{
class PatternSet;
}

namespace config
{

struct KeywordSettings
{
    std::string tag = "tag";
    std::string ref = "ref";
    std::string file = "file";
    std::string dir = "dir";
};

struct DiagnosticsSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;
};

struct LoggingSettings
{
    int level = 4; // plog::info
    bool append = true;
    std::string directory = "logs";
    bool console = false;
};

/**
 * @brief TOML-backed settings for a label scan
 *
 * Sections: [keywords], [diagnostics], [logging]. Missing keys keep their
 * defaults. A load either applies the whole document or nothing.
 */
class ScanConfig
{
public:
    bool loadFile(const std::string& path);
    bool loadString(std::string_view text, std::string_view source_name = "<string>");

    const KeywordSettings& keywords() const { return keywords_; }
    const DiagnosticsSettings& diagnostics() const { return diagnostics_; }
    const LoggingSettings& logging() const { return logging_; }

    // Push [diagnostics] into processing::Diagnostics
    void applyDiagnostics() const;

    // Throws labelscan::InvalidPattern
    labelscan::PatternSet buildPatterns() const;

    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(const toml::table& root, std::string_view source_name);
    bool fail(std::string message, std::string_view source_name);

    KeywordSettings keywords_;
    DiagnosticsSettings diagnostics_;
    LoggingSettings logging_;
    std::string last_error_;
};

} // namespace config
