#include "ScanConfig.hpp"
#include "../labelscan/LabelPatterns.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <filesystem>
#include <sstream>

#include <plog/Log.h>

namespace config
{

namespace
{

bool readKeyword(const toml::table& section, const char* key, std::string& target, std::string& error)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;

    auto value = node->value<std::string>();
    if (!value)
    {
        error = std::string("keywords.") + key + " must be a string";
        return false;
    }
    if (auto problem = labelscan::validateKeyword(*value))
    {
        error = std::string("keywords.") + key + ": " + *problem;
        return false;
    }
    target = *value;
    return true;
}

} // anonymous namespace

bool ScanConfig::loadFile(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        return fail("config file not found", path);
    }

    try
    {
        toml::table root = toml::parse_file(path);
        return apply(root, path);
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream oss;
        oss << pe.description() << " (line " << pe.source().begin.line << ")";
        return fail(oss.str(), path);
    }
}

bool ScanConfig::loadString(std::string_view text, std::string_view source_name)
{
    try
    {
        toml::table root = toml::parse(text, source_name);
        return apply(root, source_name);
    }
    catch (const toml::parse_error& pe)
    {
        std::ostringstream oss;
        oss << pe.description() << " (line " << pe.source().begin.line << ")";
        return fail(oss.str(), source_name);
    }
}

bool ScanConfig::apply(const toml::table& root, std::string_view source_name)
{
    KeywordSettings keywords = keywords_;
    DiagnosticsSettings diagnostics = diagnostics_;
    LoggingSettings logging = logging_;
    std::string error;

    if (auto section = root["keywords"].as_table())
    {
        if (!readKeyword(*section, "tag", keywords.tag, error) || !readKeyword(*section, "ref", keywords.ref, error) ||
            !readKeyword(*section, "file", keywords.file, error) || !readKeyword(*section, "dir", keywords.dir, error))
        {
            return fail(error, source_name);
        }
    }

    if (auto section = root["diagnostics"].as_table())
    {
        if (auto verbose = (*section)["verbose"].value<bool>())
            diagnostics.verbose = *verbose;
        if (auto preview = (*section)["max_preview"].value<int64_t>())
        {
            if (*preview <= 0)
                return fail("diagnostics.max_preview must be positive", source_name);
            diagnostics.max_preview = static_cast<std::size_t>(*preview);
        }
    }

    if (auto section = root["logging"].as_table())
    {
        if (auto level = (*section)["level"].value<int64_t>())
        {
            if (*level < 0 || *level > 6)
                return fail("logging.level must be between 0 and 6", source_name);
            logging.level = static_cast<int>(*level);
        }
        if (auto append = (*section)["append"].value<bool>())
            logging.append = *append;
        if (auto directory = (*section)["directory"].value<std::string>())
            logging.directory = *directory;
        if (auto console = (*section)["console"].value<bool>())
            logging.console = *console;
    }

    keywords_ = std::move(keywords);
    diagnostics_ = diagnostics;
    logging_ = std::move(logging);
    last_error_.clear();

    PLOG_DEBUG << "Loaded scan config from " << source_name;
    return true;
}

bool ScanConfig::fail(std::string message, std::string_view source_name)
{
    last_error_ = std::move(message);
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to load scan config",
                                      std::string(source_name) + ": " + last_error_);
    return false;
}

void ScanConfig::applyDiagnostics() const
{
    processing::Diagnostics::SetVerbose(diagnostics_.verbose);
    processing::Diagnostics::SetMaxPreview(diagnostics_.max_preview);
}

labelscan::PatternSet ScanConfig::buildPatterns() const
{
    return labelscan::PatternSet::fromKeywords(keywords_.tag, keywords_.ref, keywords_.file, keywords_.dir);
}

} // namespace config
