#include "Extractor.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <fstream>

#include <plog/Log.h>

namespace labelscan
{

namespace
{

using processing::Diagnostics;

// Per-input accumulator. Holds no state between lines beyond the counter.
class CatalogueBuilder
{
public:
    CatalogueBuilder(const MarkerPattern& tag_pattern, const MarkerPattern& ref_pattern,
                     const MarkerPattern& file_pattern, const MarkerPattern& dir_pattern, const std::string& source)
        : tag_pattern_(tag_pattern)
        , ref_pattern_(ref_pattern)
        , file_pattern_(file_pattern)
        , dir_pattern_(dir_pattern)
        , source_(source)
        , verbose_(Diagnostics::IsVerbose())
    {
    }

    void consume(const DecodedLine& line)
    {
        ++line_number_;

        if (!line)
        {
            ++catalogue_.skipped_lines;
            if (verbose_)
            {
                PLOG_DEBUG_(Diagnostics::kLogInstance)
                    << "Skipping undecodable line " << Diagnostics::Location(source_, line_number_);
            }
            return;
        }

        collect(tag_pattern_, MarkerKind::Tag, *line, catalogue_.tags);
        collect(ref_pattern_, MarkerKind::Reference, *line, catalogue_.references);
        collect(file_pattern_, MarkerKind::FileLabel, *line, catalogue_.file_labels);
        collect(dir_pattern_, MarkerKind::DirLabel, *line, catalogue_.dir_labels);
    }

    Catalogue finish()
    {
        if (verbose_)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "Scanned " << source_ << ": " << line_number_ << " lines, " << catalogue_.tags.size() << " tags, "
                << catalogue_.references.size() << " refs, " << catalogue_.file_labels.size() << " files, "
                << catalogue_.dir_labels.size() << " dirs, " << catalogue_.skipped_lines << " skipped";
        }
        return std::move(catalogue_);
    }

private:
    void collect(const MarkerPattern& pattern, MarkerKind kind, const std::string& text, std::vector<Marker>& out)
    {
        for (auto& label : pattern.captures(text))
        {
            out.emplace_back(kind, std::move(label), source_, line_number_);
            if (verbose_)
            {
                PLOG_VERBOSE_(Diagnostics::kLogInstance)
                    << out.back().toString() << " in '" << Diagnostics::Preview(text) << "'";
            }
        }
    }

    const MarkerPattern& tag_pattern_;
    const MarkerPattern& ref_pattern_;
    const MarkerPattern& file_pattern_;
    const MarkerPattern& dir_pattern_;
    const std::string& source_;
    const bool verbose_;

    std::size_t line_number_ = 0;
    Catalogue catalogue_;
};

} // anonymous namespace

Catalogue extract(const MarkerPattern& tag_pattern, const MarkerPattern& ref_pattern,
                  const MarkerPattern& file_pattern, const MarkerPattern& dir_pattern, const std::string& source,
                  const std::vector<DecodedLine>& lines)
{
    CatalogueBuilder builder(tag_pattern, ref_pattern, file_pattern, dir_pattern, source);
    for (const auto& line : lines)
        builder.consume(line);
    return builder.finish();
}

Catalogue extract(const PatternSet& patterns, const std::string& source, const std::vector<DecodedLine>& lines)
{
    return extract(patterns.tag(), patterns.ref(), patterns.file(), patterns.dir(), source, lines);
}

Catalogue extract(const PatternSet& patterns, const std::string& source, std::istream& input)
{
    CatalogueBuilder builder(patterns.tag(), patterns.ref(), patterns.file(), patterns.dir(), source);
    LineReader reader(input);
    DecodedLine line;
    while (reader.next(line))
        builder.consume(line);
    return builder.finish();
}

std::optional<Catalogue> extractFile(const PatternSet& patterns, const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Failed to open input for label scan",
                                            "Path: " + path.string());
        return std::nullopt;
    }
    return extract(patterns, path.string(), input);
}

} // namespace labelscan
