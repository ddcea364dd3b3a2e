#pragma once

#include "Catalogue.hpp"
#include "LabelPatterns.hpp"
#include "LineReader.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace labelscan
{

/**
 * @brief Collect every marker occurrence from the lines of one input
 *
 * Each pattern is applied independently to every decoded line and all of its
 * non-overlapping matches are appended, left to right, to that kind's
 * sequence. Lines that failed to decode
 * keep their line number but contribute nothing and are counted in
 * Catalogue::skipped_lines. Never fails; performs no I/O of its own.
 */
Catalogue extract(const MarkerPattern& tag_pattern, const MarkerPattern& ref_pattern,
                  const MarkerPattern& file_pattern, const MarkerPattern& dir_pattern, const std::string& source,
                  const std::vector<DecodedLine>& lines);

Catalogue extract(const PatternSet& patterns, const std::string& source, const std::vector<DecodedLine>& lines);

// Same as above, reading physical lines from input as it goes
Catalogue extract(const PatternSet& patterns, const std::string& source, std::istream& input);

// Opens path in binary mode and extracts with path.string() as the source id.
// Returns std::nullopt, after reporting an Input warning, if the file cannot be opened.
std::optional<Catalogue> extractFile(const PatternSet& patterns, const std::filesystem::path& path);

} // namespace labelscan
