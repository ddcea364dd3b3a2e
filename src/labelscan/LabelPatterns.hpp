#pragma once

#include "KeywordScanner.hpp"
#include "Marker.hpp"

#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace labelscan
{

// Raised while building marker patterns, before any input is scanned
class InvalidPattern : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Error message for a keyword that cannot be used in the marker grammar.
// Empty keywords, malformed UTF-8, and keywords containing whitespace, ':',
// '[' or ']' are rejected.
std::optional<std::string> validateKeyword(const std::string& keyword);

// Compile a marker expression case-insensitively. Throws InvalidPattern when the
// expression is malformed or does not have exactly one capture group.
std::regex compileMarkerPattern(const std::string& expression);

/**
 * @brief Recognizer for one marker kind
 *
 * Built either from a keyword, matched by KeywordScanner, or from a full
 * std::regex expression whose first capture group is the label. Immutable
 * once built.
 */
class MarkerPattern
{
public:
    // Throws InvalidPattern
    static MarkerPattern fromKeyword(const std::string& keyword);
    static MarkerPattern fromExpression(const std::string& expression);

    // Label text of every non-overlapping match, left to right
    std::vector<std::string> captures(std::string_view line) const;

    bool isKeyword() const noexcept { return scanner_.has_value(); }

private:
    MarkerPattern() = default;

    std::optional<KeywordScanner> scanner_;
    std::optional<std::regex> regex_;
};

/**
 * @brief The four marker patterns, one per kind
 *
 * Read-only after construction; a single instance can be shared by any number
 * of concurrent extractions.
 */
class PatternSet
{
public:
    // Keywords tag, ref, file and dir
    static PatternSet defaults();

    static PatternSet fromKeywords(const std::string& tag_keyword, const std::string& ref_keyword,
                                   const std::string& file_keyword, const std::string& dir_keyword);

    static PatternSet fromExpressions(const std::string& tag_expression, const std::string& ref_expression,
                                      const std::string& file_expression, const std::string& dir_expression);

    const MarkerPattern& forKind(MarkerKind kind) const noexcept;

    const MarkerPattern& tag() const noexcept { return tag_; }
    const MarkerPattern& ref() const noexcept { return ref_; }
    const MarkerPattern& file() const noexcept { return file_; }
    const MarkerPattern& dir() const noexcept { return dir_; }

private:
    PatternSet(MarkerPattern tag, MarkerPattern ref, MarkerPattern file, MarkerPattern dir);

    MarkerPattern tag_;
    MarkerPattern ref_;
    MarkerPattern file_;
    MarkerPattern dir_;
};

} // namespace labelscan
