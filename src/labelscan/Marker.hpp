#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace labelscan
{

enum class MarkerKind
{
    Tag,       // Declares a named anchor
    Reference, // Points at a tag by name
    FileLabel, // Names a file path
    DirLabel   // Names a directory path
};

// Lowercase keyword used both in the default marker syntax and in rendering:
// "tag", "ref", "file", "dir".
std::string_view kindKeyword(MarkerKind kind) noexcept;

/**
 * @brief One marker occurrence found in an input
 *
 * Immutable once constructed. The text is kept exactly as it appeared in
 * the source and the line number is 1-based.
 */
class Marker
{
public:
    // Throws std::invalid_argument when line is 0
    Marker(MarkerKind kind, std::string text, std::string source, std::size_t line);

    MarkerKind kind() const noexcept { return kind_; }
    const std::string& text() const noexcept { return text_; }
    const std::string& source() const noexcept { return source_; }
    std::size_t line() const noexcept { return line_; }

    // "[<kind>:<text>] @ <source>:<line>"
    std::string toString() const;

    bool operator==(const Marker& other) const = default;

private:
    MarkerKind kind_;
    std::string text_;
    std::string source_;
    std::size_t line_;
};

std::ostream& operator<<(std::ostream& os, const Marker& marker);

} // namespace labelscan
