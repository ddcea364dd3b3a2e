#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labelscan
{

// One physical line: the decoded text, or empty when the bytes are not valid UTF-8
using DecodedLine = std::optional<std::string>;

/**
 * @brief Splits a byte stream into physical lines
 *
 * Lines end at '\n'; a trailing '\r' is dropped. A last line without a
 * terminator still counts, and a stream ending in '\n' does not produce an
 * extra empty line. Lines that are not valid UTF-8 are still returned, as an
 * empty DecodedLine, so that line numbering stays aligned with the input.
 */
class LineReader
{
public:
    explicit LineReader(std::istream& input);

    // Returns false once the input is exhausted
    bool next(DecodedLine& line);

    // Number of physical lines returned so far
    std::size_t lineNumber() const noexcept { return line_number_; }

private:
    std::istream& input_;
    std::string buffer_;
    std::size_t line_number_ = 0;
};

std::vector<DecodedLine> readLines(std::istream& input);
std::vector<DecodedLine> splitLines(std::string_view text);

} // namespace labelscan
