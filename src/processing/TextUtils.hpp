#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace processing
{

/// True when every byte sequence in text is well-formed UTF-8
bool isValidUtf8(std::string_view text);

/// Decode the codepoint starting at text[pos] and return its length in bytes.
/// A malformed sequence yields codepoint -1 and a length of 1.
std::size_t decodeCodepoint(std::string_view text, std::size_t pos, std::int32_t& codepoint);

/// Unicode White_Space: the C0 separators, U+0085 and categories Zs, Zl, Zp
bool isWhitespace(std::int32_t codepoint);

/// Simple lowercase mapping used for case-insensitive comparison
std::int32_t foldCase(std::int32_t codepoint);

/// Remove a single trailing '\r' left behind by CRLF line endings
void stripCarriageReturn(std::string& line);

} // namespace processing
