#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labelscan
{

struct MarkerMatch
{
    std::size_t begin = 0;      // offset of '['
    std::size_t end = 0;        // one past ']'
    std::string_view text;      // the label, a view into the scanned line
};

/**
 * @brief Finds "[ <keyword> : <label> ]" markers without backtracking
 *
 * The keyword is compared case-insensitively per codepoint. Whitespace is
 * Unicode White_Space, and the label is one or more codepoints that are
 * neither whitespace nor ']'. Matches are reported left to right and never
 * overlap. Work per line is linear in its length: a label run that was
 * already found not to be closed by ']' is never rescanned by a later '['.
 * Malformed UTF-8 bytes count as ordinary label characters.
 */
class KeywordScanner
{
public:
    // keyword must already pass validateKeyword
    explicit KeywordScanner(std::string keyword);

    std::vector<MarkerMatch> findAll(std::string_view line) const;

    const std::string& keyword() const noexcept { return keyword_; }

private:
    std::optional<MarkerMatch> matchAt(std::string_view line, std::size_t open, std::size_t& dead_run_end) const;

    std::string keyword_;
    std::vector<std::int32_t> folded_keyword_;
};

} // namespace labelscan
