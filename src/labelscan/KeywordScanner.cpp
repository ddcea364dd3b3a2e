#include "KeywordScanner.hpp"
#include "../processing/TextUtils.hpp"

namespace labelscan
{

namespace
{

std::size_t skipWhitespace(std::string_view line, std::size_t pos)
{
    while (pos < line.size())
    {
        std::int32_t cp;
        std::size_t len = processing::decodeCodepoint(line, pos, cp);
        if (!processing::isWhitespace(cp))
            break;
        pos += len;
    }
    return pos;
}

} // anonymous namespace

KeywordScanner::KeywordScanner(std::string keyword)
    : keyword_(std::move(keyword))
{
    std::size_t pos = 0;
    while (pos < keyword_.size())
    {
        std::int32_t cp;
        pos += processing::decodeCodepoint(keyword_, pos, cp);
        folded_keyword_.push_back(processing::foldCase(cp));
    }
}

std::vector<MarkerMatch> KeywordScanner::findAll(std::string_view line) const
{
    std::vector<MarkerMatch> matches;
    std::size_t dead_run_end = 0;
    std::size_t pos = 0;

    while (true)
    {
        std::size_t open = line.find('[', pos);
        if (open == std::string_view::npos)
            break;

        if (auto match = matchAt(line, open, dead_run_end))
        {
            pos = match->end;
            matches.push_back(*match);
        }
        else
        {
            pos = open + 1;
        }
    }
    return matches;
}

std::optional<MarkerMatch> KeywordScanner::matchAt(std::string_view line, std::size_t open,
                                                   std::size_t& dead_run_end) const
{
    std::size_t pos = skipWhitespace(line, open + 1);

    for (std::int32_t expected : folded_keyword_)
    {
        if (pos >= line.size())
            return std::nullopt;
        std::int32_t cp;
        std::size_t len = processing::decodeCodepoint(line, pos, cp);
        if (cp < 0 || processing::foldCase(cp) != expected)
            return std::nullopt;
        pos += len;
    }

    pos = skipWhitespace(line, pos);
    if (pos >= line.size() || line[pos] != ':')
        return std::nullopt;

    const std::size_t label_begin = skipWhitespace(line, pos + 1);

    // Inside a run that an earlier '[' already scanned: the label would end
    // at the same place and fail the same way.
    if (label_begin < dead_run_end)
        return std::nullopt;

    pos = label_begin;
    while (pos < line.size() && line[pos] != ']')
    {
        std::int32_t cp;
        std::size_t len = processing::decodeCodepoint(line, pos, cp);
        if (processing::isWhitespace(cp))
            break;
        pos += len;
    }
    const std::size_t label_end = pos;
    if (label_end == label_begin)
        return std::nullopt;

    pos = skipWhitespace(line, label_end);
    if (pos >= line.size() || line[pos] != ']')
    {
        dead_run_end = label_end;
        return std::nullopt;
    }

    return MarkerMatch{ open, pos + 1, line.substr(label_begin, label_end - label_begin) };
}

} // namespace labelscan
