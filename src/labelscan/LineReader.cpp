#include "LineReader.hpp"
#include "../processing/TextUtils.hpp"

#include <sstream>

namespace labelscan
{

LineReader::LineReader(std::istream& input)
    : input_(input)
{
}

bool LineReader::next(DecodedLine& line)
{
    if (!std::getline(input_, buffer_))
        return false;

    ++line_number_;
    processing::stripCarriageReturn(buffer_);

    if (processing::isValidUtf8(buffer_))
        line = buffer_;
    else
        line.reset();
    return true;
}

std::vector<DecodedLine> readLines(std::istream& input)
{
    std::vector<DecodedLine> lines;
    LineReader reader(input);
    DecodedLine line;
    while (reader.next(line))
        lines.push_back(std::move(line));
    return lines;
}

std::vector<DecodedLine> splitLines(std::string_view text)
{
    std::istringstream input{ std::string(text) };
    return readLines(input);
}

} // namespace labelscan
