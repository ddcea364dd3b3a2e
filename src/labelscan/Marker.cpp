#include "Marker.hpp"

#include <stdexcept>

namespace labelscan
{

std::string_view kindKeyword(MarkerKind kind) noexcept
{
    switch (kind)
    {
    case MarkerKind::Tag:
        return "tag";
    case MarkerKind::Reference:
        return "ref";
    case MarkerKind::FileLabel:
        return "file";
    case MarkerKind::DirLabel:
        return "dir";
    }
    return "tag";
}

Marker::Marker(MarkerKind kind, std::string text, std::string source, std::size_t line)
    : kind_(kind)
    , text_(std::move(text))
    , source_(std::move(source))
    , line_(line)
{
    if (line_ == 0)
        throw std::invalid_argument("marker line numbers are 1-based: " + source_);
}

std::string Marker::toString() const
{
    std::string out;
    out.reserve(text_.size() + source_.size() + 24);
    out += '[';
    out += kindKeyword(kind_);
    out += ':';
    out += text_;
    out += "] @ ";
    out += source_;
    out += ':';
    out += std::to_string(line_);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Marker& marker)
{
    return os << marker.toString();
}

} // namespace labelscan
