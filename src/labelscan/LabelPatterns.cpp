#include "LabelPatterns.hpp"
#include "../processing/TextUtils.hpp"

namespace labelscan
{

namespace
{

MarkerPattern keywordPattern(MarkerKind kind, const std::string& keyword)
{
    try
    {
        return MarkerPattern::fromKeyword(keyword);
    }
    catch (const InvalidPattern& ex)
    {
        throw InvalidPattern("invalid " + std::string(kindKeyword(kind)) + " keyword: " + ex.what());
    }
}

} // anonymous namespace

std::optional<std::string> validateKeyword(const std::string& keyword)
{
    if (keyword.empty())
        return std::string("keyword is empty");

    std::size_t pos = 0;
    while (pos < keyword.size())
    {
        std::int32_t cp;
        pos += processing::decodeCodepoint(keyword, pos, cp);
        if (cp < 0)
            return "keyword '" + keyword + "' is not valid UTF-8";
        if (processing::isWhitespace(cp))
            return "keyword '" + keyword + "' contains whitespace";
        if (cp == ':' || cp == '[' || cp == ']')
            return "keyword '" + keyword + "' contains reserved character '" +
                   std::string(1, static_cast<char>(cp)) + "'";
    }
    return std::nullopt;
}

std::regex compileMarkerPattern(const std::string& expression)
{
    std::regex pattern;
    try
    {
        pattern.assign(expression, std::regex_constants::ECMAScript | std::regex_constants::icase);
    }
    catch (const std::regex_error& ex)
    {
        throw InvalidPattern("cannot compile marker pattern '" + expression + "': " + ex.what());
    }

    if (pattern.mark_count() != 1)
    {
        throw InvalidPattern("marker pattern '" + expression + "' must have exactly one capture group, found " +
                             std::to_string(pattern.mark_count()));
    }
    return pattern;
}

MarkerPattern MarkerPattern::fromKeyword(const std::string& keyword)
{
    if (auto error = validateKeyword(keyword))
        throw InvalidPattern(*error);

    MarkerPattern pattern;
    pattern.scanner_.emplace(keyword);
    return pattern;
}

MarkerPattern MarkerPattern::fromExpression(const std::string& expression)
{
    MarkerPattern pattern;
    pattern.regex_ = compileMarkerPattern(expression);
    return pattern;
}

std::vector<std::string> MarkerPattern::captures(std::string_view line) const
{
    std::vector<std::string> labels;

    if (scanner_)
    {
        for (const auto& match : scanner_->findAll(line))
            labels.emplace_back(match.text);
        return labels;
    }

    using iterator = std::regex_iterator<std::string_view::const_iterator>;
    for (iterator iter(line.begin(), line.end(), *regex_), end; iter != end; ++iter)
        labels.push_back((*iter)[1].str());
    return labels;
}

PatternSet::PatternSet(MarkerPattern tag, MarkerPattern ref, MarkerPattern file, MarkerPattern dir)
    : tag_(std::move(tag))
    , ref_(std::move(ref))
    , file_(std::move(file))
    , dir_(std::move(dir))
{
}

PatternSet PatternSet::defaults()
{
    return fromKeywords("tag", "ref", "file", "dir");
}

PatternSet PatternSet::fromKeywords(const std::string& tag_keyword, const std::string& ref_keyword,
                                    const std::string& file_keyword, const std::string& dir_keyword)
{
    return PatternSet(keywordPattern(MarkerKind::Tag, tag_keyword),
                      keywordPattern(MarkerKind::Reference, ref_keyword),
                      keywordPattern(MarkerKind::FileLabel, file_keyword),
                      keywordPattern(MarkerKind::DirLabel, dir_keyword));
}

PatternSet PatternSet::fromExpressions(const std::string& tag_expression, const std::string& ref_expression,
                                       const std::string& file_expression, const std::string& dir_expression)
{
    return PatternSet(MarkerPattern::fromExpression(tag_expression), MarkerPattern::fromExpression(ref_expression),
                      MarkerPattern::fromExpression(file_expression),
                      MarkerPattern::fromExpression(dir_expression));
}

const MarkerPattern& PatternSet::forKind(MarkerKind kind) const noexcept
{
    switch (kind)
    {
    case MarkerKind::Reference:
        return ref_;
    case MarkerKind::FileLabel:
        return file_;
    case MarkerKind::DirLabel:
        return dir_;
    case MarkerKind::Tag:
    default:
        return tag_;
    }
}

} // namespace labelscan
