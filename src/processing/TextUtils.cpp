#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

bool isValidUtf8(std::string_view text)
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::int32_t codepoint;
        pos += decodeCodepoint(text, pos, codepoint);
        if (codepoint < 0)
            return false;
    }
    return true;
}

std::size_t decodeCodepoint(std::string_view text, std::size_t pos, std::int32_t& codepoint)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data() + pos);
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size() - pos);

    utf8proc_int32_t cp;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, len, &cp);
    if (bytes <= 0)
    {
        codepoint = -1;
        return 1;
    }
    codepoint = cp;
    return static_cast<std::size_t>(bytes);
}

bool isWhitespace(std::int32_t codepoint)
{
    if (codepoint < 0)
        return false;
    if (codepoint < 0x80)
        return codepoint == ' ' || (codepoint >= 0x09 && codepoint <= 0x0D);
    if (codepoint == 0x85)
        return true;

    switch (utf8proc_category(codepoint))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::int32_t foldCase(std::int32_t codepoint)
{
    if (codepoint < 0)
        return codepoint;
    return utf8proc_tolower(codepoint);
}

void stripCarriageReturn(std::string& line)
{
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
}

} // namespace processing
