#include "Utf8Utils.hpp"
#include <utf8proc.h>

namespace utils
{

namespace
{

/// Byte length of the first `max_codepoints` code points. Stops early at an
/// invalid sequence and reports it through `valid`.
std::size_t prefixLength(const std::string& text, std::size_t max_codepoints, std::size_t& count, bool& valid)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    count = 0;
    valid = true;
    while (pos < len && count < max_codepoints)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            valid = false;
            break;
        }
        pos += bytes;
        ++count;
    }
    return static_cast<std::size_t>(pos);
}

} // namespace

std::optional<std::size_t> codepointCount(const std::string& text)
{
    std::size_t count = 0;
    bool valid = true;
    prefixLength(text, text.size(), count, valid);
    if (!valid)
        return std::nullopt;
    return count;
}

std::string truncateCodepoints(const std::string& text, std::size_t max_codepoints)
{
    std::size_t count = 0;
    bool valid = true;
    return text.substr(0, prefixLength(text, max_codepoints, count, valid));
}

} // namespace utils
