#pragma once

#include <string>

namespace utils {

// Escape a literal string so it can be used in std::regex as a literal match.
inline std::string escape_regex(const std::string& s)
{
    static const std::string special = R"(\.^$|()[]*+?{}-)";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s)
    {
        if (special.find(c) != std::string::npos)
        {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace utils
