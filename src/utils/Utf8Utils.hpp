#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace utils
{

/// Number of code points in `text`, or std::nullopt if it is not valid UTF-8.
std::optional<std::size_t> codepointCount(const std::string& text);

/// Keep at most `max_codepoints` code points. Invalid input is cut at the
/// first bad sequence so the result is always valid UTF-8.
std::string truncateCodepoints(const std::string& text, std::size_t max_codepoints);

} // namespace utils
