#include "PatternSet.hpp"
#include "ScanTypes.hpp"
#include "../utils/RegexUtils.hpp"
#include "../utils/Utf8Utils.hpp"
#include "../waypoint/WaypointColors.hpp"

#include <plog/Log.h>

namespace claimpoints
{

namespace
{

bool fail(ConfigErrorInfo* error, ConfigError code, std::string message)
{
    if (error)
    {
        error->code = code;
        error->message = std::move(message);
    }
    return false;
}

bool compileOne(const std::string& source, const char* what, std::regex& out, ConfigErrorInfo* error)
{
    try
    {
        out = std::regex(source, std::regex_constants::ECMAScript);
        return true;
    }
    catch (const std::regex_error& e)
    {
        return fail(error, ConfigError::BadPattern,
                    std::string(what) + " '" + source + "' is not a valid pattern: " + e.what());
    }
}

std::size_t countOccurrences(const std::string& text, std::string_view needle)
{
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
        ++count;
    return count;
}

} // namespace

const char* toString(ConfigError error)
{
    switch (error)
    {
    case ConfigError::None:
        return "none";
    case ConfigError::MissingPlaceholder:
        return "missing placeholder";
    case ConfigError::BadAlias:
        return "bad alias";
    case ConfigError::UnknownColor:
        return "unknown color";
    case ConfigError::BadPattern:
        return "bad pattern";
    }
    return "unknown";
}

std::optional<std::string> PatternSet::BuildNamePattern(const std::string& name_format)
{
    if (countOccurrences(name_format, kSizePlaceholder) != 1)
        return std::nullopt;

    const auto idx = name_format.find(kSizePlaceholder);
    return "^" + utils::escape_regex(name_format.substr(0, idx)) + R"((\d+))" +
           utils::escape_regex(name_format.substr(idx + kSizePlaceholder.size())) + "$";
}

std::shared_ptr<const PatternSet> PatternSet::Compile(const ClaimPointSettings& settings, ConfigErrorInfo* error)
{
    std::shared_ptr<PatternSet> set(new PatternSet());
    set->settings_ = settings;

    auto name_source = BuildNamePattern(settings.name_format);
    if (!name_source)
    {
        fail(error, ConfigError::MissingPlaceholder,
             "Name format '" + settings.name_format + "' must contain %d exactly once.");
        return nullptr;
    }
    set->name_source_ = *name_source;
    const auto idx = settings.name_format.find(kSizePlaceholder);
    set->name_prefix_ = settings.name_format.substr(0, idx);
    set->name_suffix_ = settings.name_format.substr(idx + kSizePlaceholder.size());

    const auto alias_length = utils::codepointCount(settings.alias);
    if (!alias_length)
    {
        fail(error, ConfigError::BadAlias, "Alias is not valid UTF-8.");
        return nullptr;
    }
    if (*alias_length > kMaxAliasLength)
    {
        fail(error, ConfigError::BadAlias, "Alias '" + settings.alias + "' is longer than 2 characters.");
        return nullptr;
    }

    auto color = colorIndex(settings.color);
    if (!color)
    {
        fail(error, ConfigError::UnknownColor, "Color '" + settings.color + "' is not a valid waypoint color.");
        return nullptr;
    }
    set->color_index_ = *color;

    if (!compileOne(set->name_source_, "Name pattern", set->name_, error) ||
        !compileOne(settings.first_line_pattern, "First line pattern", set->start_, error) ||
        !compileOne(settings.claim_line_pattern, "Claim line pattern", set->claim_, error))
    {
        return nullptr;
    }

    if (set->claim_.mark_count() != kClaimLineGroups)
    {
        fail(error, ConfigError::BadPattern,
             "Claim line pattern '" + settings.claim_line_pattern + "' must have exactly 4 capture groups (has " +
                 std::to_string(set->claim_.mark_count()) + ").");
        return nullptr;
    }

    set->ignored_.reserve(settings.ignored_line_patterns.size());
    for (const auto& source : settings.ignored_line_patterns)
    {
        std::regex compiled;
        if (!compileOne(source, "Ignored line pattern", compiled, error))
            return nullptr;
        set->ignored_.push_back(std::move(compiled));
    }

    set->end_.reserve(settings.ending_line_patterns.size());
    for (const auto& source : settings.ending_line_patterns)
    {
        std::regex compiled;
        if (!compileOne(source, "Ending line pattern", compiled, error))
            return nullptr;
        set->end_.push_back(std::move(compiled));
    }

    if (error)
        *error = {};

    PLOG_DEBUG << "Compiled pattern set: name pattern " << set->name_source_ << ", " << set->ignored_.size()
               << " ignored, " << set->end_.size() << " ending";
    return set;
}

std::string PatternSet::formatName(std::uint32_t size) const
{
    return name_prefix_ + std::to_string(size) + name_suffix_;
}

std::optional<std::uint32_t> PatternSet::parseSize(const std::string& label) const
{
    std::smatch match;
    if (!std::regex_match(label, match, name_))
        return std::nullopt;

    std::uint32_t size = 0;
    if (parseNumber(match.str(1), size) != ExtractionError::None)
    {
        return std::nullopt;
    }
    return size;
}

std::optional<std::uint32_t> PatternSet::claimPointSize(const std::string& label, const std::string& alias,
                                                        int color) const
{
    if (alias != settings_.alias || color != color_index_)
        return std::nullopt;
    return parseSize(label);
}

} // namespace claimpoints
