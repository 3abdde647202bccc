#include "LineClassifier.hpp"

#include <algorithm>

namespace claimpoints
{

namespace
{

bool matchesAny(const std::string& line, const std::vector<std::regex>& patterns)
{
    return std::any_of(patterns.begin(), patterns.end(),
                       [&line](const std::regex& re) { return std::regex_match(line, re); });
}

// First non-None error wins, so a line is reported once.
void mergeError(ExtractionError& current, ExtractionError next)
{
    if (current == ExtractionError::None)
        current = next;
}

} // namespace

LineClassification classifyLine(const std::string& line, const PatternSet& patterns)
{
    LineClassification result;

    if (matchesAny(line, patterns.end()))
    {
        result.kind = LineClass::End;
        return result;
    }

    if (matchesAny(line, patterns.ignored()))
    {
        result.kind = LineClass::Ignored;
        return result;
    }

    std::smatch match;
    if (std::regex_match(line, match, patterns.claim()))
    {
        result.kind = LineClass::ClaimData;
        result.record.world = match.str(1);
        mergeError(result.error, parseNumber(match.str(2), result.record.x));
        mergeError(result.error, parseNumber(match.str(3), result.record.z));
        mergeError(result.error, parseNumber(match.str(4), result.record.size));
        if (result.error != ExtractionError::None)
        {
            result.record.x = 0;
            result.record.z = 0;
            result.record.size = 0;
        }
        return result;
    }

    if (std::regex_match(line, patterns.start()))
    {
        result.kind = LineClass::Start;
        return result;
    }

    return result;
}

} // namespace claimpoints
