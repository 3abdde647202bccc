#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace claimpoints
{

enum class ScanKind
{
    Add,   // create missing ClaimPoints
    Clean, // remove ClaimPoints without a live claim
    Update // Clean + Add + relabel changed sizes
};

enum class ScanState
{
    AwaitingStart, // ignoring everything until the report header arrives
    Collecting,    // header seen, accumulating claim lines
    Completed,     // ending line seen
    TimedOut       // no ending line within the bound
};

enum class LineClass
{
    Start,
    ClaimData,
    Ignored,
    End,
    Unrecognized
};

enum class ExtractionError
{
    None,
    NumericOverflow, // captured number does not fit the field
    InvalidNumber    // captured text is not a number at all
};

struct ClaimRecord
{
    std::string world;
    std::int32_t x = 0;
    std::int32_t z = 0;
    std::uint32_t size = 0;

    bool operator==(const ClaimRecord&) const = default;
};

const char* toString(ScanKind kind);
const char* toString(ScanState state);
const char* toString(LineClass cls);
const char* toString(ExtractionError error);

/// Parse a whole captured group as an integer of type T.
template <typename T>
ExtractionError parseNumber(std::string_view text, T& out)
{
    if (text.empty())
        return ExtractionError::InvalidNumber;

    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec == std::errc::result_out_of_range)
        return ExtractionError::NumericOverflow;
    if (ec != std::errc() || ptr != last)
        return ExtractionError::InvalidNumber;
    return ExtractionError::None;
}

} // namespace claimpoints
