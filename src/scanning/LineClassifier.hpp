#pragma once

#include "PatternSet.hpp"
#include "ScanTypes.hpp"

#include <string>

namespace claimpoints
{

struct LineClassification
{
    LineClass kind = LineClass::Unrecognized;

    // ClaimData only. record.world is always filled; the numeric fields are
    // valid only when error == ExtractionError::None.
    ClaimRecord record;
    ExtractionError error = ExtractionError::None;

    bool hasRecord() const { return kind == LineClass::ClaimData && error == ExtractionError::None; }
};

/**
 * @brief Classify one chat line against a pattern set
 *
 * Matchers are tried in a fixed order: ending, ignored, claim, first line.
 * Ending comes first so a separator that also looks like noise still ends
 * the report.
 */
LineClassification classifyLine(const std::string& line, const PatternSet& patterns);

} // namespace claimpoints
