#include "ScanTypes.hpp"

namespace claimpoints
{

const char* toString(ScanKind kind)
{
    switch (kind)
    {
    case ScanKind::Add:
        return "add";
    case ScanKind::Clean:
        return "clean";
    case ScanKind::Update:
        return "update";
    }
    return "unknown";
}

const char* toString(ScanState state)
{
    switch (state)
    {
    case ScanState::AwaitingStart:
        return "AwaitingStart";
    case ScanState::Collecting:
        return "Collecting";
    case ScanState::Completed:
        return "Completed";
    case ScanState::TimedOut:
        return "TimedOut";
    }
    return "Unknown";
}

const char* toString(LineClass cls)
{
    switch (cls)
    {
    case LineClass::Start:
        return "Start";
    case LineClass::ClaimData:
        return "ClaimData";
    case LineClass::Ignored:
        return "Ignored";
    case LineClass::End:
        return "End";
    case LineClass::Unrecognized:
        return "Unrecognized";
    }
    return "Unknown";
}

const char* toString(ExtractionError error)
{
    switch (error)
    {
    case ExtractionError::None:
        return "none";
    case ExtractionError::NumericOverflow:
        return "numeric overflow";
    case ExtractionError::InvalidNumber:
        return "invalid number";
    }
    return "unknown";
}

} // namespace claimpoints
