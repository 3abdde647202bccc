#include "ScanSessionBase.hpp"
#include "ScanDiagnostics.hpp"

#include <plog/Log.h>

namespace claimpoints
{

ScanSessionBase::ScanSessionBase(const ScanSessionCreateInfo& create_info)
    : patterns_(create_info.patterns)
    , started_at_(create_info.started_at)
    , timeout_(create_info.timeout)
{
}

bool ScanSessionBase::FeedLine(const std::string& line)
{
    if (!IsActive() || !patterns_)
        return false;

    ++lines_seen_;
    const LineClassification cls = classifyLine(line, *patterns_);

    if (ScanDiagnostics::IsVerbose())
    {
        PLOG_DEBUG_(ScanDiagnostics::kLogInstance)
            << Name() << " [" << toString(state_) << "] " << toString(cls.kind) << ": "
            << ScanDiagnostics::Preview(line);
    }

    if (state_ == ScanState::AwaitingStart)
    {
        if (cls.kind != LineClass::Start)
            return false;

        state_ = ScanState::Collecting;
        PLOG_DEBUG << Name() << ": report header received";
        return true;
    }

    switch (cls.kind)
    {
    case LineClass::End:
        state_ = ScanState::Completed;
        PLOG_DEBUG << Name() << ": report complete after " << lines_seen_ << " lines (" << unrecognized_
                   << " unrecognized, " << dropped_ << " dropped)";
        return true;
    case LineClass::ClaimData:
        if (cls.error != ExtractionError::None)
        {
            PLOG_WARNING << Name() << ": " << toString(cls.error) << " in claim line: "
                         << ScanDiagnostics::Preview(line);
        }
        return OnClaimLine(cls);
    case LineClass::Unrecognized:
        ++unrecognized_;
        return false;
    case LineClass::Start:
    case LineClass::Ignored:
        return false;
    }
    return false;
}

bool ScanSessionBase::HasTimedOut(Clock::time_point now) const
{
    return IsActive() && now - started_at_ >= timeout_;
}

bool ScanSessionBase::CheckTimeout(Clock::time_point now)
{
    if (!HasTimedOut(now))
        return false;

    PLOG_WARNING << Name() << ": no complete response within " << timeout_.count() << " ms (state "
                 << toString(state_) << ")";
    state_ = ScanState::TimedOut;
    return true;
}

} // namespace claimpoints
