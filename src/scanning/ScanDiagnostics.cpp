#include "ScanDiagnostics.hpp"

#include <algorithm>

namespace claimpoints
{

std::atomic<bool> ScanDiagnostics::verbose_{ false };

void ScanDiagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool ScanDiagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

std::string ScanDiagnostics::Preview(std::string_view text)
{
    std::size_t limit = std::min(text.size(), kMaxPreview);

    // Never cut inside a UTF-8 sequence
    if (limit < text.size())
    {
        while (limit > 0 && (text[limit] & 0x80) && !(text[limit] & 0x40))
        {
            --limit;
        }
    }

    std::string out;
    out.reserve(limit + 16);

    for (char ch : text.substr(0, limit))
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }

    if (text.size() > limit)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

void ScanDiagnostics::sanitize(std::string& text)
{
    // Chat lines may carry formatting control bytes.
    auto is_control = [](unsigned char c) { return c < 0x20 || c == 0x7f; };
    std::replace_if(text.begin(), text.end(), [&](char c) { return is_control(static_cast<unsigned char>(c)); }, '?');
}

} // namespace claimpoints
