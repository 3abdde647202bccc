#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace claimpoints
{

// Trace channel for chat lines seen by the scan sessions. Lines go to a
// separate plog instance so the main log stays readable.
class ScanDiagnostics
{
public:
    static constexpr int kLogInstance = 1;
    static constexpr std::size_t kMaxPreview = 120;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
};

} // namespace claimpoints
