#pragma once

#include "scanning/PatternSet.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_utils {

inline std::shared_ptr<const claimpoints::PatternSet> defaultPatterns()
{
    auto patterns = claimpoints::PatternSet::Compile(claimpoints::ClaimPointSettings{});
    if (!patterns)
        throw std::runtime_error("default settings do not compile");
    return patterns;
}

// A complete claim list response as the server prints it.
inline std::vector<std::string> claimListResponse(const std::vector<std::string>& claim_lines)
{
    std::vector<std::string> lines{ "Claims:", "5 blocks from play + 0 bonus = 5 total." };
    lines.insert(lines.end(), claim_lines.begin(), claim_lines.end());
    lines.push_back(" = 900 blocks left to spend");
    return lines;
}

// Unique file path in the temp directory, removed (with its .tmp sibling)
// when the helper goes out of scope.
class TempPath
{
public:
    explicit TempPath(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name)
    {
        cleanup();
    }

    ~TempPath() { cleanup(); }

    std::string str() const { return path_.string(); }

    void write(const std::string& content) const
    {
        std::ofstream file(path_, std::ios::binary | std::ios::trunc);
        file << content;
    }

    std::string read() const
    {
        std::ifstream file(path_, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

private:
    void cleanup() const
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        std::filesystem::remove(path_.string() + ".tmp", ec);
    }

    std::filesystem::path path_;
};

} // namespace test_utils
