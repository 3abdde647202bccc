#include <catch2/catch_test_macros.hpp>
#include "scanning/ClaimScanSession.hpp"
#include "scanning/ScanDiagnostics.hpp"
#include "utils/claimpoints_fixtures.hpp"

using namespace claimpoints;
using namespace std::chrono_literals;

namespace
{

ScanSessionCreateInfo makeInfo(IScanSession::Clock::time_point start, std::chrono::milliseconds timeout = 5000ms)
{
    return ScanSessionCreateInfo{ .patterns = test_utils::defaultPatterns(), .started_at = start, .timeout = timeout };
}

} // namespace

TEST_CASE("ClaimScanSession - Example report", "[scanning][session]")
{
    const auto t0 = IScanSession::Clock::now();
    ClaimScanSession session(makeInfo(t0), "World1", ScanKind::Add);

    REQUIRE(session.State() == ScanState::AwaitingStart);
    REQUIRE(session.IsActive());

    for (const std::string line : { "Claims:", "5 blocks from play + 0 bonus = 5 total.",
                                    "World1: x10, z20 (100 blocks)", " = 900 blocks left to spend" })
    {
        session.FeedLine(line);
    }

    REQUIRE(session.State() == ScanState::Completed);
    REQUIRE_FALSE(session.IsActive());
    REQUIRE(session.Records().size() == 1);
    REQUIRE(session.Records()[0] == ClaimRecord{ "World1", 10, 20, 100 });
}

TEST_CASE("ClaimScanSession - Gating on the first line", "[scanning][session]")
{
    const auto t0 = IScanSession::Clock::now();
    ClaimScanSession session(makeInfo(t0), "World1", ScanKind::Update);

    SECTION("Noise and stray claim lines before the header are ignored")
    {
        REQUIRE_FALSE(session.FeedLine("<Alex> hi"));
        REQUIRE_FALSE(session.FeedLine("World1: x1, z1 (1 blocks)"));
        REQUIRE_FALSE(session.FeedLine(" = 900 blocks left to spend"));
        REQUIRE(session.State() == ScanState::AwaitingStart);

        REQUIRE(session.FeedLine("5 blocks from play + 0 bonus = 5 total."));
        REQUIRE(session.FeedLine("World1: x10, z20 (100 blocks)"));
        session.FeedLine("Claims:");
        REQUIRE(session.FeedLine("World1: x30, z40 (200 blocks)"));
        REQUIRE(session.FeedLine(" = 900 blocks left to spend"));

        REQUIRE(session.State() == ScanState::Completed);
        REQUIRE(session.Records() ==
                std::vector<ClaimRecord>{ { "World1", 10, 20, 100 }, { "World1", 30, 40, 200 } });
    }

    SECTION("Lines after completion are ignored")
    {
        for (const auto& line : test_utils::claimListResponse({ "World1: x1, z2 (3 blocks)" }))
            session.FeedLine(line);
        REQUIRE(session.State() == ScanState::Completed);

        REQUIRE_FALSE(session.FeedLine("World1: x9, z9 (9 blocks)"));
        REQUIRE(session.Records().size() == 1);
    }

    SECTION("Unrecognized lines while collecting are counted")
    {
        session.FeedLine("5 blocks from play + 0 bonus = 5 total.");
        session.FeedLine("<Alex> brb");
        session.FeedLine("<Alex> back");
        REQUIRE(session.State() == ScanState::Collecting);
        REQUIRE(session.UnrecognizedCount() == 2);
    }
}

TEST_CASE("ClaimScanSession - World filtering and bad lines", "[scanning][session]")
{
    const auto t0 = IScanSession::Clock::now();
    ClaimScanSession session(makeInfo(t0), "World1", ScanKind::Add);

    const auto lines = test_utils::claimListResponse({
        "World1: x1, z1 (10 blocks)",
        "world1: x2, z2 (10 blocks)",
        "World2: x3, z3 (10 blocks)",
        "World1: x99999999999, z4 (10 blocks)",
        "World1: x1, z1 (10 blocks)",
    });
    for (const auto& line : lines)
        session.FeedLine(line);

    REQUIRE(session.State() == ScanState::Completed);
    // Duplicates are kept in arrival order.
    REQUIRE(session.Records() == std::vector<ClaimRecord>{ { "World1", 1, 1, 10 }, { "World1", 1, 1, 10 } });
    REQUIRE(session.FilteredCount() == 2);
    REQUIRE(session.DroppedCount() == 1);

    auto taken = session.TakeRecords();
    REQUIRE(taken.size() == 2);
}

TEST_CASE("ClaimScanSession - Timeout", "[scanning][session]")
{
    const auto t0 = IScanSession::Clock::now();
    ClaimScanSession session(makeInfo(t0, 1000ms), "World1", ScanKind::Add);

    SECTION("Header and one claim but no ending line")
    {
        session.FeedLine("5 blocks from play + 0 bonus = 5 total.");
        session.FeedLine("World1: x10, z20 (100 blocks)");

        REQUIRE_FALSE(session.CheckTimeout(t0 + 999ms));
        REQUIRE(session.State() == ScanState::Collecting);

        REQUIRE(session.CheckTimeout(t0 + 1000ms));
        REQUIRE(session.State() == ScanState::TimedOut);

        // Terminal: a late ending line does not complete it.
        REQUIRE_FALSE(session.FeedLine(" = 900 blocks left to spend"));
        REQUIRE(session.State() == ScanState::TimedOut);
        REQUIRE_FALSE(session.CheckTimeout(t0 + 5000ms));
    }

    SECTION("No response at all")
    {
        REQUIRE(session.HasTimedOut(t0 + 2s));
        REQUIRE(session.CheckTimeout(t0 + 2s));
        REQUIRE(session.State() == ScanState::TimedOut);
        REQUIRE(session.Records().empty());
    }

    SECTION("Completed sessions never time out")
    {
        for (const auto& line : test_utils::claimListResponse({}))
            session.FeedLine(line);
        REQUIRE(session.State() == ScanState::Completed);
        REQUIRE_FALSE(session.CheckTimeout(t0 + 1h));
        REQUIRE(session.State() == ScanState::Completed);
    }
}

TEST_CASE("ScanDiagnostics - Line preview", "[scan]")
{
    SECTION("Control characters are escaped or replaced")
    {
        REQUIRE(ScanDiagnostics::Preview("a\tb\r\n") == "a\\tb\\r\\n");
        REQUIRE(ScanDiagnostics::Preview(std::string("x\x07y")) == "x?y");
    }

    SECTION("Long lines are cut with the full size noted")
    {
        const std::string line(ScanDiagnostics::kMaxPreview + 10, 'c');
        const auto preview = ScanDiagnostics::Preview(line);
        REQUIRE(preview.substr(0, ScanDiagnostics::kMaxPreview) == line.substr(0, ScanDiagnostics::kMaxPreview));
        REQUIRE(preview.substr(ScanDiagnostics::kMaxPreview) == "... (130 bytes)");
    }

    SECTION("A multi-byte character at the cut is left out whole")
    {
        const std::string head(ScanDiagnostics::kMaxPreview - 1, 'c');
        const std::string line = head + "\xC3\x89" + "tail";
        REQUIRE(ScanDiagnostics::Preview(line) == head + "... (" + std::to_string(line.size()) + " bytes)");

        // Fits exactly: nothing is dropped.
        const std::string fits = std::string(ScanDiagnostics::kMaxPreview - 2, 'c') + "\xC3\x89";
        REQUIRE(ScanDiagnostics::Preview(fits) == fits);
    }
}
