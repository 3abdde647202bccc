#include <catch2/catch_test_macros.hpp>
#include "scanning/WorldScanSession.hpp"
#include "utils/claimpoints_fixtures.hpp"

using namespace claimpoints;
using namespace std::chrono_literals;

TEST_CASE("WorldScanSession - Distinct worlds in first-seen order", "[scanning][worlds]")
{
    const auto t0 = IScanSession::Clock::now();
    WorldScanSession session({ .patterns = test_utils::defaultPatterns(), .started_at = t0, .timeout = 5000ms });

    session.FeedLine("world_nether: x0, z0 (1 blocks)"); // before the header
    for (const auto& line : test_utils::claimListResponse({
             "world: x1, z1 (10 blocks)",
             "world_the_end: x2, z2 (10 blocks)",
             "world: x3, z3 (10 blocks)",
             "world_nether: x99999999999, z4 (10 blocks)",
         }))
    {
        session.FeedLine(line);
    }

    REQUIRE(session.State() == ScanState::Completed);
    REQUIRE(session.Worlds() == std::vector<std::string>{ "world", "world_the_end", "world_nether" });
}

TEST_CASE("WorldScanSession - Empty report", "[scanning][worlds]")
{
    const auto t0 = IScanSession::Clock::now();
    WorldScanSession session({ .patterns = test_utils::defaultPatterns(), .started_at = t0, .timeout = 100ms });

    SECTION("Completes with no worlds")
    {
        for (const auto& line : test_utils::claimListResponse({}))
            session.FeedLine(line);
        REQUIRE(session.State() == ScanState::Completed);
        REQUIRE(session.Worlds().empty());
    }

    SECTION("Times out with what was seen")
    {
        session.FeedLine("5 blocks from play + 0 bonus = 5 total.");
        session.FeedLine("world: x1, z1 (10 blocks)");
        REQUIRE(session.CheckTimeout(t0 + 100ms));
        REQUIRE(session.State() == ScanState::TimedOut);
        REQUIRE(session.Worlds() == std::vector<std::string>{ "world" });
    }
}
