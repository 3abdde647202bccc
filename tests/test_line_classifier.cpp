#include <catch2/catch_test_macros.hpp>
#include "scanning/LineClassifier.hpp"
#include "utils/claimpoints_fixtures.hpp"

using namespace claimpoints;

TEST_CASE("LineClassifier - Default report lines", "[scanning][classifier]")
{
    auto patterns = test_utils::defaultPatterns();

    REQUIRE(classifyLine("Claims:", *patterns).kind == LineClass::Ignored);
    REQUIRE(classifyLine("5 blocks from play + 0 bonus = 5 total.", *patterns).kind == LineClass::Start);
    REQUIRE(classifyLine(" = 900 blocks left to spend", *patterns).kind == LineClass::End);
    REQUIRE(classifyLine("<Steve> hello", *patterns).kind == LineClass::Unrecognized);
    REQUIRE(classifyLine("", *patterns).kind == LineClass::Unrecognized);

    auto claim = classifyLine("World1: x10, z20 (100 blocks)", *patterns);
    REQUIRE(claim.kind == LineClass::ClaimData);
    REQUIRE(claim.hasRecord());
    REQUIRE(claim.record == ClaimRecord{ "World1", 10, 20, 100 });
}

TEST_CASE("LineClassifier - Claim line extraction", "[scanning][classifier]")
{
    auto patterns = test_utils::defaultPatterns();

    SECTION("Negative coordinates")
    {
        auto cls = classifyLine("world_nether: x-150, z-3 (25 blocks)", *patterns);
        REQUIRE(cls.hasRecord());
        REQUIRE(cls.record.world == "world_nether");
        REQUIRE(cls.record.x == -150);
        REQUIRE(cls.record.z == -3);
        REQUIRE(cls.record.size == 25);
    }

    SECTION("Negative size is read as its magnitude")
    {
        auto cls = classifyLine("World1: x1, z2 (-40 blocks)", *patterns);
        REQUIRE(cls.hasRecord());
        REQUIRE(cls.record.size == 40);
    }

    SECTION("World names with spaces and colons")
    {
        auto cls = classifyLine("My World: East: x5, z6 (7 blocks)", *patterns);
        REQUIRE(cls.hasRecord());
        REQUIRE(cls.record.world == "My World: East");
    }

    SECTION("Coordinate overflow")
    {
        auto cls = classifyLine("World1: x99999999999, z0 (10 blocks)", *patterns);
        REQUIRE(cls.kind == LineClass::ClaimData);
        REQUIRE(cls.error == ExtractionError::NumericOverflow);
        REQUIRE_FALSE(cls.hasRecord());
        REQUIRE(cls.record.world == "World1");
        REQUIRE(cls.record.x == 0);
    }

    SECTION("Size overflow")
    {
        auto cls = classifyLine("World1: x1, z1 (4294967296 blocks)", *patterns);
        REQUIRE(cls.error == ExtractionError::NumericOverflow);
    }

    SECTION("Integer limits still fit")
    {
        auto cls = classifyLine("World1: x-2147483648, z2147483647 (4294967295 blocks)", *patterns);
        REQUIRE(cls.hasRecord());
        REQUIRE(cls.record.x == -2147483648LL);
        REQUIRE(cls.record.z == 2147483647);
        REQUIRE(cls.record.size == 4294967295u);
    }
}

TEST_CASE("LineClassifier - Matcher precedence", "[scanning][classifier]")
{
    ClaimPointSettings settings;

    SECTION("Ending wins over ignored")
    {
        settings.ignored_line_patterns = { "^---$" };
        settings.ending_line_patterns = { "^---$" };
        auto patterns = PatternSet::Compile(settings);
        REQUIRE(patterns != nullptr);
        REQUIRE(classifyLine("---", *patterns).kind == LineClass::End);
    }

    SECTION("Ignored wins over claim data")
    {
        settings.ignored_line_patterns = { R"(^Admin: x\d+, z\d+ \(\d+ blocks\)$)" };
        auto patterns = PatternSet::Compile(settings);
        REQUIRE(patterns != nullptr);
        REQUIRE(classifyLine("Admin: x1, z2 (3 blocks)", *patterns).kind == LineClass::Ignored);
        REQUIRE(classifyLine("World: x1, z2 (3 blocks)", *patterns).kind == LineClass::ClaimData);
    }

    SECTION("Claim data wins over the first line")
    {
        settings.first_line_pattern = ".*";
        auto patterns = PatternSet::Compile(settings);
        REQUIRE(patterns != nullptr);
        REQUIRE(classifyLine("World: x1, z2 (3 blocks)", *patterns).kind == LineClass::ClaimData);
        REQUIRE(classifyLine("anything", *patterns).kind == LineClass::Start);
    }

    SECTION("Patterns match whole lines only")
    {
        auto patterns = PatternSet::Compile(settings);
        REQUIRE(patterns != nullptr);
        REQUIRE(classifyLine("Claims: extra", *patterns).kind == LineClass::Unrecognized);
    }
}
