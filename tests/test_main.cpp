// Test main file - Catch2 provides main() function
// This file is intentionally minimal as Catch2WithMain handles everything

#include <catch2/catch_test_macros.hpp>
#include "scanning/PatternSet.hpp"

// Simple smoke test to verify the test framework and the core library link
TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
    REQUIRE(claimpoints::PatternSet::Compile(claimpoints::ClaimPointSettings{}) != nullptr);
}
