#include <catch2/catch_test_macros.hpp>
#include "reconcile/Reconciler.hpp"
#include "waypoint/JsonWaypointStore.hpp"
#include "waypoint/WaypointManager.hpp"
#include "utils/claimpoints_fixtures.hpp"

#include <algorithm>

using namespace claimpoints;

namespace
{

constexpr int kWhite = 15;
constexpr int kRed = 12;

std::size_t countOps(const ReconcileDiff& diff, WaypointOpType type)
{
    return static_cast<std::size_t>(
        std::count_if(diff.ops.begin(), diff.ops.end(), [type](const WaypointOp& op) { return op.type == type; }));
}

} // namespace

TEST_CASE("Reconciler - Add against an empty store", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);

    auto diff = reconciler.reconcile({ { "World1", 10, 20, 100 } }, ScanKind::Add, {});

    REQUIRE(diff.ops.size() == 1);
    REQUIRE(diff.created == 1);
    const auto& op = diff.ops[0];
    REQUIRE(op.type == WaypointOpType::Create);
    REQUIRE(op.x == 10);
    REQUIRE(op.z == 20);
    REQUIRE(op.label == "Claim (100)");
    REQUIRE(op.alias == "CP");
    REQUIRE(op.color == kWhite);
}

TEST_CASE("Reconciler - Add is idempotent", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);
    JsonWaypointStore store;
    WaypointManager manager(store);

    const std::vector<ClaimRecord> records{
        { "World1", 10, 20, 100 },
        { "World1", -5, 7, 40 },
        { "World1", 10, 20, 999 }, // repeated corner yields one create
    };

    auto first = reconciler.reconcile(records, ScanKind::Add, store.list());
    REQUIRE(first.created == 2);
    REQUIRE(manager.apply(first) == 2);
    REQUIRE(store.count() == 2);

    auto second = reconciler.reconcile(records, ScanKind::Add, store.list());
    REQUIRE(second.empty());
}

TEST_CASE("Reconciler - Add leaves user waypoints alone", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);

    // Same corner, but a user waypoint: different alias.
    const std::vector<Waypoint> existing{ { .id = 1, .x = 10, .z = 20, .label = "Claim (100)", .alias = "H",
                                            .color = kWhite } };

    auto diff = reconciler.reconcile({ { "World1", 10, 20, 100 } }, ScanKind::Add, existing);
    REQUIRE(diff.created == 1);
    REQUIRE(diff.deleted == 0);
}

TEST_CASE("Reconciler - Clean removes only unbacked ClaimPoints", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);

    const std::vector<Waypoint> existing{
        { .id = 1, .x = 10, .z = 20, .label = "Claim (100)", .alias = "CP", .color = kWhite }, // backed
        { .id = 2, .x = 50, .z = 60, .label = "Claim (30)", .alias = "CP", .color = kWhite },  // stale
        { .id = 3, .x = 50, .z = 60, .label = "Home", .alias = "H", .color = kWhite },         // user
        { .id = 4, .x = 70, .z = 80, .label = "Claim (30)", .alias = "CP", .color = kRed },    // user colour
        { .id = 5, .x = 90, .z = 90, .label = "Mine (5)", .alias = "CP", .color = kWhite },    // user label
    };

    auto diff = reconciler.reconcile({ { "World1", 10, 20, 100 } }, ScanKind::Clean, existing);

    REQUIRE(diff.ops.size() == 1);
    REQUIRE(diff.deleted == 1);
    REQUIRE(diff.ops[0].type == WaypointOpType::Delete);
    REQUIRE(diff.ops[0].target == 2);
}

TEST_CASE("Reconciler - Clean is not scoped to the scanned world", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);

    // ClaimPoints created by an earlier scan of World2. Waypoints carry no
    // world, so a clean of World1 removes them as well.
    const std::vector<Waypoint> existing{
        { .id = 1, .x = 10, .z = 20, .label = "Claim (100)", .alias = "CP", .color = kWhite },
        { .id = 2, .x = 500, .z = 500, .label = "Claim (64)", .alias = "CP", .color = kWhite },
    };

    auto diff = reconciler.reconcile({ { "World1", 10, 20, 100 } }, ScanKind::Clean, existing);
    REQUIRE(diff.deleted == 1);
    REQUIRE(diff.ops[0].target == 2);

    SECTION("A claim of another world at the same corner keeps it")
    {
        auto kept = reconciler.reconcile({ { "World1", 10, 20, 100 }, { "World1", 500, 500, 64 } }, ScanKind::Clean,
                                         existing);
        REQUIRE(kept.empty());
    }
}

TEST_CASE("Reconciler - Clean with no claims removes every ClaimPoint", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);

    const std::vector<Waypoint> existing{
        { .id = 1, .x = 1, .z = 1, .label = "Claim (1)", .alias = "CP", .color = kWhite },
        { .id = 2, .x = 2, .z = 2, .label = "Claim (2)", .alias = "CP", .color = kWhite },
        { .id = 3, .x = 3, .z = 3, .label = "Spawn", .alias = "S", .color = 0 },
    };

    auto diff = reconciler.reconcile({}, ScanKind::Clean, existing);
    REQUIRE(diff.deleted == 2);
    REQUIRE(diff.created == 0);
}

TEST_CASE("Reconciler - Update relabels changed sizes", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);

    const std::vector<Waypoint> existing{
        { .id = 1, .x = 10, .z = 20, .label = "Claim (100)", .alias = "CP", .color = kWhite },
    };

    SECTION("Size grew from 100 to 150")
    {
        auto diff = reconciler.reconcile({ { "World1", 10, 20, 150 } }, ScanKind::Update, existing);

        REQUIRE(diff.ops.size() == 1);
        REQUIRE(diff.relabeled == 1);
        REQUIRE(countOps(diff, WaypointOpType::Delete) == 0);
        REQUIRE(countOps(diff, WaypointOpType::Create) == 0);
        REQUIRE(diff.ops[0].type == WaypointOpType::Relabel);
        REQUIRE(diff.ops[0].target == 1);
        REQUIRE(diff.ops[0].label == "Claim (150)");
    }

    SECTION("Unchanged size is left alone")
    {
        auto diff = reconciler.reconcile({ { "World1", 10, 20, 100 } }, ScanKind::Update, existing);
        REQUIRE(diff.empty());
    }

    SECTION("First record at a corner decides the size")
    {
        auto diff = reconciler.reconcile({ { "World1", 10, 20, 120 }, { "World1", 10, 20, 100 } }, ScanKind::Update,
                                         existing);
        REQUIRE(diff.relabeled == 1);
        REQUIRE(diff.ops[0].label == "Claim (120)");
    }
}

TEST_CASE("Reconciler - Update combines clean, add and relabel", "[reconcile]")
{
    auto patterns = test_utils::defaultPatterns();
    Reconciler reconciler(*patterns);
    JsonWaypointStore store;
    WaypointManager manager(store);

    store.create(10, 20, "Claim (100)", "CP", kWhite); // resized
    store.create(30, 40, "Claim (50)", "CP", kWhite);  // gone
    store.create(30, 40, "Base", "B", kRed);           // user waypoint

    const std::vector<ClaimRecord> records{ { "World1", 10, 20, 150 }, { "World1", 70, 80, 25 } };
    auto diff = reconciler.reconcile(records, ScanKind::Update, store.list());

    REQUIRE(diff.deleted == 1);
    REQUIRE(diff.created == 1);
    REQUIRE(diff.relabeled == 1);

    SECTION("Operations are ordered deletes, creates, relabels")
    {
        REQUIRE(diff.ops[0].type == WaypointOpType::Delete);
        REQUIRE(diff.ops[1].type == WaypointOpType::Create);
        REQUIRE(diff.ops[2].type == WaypointOpType::Relabel);
    }

    SECTION("Applying converges")
    {
        REQUIRE(manager.apply(diff) == 3);
        REQUIRE(store.count() == 3);
        REQUIRE(reconciler.reconcile(records, ScanKind::Update, store.list()).empty());

        auto claim_points = manager.claimPoints(*patterns);
        REQUIRE(claim_points.size() == 2);
    }

    SECTION("Applying twice is harmless")
    {
        manager.apply(diff);
        const auto after_first = store.list();
        // Only the relabel finds its target again, and it writes the same label.
        REQUIRE(manager.apply(diff) == 1);
        REQUIRE(store.count() == after_first.size());
        REQUIRE(store.list()[0].label == after_first[0].label);
    }
}
