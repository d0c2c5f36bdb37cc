#include "ledger/trade_validator.hpp"
#include "ledger/valuation_store.hpp"

#include "ledger_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

using ledger_test::Direction;
using ledger_test::World;
using ledger_test::at;
using ledger_test::proposed;

namespace {

// Movement history used by every aggregation test:
//   t=1000 import gate -> town  100 iron
//   t=2000 mine        -> town   64 coal
//   t=3000 town        -> export 30 iron
//   t=4000 mine        -> alice   5 gold (gold is never priced)
struct AggregationWorld : World {
    AggregationWorld() {
        engine.record_value(alice_ctx, coal.id, ledger::parse_money("0.010"), at(0));
        engine.record_value(alice_ctx, iron.id, ledger::parse_money("1.000"), at(0));

        move_between_locations(1000, iron, 100, import_gate, town);
        move_between_locations(2000, coal, 64, mine, town);
        move_between_locations(3000, iron, 30, town, export_gate);

        auto request = this->request(4000);
        auto line = proposed(gold.id, Direction::Gained, 5);
        line.from_location_id = mine.id;
        line.to_user_id = alice.id;
        request.lines.push_back(line);
        engine.create_trade(alice_ctx, request);
    }

    void move_between_locations(int64_t epoch_ms,
                                const ledger::Item& item,
                                ledger::Quantity quantity,
                                const ledger::Location& from,
                                const ledger::Location& to) {
        auto request = this->request(epoch_ms);
        auto line = proposed(item.id, Direction::Gained, quantity);
        line.from_location_id = from.id;
        line.to_location_id = to.id;
        request.lines.push_back(line);
        engine.create_trade(alice_ctx, request);
    }
};

} // namespace

TEST_CASE("Inventory summary excludes external legs unless asked", "[aggregation]") {
    AggregationWorld world;

    const auto internal = world.engine.get_inventory_summary(world.tenant, at(1500), false);
    REQUIRE(internal.rows.size() == 1);
    CHECK(internal.rows[0].item_id == world.iron.id);
    CHECK(internal.rows[0].quantity == 100);
    CHECK(internal.rows[0].total_value == ledger::parse_money("100"));

    // The import gate's -100 leg cancels the town's +100.
    const auto with_external = world.engine.get_inventory_summary(world.tenant, at(1500), true);
    CHECK(with_external.include_external);
    CHECK(with_external.rows.empty());
    CHECK(with_external.grand_total_value == 0);
}

TEST_CASE("Inventory summary orders by quantity and keeps unknown values local", "[aggregation]") {
    AggregationWorld world;

    const auto summary = world.engine.get_inventory_summary(world.tenant, at(5000), false);
    REQUIRE(summary.rows.size() == 2);

    CHECK(summary.rows[0].item_name == "Iron Ingot");
    CHECK(summary.rows[0].quantity == 70);
    CHECK(summary.rows[0].unit_value == ledger::parse_money("1"));
    CHECK(summary.rows[0].total_value == ledger::parse_money("70"));

    CHECK(summary.rows[1].item_name == "Gold Ingot");
    CHECK(summary.rows[1].quantity == -5);
    CHECK_FALSE(summary.rows[1].unit_value.has_value());
    CHECK_FALSE(summary.rows[1].total_value.has_value());

    // Coal nets to zero across mine and town and is omitted.
    CHECK(summary.grand_total_value == ledger::parse_money("70"));
}

TEST_CASE("Item by location lists internal locations before external ones", "[aggregation]") {
    AggregationWorld world;

    const auto rows = world.engine.get_item_by_location(world.tenant, world.iron.id, at(5000), true);
    REQUIRE(rows.size() == 3);
    CHECK(rows[0].location_id == world.town.id);
    CHECK(rows[0].quantity == 70);
    CHECK_FALSE(rows[0].is_external);
    CHECK(rows[1].location_name == "Export Gate");
    CHECK(rows[1].quantity == 30);
    CHECK(rows[1].external_kind == ledger::ExternalKind::Export);
    CHECK(rows[2].location_name == "Import Gate");
    CHECK(rows[2].quantity == -100);
    CHECK(rows[2].value == ledger::parse_money("-100"));

    const auto internal_only = world.engine.get_item_by_location(world.tenant, world.iron.id, at(5000), false);
    REQUIRE(internal_only.size() == 1);
    CHECK(internal_only[0].location_id == world.town.id);
}

TEST_CASE("By location totals quantities and values per location", "[aggregation]") {
    AggregationWorld world;

    const auto rows = world.engine.get_by_location(world.tenant, at(5000), true);
    REQUIRE(rows.size() == 4);

    CHECK(rows[0].location_id == world.town.id);
    CHECK(rows[0].total_quantity == 134);
    CHECK(rows[0].total_value == ledger::parse_money("70.640"));

    // Unpriced gold leaves the mine's value unknown; it sorts after priced rows.
    CHECK(rows[1].location_id == world.mine.id);
    CHECK(rows[1].total_quantity == -69);
    CHECK_FALSE(rows[1].total_value.has_value());

    CHECK(rows[2].location_id == world.export_gate.id);
    CHECK(rows[3].location_id == world.import_gate.id);

    const auto internal_only = world.engine.get_by_location(world.tenant, at(5000), false);
    CHECK(internal_only.size() == 2);
}

TEST_CASE("Location by item hides zero rows and orders by item id", "[aggregation]") {
    AggregationWorld world;

    const auto town = world.engine.get_location_by_item(world.tenant, world.town.id, at(5000));
    REQUIRE(town.size() == 2);
    CHECK(town[0].item_id == world.coal.id);
    CHECK(town[0].quantity == 64);
    CHECK(town[0].value == ledger::parse_money("0.640"));
    CHECK(town[1].item_id == world.iron.id);

    // At t=2500 the export leg has not happened yet.
    const auto early = world.engine.get_location_by_item(world.tenant, world.export_gate.id, at(2500));
    CHECK(early.empty());
}

TEST_CASE("Aggregations only see the caller's tenant", "[aggregation]") {
    AggregationWorld world;
    CHECK(world.engine.get_inventory_summary(world.other_tenant, at(5000), true).rows.empty());
    CHECK(world.engine.get_by_location(world.other_tenant, at(5000), true).empty());
    CHECK(world.engine.get_location_by_item(world.other_tenant, world.town.id, at(5000)).empty());
}

TEST_CASE("Values that do not fit Money become unknown per row", "[aggregation]") {
    World world;
    world.engine.record_value(world.alice_ctx, world.gold.id, ledger::ValuationStore::kMaxValue, at(0));
    world.engine.record_value(world.alice_ctx, world.coal.id, ledger::parse_money("0.010"), at(0));

    auto request = world.request(1000);
    for (int i = 0; i < 10; ++i) {
        auto line = proposed(world.gold.id, Direction::Gained, ledger::TradeValidator::kMaxLineQuantity);
        line.from_location_id = world.import_gate.id;
        line.to_location_id = world.town.id;
        request.lines.push_back(line);
    }
    auto coal = proposed(world.coal.id, Direction::Gained, 100);
    coal.from_location_id = world.mine.id;
    coal.to_location_id = world.town.id;
    request.lines.push_back(coal);
    world.engine.create_trade(world.alice_ctx, request);

    const auto summary = world.engine.get_inventory_summary(world.tenant, at(2000));
    // Coal nets to zero across mine and town and is omitted.
    REQUIRE(summary.rows.size() == 1);
    CHECK(summary.rows[0].item_id == world.gold.id);
    CHECK(summary.rows[0].quantity == 10 * ledger::TradeValidator::kMaxLineQuantity);
    CHECK(summary.rows[0].unit_value == ledger::ValuationStore::kMaxValue);
    CHECK_FALSE(summary.rows[0].total_value.has_value());
    CHECK(summary.grand_total_value == 0);

    const auto locations = world.engine.get_by_location(world.tenant, at(2000), false);
    REQUIRE(locations.size() == 2);
    CHECK(locations[0].location_id == world.mine.id);
    CHECK(locations[0].total_value == ledger::parse_money("-1.000"));
    CHECK(locations[1].location_id == world.town.id);
    CHECK_FALSE(locations[1].total_value.has_value());

    const auto town_items = world.engine.get_location_by_item(world.tenant, world.town.id, at(2000));
    REQUIRE(town_items.size() == 2);
    CHECK(town_items[0].item_id == world.coal.id);
    CHECK(town_items[0].value == ledger::parse_money("1.000"));
    CHECK_FALSE(town_items[1].value.has_value());
}
