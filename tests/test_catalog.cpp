#include "ledger/catalog.hpp"
#include "ledger/errors.hpp"

#include "ledger_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using ledger_test::World;

TEST_CASE("Catalog rejects duplicate item codes", "[catalog]") {
    ledger::Catalog catalog;
    const auto coal = catalog.add_item("Coal", "minecraft:coal", "ore");
    CHECK(coal.id == 1);
    CHECK(coal.stack_size == 64);
    CHECK_THROWS_AS(catalog.add_item("Charcoal", " minecraft:coal ", "ore"), ledger::CatalogError);
    CHECK_THROWS_AS(catalog.add_item("", "minecraft:stone", "block"), ledger::CatalogError);
    CHECK_THROWS_AS(catalog.add_item("Stone", "minecraft:stone", "block", 0), ledger::CatalogError);
}

TEST_CASE("Location codes are unique per tenant only", "[catalog]") {
    World world;
    CHECK_THROWS_AS(world.engine.add_location(world.alice_ctx, World::location("Other", "town", ledger::LocationType::Town)),
                    ledger::CatalogError);
    CHECK_NOTHROW(world.engine.add_location(world.other_ctx, World::location("Their town", "town", ledger::LocationType::Town)));
}

TEST_CASE("External locations need a kind and hold a single active slot", "[catalog]") {
    World world;

    auto missing_kind = World::location("Dock", "dock", ledger::LocationType::Port);
    missing_kind.is_external = true;
    CHECK_THROWS_AS(world.engine.add_location(world.alice_ctx, missing_kind), ledger::CatalogError);

    const auto second_import = World::gate("Second Import", "import2", ledger::ExternalKind::Import);
    CHECK_THROWS_AS(world.engine.add_location(world.alice_ctx, second_import), ledger::CatalogError);

    auto inactive_import = second_import;
    inactive_import.is_active = false;
    const auto parked = world.engine.add_location(world.alice_ctx, inactive_import);

    // Re-activating the parked gate while the first import gate is active breaks the rule.
    CHECK_THROWS_AS(world.engine.set_location_active(world.alice_ctx, parked.id, true), ledger::CatalogError);

    world.engine.set_location_active(world.alice_ctx, world.import_gate.id, false);
    const auto activated = world.engine.set_location_active(world.alice_ctx, parked.id, true);
    CHECK(activated.is_active);

    // Another tenant has its own slots.
    CHECK_NOTHROW(world.engine.add_location(world.other_ctx, World::gate("Their Import", "import", ledger::ExternalKind::Import)));
}

TEST_CASE("Locations of another tenant are invisible", "[catalog]") {
    World world;
    CHECK_THROWS_AS(world.engine.set_location_active(world.alice_ctx, world.foreign_town.id, false),
                    ledger::NotFoundError);

    const auto locations = world.engine.list_locations(world.alice_ctx);
    REQUIRE(locations.size() == 4);
    CHECK(locations.front().name == "Aurora Town");
    for (const auto& location : locations) {
        CHECK(location.tenant_id == world.tenant);
    }
}

TEST_CASE("Movement reasons can be deactivated", "[catalog]") {
    World world;
    CHECK_THROWS_AS(world.engine.add_movement_reason(world.alice_ctx, "mined", "Again"), ledger::CatalogError);

    world.engine.set_movement_reason_active(world.alice_ctx, "sold", false);
    const auto active = world.engine.list_movement_reasons(world.alice_ctx, true);
    REQUIRE(active.size() == 1);
    CHECK(active[0].code == "mined");
    CHECK(world.engine.list_movement_reasons(world.alice_ctx, false).size() == 2);
    CHECK(world.engine.list_movement_reasons(world.other_ctx, false).empty());

    CHECK_THROWS_AS(world.engine.set_movement_reason_active(world.other_ctx, "mined", false), ledger::NotFoundError);
}

TEST_CASE("User membership follows tenant assignment", "[catalog]") {
    ledger::Catalog catalog;
    const auto steve = catalog.add_user("steve", std::nullopt);
    CHECK_FALSE(catalog.is_member("aurora", steve.id));

    catalog.assign_user_tenant(steve.id, ledger::TenantId{"aurora"});
    CHECK(catalog.is_member("aurora", steve.id));
    CHECK_FALSE(catalog.is_member("borealis", steve.id));

    CHECK_THROWS_AS(catalog.add_user("steve", ledger::TenantId{"aurora"}), ledger::CatalogError);
    CHECK_THROWS_AS(catalog.assign_user_tenant(999, std::nullopt), ledger::NotFoundError);
}

TEST_CASE("Catalog emits records before applying and replays them", "[catalog]") {
    std::vector<nlohmann::json> records;
    ledger::Catalog source;
    source.set_record_sink([&](const nlohmann::json& record) { records.push_back(record); });

    source.add_item("Coal", "minecraft:coal", "ore");
    ledger::NewLocation gate;
    gate.name = "Gate";
    gate.code = "gate";
    gate.is_external = true;
    gate.external_kind = ledger::ExternalKind::Export;
    const auto location = source.add_location("aurora", gate);
    source.add_movement_reason("aurora", "mined", "Mined");
    source.set_movement_reason_active("aurora", "mined", false);
    REQUIRE(records.size() == 4);

    ledger::Catalog restored;
    for (const auto& record : records) {
        CHECK(restored.replay(record));
    }
    CHECK_FALSE(restored.replay({{"type", "trade"}}));

    REQUIRE(restored.find_item(1).has_value());
    const auto replayed = restored.find_location("aurora", location.id);
    REQUIRE(replayed.has_value());
    CHECK(replayed->external_kind == ledger::ExternalKind::Export);
    CHECK_FALSE(restored.find_movement_reason("aurora", "mined")->is_active);

    // Ids continue after the replayed ones.
    CHECK(restored.add_item("Iron", "minecraft:iron", "ingot").id == 2);
}

TEST_CASE("A failing sink leaves the catalog untouched", "[catalog]") {
    ledger::Catalog catalog;
    catalog.set_record_sink([](const nlohmann::json&) { throw ledger::PersistenceError("disk full"); });

    CHECK_THROWS_AS(catalog.add_item("Coal", "minecraft:coal", "ore"), ledger::PersistenceError);
    CHECK(catalog.list_items().empty());
}
