#include "ledger/errors.hpp"
#include "ledger/profit_calculator.hpp"
#include "ledger/valuation_store.hpp"

#include "ledger_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

using ledger_test::at;

TEST_CASE("get_value_at picks the latest row effective at or before as_of", "[valuation]") {
    ledger::ValuationStore store;
    ledger::ProfitCalculator pricing{store};

    store.record_value("aurora", 1, 1000, at(1000), 1);
    store.record_value("aurora", 1, 1500, at(5000), 1);

    CHECK_FALSE(pricing.get_value_at("aurora", 1, at(999)).has_value());
    CHECK(pricing.get_value_at("aurora", 1, at(1000)) == 1000);
    CHECK(pricing.get_value_at("aurora", 1, at(4999)) == 1000);
    CHECK(pricing.get_value_at("aurora", 1, at(5000)) == 1500);
    CHECK(pricing.get_value_at("aurora", 1, at(90000)) == 1500);

    // Prices are per tenant.
    CHECK_FALSE(pricing.get_value_at("borealis", 1, at(90000)).has_value());
}

TEST_CASE("Valuations never come from the future of as_of", "[valuation]") {
    ledger::ValuationStore store;
    for (int64_t t = 100; t <= 1000; t += 100) {
        store.record_value("aurora", 7, t, at(t), 1);
    }

    ledger::Timestamp previous_effective{};
    for (int64_t as_of = 0; as_of <= 1100; as_of += 50) {
        const auto valuation = store.valuation_at("aurora", 7, at(as_of));
        if (!valuation) {
            CHECK(as_of < 100);
            continue;
        }
        CHECK(valuation->effective_from <= at(as_of));
        CHECK(valuation->effective_from >= previous_effective);
        previous_effective = valuation->effective_from;
    }
}

TEST_CASE("record_value enforces range and one row per effective_from", "[valuation]") {
    ledger::ValuationStore store;
    CHECK_THROWS_AS(store.record_value("aurora", 1, 0, at(1), 1), ledger::CatalogError);
    CHECK_THROWS_AS(store.record_value("aurora", 1, ledger::ValuationStore::kMaxValue + 1, at(1), 1),
                    ledger::CatalogError);
    CHECK_NOTHROW(store.record_value("aurora", 1, ledger::ValuationStore::kMinValue, at(1), 1));
    CHECK_NOTHROW(store.record_value("aurora", 1, ledger::ValuationStore::kMaxValue, at(2), 1));
    CHECK_THROWS_AS(store.record_value("aurora", 1, 5000, at(1), 1), ledger::CatalogError);
    CHECK_NOTHROW(store.record_value("borealis", 1, 5000, at(1), 1));
}

TEST_CASE("list_values orders by item then newest first", "[valuation]") {
    ledger::ValuationStore store;
    store.record_value("aurora", 2, 2000, at(10), 1);
    store.record_value("aurora", 1, 1000, at(10), 1);
    store.record_value("aurora", 1, 1100, at(20), 1);
    store.record_value("borealis", 1, 9000, at(10), 1);

    const auto all = store.list_values("aurora", std::nullopt);
    REQUIRE(all.size() == 3);
    CHECK(all[0].item_id == 1);
    CHECK(all[0].value == 1100);
    CHECK(all[1].value == 1000);
    CHECK(all[2].item_id == 2);

    CHECK(store.list_values("aurora", ledger::ItemId{2}).size() == 1);
}

TEST_CASE("Engine record_value requires an active item", "[valuation]") {
    ledger_test::World world;
    const auto valuation = world.engine.record_value(world.alice_ctx, world.iron.id, 1000, at(10));
    CHECK(valuation.recorded_by == world.alice.id);
    CHECK(valuation.tenant_id == world.tenant);

    CHECK_THROWS_AS(world.engine.record_value(world.alice_ctx, 999, 1000, at(10)), ledger::InvalidItemError);

    world.engine.set_item_active(world.gold.id, false);
    CHECK_THROWS_AS(world.engine.record_value(world.alice_ctx, world.gold.id, 1000, at(10)),
                    ledger::InvalidItemError);
}
