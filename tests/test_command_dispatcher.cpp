#include "ledger/command_dispatcher.hpp"

#include "ledger_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using nlohmann::json;
using ledger_test::World;

namespace {

json ctx(const World& world) {
    return json{{"tenant_id", world.tenant}, {"user_id", world.alice.id}};
}

json mined_trade(const World& world, int64_t timestamp) {
    return json{
        {"timestamp", timestamp},
        {"from_location_id", world.mine.id},
        {"lines", json::array({
            {{"item_id", world.iron.id}, {"direction", "GAINED"}, {"quantity", 10},
             {"to_user_id", world.alice.id}, {"movement_reason_code", "mined"}}
        })}
    };
}

} // namespace

TEST_CASE("Dispatcher creates trades and reports profit as money text", "[dispatcher]") {
    World world;
    ledger::CommandDispatcher dispatcher{world.engine};

    const auto priced = dispatcher.handle({
        {"command", "record_value"}, {"ctx", ctx(world)}, {"item_id", world.iron.id},
        {"value", "1.25"}, {"effective_from", 0}
    });
    REQUIRE(priced.at("ok") == true);
    CHECK(priced.at("result").at("value") == "1.250");

    const auto created = dispatcher.handle({
        {"id", "req-1"}, {"command", "create_trade"}, {"ctx", ctx(world)}, {"trade", mined_trade(world, 1000)}
    });
    REQUIRE(created.at("ok") == true);
    CHECK(created.at("id") == "req-1");
    CHECK(created.at("result").at("profit") == "12.500");
    CHECK(created.at("result").at("lines").size() == 1);
    CHECK(created.at("result").at("lines")[0].at("from").at("location_id") == world.mine.id);

    const auto inventory = dispatcher.handle({
        {"command", "player_inventory"}, {"ctx", ctx(world)}, {"user_id", world.alice.id}, {"as_of", 2000}
    });
    REQUIRE(inventory.at("ok") == true);
    CHECK(inventory.at("result").at("items")[0].at("quantity") == 10);
    CHECK(inventory.at("result").at("total_value") == "12.500");
}

TEST_CASE("Dispatcher maps engine errors to codes", "[dispatcher]") {
    World world;
    ledger::CommandDispatcher dispatcher{world.engine};

    auto trade = mined_trade(world, 1000);
    trade["lines"][0]["from_user_id"] = world.alice.id;
    const auto invalid = dispatcher.handle({{"command", "create_trade"}, {"ctx", ctx(world)}, {"trade", trade}});
    CHECK(invalid.at("ok") == false);
    CHECK(invalid.at("error") == "invalid_party");
    CHECK(invalid.at("message").get<std::string>().find("line 1") != std::string::npos);

    const auto missing = dispatcher.handle({{"command", "delete_trade_line"}, {"ctx", ctx(world)}, {"line_id", 42}});
    CHECK(missing.at("error") == "not_found");

    const auto unknown = dispatcher.handle({{"command", "launch_rockets"}});
    CHECK(unknown.at("error") == "unknown_command");

    const auto incomplete = dispatcher.handle({{"command", "delete_trade_line"}, {"ctx", ctx(world)}});
    CHECK(incomplete.at("error") == "bad_request");

    const auto bad_direction = dispatcher.handle({
        {"command", "create_trade"}, {"ctx", ctx(world)},
        {"trade", {{"lines", json::array({{{"item_id", 1}, {"direction", "UP"}, {"quantity", 1}}})}}}
    });
    CHECK(bad_direction.at("error") == "bad_request");

    CHECK(dispatcher.handle_line("{not json").at("error") == "bad_request");
    CHECK(dispatcher.handle_line("[1,2]").at("error") == "bad_request");
}

TEST_CASE("Dispatcher serves aggregation and ledger views", "[dispatcher]") {
    World world;
    ledger::CommandDispatcher dispatcher{world.engine};
    dispatcher.handle({{"command", "create_trade"}, {"ctx", ctx(world)}, {"trade", mined_trade(world, 1000)}});
    dispatcher.handle({{"command", "create_trade"}, {"ctx", ctx(world)}, {"trade", mined_trade(world, 2000)}});

    const auto summary = dispatcher.handle({{"command", "inventory_summary"}, {"ctx", ctx(world)}, {"as_of", 5000}});
    REQUIRE(summary.at("ok") == true);
    CHECK(summary.at("result").at("include_external") == false);
    CHECK(summary.at("result").at("rows")[0].at("qty") == -20);
    CHECK(summary.at("result").at("rows")[0].at("total_value").is_null());

    const auto by_location = dispatcher.handle({{"command", "by_location"}, {"ctx", ctx(world)}, {"as_of", 5000}});
    CHECK(by_location.at("result").size() == 1);
    CHECK(by_location.at("result")[0].at("location_id") == world.mine.id);

    const auto ledger_page = dispatcher.handle({
        {"command", "player_ledger"}, {"ctx", ctx(world)}, {"user_id", world.alice.id}, {"limit", 1}
    });
    REQUIRE(ledger_page.at("ok") == true);
    CHECK(ledger_page.at("result").at("total") == 2);
    REQUIRE(ledger_page.at("result").at("rows").size() == 1);
    CHECK(ledger_page.at("result").at("rows")[0].at("timestamp") == 2000);

    const auto foreign = dispatcher.handle({
        {"command", "player_ledger"}, {"ctx", ctx(world)}, {"user_id", world.outsider.id}
    });
    CHECK(foreign.at("error") == "not_found");

    const auto trades = dispatcher.handle({{"command", "list_trades"}, {"ctx", ctx(world)}});
    REQUIRE(trades.at("result").size() == 2);
    CHECK(trades.at("result")[0].at("gained").size() == 1);
    CHECK(trades.at("result")[0].at("given").empty());

    const auto reconcile = dispatcher.handle({{"command", "reconcile"}, {"ctx", ctx(world)}});
    CHECK(reconcile.at("result").empty());

    const auto names = dispatcher.commands();
    CHECK(std::find(names.begin(), names.end(), "location_by_item") != names.end());
}

TEST_CASE("Dispatcher rejects ledger pages that cannot be served", "[dispatcher]") {
    World world;
    ledger::CommandDispatcher dispatcher{world.engine};
    dispatcher.handle({{"command", "create_trade"}, {"ctx", ctx(world)}, {"trade", mined_trade(world, 1000)}});

    const auto page = [&](json bounds) {
        json request{{"command", "player_ledger"}, {"ctx", ctx(world)}, {"user_id", world.alice.id}};
        request.update(bounds);
        return dispatcher.handle(request);
    };

    CHECK(page({{"limit", -1}, {"offset", 1}}).at("error") == "bad_request");
    CHECK(page({{"offset", -5}}).at("error") == "bad_request");
    CHECK(page({{"limit", 0}}).at("error") == "bad_request");
    CHECK(page({{"limit", ledger::EngineConfig::kMaxPlayerLedgerPageLimit + 1}}).at("error") == "bad_request");

    const auto past_end = page({{"limit", ledger::EngineConfig::kMaxPlayerLedgerPageLimit}, {"offset", 1000000}});
    REQUIRE(past_end.at("ok") == true);
    CHECK(past_end.at("result").at("total") == 1);
    CHECK(past_end.at("result").at("rows").empty());
}
