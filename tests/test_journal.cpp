#include "journal/journal.hpp"

#include "ledger_fixture.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <stdexcept>

TEST_CASE("Journal requires a storage path", "[journal]") {
    CHECK_THROWS_AS(journal::Journal{""}, std::invalid_argument);
}

TEST_CASE("Journal load on a missing file returns nothing", "[journal]") {
    ledger_test::TempDir dir;
    journal::Journal log{dir.path() / "nested" / "journal.jsonl"};

    CHECK(log.load().empty());
    CHECK(log.skipped_on_load() == 0);
}

TEST_CASE("Journal appends records in order", "[journal]") {
    ledger_test::TempDir dir;
    journal::Journal log{dir.path() / "data" / "journal.jsonl"};

    log.append({{"type", "item"}, {"seq", 1}});
    log.append({{"type", "trade"}, {"seq", 2}});

    const auto records = log.load();
    REQUIRE(records.size() == 2);
    CHECK(records[0].at("seq") == 1);
    CHECK(records[1].at("type") == "trade");
}

TEST_CASE("Journal skips torn and non-object lines", "[journal]") {
    ledger_test::TempDir dir;
    const auto path = dir.path() / "journal.jsonl";
    {
        std::ofstream out(path);
        out << R"({"type":"item","seq":1})" << '\n'
            << R"([1,2,3])" << '\n'
            << '\n'
            << R"({"type":"trade","se)" << '\n';
    }

    journal::Journal log{path};
    const auto records = log.load();
    REQUIRE(records.size() == 1);
    CHECK(records[0].at("seq") == 1);
    CHECK(log.skipped_on_load() == 2);
}
