#pragma once

#include "ledger/engine.hpp"
#include "ledger/engine_config.hpp"
#include "ledger/types.hpp"

#include <filesystem>
#include <random>
#include <string>
#include <system_error>
#include <utility>

namespace ledger_test {

using ledger::Direction;
using ledger::Timestamp;

inline Timestamp at(int64_t epoch_ms) {
    return journal::from_epoch_ms(epoch_ms);
}

inline ledger::EngineConfig memory_config() {
    ledger::EngineConfig config;
    config.journal_path.clear();
    return config;
}

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("structure_ledger_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline ledger::ProposedLine proposed(ledger::ItemId item_id, Direction direction, ledger::Quantity quantity) {
    ledger::ProposedLine line;
    line.item_id = item_id;
    line.direction = direction;
    line.quantity = quantity;
    return line;
}

// One tenant ("aurora") with a mine, a town and its import/export gates, three
// members, one outsider in another tenant, and a few items.
struct World {
    explicit World(ledger::EngineConfig config = memory_config())
        : engine(std::move(config)) {
        seed();
    }

    void seed() {
        coal = engine.add_item("Coal", "minecraft:coal", "ore");
        iron = engine.add_item("Iron Ingot", "minecraft:iron_ingot", "ingot");
        gold = engine.add_item("Gold Ingot", "minecraft:gold_ingot", "ingot");

        alice = engine.add_user("alice", tenant);
        bob = engine.add_user("bob", tenant);
        carol = engine.add_user("carol", tenant);
        outsider = engine.add_user("mallory", other_tenant);

        alice_ctx = ledger::CallerContext{tenant, alice.id};
        bob_ctx = ledger::CallerContext{tenant, bob.id};
        other_ctx = ledger::CallerContext{other_tenant, outsider.id};

        mine = engine.add_location(alice_ctx, location("Mithril Mine", "mithril", ledger::LocationType::Mine));
        town = engine.add_location(alice_ctx, location("Aurora Town", "town", ledger::LocationType::Town));
        import_gate = engine.add_location(alice_ctx, gate("Import Gate", "import", ledger::ExternalKind::Import));
        export_gate = engine.add_location(alice_ctx, gate("Export Gate", "export", ledger::ExternalKind::Export));
        foreign_town = engine.add_location(other_ctx, location("Elsewhere", "elsewhere", ledger::LocationType::Town));

        mined = engine.add_movement_reason(alice_ctx, "mined", "Mined");
        engine.add_movement_reason(alice_ctx, "sold", "Sold");
    }

    static ledger::NewLocation location(const std::string& name, const std::string& code, ledger::LocationType type) {
        ledger::NewLocation spec;
        spec.name = name;
        spec.code = code;
        spec.type = type;
        return spec;
    }

    static ledger::NewLocation gate(const std::string& name, const std::string& code, ledger::ExternalKind kind) {
        auto spec = location(name, code, ledger::LocationType::Other);
        spec.is_external = true;
        spec.external_kind = kind;
        return spec;
    }

    ledger::CreateTradeRequest request(int64_t epoch_ms) const {
        ledger::CreateTradeRequest trade;
        trade.timestamp = at(epoch_ms);
        return trade;
    }

    ledger::Quantity balance(const ledger::User& user, const ledger::Item& item) const {
        const auto row = engine.balances().get(ledger::BalanceKey{user.id, item.id, tenant});
        return row ? row->quantity : 0;
    }

    ledger::TenantId tenant = "aurora";
    ledger::TenantId other_tenant = "borealis";

    ledger::Engine engine;

    ledger::Item coal;
    ledger::Item iron;
    ledger::Item gold;
    ledger::User alice;
    ledger::User bob;
    ledger::User carol;
    ledger::User outsider;
    ledger::CallerContext alice_ctx;
    ledger::CallerContext bob_ctx;
    ledger::CallerContext other_ctx;
    ledger::Location mine;
    ledger::Location town;
    ledger::Location import_gate;
    ledger::Location export_gate;
    ledger::Location foreign_town;
    ledger::MovementReason mined;
};

} // namespace ledger_test
