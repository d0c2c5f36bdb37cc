#pragma once

#include "journal/journal.hpp"
#include "ledger/aggregation.hpp"
#include "ledger/balance_materializer.hpp"
#include "ledger/catalog.hpp"
#include "ledger/engine_config.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/ledger_writer.hpp"
#include "ledger/profit_calculator.hpp"
#include "ledger/trade_validator.hpp"
#include "ledger/types.hpp"
#include "ledger/valuation_store.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

struct CreateTradeResult {
    TradeRecord record;
    std::optional<Money> profit;
};

struct TradeView {
    TradeRecord record;
    std::vector<TradeLine> gained;
    std::vector<TradeLine> given;
    std::optional<Money> profit;
};

struct PlayerInventoryItem {
    ItemId item_id = 0;
    std::string item_name;
    Quantity quantity = 0;
    Timestamp updated_at{};
    std::optional<Money> unit_value;
    std::optional<Money> total_value;
};

struct PlayerInventory {
    UserId user_id = 0;
    TenantId tenant_id;
    std::optional<Timestamp> as_of;
    std::vector<PlayerInventoryItem> items;
    std::optional<Money> total_value;   // only when priced at as_of
};

struct PlayerLedgerPage {
    UserId user_id = 0;
    std::size_t total = 0;
    std::size_t limit = 0;
    std::size_t offset = 0;
    std::vector<LedgerEntry> entries;
};

struct BalanceMismatch {
    BalanceKey key;
    Quantity materialized = 0;
    Quantity ledger_sum = 0;
};

// Owns every store of one ledger instance and routes committed changes to the
// journal. All tenant-scoped operations take the caller's context.
class Engine {
public:
    explicit Engine(EngineConfig config = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Rebuilds every table from the journal. Returns the number of records
    // applied; call once before the first write.
    std::size_t load();

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    // Catalog
    Item add_item(const std::string& name, const std::string& code, const std::string& category, int stack_size = 64);
    Item set_item_active(ItemId item_id, bool active);
    Location add_location(const CallerContext& ctx, const NewLocation& spec);
    Location set_location_active(const CallerContext& ctx, LocationId location_id, bool active);
    MovementReason add_movement_reason(const CallerContext& ctx, const std::string& code, const std::string& name);
    MovementReason set_movement_reason_active(const CallerContext& ctx, const std::string& code, bool active);
    User add_user(const std::string& username, std::optional<TenantId> tenant_id);
    User assign_user_tenant(UserId user_id, std::optional<TenantId> tenant_id);
    [[nodiscard]] std::vector<Item> list_items() const;
    [[nodiscard]] std::vector<Location> list_locations(const CallerContext& ctx) const;
    [[nodiscard]] std::vector<MovementReason> list_movement_reasons(const CallerContext& ctx, bool active_only) const;

    // Valuations
    ItemValuation record_value(const CallerContext& ctx, ItemId item_id, Money value, Timestamp effective_from);
    [[nodiscard]] std::vector<ItemValuation> list_values(const CallerContext& ctx, std::optional<ItemId> item_id) const;
    [[nodiscard]] std::optional<Money> get_value_at(const TenantId& tenant_id, ItemId item_id, Timestamp as_of) const;

    // Trades
    CreateTradeResult create_trade(const CallerContext& ctx, const CreateTradeRequest& request);
    DeleteLineResult delete_trade_line(const CallerContext& ctx, TradeLineId line_id);
    [[nodiscard]] std::optional<Money> get_trade_profit(TradeId trade_id) const;
    [[nodiscard]] std::optional<Money> get_trade_profit(const CallerContext& ctx, TradeId trade_id) const;
    [[nodiscard]] std::vector<TradeView> list_trades(const CallerContext& ctx, bool view_all) const;

    // Aggregations
    [[nodiscard]] InventorySummary get_inventory_summary(const TenantId& tenant_id,
                                                         Timestamp as_of,
                                                         bool include_external = false) const;
    [[nodiscard]] std::vector<ItemLocationRow> get_item_by_location(const TenantId& tenant_id,
                                                                    ItemId item_id,
                                                                    Timestamp as_of,
                                                                    bool include_external = true) const;
    [[nodiscard]] std::vector<LocationSummaryRow> get_by_location(const TenantId& tenant_id,
                                                                  Timestamp as_of,
                                                                  bool include_external = true) const;
    [[nodiscard]] std::vector<LocationItemRow> get_location_by_item(const TenantId& tenant_id,
                                                                    LocationId location_id,
                                                                    Timestamp as_of) const;

    // Player views
    [[nodiscard]] PlayerInventory get_player_inventory(const CallerContext& ctx,
                                                       UserId user_id,
                                                       std::optional<Timestamp> as_of) const;
    // limit defaults to the configured page size and must lie in
    // [1, EngineConfig::kMaxPlayerLedgerPageLimit]; anything else is a "bad_request".
    [[nodiscard]] PlayerLedgerPage get_player_ledger(const CallerContext& ctx,
                                                     UserId user_id,
                                                     std::optional<std::size_t> limit,
                                                     std::size_t offset) const;

    // Keys whose materialized balance differs from the sum of their ledger rows.
    [[nodiscard]] std::vector<BalanceMismatch> reconcile(const TenantId& tenant_id) const;

    [[nodiscard]] const LedgerStore& store() const noexcept { return store_; }
    [[nodiscard]] const BalanceMaterializer& balances() const noexcept { return balances_; }

private:
    void persist(const nlohmann::json& record);
    void require_member(const CallerContext& ctx, UserId user_id) const;

    EngineConfig config_;
    std::unique_ptr<journal::Journal> journal_;

    Catalog catalog_;
    ValuationStore valuations_;
    BalanceMaterializer balances_;
    LedgerStore store_;
    TradeValidator validator_;
    LedgerWriter writer_;
    ProfitCalculator pricing_;
    AggregationQueries aggregation_;
};

} // namespace ledger
