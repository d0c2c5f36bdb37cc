#include "ledger/engine.hpp"

#include "ledger/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <map>
#include <utility>

namespace ledger {

Engine::Engine(EngineConfig config)
    : config_(std::move(config)),
      store_(balances_),
      validator_(catalog_),
      writer_(store_, validator_),
      pricing_(valuations_),
      aggregation_(store_, catalog_, pricing_) {
    if (!config_.journal_path.empty()) {
        journal_ = std::make_unique<journal::Journal>(config_.journal_path);
        const auto sink = [this](const nlohmann::json& record) { persist(record); };
        catalog_.set_record_sink(sink);
        valuations_.set_record_sink(sink);
        store_.set_record_sink(sink);
    }
}

std::size_t Engine::load() {
    if (!journal_) {
        std::clog << "[Ledger] No journal configured; running in memory." << std::endl;
        return 0;
    }

    const auto records = journal_->load();
    std::size_t applied = 0;
    std::size_t ignored = 0;
    for (const auto& record : records) {
        try {
            if (catalog_.replay(record) || valuations_.replay(record) || store_.replay(record)) {
                ++applied;
            } else {
                ++ignored;
                std::cerr << "[Journal] Unknown record type: " << record.value("type", std::string{"<none>"})
                          << std::endl;
            }
        } catch (const std::exception& ex) {
            ++ignored;
            std::cerr << "[Journal] Failed to replay record: " << ex.what() << std::endl;
        }
    }

    if (applied == 0) {
        std::clog << "[Ledger] No prior records found; starting fresh." << std::endl;
    } else {
        std::clog << "[Ledger] Replayed " << applied << " records from " << journal_->path().string()
                  << " (" << store_.trade_count() << " trades, " << store_.line_count() << " lines)" << std::endl;
    }
    if (ignored > 0 || journal_->skipped_on_load() > 0) {
        std::cerr << "[Ledger] Ignored " << ignored + journal_->skipped_on_load() << " journal records" << std::endl;
    }
    return applied;
}

Item Engine::add_item(const std::string& name, const std::string& code, const std::string& category, int stack_size) {
    return catalog_.add_item(name, code, category, stack_size);
}

Item Engine::set_item_active(ItemId item_id, bool active) {
    return catalog_.set_item_active(item_id, active);
}

Location Engine::add_location(const CallerContext& ctx, const NewLocation& spec) {
    return catalog_.add_location(ctx.tenant_id, spec);
}

Location Engine::set_location_active(const CallerContext& ctx, LocationId location_id, bool active) {
    return catalog_.set_location_active(ctx.tenant_id, location_id, active);
}

MovementReason Engine::add_movement_reason(const CallerContext& ctx, const std::string& code, const std::string& name) {
    return catalog_.add_movement_reason(ctx.tenant_id, code, name);
}

MovementReason Engine::set_movement_reason_active(const CallerContext& ctx, const std::string& code, bool active) {
    return catalog_.set_movement_reason_active(ctx.tenant_id, code, active);
}

User Engine::add_user(const std::string& username, std::optional<TenantId> tenant_id) {
    return catalog_.add_user(username, std::move(tenant_id));
}

User Engine::assign_user_tenant(UserId user_id, std::optional<TenantId> tenant_id) {
    return catalog_.assign_user_tenant(user_id, std::move(tenant_id));
}

std::vector<Item> Engine::list_items() const {
    return catalog_.list_items();
}

std::vector<Location> Engine::list_locations(const CallerContext& ctx) const {
    return catalog_.list_locations(ctx.tenant_id);
}

std::vector<MovementReason> Engine::list_movement_reasons(const CallerContext& ctx, bool active_only) const {
    return catalog_.list_movement_reasons(ctx.tenant_id, active_only);
}

ItemValuation Engine::record_value(const CallerContext& ctx, ItemId item_id, Money value, Timestamp effective_from) {
    if (ctx.tenant_id.empty()) {
        throw ValidationError("Caller has no structure", "no_structure");
    }
    const auto item = catalog_.find_item(item_id);
    if (!item || !item->is_active) {
        throw InvalidItemError("Unknown or inactive item " + std::to_string(item_id));
    }
    return valuations_.record_value(ctx.tenant_id, item_id, value, effective_from, ctx.user_id);
}

std::vector<ItemValuation> Engine::list_values(const CallerContext& ctx, std::optional<ItemId> item_id) const {
    return valuations_.list_values(ctx.tenant_id, item_id);
}

std::optional<Money> Engine::get_value_at(const TenantId& tenant_id, ItemId item_id, Timestamp as_of) const {
    return pricing_.get_value_at(tenant_id, item_id, as_of);
}

CreateTradeResult Engine::create_trade(const CallerContext& ctx, const CreateTradeRequest& request) {
    CreateTradeResult result;
    result.record = writer_.create_trade(ctx, request);
    result.profit = pricing_.compute_profit(result.record);
    return result;
}

DeleteLineResult Engine::delete_trade_line(const CallerContext& ctx, TradeLineId line_id) {
    return writer_.delete_trade_line(ctx.tenant_id, line_id);
}

std::optional<Money> Engine::get_trade_profit(TradeId trade_id) const {
    const auto record = store_.find_trade(trade_id);
    if (!record) {
        throw NotFoundError("Trade not found");
    }
    return pricing_.compute_profit(*record);
}

std::optional<Money> Engine::get_trade_profit(const CallerContext& ctx, TradeId trade_id) const {
    const auto record = store_.find_trade(trade_id);
    if (!record || record->trade.tenant_id != ctx.tenant_id) {
        throw NotFoundError("Trade not found");
    }
    return pricing_.compute_profit(*record);
}

std::vector<TradeView> Engine::list_trades(const CallerContext& ctx, bool view_all) const {
    const auto involves_caller = [&](const TradeRecord& record) {
        if (record.trade.recorded_by == ctx.user_id) {
            return true;
        }
        return std::any_of(record.lines.begin(), record.lines.end(), [&](const TradeLine& line) {
            return party_user(line.from) == ctx.user_id || party_user(line.to) == ctx.user_id;
        });
    };

    std::vector<TradeView> views;
    for (auto& record : store_.trades_for_tenant(ctx.tenant_id)) {
        if (!view_all && !involves_caller(record)) {
            continue;
        }
        TradeView view;
        for (const auto& line : record.lines) {
            (line.direction == Direction::Gained ? view.gained : view.given).push_back(line);
        }
        view.profit = pricing_.compute_profit(record);
        view.record = std::move(record);
        views.push_back(std::move(view));
    }
    return views;
}

InventorySummary Engine::get_inventory_summary(const TenantId& tenant_id, Timestamp as_of, bool include_external) const {
    return aggregation_.inventory_summary(tenant_id, as_of, include_external);
}

std::vector<ItemLocationRow> Engine::get_item_by_location(const TenantId& tenant_id,
                                                          ItemId item_id,
                                                          Timestamp as_of,
                                                          bool include_external) const {
    return aggregation_.item_by_location(tenant_id, item_id, as_of, include_external);
}

std::vector<LocationSummaryRow> Engine::get_by_location(const TenantId& tenant_id,
                                                        Timestamp as_of,
                                                        bool include_external) const {
    return aggregation_.by_location(tenant_id, as_of, include_external);
}

std::vector<LocationItemRow> Engine::get_location_by_item(const TenantId& tenant_id,
                                                          LocationId location_id,
                                                          Timestamp as_of) const {
    return aggregation_.location_by_item(tenant_id, location_id, as_of);
}

PlayerInventory Engine::get_player_inventory(const CallerContext& ctx,
                                             UserId user_id,
                                             std::optional<Timestamp> as_of) const {
    require_member(ctx, user_id);

    PlayerInventory inventory;
    inventory.user_id = user_id;
    inventory.tenant_id = ctx.tenant_id;
    inventory.as_of = as_of;
    if (as_of) {
        inventory.total_value = Money{0};
    }

    for (const auto& row : balances_.rows_for_user(ctx.tenant_id, user_id)) {
        const auto item = catalog_.find_item(row.key.item_id);
        if (!item) {
            continue;
        }
        PlayerInventoryItem entry;
        entry.item_id = item->id;
        entry.item_name = item->name;
        entry.quantity = row.quantity;
        entry.updated_at = row.updated_at;
        if (as_of) {
            // Unpriced items count as zero in the player's total.
            entry.unit_value = pricing_.get_value_at(ctx.tenant_id, item->id, *as_of).value_or(0);
            entry.total_value = safe_mul(*entry.unit_value, row.quantity);
            inventory.total_value = safe_add(*inventory.total_value, *entry.total_value);
        }
        inventory.items.push_back(std::move(entry));
    }

    std::stable_sort(inventory.items.begin(), inventory.items.end(),
                     [](const PlayerInventoryItem& a, const PlayerInventoryItem& b) {
                         return a.item_name < b.item_name;
                     });
    return inventory;
}

PlayerLedgerPage Engine::get_player_ledger(const CallerContext& ctx,
                                           UserId user_id,
                                           std::optional<std::size_t> limit,
                                           std::size_t offset) const {
    require_member(ctx, user_id);

    auto entries = store_.ledger_entries(ctx.tenant_id, user_id);
    std::sort(entries.begin(), entries.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.id > b.id;
    });

    PlayerLedgerPage page;
    page.user_id = user_id;
    page.total = entries.size();
    page.limit = limit.value_or(config_.player_ledger_page_limit);
    page.offset = offset;
    if (page.limit == 0 || page.limit > EngineConfig::kMaxPlayerLedgerPageLimit) {
        throw ValidationError("limit must be between 1 and " + std::to_string(EngineConfig::kMaxPlayerLedgerPageLimit),
                              "bad_request");
    }
    if (offset < entries.size()) {
        const auto end = offset + std::min(page.limit, entries.size() - offset);
        page.entries.assign(entries.begin() + static_cast<std::ptrdiff_t>(offset),
                            entries.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return page;
}

std::vector<BalanceMismatch> Engine::reconcile(const TenantId& tenant_id) const {
    using Key = std::pair<UserId, ItemId>;
    std::map<Key, Quantity> ledger_sums;
    for (const auto& entry : store_.ledger_entries(tenant_id, std::nullopt)) {
        auto& sum = ledger_sums[{entry.user_id, entry.item_id}];
        sum = safe_add(sum, entry.delta_qty);
    }

    std::map<Key, Quantity> materialized;
    for (const auto& row : balances_.rows_for_tenant(tenant_id)) {
        materialized[{row.key.user_id, row.key.item_id}] = row.quantity;
    }

    std::map<Key, BalanceMismatch> mismatches;
    const auto note = [&](const Key& key, Quantity balance, Quantity sum) {
        if (balance == sum) {
            return;
        }
        BalanceMismatch mismatch;
        mismatch.key = BalanceKey{key.first, key.second, tenant_id};
        mismatch.materialized = balance;
        mismatch.ledger_sum = sum;
        mismatches[key] = mismatch;
    };
    for (const auto& [key, balance] : materialized) {
        const auto it = ledger_sums.find(key);
        note(key, balance, it == ledger_sums.end() ? 0 : it->second);
    }
    for (const auto& [key, sum] : ledger_sums) {
        if (materialized.count(key) == 0) {
            note(key, 0, sum);
        }
    }

    std::vector<BalanceMismatch> report;
    report.reserve(mismatches.size());
    for (auto& [key, mismatch] : mismatches) {
        report.push_back(std::move(mismatch));
    }
    if (!report.empty()) {
        std::cerr << "[Ledger] Reconciliation found " << report.size() << " drifting balances for tenant "
                  << tenant_id << std::endl;
    }
    return report;
}

void Engine::persist(const nlohmann::json& record) {
    try {
        journal_->append(record);
    } catch (const std::exception& ex) {
        std::cerr << "[Journal] Append failed: " << ex.what() << std::endl;
        throw PersistenceError("Failed to persist change");
    }
}

void Engine::require_member(const CallerContext& ctx, UserId user_id) const {
    if (!catalog_.is_member(ctx.tenant_id, user_id)) {
        throw NotFoundError("User not found");
    }
}

} // namespace ledger
