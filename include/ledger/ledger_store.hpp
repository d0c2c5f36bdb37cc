#pragma once

#include "ledger/balance_materializer.hpp"
#include "ledger/codec.hpp"
#include "ledger/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ledger {

struct DeleteLineResult {
    TradeLineId deleted_line_id = 0;
    TradeId trade_id = 0;
    bool trade_deleted = false;
};

// A persisted line paired with its trade's timestamp.
struct MovementLine {
    TradeLine line;
    Timestamp timestamp{};
};

// Trades, trade lines and the player inventory ledger. Writers go through a
// WriteUnit, which holds the store exclusively from begin() until it is
// committed or destroyed; nothing staged in a unit is visible before commit.
class LedgerStore {
public:
    class WriteUnit {
    public:
        WriteUnit(WriteUnit&&) = default;
        WriteUnit& operator=(WriteUnit&&) = delete;
        WriteUnit(const WriteUnit&) = delete;
        WriteUnit& operator=(const WriteUnit&) = delete;

        // Dropping an uncommitted unit rolls it back.
        ~WriteUnit() = default;

        Trade stage_trade(const TenantId& tenant_id,
                          UserId recorded_by,
                          Timestamp timestamp,
                          std::optional<LocationId> default_from_location,
                          std::optional<LocationId> default_to_location);

        TradeLine stage_line(ItemId item_id,
                             Direction direction,
                             Quantity quantity,
                             Party from,
                             Party to,
                             std::optional<std::string> reason_code);

        // Appends a ledger row for one user party of a staged line and stages
        // the matching balance delta.
        LedgerEntry stage_ledger_entry(const TradeLine& line, UserId user_id, Quantity delta_qty);

        // Stages removal of a line (and its ledger rows) of the given tenant,
        // plus its trade when no line would remain.
        DeleteLineResult stage_line_delete(const TenantId& tenant_id, TradeLineId line_id);

        void commit();

        [[nodiscard]] bool committed() const noexcept { return committed_; }
        [[nodiscard]] const std::optional<TradeRecord>& staged_trade() const noexcept { return trade_; }

    private:
        friend class LedgerStore;
        explicit WriteUnit(LedgerStore& store);

        LedgerStore* store_;
        std::unique_lock<std::shared_mutex> lock_;
        std::optional<TradeRecord> trade_;
        std::vector<LedgerEntry> entries_;
        std::optional<DeleteLineResult> delete_;
        TradeId next_trade_id_;
        TradeLineId next_line_id_;
        LedgerEntryId next_entry_id_;
        bool committed_ = false;
    };

    explicit LedgerStore(BalanceMaterializer& balances);

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    void set_record_sink(RecordSink sink) { sink_ = std::move(sink); }

    WriteUnit begin();

    [[nodiscard]] std::optional<TradeRecord> find_trade(TradeId trade_id) const;
    // Newest first.
    [[nodiscard]] std::vector<TradeRecord> trades_for_tenant(const TenantId& tenant_id) const;
    // Lines of the tenant whose trade timestamp is <= as_of.
    [[nodiscard]] std::vector<MovementLine> movements_up_to(const TenantId& tenant_id, Timestamp as_of) const;
    // Oldest first; all users when user_id is empty.
    [[nodiscard]] std::vector<LedgerEntry> ledger_entries(const TenantId& tenant_id,
                                                          std::optional<UserId> user_id) const;

    [[nodiscard]] std::size_t trade_count() const;
    [[nodiscard]] std::size_t line_count() const;
    [[nodiscard]] std::size_t ledger_entry_count() const;

    bool replay(const nlohmann::json& record);

private:
    void apply_trade(const TradeRecord& record, const std::vector<LedgerEntry>& entries, Timestamp committed_at);
    void apply_delete(const DeleteLineResult& result);
    TradeRecord assemble(const Trade& trade) const;

    BalanceMaterializer& balances_;
    RecordSink sink_;
    mutable std::shared_mutex mutex_;

    std::map<TradeId, Trade> trades_;
    std::map<TradeLineId, TradeLine> lines_;
    std::map<TradeId, std::vector<TradeLineId>> lines_by_trade_;
    std::map<LedgerEntryId, LedgerEntry> entries_;

    TradeId next_trade_id_ = 1;
    TradeLineId next_line_id_ = 1;
    LedgerEntryId next_entry_id_ = 1;
};

} // namespace ledger
