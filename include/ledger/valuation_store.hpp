#pragma once

#include "ledger/codec.hpp"
#include "ledger/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace ledger {

// Append-only price history per (tenant, item). A new price is a new row.
class ValuationStore {
public:
    static constexpr Money kMinValue = 1;                        // 0.001
    static constexpr Money kMaxValue = 1000000 * kMoneyScale;    // 1,000,000

    ValuationStore() = default;

    ValuationStore(const ValuationStore&) = delete;
    ValuationStore& operator=(const ValuationStore&) = delete;

    void set_record_sink(RecordSink sink) { sink_ = std::move(sink); }

    // Item existence is the caller's concern; this store only enforces the
    // value range and one row per (tenant, item, effective_from).
    ItemValuation record_value(const TenantId& tenant_id,
                               ItemId item_id,
                               Money value,
                               Timestamp effective_from,
                               UserId recorded_by);

    // Row with the greatest effective_from <= as_of, if any.
    [[nodiscard]] std::optional<ItemValuation> valuation_at(const TenantId& tenant_id,
                                                            ItemId item_id,
                                                            Timestamp as_of) const;

    // Ordered by item ascending, then effective_from descending.
    [[nodiscard]] std::vector<ItemValuation> list_values(const TenantId& tenant_id,
                                                         std::optional<ItemId> item_id) const;

    bool replay(const nlohmann::json& record);

private:
    using Key = std::pair<TenantId, ItemId>;
    using History = std::map<Timestamp, ItemValuation>;

    RecordSink sink_;
    mutable std::shared_mutex mutex_;
    std::map<Key, History> histories_;
    ValuationId next_id_ = 1;
};

} // namespace ledger
