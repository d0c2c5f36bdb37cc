#pragma once

#include "ledger/types.hpp"

#include <optional>

namespace ledger {

class ValuationStore;

class ProfitCalculator {
public:
    explicit ProfitCalculator(const ValuationStore& valuations);

    // Unknown when the tenant has no valuation effective at or before as_of.
    [[nodiscard]] std::optional<Money> get_value_at(const TenantId& tenant_id, ItemId item_id, Timestamp as_of) const;

    // GAINED lines add value x quantity, GIVEN lines subtract it, every line
    // priced at the trade timestamp. A single unpriced line makes the whole
    // result unknown, as does a total that does not fit a Money.
    [[nodiscard]] std::optional<Money> compute_profit(const TradeRecord& record) const;

private:
    const ValuationStore& valuations_;
};

} // namespace ledger
