#include "ledger/profit_calculator.hpp"
#include "ledger/valuation_store.hpp"

namespace ledger {

ProfitCalculator::ProfitCalculator(const ValuationStore& valuations)
    : valuations_(valuations) {
}

std::optional<Money> ProfitCalculator::get_value_at(const TenantId& tenant_id, ItemId item_id, Timestamp as_of) const {
    const auto valuation = valuations_.valuation_at(tenant_id, item_id, as_of);
    if (!valuation) {
        return std::nullopt;
    }
    return valuation->value;
}

std::optional<Money> ProfitCalculator::compute_profit(const TradeRecord& record) const {
    Money total = 0;
    for (const auto& line : record.lines) {
        const auto value = get_value_at(record.trade.tenant_id, line.item_id, record.trade.timestamp);
        if (!value) {
            return std::nullopt;
        }
        const auto line_value = checked_mul(*value, line.quantity);
        if (!line_value) {
            return std::nullopt;
        }
        const auto next = line.direction == Direction::Gained ? checked_add(total, *line_value)
                                                              : checked_add(total, -*line_value);
        if (!next) {
            return std::nullopt;
        }
        total = *next;
    }
    return total;
}

} // namespace ledger
