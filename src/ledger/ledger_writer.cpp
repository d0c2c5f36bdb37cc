#include "ledger/ledger_writer.hpp"

namespace ledger {

LedgerWriter::LedgerWriter(LedgerStore& store, const TradeValidator& validator)
    : store_(store),
      validator_(validator) {
}

TradeRecord LedgerWriter::create_trade(const CallerContext& caller, const CreateTradeRequest& request) {
    // Validation only reads the catalog, so it runs before the store lock.
    const auto validated = validator_.validate(caller, request);
    auto unit = store_.begin();

    unit.stage_trade(validated.tenant_id,
                     validated.recorded_by,
                     validated.timestamp,
                     validated.default_from_location,
                     validated.default_to_location);

    for (const auto& resolved : validated.lines) {
        const auto line = unit.stage_line(resolved.item_id,
                                          resolved.direction,
                                          resolved.quantity,
                                          resolved.from,
                                          resolved.to,
                                          resolved.reason_code);

        // Location-to-location lines leave player balances untouched.
        if (const auto user = party_user(line.from)) {
            unit.stage_ledger_entry(line, *user, -line.quantity);
        }
        if (const auto user = party_user(line.to)) {
            unit.stage_ledger_entry(line, *user, line.quantity);
        }
    }

    TradeRecord record = *unit.staged_trade();
    unit.commit();
    return record;
}

DeleteLineResult LedgerWriter::delete_trade_line(const TenantId& tenant_id, TradeLineId line_id) {
    auto unit = store_.begin();
    const auto result = unit.stage_line_delete(tenant_id, line_id);
    unit.commit();
    return result;
}

} // namespace ledger
