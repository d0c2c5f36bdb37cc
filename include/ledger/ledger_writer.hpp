#pragma once

#include "ledger/ledger_store.hpp"
#include "ledger/trade_validator.hpp"
#include "ledger/types.hpp"

namespace ledger {

// Persists validated trades and line deletions, each as one unit of work.
class LedgerWriter {
public:
    LedgerWriter(LedgerStore& store, const TradeValidator& validator);

    // Validation runs before the unit takes the store lock, so a rejected
    // trade never waits on other writers. Any exception leaves no header,
    // line, ledger row or balance change.
    TradeRecord create_trade(const CallerContext& caller, const CreateTradeRequest& request);

    DeleteLineResult delete_trade_line(const TenantId& tenant_id, TradeLineId line_id);

private:
    LedgerStore& store_;
    const TradeValidator& validator_;
};

} // namespace ledger
