#include "ledger/ledger_store.hpp"
#include "ledger/errors.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace ledger {

LedgerStore::WriteUnit::WriteUnit(LedgerStore& store)
    : store_(&store),
      lock_(store.mutex_),
      next_trade_id_(store.next_trade_id_),
      next_line_id_(store.next_line_id_),
      next_entry_id_(store.next_entry_id_) {
}

Trade LedgerStore::WriteUnit::stage_trade(const TenantId& tenant_id,
                                          UserId recorded_by,
                                          Timestamp timestamp,
                                          std::optional<LocationId> default_from_location,
                                          std::optional<LocationId> default_to_location) {
    if (trade_ || delete_) {
        throw std::logic_error("WriteUnit already holds a staged change");
    }

    TradeRecord record;
    record.trade.id = next_trade_id_++;
    record.trade.tenant_id = tenant_id;
    record.trade.recorded_by = recorded_by;
    record.trade.timestamp = timestamp;
    record.trade.default_from_location = default_from_location;
    record.trade.default_to_location = default_to_location;
    trade_ = std::move(record);
    return trade_->trade;
}

TradeLine LedgerStore::WriteUnit::stage_line(ItemId item_id,
                                             Direction direction,
                                             Quantity quantity,
                                             Party from,
                                             Party to,
                                             std::optional<std::string> reason_code) {
    if (!trade_) {
        throw std::logic_error("stage_trade must precede stage_line");
    }

    TradeLine line;
    line.id = next_line_id_++;
    line.trade_id = trade_->trade.id;
    line.item_id = item_id;
    line.direction = direction;
    line.quantity = quantity;
    line.from = from;
    line.to = to;
    line.reason_code = std::move(reason_code);
    trade_->lines.push_back(line);
    return line;
}

LedgerEntry LedgerStore::WriteUnit::stage_ledger_entry(const TradeLine& line, UserId user_id, Quantity delta_qty) {
    if (!trade_ || line.trade_id != trade_->trade.id) {
        throw std::logic_error("Ledger entry must reference a line of the staged trade");
    }

    LedgerEntry entry;
    entry.id = next_entry_id_++;
    entry.user_id = user_id;
    entry.item_id = line.item_id;
    entry.tenant_id = trade_->trade.tenant_id;
    entry.delta_qty = delta_qty;
    entry.trade_id = line.trade_id;
    entry.trade_line_id = line.id;
    entry.reason_code = line.reason_code;
    entry.timestamp = trade_->trade.timestamp;
    entries_.push_back(entry);
    return entry;
}

DeleteLineResult LedgerStore::WriteUnit::stage_line_delete(const TenantId& tenant_id, TradeLineId line_id) {
    if (trade_ || delete_) {
        throw std::logic_error("WriteUnit already holds a staged change");
    }

    const auto line_it = store_->lines_.find(line_id);
    if (line_it == store_->lines_.end()) {
        throw NotFoundError("trade line not found");
    }
    const auto trade_it = store_->trades_.find(line_it->second.trade_id);
    if (trade_it == store_->trades_.end() || trade_it->second.tenant_id != tenant_id) {
        throw NotFoundError("trade line not found");
    }

    const auto siblings = store_->lines_by_trade_.find(trade_it->first);
    DeleteLineResult result;
    result.deleted_line_id = line_id;
    result.trade_id = trade_it->first;
    result.trade_deleted = siblings == store_->lines_by_trade_.end() || siblings->second.size() <= 1;
    delete_ = result;
    return result;
}

void LedgerStore::WriteUnit::commit() {
    if (committed_) {
        throw std::logic_error("WriteUnit already committed");
    }
    if (!trade_ && !delete_) {
        throw std::logic_error("Nothing staged to commit");
    }

    nlohmann::json record;
    const auto committed_at = std::chrono::system_clock::now();

    if (trade_) {
        // Every balance the unit touches must stay representable before
        // anything becomes durable.
        std::unordered_map<BalanceKey, Quantity, BalanceKeyHash> net;
        for (const auto& entry : entries_) {
            BalanceKey key{entry.user_id, entry.item_id, entry.tenant_id};
            net[key] = safe_add(net[key], entry.delta_qty);
        }
        for (const auto& [key, delta] : net) {
            store_->balances_.check_delta(key, delta);
        }

        record = {
            {"type", "trade"},
            {"committed_at", timestamp_to_json(committed_at)},
            {"record", *trade_},
            {"ledger", entries_}
        };
    } else {
        record = {
            {"type", "delete_line"},
            {"line_id", delete_->deleted_line_id},
            {"trade_id", delete_->trade_id},
            {"trade_deleted", delete_->trade_deleted}
        };
    }

    if (store_->sink_) {
        try {
            store_->sink_(record);
        } catch (const LedgerError&) {
            throw;
        } catch (const std::exception& ex) {
            throw PersistenceError(std::string("Failed to persist unit of work: ") + ex.what());
        }
    }

    if (trade_) {
        store_->apply_trade(*trade_, entries_, committed_at);
    } else {
        store_->apply_delete(*delete_);
    }
    store_->next_trade_id_ = next_trade_id_;
    store_->next_line_id_ = next_line_id_;
    store_->next_entry_id_ = next_entry_id_;

    committed_ = true;
    lock_.unlock();
}

LedgerStore::LedgerStore(BalanceMaterializer& balances)
    : balances_(balances) {
}

LedgerStore::WriteUnit LedgerStore::begin() {
    return WriteUnit(*this);
}

std::optional<TradeRecord> LedgerStore::find_trade(TradeId trade_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = trades_.find(trade_id);
    if (it == trades_.end()) {
        return std::nullopt;
    }
    return assemble(it->second);
}

std::vector<TradeRecord> LedgerStore::trades_for_tenant(const TenantId& tenant_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<TradeRecord> result;
    for (const auto& [id, trade] : trades_) {
        if (trade.tenant_id == tenant_id) {
            result.push_back(assemble(trade));
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const TradeRecord& a, const TradeRecord& b) {
        if (a.trade.timestamp != b.trade.timestamp) {
            return a.trade.timestamp > b.trade.timestamp;
        }
        return a.trade.id > b.trade.id;
    });
    return result;
}

std::vector<MovementLine> LedgerStore::movements_up_to(const TenantId& tenant_id, Timestamp as_of) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<MovementLine> result;
    for (const auto& [trade_id, line_ids] : lines_by_trade_) {
        const auto trade_it = trades_.find(trade_id);
        if (trade_it == trades_.end() ||
            trade_it->second.tenant_id != tenant_id ||
            trade_it->second.timestamp > as_of) {
            continue;
        }
        for (const auto line_id : line_ids) {
            result.push_back(MovementLine{lines_.at(line_id), trade_it->second.timestamp});
        }
    }
    return result;
}

std::vector<LedgerEntry> LedgerStore::ledger_entries(const TenantId& tenant_id,
                                                     std::optional<UserId> user_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<LedgerEntry> result;
    for (const auto& [id, entry] : entries_) {
        if (entry.tenant_id == tenant_id && (!user_id || entry.user_id == *user_id)) {
            result.push_back(entry);
        }
    }
    return result;
}

std::size_t LedgerStore::trade_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trades_.size();
}

std::size_t LedgerStore::line_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lines_.size();
}

std::size_t LedgerStore::ledger_entry_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

bool LedgerStore::replay(const nlohmann::json& record) {
    const auto type = record.value("type", std::string{});
    if (type == "trade") {
        const auto trade = record.at("record").get<TradeRecord>();
        const auto entries = record.at("ledger").get<std::vector<LedgerEntry>>();
        const auto committed_at = timestamp_from_json(record.at("committed_at"));

        std::unique_lock<std::shared_mutex> lock(mutex_);
        apply_trade(trade, entries, committed_at);
        next_trade_id_ = std::max(next_trade_id_, trade.trade.id + 1);
        for (const auto& line : trade.lines) {
            next_line_id_ = std::max(next_line_id_, line.id + 1);
        }
        for (const auto& entry : entries) {
            next_entry_id_ = std::max(next_entry_id_, entry.id + 1);
        }
        return true;
    }
    if (type == "delete_line") {
        DeleteLineResult result;
        result.deleted_line_id = record.at("line_id").get<TradeLineId>();
        result.trade_id = record.at("trade_id").get<TradeId>();
        result.trade_deleted = record.at("trade_deleted").get<bool>();

        std::unique_lock<std::shared_mutex> lock(mutex_);
        apply_delete(result);
        return true;
    }
    return false;
}

void LedgerStore::apply_trade(const TradeRecord& record,
                              const std::vector<LedgerEntry>& entries,
                              Timestamp committed_at) {
    trades_[record.trade.id] = record.trade;
    auto& line_ids = lines_by_trade_[record.trade.id];
    for (const auto& line : record.lines) {
        lines_[line.id] = line;
        line_ids.push_back(line.id);
    }
    for (const auto& entry : entries) {
        entries_[entry.id] = entry;
        balances_.apply_delta(BalanceKey{entry.user_id, entry.item_id, entry.tenant_id},
                              entry.delta_qty,
                              committed_at);
    }
}

void LedgerStore::apply_delete(const DeleteLineResult& result) {
    lines_.erase(result.deleted_line_id);

    auto by_trade = lines_by_trade_.find(result.trade_id);
    if (by_trade != lines_by_trade_.end()) {
        auto& ids = by_trade->second;
        ids.erase(std::remove(ids.begin(), ids.end(), result.deleted_line_id), ids.end());
    }

    // Ledger rows of the line cascade with it; the materialized balance is left as is.
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.trade_line_id == result.deleted_line_id) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (result.trade_deleted) {
        trades_.erase(result.trade_id);
        if (by_trade != lines_by_trade_.end()) {
            lines_by_trade_.erase(by_trade);
        }
    }
}

TradeRecord LedgerStore::assemble(const Trade& trade) const {
    TradeRecord record;
    record.trade = trade;
    auto it = lines_by_trade_.find(trade.id);
    if (it != lines_by_trade_.end()) {
        for (const auto line_id : it->second) {
            record.lines.push_back(lines_.at(line_id));
        }
    }
    return record;
}

} // namespace ledger
