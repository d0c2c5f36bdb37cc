#pragma once

#include "ledger/types.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>

namespace ledger {

// Receives one journal record per committed unit of work. Throwing from the
// sink aborts the unit before anything is applied in memory.
using RecordSink = std::function<void(const nlohmann::json&)>;

nlohmann::json timestamp_to_json(Timestamp timestamp);
Timestamp timestamp_from_json(const nlohmann::json& value);

// Money travels as a decimal string with three places ("3.500").
nlohmann::json money_to_json(Money amount);
nlohmann::json optional_money_to_json(const std::optional<Money>& amount);
Money money_from_json(const nlohmann::json& value);

template <typename T>
std::optional<T> optional_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

void to_json(nlohmann::json& j, const Party& party);
void from_json(const nlohmann::json& j, Party& party);

void to_json(nlohmann::json& j, const Item& item);
void from_json(const nlohmann::json& j, Item& item);

void to_json(nlohmann::json& j, const Location& location);
void from_json(const nlohmann::json& j, Location& location);
void from_json(const nlohmann::json& j, NewLocation& location);

void to_json(nlohmann::json& j, const MovementReason& reason);
void from_json(const nlohmann::json& j, MovementReason& reason);

void to_json(nlohmann::json& j, const User& user);
void from_json(const nlohmann::json& j, User& user);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const TradeLine& line);
void from_json(const nlohmann::json& j, TradeLine& line);

void to_json(nlohmann::json& j, const TradeRecord& record);
void from_json(const nlohmann::json& j, TradeRecord& record);

void to_json(nlohmann::json& j, const LedgerEntry& entry);
void from_json(const nlohmann::json& j, LedgerEntry& entry);

void to_json(nlohmann::json& j, const PlayerInventoryRow& row);

void to_json(nlohmann::json& j, const ItemValuation& valuation);
void from_json(const nlohmann::json& j, ItemValuation& valuation);

void from_json(const nlohmann::json& j, ProposedLine& line);
void from_json(const nlohmann::json& j, CreateTradeRequest& request);

} // namespace ledger
