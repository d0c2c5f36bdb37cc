#include "ledger/codec.hpp"

#include <stdexcept>

namespace ledger {

nlohmann::json timestamp_to_json(Timestamp timestamp) {
    return journal::to_epoch_ms(timestamp);
}

Timestamp timestamp_from_json(const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument("Timestamp must be epoch milliseconds");
    }
    return journal::from_epoch_ms(value.get<int64_t>());
}

nlohmann::json money_to_json(Money amount) {
    return format_money(amount);
}

nlohmann::json optional_money_to_json(const std::optional<Money>& amount) {
    if (!amount) {
        return nullptr;
    }
    return money_to_json(*amount);
}

Money money_from_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return parse_money(value.get<std::string>());
    }
    if (value.is_number()) {
        return money_from_double(value.get<double>());
    }
    throw std::invalid_argument("Money must be a decimal string or number");
}

void to_json(nlohmann::json& j, const Party& party) {
    if (const auto user = party_user(party)) {
        j = nlohmann::json{{"user_id", *user}};
    } else {
        j = nlohmann::json{{"location_id", *party_location(party)}};
    }
}

void from_json(const nlohmann::json& j, Party& party) {
    party = make_party(optional_field<UserId>(j, "user_id"),
                       optional_field<LocationId>(j, "location_id"),
                       "stored");
}

void to_json(nlohmann::json& j, const Item& item) {
    j = nlohmann::json{
        {"id", item.id},
        {"name", item.name},
        {"code", item.code},
        {"category", item.category},
        {"stack_size", item.stack_size},
        {"is_active", item.is_active}
    };
}

void from_json(const nlohmann::json& j, Item& item) {
    item.id = j.value("id", int64_t{0});
    item.name = j.at("name").get<std::string>();
    item.code = j.at("code").get<std::string>();
    item.category = j.value("category", std::string{});
    item.stack_size = j.value("stack_size", 64);
    item.is_active = j.value("is_active", true);
}

void to_json(nlohmann::json& j, const Location& location) {
    j = nlohmann::json{
        {"id", location.id},
        {"tenant_id", location.tenant_id},
        {"name", location.name},
        {"code", location.code},
        {"type", to_string(location.type)},
        {"description", location.description},
        {"x", optional_to_json(location.x)},
        {"y", optional_to_json(location.y)},
        {"z", optional_to_json(location.z)},
        {"is_active", location.is_active},
        {"is_external", location.is_external},
        {"external_kind", location.external_kind ? nlohmann::json(to_string(*location.external_kind))
                                                 : nlohmann::json(nullptr)}
    };
}

void from_json(const nlohmann::json& j, Location& location) {
    location.id = j.at("id").get<LocationId>();
    location.tenant_id = j.at("tenant_id").get<TenantId>();
    location.name = j.at("name").get<std::string>();
    location.code = j.at("code").get<std::string>();
    location.type = parse_location_type(j.value("type", std::string{"OTHER"}));
    location.description = j.value("description", std::string{});
    location.x = optional_field<int>(j, "x");
    location.y = optional_field<int>(j, "y");
    location.z = optional_field<int>(j, "z");
    location.is_active = j.value("is_active", true);
    location.is_external = j.value("is_external", false);
    const auto kind = optional_field<std::string>(j, "external_kind");
    location.external_kind = kind ? std::optional<ExternalKind>(parse_external_kind(*kind)) : std::nullopt;
}

void from_json(const nlohmann::json& j, NewLocation& location) {
    location.name = j.at("name").get<std::string>();
    location.code = j.at("code").get<std::string>();
    location.type = parse_location_type(j.value("type", std::string{"OTHER"}));
    location.description = j.value("description", std::string{});
    location.x = optional_field<int>(j, "x");
    location.y = optional_field<int>(j, "y");
    location.z = optional_field<int>(j, "z");
    location.is_active = j.value("is_active", true);
    location.is_external = j.value("is_external", false);
    const auto kind = optional_field<std::string>(j, "external_kind");
    location.external_kind = kind ? std::optional<ExternalKind>(parse_external_kind(*kind)) : std::nullopt;
}

void to_json(nlohmann::json& j, const MovementReason& reason) {
    j = nlohmann::json{
        {"id", reason.id},
        {"tenant_id", reason.tenant_id},
        {"code", reason.code},
        {"name", reason.name},
        {"is_active", reason.is_active}
    };
}

void from_json(const nlohmann::json& j, MovementReason& reason) {
    reason.id = j.at("id").get<ReasonId>();
    reason.tenant_id = j.at("tenant_id").get<TenantId>();
    reason.code = j.at("code").get<std::string>();
    reason.name = j.value("name", reason.code);
    reason.is_active = j.value("is_active", true);
}

void to_json(nlohmann::json& j, const User& user) {
    j = nlohmann::json{
        {"id", user.id},
        {"username", user.username},
        {"tenant_id", optional_to_json(user.tenant_id)}
    };
}

void from_json(const nlohmann::json& j, User& user) {
    user.id = j.at("id").get<UserId>();
    user.username = j.at("username").get<std::string>();
    user.tenant_id = optional_field<TenantId>(j, "tenant_id");
}

void to_json(nlohmann::json& j, const Trade& trade) {
    j = nlohmann::json{
        {"id", trade.id},
        {"tenant_id", trade.tenant_id},
        {"recorded_by", trade.recorded_by},
        {"timestamp", timestamp_to_json(trade.timestamp)},
        {"from_location_id", optional_to_json(trade.default_from_location)},
        {"to_location_id", optional_to_json(trade.default_to_location)}
    };
}

void from_json(const nlohmann::json& j, Trade& trade) {
    trade.id = j.at("id").get<TradeId>();
    trade.tenant_id = j.at("tenant_id").get<TenantId>();
    trade.recorded_by = j.at("recorded_by").get<UserId>();
    trade.timestamp = timestamp_from_json(j.at("timestamp"));
    trade.default_from_location = optional_field<LocationId>(j, "from_location_id");
    trade.default_to_location = optional_field<LocationId>(j, "to_location_id");
}

void to_json(nlohmann::json& j, const TradeLine& line) {
    j = nlohmann::json{
        {"id", line.id},
        {"trade_id", line.trade_id},
        {"item_id", line.item_id},
        {"direction", to_string(line.direction)},
        {"quantity", line.quantity},
        {"from", line.from},
        {"to", line.to},
        {"movement_reason_code", optional_to_json(line.reason_code)}
    };
}

void from_json(const nlohmann::json& j, TradeLine& line) {
    line.id = j.at("id").get<TradeLineId>();
    line.trade_id = j.at("trade_id").get<TradeId>();
    line.item_id = j.at("item_id").get<ItemId>();
    line.direction = parse_direction(j.at("direction").get<std::string>());
    line.quantity = j.at("quantity").get<Quantity>();
    line.from = j.at("from").get<Party>();
    line.to = j.at("to").get<Party>();
    line.reason_code = optional_field<std::string>(j, "movement_reason_code");
}

void to_json(nlohmann::json& j, const TradeRecord& record) {
    j = nlohmann::json{
        {"trade", record.trade},
        {"lines", record.lines}
    };
}

void from_json(const nlohmann::json& j, TradeRecord& record) {
    record.trade = j.at("trade").get<Trade>();
    record.lines = j.at("lines").get<std::vector<TradeLine>>();
}

void to_json(nlohmann::json& j, const LedgerEntry& entry) {
    j = nlohmann::json{
        {"id", entry.id},
        {"user_id", entry.user_id},
        {"item_id", entry.item_id},
        {"tenant_id", entry.tenant_id},
        {"delta_qty", entry.delta_qty},
        {"trade_id", entry.trade_id},
        {"trade_line_id", entry.trade_line_id},
        {"movement_reason_code", optional_to_json(entry.reason_code)},
        {"timestamp", timestamp_to_json(entry.timestamp)}
    };
}

void from_json(const nlohmann::json& j, LedgerEntry& entry) {
    entry.id = j.at("id").get<LedgerEntryId>();
    entry.user_id = j.at("user_id").get<UserId>();
    entry.item_id = j.at("item_id").get<ItemId>();
    entry.tenant_id = j.at("tenant_id").get<TenantId>();
    entry.delta_qty = j.at("delta_qty").get<Quantity>();
    entry.trade_id = j.at("trade_id").get<TradeId>();
    entry.trade_line_id = j.at("trade_line_id").get<TradeLineId>();
    entry.reason_code = optional_field<std::string>(j, "movement_reason_code");
    entry.timestamp = timestamp_from_json(j.at("timestamp"));
}

void to_json(nlohmann::json& j, const PlayerInventoryRow& row) {
    j = nlohmann::json{
        {"user_id", row.key.user_id},
        {"item_id", row.key.item_id},
        {"tenant_id", row.key.tenant_id},
        {"quantity", row.quantity},
        {"updated_at", timestamp_to_json(row.updated_at)}
    };
}

void to_json(nlohmann::json& j, const ItemValuation& valuation) {
    j = nlohmann::json{
        {"id", valuation.id},
        {"tenant_id", valuation.tenant_id},
        {"item_id", valuation.item_id},
        {"value", money_to_json(valuation.value)},
        {"effective_from", timestamp_to_json(valuation.effective_from)},
        {"recorded_by", valuation.recorded_by}
    };
}

void from_json(const nlohmann::json& j, ItemValuation& valuation) {
    valuation.id = j.at("id").get<ValuationId>();
    valuation.tenant_id = j.at("tenant_id").get<TenantId>();
    valuation.item_id = j.at("item_id").get<ItemId>();
    valuation.value = money_from_json(j.at("value"));
    valuation.effective_from = timestamp_from_json(j.at("effective_from"));
    valuation.recorded_by = j.value("recorded_by", UserId{0});
}

void from_json(const nlohmann::json& j, ProposedLine& line) {
    line.item_id = j.at("item_id").get<ItemId>();
    line.direction = parse_direction(j.at("direction").get<std::string>());
    line.quantity = j.at("quantity").get<Quantity>();
    line.from_user_id = optional_field<UserId>(j, "from_user_id");
    line.from_location_id = optional_field<LocationId>(j, "from_location_id");
    line.to_user_id = optional_field<UserId>(j, "to_user_id");
    line.to_location_id = optional_field<LocationId>(j, "to_location_id");
    line.reason_code = optional_field<std::string>(j, "movement_reason_code");
}

void from_json(const nlohmann::json& j, CreateTradeRequest& request) {
    request.timestamp = timestamp_from_json(j.at("timestamp"));
    request.from_location_id = optional_field<LocationId>(j, "from_location_id");
    request.to_location_id = optional_field<LocationId>(j, "to_location_id");
    request.lines = j.at("lines").get<std::vector<ProposedLine>>();
}

} // namespace ledger
