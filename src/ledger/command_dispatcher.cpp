#include "ledger/command_dispatcher.hpp"

#include "ledger/codec.hpp"
#include "ledger/errors.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace ledger {

namespace {

using nlohmann::json;

json ok(json result) {
    return json{{"ok", true}, {"result", std::move(result)}};
}

json failure(const std::string& code, const std::string& message) {
    return json{{"ok", false}, {"error", code}, {"message", message}};
}

Timestamp as_of_or_now(const json& params) {
    if (params.contains("as_of") && !params.at("as_of").is_null()) {
        return timestamp_from_json(params.at("as_of"));
    }
    return std::chrono::system_clock::now();
}

// Page bounds arrive as signed numbers; a negative one is rejected, not wrapped.
std::optional<std::size_t> page_field(const json& params, const char* key) {
    const auto value = optional_field<int64_t>(params, key);
    if (!value) {
        return std::nullopt;
    }
    if (*value < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return static_cast<std::size_t>(*value);
}

CallerContext context_from(const json& request) {
    CallerContext ctx;
    if (request.contains("ctx")) {
        const auto& j = request.at("ctx");
        ctx.tenant_id = j.value("tenant_id", std::string{});
        ctx.user_id = j.value("user_id", UserId{0});
    }
    return ctx;
}

json summary_to_json(const InventorySummary& summary) {
    json rows = json::array();
    for (const auto& row : summary.rows) {
        rows.push_back({
            {"item_id", row.item_id},
            {"item_name", row.item_name},
            {"qty", row.quantity},
            {"unit_value", optional_money_to_json(row.unit_value)},
            {"total_value", optional_money_to_json(row.total_value)}
        });
    }
    return json{
        {"as_of", timestamp_to_json(summary.as_of)},
        {"include_external", summary.include_external},
        {"rows", std::move(rows)},
        {"grand_total_value", money_to_json(summary.grand_total_value)}
    };
}

json location_fields(LocationId id, const std::string& name, bool is_external, const std::optional<ExternalKind>& kind) {
    return json{
        {"location_id", id},
        {"location_name", name},
        {"is_external", is_external},
        {"external_kind", kind ? json(to_string(*kind)) : json(nullptr)}
    };
}

json item_by_location_to_json(const std::vector<ItemLocationRow>& rows) {
    json out = json::array();
    for (const auto& row : rows) {
        auto j = location_fields(row.location_id, row.location_name, row.is_external, row.external_kind);
        j["qty"] = row.quantity;
        j["value"] = optional_money_to_json(row.value);
        out.push_back(std::move(j));
    }
    return out;
}

json by_location_to_json(const std::vector<LocationSummaryRow>& rows) {
    json out = json::array();
    for (const auto& row : rows) {
        auto j = location_fields(row.location_id, row.location_name, row.is_external, row.external_kind);
        j["total_qty"] = row.total_quantity;
        j["total_value"] = optional_money_to_json(row.total_value);
        out.push_back(std::move(j));
    }
    return out;
}

json location_by_item_to_json(const std::vector<LocationItemRow>& rows) {
    json out = json::array();
    for (const auto& row : rows) {
        out.push_back({
            {"item_id", row.item_id},
            {"item_name", row.item_name},
            {"qty", row.quantity},
            {"value", optional_money_to_json(row.value)}
        });
    }
    return out;
}

json trade_view_to_json(const TradeView& view) {
    json j = view.record.trade;
    j["gained"] = view.gained;
    j["given"] = view.given;
    j["profit"] = optional_money_to_json(view.profit);
    return j;
}

json player_inventory_to_json(const PlayerInventory& inventory) {
    json items = json::array();
    for (const auto& item : inventory.items) {
        items.push_back({
            {"item_id", item.item_id},
            {"name", item.item_name},
            {"quantity", item.quantity},
            {"updated_at", timestamp_to_json(item.updated_at)},
            {"price", optional_money_to_json(item.unit_value)},
            {"value", optional_money_to_json(item.total_value)}
        });
    }
    return json{
        {"user_id", inventory.user_id},
        {"tenant_id", inventory.tenant_id},
        {"items", std::move(items)},
        {"total_value", optional_money_to_json(inventory.total_value)}
    };
}

json reconcile_to_json(const std::vector<BalanceMismatch>& report) {
    json out = json::array();
    for (const auto& mismatch : report) {
        out.push_back({
            {"user_id", mismatch.key.user_id},
            {"item_id", mismatch.key.item_id},
            {"materialized", mismatch.materialized},
            {"ledger_sum", mismatch.ledger_sum}
        });
    }
    return out;
}

} // namespace

CommandDispatcher::CommandDispatcher(Engine& engine)
    : engine_(engine) {
    register_handlers();
}

json CommandDispatcher::handle_line(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& ex) {
        return failure("bad_request", std::string("Malformed JSON: ") + ex.what());
    }
    return handle(request);
}

json CommandDispatcher::handle(const json& request) {
    json response;
    if (!request.is_object()) {
        response = failure("bad_request", "Request must be a JSON object");
    } else {
        const auto command = request.value("command", std::string{});
        const auto it = handlers_.find(command);
        if (it == handlers_.end()) {
            response = failure("unknown_command", "Unknown command: " + command);
        } else {
            try {
                response = ok(it->second(context_from(request), request));
            } catch (const PersistenceError& ex) {
                std::cerr << "[Ledger] " << command << " failed: " << ex.what() << std::endl;
                response = failure(ex.code(), "Failed to persist change");
            } catch (const LedgerError& ex) {
                response = failure(ex.code(), ex.what());
            } catch (const json::exception& ex) {
                response = failure("bad_request", ex.what());
            } catch (const std::invalid_argument& ex) {
                response = failure("bad_request", ex.what());
            } catch (const std::overflow_error& ex) {
                response = failure("overflow", ex.what());
            } catch (const std::exception& ex) {
                std::cerr << "[Ledger] " << command << " failed: " << ex.what() << std::endl;
                response = failure("internal_error", ex.what());
            }
        }
    }

    if (request.is_object() && request.contains("id")) {
        response["id"] = request.at("id");
    }
    return response;
}

std::vector<std::string> CommandDispatcher::commands() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

void CommandDispatcher::register_handlers() {
    // Catalog
    handlers_["add_item"] = [this](const CallerContext&, const json& p) -> json {
        return engine_.add_item(p.at("name").get<std::string>(),
                                p.at("code").get<std::string>(),
                                p.value("category", std::string{}),
                                p.value("stack_size", 64));
    };
    handlers_["set_item_active"] = [this](const CallerContext&, const json& p) -> json {
        return engine_.set_item_active(p.at("item_id").get<ItemId>(), p.at("is_active").get<bool>());
    };
    handlers_["list_items"] = [this](const CallerContext&, const json&) -> json {
        return engine_.list_items();
    };
    handlers_["add_location"] = [this](const CallerContext& ctx, const json& p) -> json {
        return engine_.add_location(ctx, p.at("location").get<NewLocation>());
    };
    handlers_["set_location_active"] = [this](const CallerContext& ctx, const json& p) -> json {
        return engine_.set_location_active(ctx, p.at("location_id").get<LocationId>(), p.at("is_active").get<bool>());
    };
    handlers_["list_locations"] = [this](const CallerContext& ctx, const json&) -> json {
        return engine_.list_locations(ctx);
    };
    handlers_["add_reason"] = [this](const CallerContext& ctx, const json& p) -> json {
        return engine_.add_movement_reason(ctx, p.at("code").get<std::string>(), p.value("name", std::string{}));
    };
    handlers_["set_reason_active"] = [this](const CallerContext& ctx, const json& p) -> json {
        return engine_.set_movement_reason_active(ctx, p.at("code").get<std::string>(), p.at("is_active").get<bool>());
    };
    handlers_["list_reasons"] = [this](const CallerContext& ctx, const json& p) -> json {
        return engine_.list_movement_reasons(ctx, p.value("active_only", true));
    };
    handlers_["add_user"] = [this](const CallerContext&, const json& p) -> json {
        return engine_.add_user(p.at("username").get<std::string>(), optional_field<TenantId>(p, "tenant_id"));
    };
    handlers_["assign_user_tenant"] = [this](const CallerContext&, const json& p) -> json {
        return engine_.assign_user_tenant(p.at("user_id").get<UserId>(), optional_field<TenantId>(p, "tenant_id"));
    };

    // Valuations
    handlers_["record_value"] = [this](const CallerContext& ctx, const json& p) -> json {
        const auto effective_from = p.contains("effective_from") ? timestamp_from_json(p.at("effective_from"))
                                                                 : std::chrono::system_clock::now();
        return engine_.record_value(ctx, p.at("item_id").get<ItemId>(), money_from_json(p.at("value")), effective_from);
    };
    handlers_["list_values"] = [this](const CallerContext& ctx, const json& p) -> json {
        return engine_.list_values(ctx, optional_field<ItemId>(p, "item_id"));
    };
    handlers_["get_value_at"] = [this](const CallerContext& ctx, const json& p) -> json {
        const auto value = engine_.get_value_at(ctx.tenant_id, p.at("item_id").get<ItemId>(), as_of_or_now(p));
        return json{{"value", optional_money_to_json(value)}};
    };

    // Trades
    handlers_["create_trade"] = [this](const CallerContext& ctx, const json& p) -> json {
        auto trade = p.at("trade");
        if (!trade.contains("timestamp")) {
            trade["timestamp"] = timestamp_to_json(std::chrono::system_clock::now());
        }
        const auto result = engine_.create_trade(ctx, trade.get<CreateTradeRequest>());
        json out = result.record;
        out["profit"] = optional_money_to_json(result.profit);
        return out;
    };
    handlers_["delete_trade_line"] = [this](const CallerContext& ctx, const json& p) -> json {
        const auto result = engine_.delete_trade_line(ctx, p.at("line_id").get<TradeLineId>());
        return json{
            {"deleted_line_id", result.deleted_line_id},
            {"trade_id", result.trade_id},
            {"trade_deleted", result.trade_deleted}
        };
    };
    handlers_["get_trade_profit"] = [this](const CallerContext& ctx, const json& p) -> json {
        const auto profit = engine_.get_trade_profit(ctx, p.at("trade_id").get<TradeId>());
        return json{{"profit", optional_money_to_json(profit)}};
    };
    handlers_["list_trades"] = [this](const CallerContext& ctx, const json& p) -> json {
        json out = json::array();
        for (const auto& view : engine_.list_trades(ctx, p.value("view_all", false))) {
            out.push_back(trade_view_to_json(view));
        }
        return out;
    };

    // Aggregations
    handlers_["inventory_summary"] = [this](const CallerContext& ctx, const json& p) -> json {
        return summary_to_json(
            engine_.get_inventory_summary(ctx.tenant_id, as_of_or_now(p), p.value("include_external", false)));
    };
    handlers_["item_by_location"] = [this](const CallerContext& ctx, const json& p) -> json {
        return item_by_location_to_json(engine_.get_item_by_location(
            ctx.tenant_id, p.at("item_id").get<ItemId>(), as_of_or_now(p), p.value("include_external", true)));
    };
    handlers_["by_location"] = [this](const CallerContext& ctx, const json& p) -> json {
        return by_location_to_json(
            engine_.get_by_location(ctx.tenant_id, as_of_or_now(p), p.value("include_external", true)));
    };
    handlers_["location_by_item"] = [this](const CallerContext& ctx, const json& p) -> json {
        return location_by_item_to_json(
            engine_.get_location_by_item(ctx.tenant_id, p.at("location_id").get<LocationId>(), as_of_or_now(p)));
    };

    // Player views
    handlers_["player_inventory"] = [this](const CallerContext& ctx, const json& p) -> json {
        std::optional<Timestamp> as_of;
        if (p.contains("as_of") && !p.at("as_of").is_null()) {
            as_of = timestamp_from_json(p.at("as_of"));
        }
        return player_inventory_to_json(engine_.get_player_inventory(ctx, p.at("user_id").get<UserId>(), as_of));
    };
    handlers_["player_ledger"] = [this](const CallerContext& ctx, const json& p) -> json {
        const auto page = engine_.get_player_ledger(ctx,
                                                    p.at("user_id").get<UserId>(),
                                                    page_field(p, "limit"),
                                                    page_field(p, "offset").value_or(0));
        return json{
            {"total", page.total},
            {"limit", page.limit},
            {"offset", page.offset},
            {"rows", page.entries}
        };
    };
    handlers_["reconcile"] = [this](const CallerContext& ctx, const json&) -> json {
        return reconcile_to_json(engine_.reconcile(ctx.tenant_id));
    };
}

} // namespace ledger
