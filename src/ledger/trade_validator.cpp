#include "ledger/trade_validator.hpp"
#include "ledger/catalog.hpp"
#include "ledger/errors.hpp"

namespace ledger {
namespace {

std::string line_label(std::size_t index) {
    return "line " + std::to_string(index + 1);
}

} // namespace

TradeValidator::TradeValidator(const Catalog& catalog)
    : catalog_(catalog) {
}

ValidatedTrade TradeValidator::validate(const CallerContext& caller, const CreateTradeRequest& request) const {
    if (caller.tenant_id.empty()) {
        throw ValidationError("Caller has no structure", "no_structure");
    }
    if (request.lines.empty()) {
        throw ValidationError("A trade needs at least one line", "empty_trade");
    }

    check_header_location(caller.tenant_id, request.from_location_id, "from_location_id");
    check_header_location(caller.tenant_id, request.to_location_id, "to_location_id");

    ValidatedTrade validated;
    validated.tenant_id = caller.tenant_id;
    validated.recorded_by = caller.user_id;
    validated.timestamp = request.timestamp;
    validated.default_from_location = request.from_location_id;
    validated.default_to_location = request.to_location_id;
    validated.lines.reserve(request.lines.size());

    for (std::size_t i = 0; i < request.lines.size(); ++i) {
        validated.lines.push_back(resolve_line(caller.tenant_id, request, request.lines[i], i));
    }
    return validated;
}

void TradeValidator::check_header_location(const TenantId& tenant_id,
                                           const std::optional<LocationId>& location_id,
                                           const char* field) const {
    if (location_id && !catalog_.find_location(tenant_id, *location_id)) {
        throw InvalidLocationError(std::string(field) + " not in your structure");
    }
}

ResolvedLine TradeValidator::resolve_line(const TenantId& tenant_id,
                                          const CreateTradeRequest& request,
                                          const ProposedLine& proposed,
                                          std::size_t index) const {
    const auto label = line_label(index);

    const auto item = catalog_.find_item(proposed.item_id);
    if (!item || !item->is_active) {
        throw InvalidItemError(label + ": unknown or inactive item " + std::to_string(proposed.item_id));
    }
    if (proposed.quantity <= 0) {
        throw InvalidQuantityError(label + ": quantity must be positive");
    }
    if (proposed.quantity > kMaxLineQuantity) {
        throw InvalidQuantityError(label + ": quantity exceeds " + std::to_string(kMaxLineQuantity));
    }

    // Header defaults only fill a side whose location the line omits.
    const auto from_location = proposed.from_location_id ? proposed.from_location_id : request.from_location_id;
    const auto to_location = proposed.to_location_id ? proposed.to_location_id : request.to_location_id;

    ResolvedLine line;
    line.item_id = proposed.item_id;
    line.direction = proposed.direction;
    line.quantity = proposed.quantity;
    line.from = make_party(proposed.from_user_id, from_location, label + " FROM");
    line.to = make_party(proposed.to_user_id, to_location, label + " TO");
    line.reason_code = proposed.reason_code;

    for (const auto& party : {line.from, line.to}) {
        if (const auto location_id = party_location(party)) {
            if (!catalog_.find_location(tenant_id, *location_id)) {
                throw InvalidLocationError(label + ": location " + std::to_string(*location_id) +
                                           " not in your structure");
            }
        }
    }

    if (const auto user = party_user(line.from); user && !catalog_.is_member(tenant_id, *user)) {
        throw CrossTenantUserError(label + ": from_user_id not in your structure");
    }
    if (const auto user = party_user(line.to); user && !catalog_.is_member(tenant_id, *user)) {
        throw CrossTenantUserError(label + ": to_user_id not in your structure");
    }

    if (line.reason_code && !line.reason_code->empty()) {
        const auto reason = catalog_.find_movement_reason(tenant_id, *line.reason_code);
        if (!reason || !reason->is_active) {
            throw InvalidReasonError(label + ": invalid movement_reason_code for structure");
        }
    } else {
        line.reason_code.reset();
    }

    check_external_boundary(tenant_id, line, index);
    return line;
}

void TradeValidator::check_external_boundary(const TenantId& tenant_id,
                                             const ResolvedLine& line,
                                             std::size_t index) const {
    const auto is_external = [&](const Party& party) {
        const auto location_id = party_location(party);
        if (!location_id) {
            return false;
        }
        const auto location = catalog_.find_location(tenant_id, *location_id);
        return location && location->is_external;
    };
    const auto is_internal_location = [&](const Party& party) {
        return party_location(party).has_value() && !is_external(party);
    };

    const auto label = line_label(index);
    if (is_external(line.from) && !is_internal_location(line.to)) {
        throw ExternalBoundaryError(label + (party_user(line.to) ? ": external -> user not allowed"
                                                                 : ": external must trade with an internal location"));
    }
    if (is_external(line.to) && !is_internal_location(line.from)) {
        throw ExternalBoundaryError(label + (party_user(line.from) ? ": user -> external not allowed"
                                                                   : ": external must trade with an internal location"));
    }
}

} // namespace ledger
