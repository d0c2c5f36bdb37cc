#pragma once

#include "ledger/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {

class Catalog;

struct ResolvedLine {
    ItemId item_id = 0;
    Direction direction = Direction::Gained;
    Quantity quantity = 0;
    Party from;
    Party to;
    std::optional<std::string> reason_code;
};

struct ValidatedTrade {
    TenantId tenant_id;
    UserId recorded_by = 0;
    Timestamp timestamp{};
    std::optional<LocationId> default_from_location;
    std::optional<LocationId> default_to_location;
    std::vector<ResolvedLine> lines;
};

// Checks a proposed trade against the catalog and resolves every line's
// parties. Read-only; throws the first ValidationError it meets.
class TradeValidator {
public:
    // Largest quantity a single line may move. At the highest valuation one
    // line's value still fits a Money.
    static constexpr Quantity kMaxLineQuantity = 1000000000;

    explicit TradeValidator(const Catalog& catalog);

    [[nodiscard]] ValidatedTrade validate(const CallerContext& caller, const CreateTradeRequest& request) const;

private:
    void check_header_location(const TenantId& tenant_id,
                               const std::optional<LocationId>& location_id,
                               const char* field) const;
    ResolvedLine resolve_line(const TenantId& tenant_id,
                              const CreateTradeRequest& request,
                              const ProposedLine& proposed,
                              std::size_t index) const;
    void check_external_boundary(const TenantId& tenant_id, const ResolvedLine& line, std::size_t index) const;

    const Catalog& catalog_;
};

} // namespace ledger
