#pragma once

#include "ledger/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

class Catalog;
class LedgerStore;
class ProfitCalculator;

struct InventorySummaryRow {
    ItemId item_id = 0;
    std::string item_name;
    Quantity quantity = 0;
    std::optional<Money> unit_value;
    std::optional<Money> total_value;
};

struct InventorySummary {
    Timestamp as_of{};
    bool include_external = false;
    std::vector<InventorySummaryRow> rows;
    Money grand_total_value = 0;   // sum of the rows whose value is known
};

struct ItemLocationRow {
    LocationId location_id = 0;
    std::string location_name;
    bool is_external = false;
    std::optional<ExternalKind> external_kind;
    Quantity quantity = 0;
    std::optional<Money> value;
};

struct LocationSummaryRow {
    LocationId location_id = 0;
    std::string location_name;
    bool is_external = false;
    std::optional<ExternalKind> external_kind;
    Quantity total_quantity = 0;
    std::optional<Money> total_value;
};

struct LocationItemRow {
    ItemId item_id = 0;
    std::string item_name;
    Quantity quantity = 0;
    std::optional<Money> value;
};

// Read-only views recomputed from trade lines rather than from materialized
// balances. Each location party contributes one leg: -quantity for the FROM
// location, +quantity for the TO location.
class AggregationQueries {
public:
    AggregationQueries(const LedgerStore& store, const Catalog& catalog, const ProfitCalculator& pricing);

    [[nodiscard]] InventorySummary inventory_summary(const TenantId& tenant_id,
                                                     Timestamp as_of,
                                                     bool include_external) const;

    [[nodiscard]] std::vector<ItemLocationRow> item_by_location(const TenantId& tenant_id,
                                                                ItemId item_id,
                                                                Timestamp as_of,
                                                                bool include_external) const;

    [[nodiscard]] std::vector<LocationSummaryRow> by_location(const TenantId& tenant_id,
                                                              Timestamp as_of,
                                                              bool include_external) const;

    [[nodiscard]] std::vector<LocationItemRow> location_by_item(const TenantId& tenant_id,
                                                                LocationId location_id,
                                                                Timestamp as_of) const;

private:
    // (item, location) -> net quantity, restricted to locations of the tenant.
    using NetMovements = std::map<std::pair<ItemId, LocationId>, Quantity>;

    NetMovements net_movements(const TenantId& tenant_id, Timestamp as_of) const;
    std::string item_name(ItemId item_id) const;
    static std::optional<Money> multiply(const std::optional<Money>& unit, Quantity quantity);

    const LedgerStore& store_;
    const Catalog& catalog_;
    const ProfitCalculator& pricing_;
};

} // namespace ledger
