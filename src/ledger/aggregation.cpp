#include "ledger/aggregation.hpp"
#include "ledger/catalog.hpp"
#include "ledger/ledger_store.hpp"
#include "ledger/profit_calculator.hpp"

#include <algorithm>
#include <unordered_map>

namespace ledger {

AggregationQueries::AggregationQueries(const LedgerStore& store,
                                       const Catalog& catalog,
                                       const ProfitCalculator& pricing)
    : store_(store),
      catalog_(catalog),
      pricing_(pricing) {
}

InventorySummary AggregationQueries::inventory_summary(const TenantId& tenant_id,
                                                       Timestamp as_of,
                                                       bool include_external) const {
    const auto movements = net_movements(tenant_id, as_of);

    std::map<ItemId, Quantity> by_item;
    std::unordered_map<LocationId, bool> external_cache;
    for (const auto& [key, quantity] : movements) {
        const auto location_id = key.second;
        auto cached = external_cache.find(location_id);
        if (cached == external_cache.end()) {
            const auto location = catalog_.find_location(tenant_id, location_id);
            cached = external_cache.emplace(location_id, location && location->is_external).first;
        }
        if (cached->second && !include_external) {
            continue;
        }
        by_item[key.first] = safe_add(by_item[key.first], quantity);
    }

    InventorySummary summary;
    summary.as_of = as_of;
    summary.include_external = include_external;
    for (const auto& [item_id, quantity] : by_item) {
        if (quantity == 0) {
            continue;
        }
        InventorySummaryRow row;
        row.item_id = item_id;
        row.item_name = item_name(item_id);
        row.quantity = quantity;
        row.unit_value = pricing_.get_value_at(tenant_id, item_id, as_of);
        row.total_value = multiply(row.unit_value, quantity);
        if (row.total_value) {
            if (const auto total = checked_add(summary.grand_total_value, *row.total_value)) {
                summary.grand_total_value = *total;
            } else {
                row.total_value.reset();
            }
        }
        summary.rows.push_back(std::move(row));
    }

    std::sort(summary.rows.begin(), summary.rows.end(), [](const InventorySummaryRow& a, const InventorySummaryRow& b) {
        if (a.quantity != b.quantity) {
            return a.quantity > b.quantity;
        }
        return a.item_name < b.item_name;
    });
    return summary;
}

std::vector<ItemLocationRow> AggregationQueries::item_by_location(const TenantId& tenant_id,
                                                                  ItemId item_id,
                                                                  Timestamp as_of,
                                                                  bool include_external) const {
    const auto movements = net_movements(tenant_id, as_of);
    const auto unit = pricing_.get_value_at(tenant_id, item_id, as_of);

    std::vector<ItemLocationRow> rows;
    for (const auto& [key, quantity] : movements) {
        if (key.first != item_id) {
            continue;
        }
        const auto location = catalog_.find_location(tenant_id, key.second);
        if (!location || (location->is_external && !include_external)) {
            continue;
        }
        ItemLocationRow row;
        row.location_id = location->id;
        row.location_name = location->name;
        row.is_external = location->is_external;
        row.external_kind = location->external_kind;
        row.quantity = quantity;
        row.value = multiply(unit, quantity);
        rows.push_back(std::move(row));
    }

    std::sort(rows.begin(), rows.end(), [](const ItemLocationRow& a, const ItemLocationRow& b) {
        if (a.is_external != b.is_external) {
            return !a.is_external;
        }
        return a.location_name < b.location_name;
    });
    return rows;
}

std::vector<LocationSummaryRow> AggregationQueries::by_location(const TenantId& tenant_id,
                                                                Timestamp as_of,
                                                                bool include_external) const {
    const auto movements = net_movements(tenant_id, as_of);

    std::unordered_map<ItemId, std::optional<Money>> unit_cache;
    const auto unit_value = [&](ItemId item_id) {
        auto it = unit_cache.find(item_id);
        if (it == unit_cache.end()) {
            it = unit_cache.emplace(item_id, pricing_.get_value_at(tenant_id, item_id, as_of)).first;
        }
        return it->second;
    };

    std::map<LocationId, LocationSummaryRow> aggregated;
    for (const auto& [key, quantity] : movements) {
        const auto location = catalog_.find_location(tenant_id, key.second);
        if (!location || (location->is_external && !include_external)) {
            continue;
        }

        auto [it, inserted] = aggregated.try_emplace(location->id);
        auto& row = it->second;
        if (inserted) {
            row.location_id = location->id;
            row.location_name = location->name;
            row.is_external = location->is_external;
            row.external_kind = location->external_kind;
            row.total_value = Money{0};
        }
        row.total_quantity = safe_add(row.total_quantity, quantity);
        if (quantity == 0) {
            continue;
        }
        // One unpriced item makes this location's value unknown.
        const auto value = multiply(unit_value(key.first), quantity);
        row.total_value = (row.total_value && value) ? checked_add(*row.total_value, *value) : std::nullopt;
    }

    std::vector<LocationSummaryRow> rows;
    for (auto& [location_id, row] : aggregated) {
        if (row.total_quantity != 0) {
            rows.push_back(std::move(row));
        }
    }

    std::sort(rows.begin(), rows.end(), [](const LocationSummaryRow& a, const LocationSummaryRow& b) {
        if (a.is_external != b.is_external) {
            return !a.is_external;
        }
        if (a.total_value.has_value() != b.total_value.has_value()) {
            return a.total_value.has_value();
        }
        if (a.total_value && *a.total_value != *b.total_value) {
            return *a.total_value > *b.total_value;
        }
        return a.location_name < b.location_name;
    });
    return rows;
}

std::vector<LocationItemRow> AggregationQueries::location_by_item(const TenantId& tenant_id,
                                                                  LocationId location_id,
                                                                  Timestamp as_of) const {
    const auto movements = net_movements(tenant_id, as_of);

    std::vector<LocationItemRow> rows;
    for (const auto& [key, quantity] : movements) {
        if (key.second != location_id || quantity == 0) {
            continue;
        }
        LocationItemRow row;
        row.item_id = key.first;
        row.item_name = item_name(key.first);
        row.quantity = quantity;
        row.value = multiply(pricing_.get_value_at(tenant_id, key.first, as_of), quantity);
        rows.push_back(std::move(row));
    }
    // Map order already yields ascending item ids.
    return rows;
}

AggregationQueries::NetMovements AggregationQueries::net_movements(const TenantId& tenant_id, Timestamp as_of) const {
    NetMovements net;
    std::unordered_map<LocationId, bool> in_tenant;
    const auto belongs = [&](LocationId location_id) {
        auto it = in_tenant.find(location_id);
        if (it == in_tenant.end()) {
            it = in_tenant.emplace(location_id, catalog_.find_location(tenant_id, location_id).has_value()).first;
        }
        return it->second;
    };

    for (const auto& movement : store_.movements_up_to(tenant_id, as_of)) {
        const auto& line = movement.line;
        if (const auto from = party_location(line.from); from && belongs(*from)) {
            auto& quantity = net[{line.item_id, *from}];
            quantity = safe_add(quantity, -line.quantity);
        }
        if (const auto to = party_location(line.to); to && belongs(*to)) {
            auto& quantity = net[{line.item_id, *to}];
            quantity = safe_add(quantity, line.quantity);
        }
    }
    return net;
}

std::string AggregationQueries::item_name(ItemId item_id) const {
    const auto item = catalog_.find_item(item_id);
    return item ? item->name : "#" + std::to_string(item_id);
}

std::optional<Money> AggregationQueries::multiply(const std::optional<Money>& unit, Quantity quantity) {
    if (!unit) {
        return std::nullopt;
    }
    return checked_mul(*unit, quantity);
}

} // namespace ledger
