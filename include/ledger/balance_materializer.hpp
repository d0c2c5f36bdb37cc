#pragma once

#include "ledger/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ledger {

// Current quantity per (user, item, tenant). Each delta is applied as a
// read-modify-write while holding the lock stripe that owns the key, so two
// committers touching the same key never lose an update.
class BalanceMaterializer {
public:
    explicit BalanceMaterializer(std::size_t stripe_count = 64);

    BalanceMaterializer(const BalanceMaterializer&) = delete;
    BalanceMaterializer& operator=(const BalanceMaterializer&) = delete;

    // Creates the row at 0 when absent. Returns the new quantity.
    Quantity apply_delta(const BalanceKey& key, Quantity delta, Timestamp updated_at);

    // Throws std::overflow_error if applying the delta would overflow.
    void check_delta(const BalanceKey& key, Quantity delta) const;

    [[nodiscard]] std::optional<PlayerInventoryRow> get(const BalanceKey& key) const;
    [[nodiscard]] std::vector<PlayerInventoryRow> rows_for_user(const TenantId& tenant_id, UserId user_id) const;
    [[nodiscard]] std::vector<PlayerInventoryRow> rows_for_tenant(const TenantId& tenant_id) const;

private:
    struct Stripe {
        mutable std::mutex mutex;
        std::unordered_map<BalanceKey, PlayerInventoryRow, BalanceKeyHash> rows;
    };

    Stripe& stripe_for(const BalanceKey& key) const;

    std::vector<std::unique_ptr<Stripe>> stripes_;
};

} // namespace ledger
