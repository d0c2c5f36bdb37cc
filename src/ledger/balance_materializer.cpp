#include "ledger/balance_materializer.hpp"

#include <algorithm>
#include <stdexcept>

namespace ledger {

BalanceMaterializer::BalanceMaterializer(std::size_t stripe_count) {
    if (stripe_count == 0) {
        throw std::invalid_argument("BalanceMaterializer needs at least one stripe");
    }
    stripes_.reserve(stripe_count);
    for (std::size_t i = 0; i < stripe_count; ++i) {
        stripes_.push_back(std::make_unique<Stripe>());
    }
}

Quantity BalanceMaterializer::apply_delta(const BalanceKey& key, Quantity delta, Timestamp updated_at) {
    auto& stripe = stripe_for(key);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto [it, inserted] = stripe.rows.try_emplace(key, PlayerInventoryRow{key, 0, updated_at});
    it->second.quantity = safe_add(it->second.quantity, delta);
    it->second.updated_at = updated_at;
    return it->second.quantity;
}

void BalanceMaterializer::check_delta(const BalanceKey& key, Quantity delta) const {
    auto& stripe = stripe_for(key);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto it = stripe.rows.find(key);
    const Quantity current = it == stripe.rows.end() ? 0 : it->second.quantity;
    (void)safe_add(current, delta);
}

std::optional<PlayerInventoryRow> BalanceMaterializer::get(const BalanceKey& key) const {
    auto& stripe = stripe_for(key);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto it = stripe.rows.find(key);
    if (it == stripe.rows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PlayerInventoryRow> BalanceMaterializer::rows_for_user(const TenantId& tenant_id, UserId user_id) const {
    std::vector<PlayerInventoryRow> result;
    for (const auto& stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        for (const auto& [key, row] : stripe->rows) {
            if (key.tenant_id == tenant_id && key.user_id == user_id) {
                result.push_back(row);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const PlayerInventoryRow& a, const PlayerInventoryRow& b) {
        return a.key.item_id < b.key.item_id;
    });
    return result;
}

std::vector<PlayerInventoryRow> BalanceMaterializer::rows_for_tenant(const TenantId& tenant_id) const {
    std::vector<PlayerInventoryRow> result;
    for (const auto& stripe : stripes_) {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        for (const auto& [key, row] : stripe->rows) {
            if (key.tenant_id == tenant_id) {
                result.push_back(row);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const PlayerInventoryRow& a, const PlayerInventoryRow& b) {
        if (a.key.user_id != b.key.user_id) {
            return a.key.user_id < b.key.user_id;
        }
        return a.key.item_id < b.key.item_id;
    });
    return result;
}

BalanceMaterializer::Stripe& BalanceMaterializer::stripe_for(const BalanceKey& key) const {
    return *stripes_[BalanceKeyHash{}(key) % stripes_.size()];
}

} // namespace ledger
