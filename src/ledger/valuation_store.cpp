#include "ledger/valuation_store.hpp"
#include "ledger/errors.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace ledger {

ItemValuation ValuationStore::record_value(const TenantId& tenant_id,
                                           ItemId item_id,
                                           Money value,
                                           Timestamp effective_from,
                                           UserId recorded_by) {
    if (value < kMinValue || value > kMaxValue) {
        throw CatalogError("value_in_currency out of allowed range");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& history = histories_[{tenant_id, item_id}];
    if (history.count(effective_from) != 0) {
        throw CatalogError("A valuation already exists for this item at that effective_from");
    }

    ItemValuation valuation;
    valuation.id = next_id_;
    valuation.tenant_id = tenant_id;
    valuation.item_id = item_id;
    valuation.value = value;
    valuation.effective_from = effective_from;
    valuation.recorded_by = recorded_by;

    if (sink_) {
        sink_({{"type", "valuation"}, {"valuation", valuation}});
    }
    history.emplace(effective_from, valuation);
    ++next_id_;
    return valuation;
}

std::optional<ItemValuation> ValuationStore::valuation_at(const TenantId& tenant_id,
                                                          ItemId item_id,
                                                          Timestamp as_of) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = histories_.find({tenant_id, item_id});
    if (it == histories_.end() || it->second.empty()) {
        return std::nullopt;
    }

    // First row strictly after as_of; the one before it is the answer.
    auto after = it->second.upper_bound(as_of);
    if (after == it->second.begin()) {
        return std::nullopt;
    }
    return std::prev(after)->second;
}

std::vector<ItemValuation> ValuationStore::list_values(const TenantId& tenant_id,
                                                       std::optional<ItemId> item_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ItemValuation> result;
    for (const auto& [key, history] : histories_) {
        if (key.first != tenant_id || (item_id && key.second != *item_id)) {
            continue;
        }
        for (auto it = history.rbegin(); it != history.rend(); ++it) {
            result.push_back(it->second);
        }
    }
    return result;
}

bool ValuationStore::replay(const nlohmann::json& record) {
    if (record.value("type", std::string{}) != "valuation") {
        return false;
    }
    auto valuation = record.at("valuation").get<ItemValuation>();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    next_id_ = std::max(next_id_, valuation.id + 1);
    histories_[{valuation.tenant_id, valuation.item_id}][valuation.effective_from] = std::move(valuation);
    return true;
}

} // namespace ledger
