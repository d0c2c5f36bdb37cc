#include "ledger/catalog.hpp"
#include "ledger/errors.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace ledger {

Item Catalog::add_item(const std::string& name,
                       const std::string& code,
                       const std::string& category,
                       int stack_size) {
    const auto trimmed_code = journal::trim(code);
    if (journal::trim(name).empty() || trimmed_code.empty()) {
        throw CatalogError("Item name and code are required");
    }
    if (stack_size <= 0) {
        throw CatalogError("Item stack size must be positive");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const bool duplicate = std::any_of(items_.begin(), items_.end(), [&](const auto& entry) {
        return entry.second.code == trimmed_code;
    });
    if (duplicate) {
        throw CatalogError("Item code already exists: " + trimmed_code);
    }

    Item item;
    item.id = next_item_id_;
    item.name = journal::trim(name);
    item.code = trimmed_code;
    item.category = category;
    item.stack_size = stack_size;
    item.is_active = true;

    emit({{"type", "item"}, {"item", item}});
    items_.emplace(item.id, item);
    ++next_item_id_;
    return item;
}

Item Catalog::set_item_active(ItemId item_id, bool active) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = items_.find(item_id);
    if (it == items_.end()) {
        throw NotFoundError("Item not found");
    }

    emit({{"type", "item_active"}, {"item_id", item_id}, {"is_active", active}});
    it->second.is_active = active;
    return it->second;
}

Location Catalog::add_location(const TenantId& tenant_id, const NewLocation& spec) {
    if (tenant_id.empty()) {
        throw CatalogError("Location requires a tenant");
    }
    const auto code = journal::trim(spec.code);
    if (journal::trim(spec.name).empty() || code.empty()) {
        throw CatalogError("Location name and code are required");
    }
    if (spec.is_external && !spec.external_kind) {
        throw CatalogError("External locations need an external kind (IMPORT or EXPORT)");
    }
    if (!spec.is_external && spec.external_kind) {
        throw CatalogError("Only external locations carry an external kind");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const bool duplicate = std::any_of(locations_.begin(), locations_.end(), [&](const auto& entry) {
        return entry.second.tenant_id == tenant_id && entry.second.code == code;
    });
    if (duplicate) {
        throw CatalogError("Location code already exists in structure: " + code);
    }

    Location location;
    location.id = next_location_id_;
    location.tenant_id = tenant_id;
    location.name = journal::trim(spec.name);
    location.code = code;
    location.type = spec.type;
    location.description = spec.description;
    location.x = spec.x;
    location.y = spec.y;
    location.z = spec.z;
    location.is_active = spec.is_active;
    location.is_external = spec.is_external;
    location.external_kind = spec.external_kind;
    check_external_slot(location);

    emit({{"type", "location"}, {"location", location}});
    store_location(location);
    return location;
}

Location Catalog::set_location_active(const TenantId& tenant_id, LocationId location_id, bool active) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = locations_.find(location_id);
    if (it == locations_.end() || it->second.tenant_id != tenant_id) {
        throw NotFoundError("Location not found");
    }

    Location candidate = it->second;
    candidate.is_active = active;
    check_external_slot(candidate);

    emit({{"type", "location_active"},
          {"tenant_id", tenant_id},
          {"location_id", location_id},
          {"is_active", active}});
    it->second.is_active = active;
    return it->second;
}

MovementReason Catalog::add_movement_reason(const TenantId& tenant_id,
                                            const std::string& code,
                                            const std::string& name) {
    const auto trimmed_code = journal::trim(code);
    if (tenant_id.empty() || trimmed_code.empty()) {
        throw CatalogError("Movement reason requires a tenant and a code");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const bool duplicate = std::any_of(reasons_.begin(), reasons_.end(), [&](const auto& entry) {
        return entry.second.tenant_id == tenant_id && entry.second.code == trimmed_code;
    });
    if (duplicate) {
        throw CatalogError("Movement reason already exists in structure: " + trimmed_code);
    }

    MovementReason reason;
    reason.id = next_reason_id_;
    reason.tenant_id = tenant_id;
    reason.code = trimmed_code;
    reason.name = name.empty() ? trimmed_code : name;
    reason.is_active = true;

    emit({{"type", "reason"}, {"reason", reason}});
    store_reason(reason);
    return reason;
}

MovementReason Catalog::set_movement_reason_active(const TenantId& tenant_id,
                                                   const std::string& code,
                                                   bool active) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(reasons_.begin(), reasons_.end(), [&](const auto& entry) {
        return entry.second.tenant_id == tenant_id && entry.second.code == code;
    });
    if (it == reasons_.end()) {
        throw NotFoundError("Movement reason not found");
    }

    emit({{"type", "reason_active"}, {"tenant_id", tenant_id}, {"code", code}, {"is_active", active}});
    it->second.is_active = active;
    return it->second;
}

User Catalog::add_user(const std::string& username, std::optional<TenantId> tenant_id) {
    const auto name = journal::trim(username);
    if (name.empty()) {
        throw CatalogError("Username is required");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const bool duplicate = std::any_of(users_.begin(), users_.end(), [&](const auto& entry) {
        return entry.second.username == name;
    });
    if (duplicate) {
        throw CatalogError("Username already taken: " + name);
    }

    User user;
    user.id = next_user_id_;
    user.username = name;
    user.tenant_id = std::move(tenant_id);

    emit({{"type", "user"}, {"user", user}});
    users_.emplace(user.id, user);
    ++next_user_id_;
    return user;
}

User Catalog::assign_user_tenant(UserId user_id, std::optional<TenantId> tenant_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        throw NotFoundError("User not found");
    }

    emit({{"type", "user_tenant"}, {"user_id", user_id}, {"tenant_id", optional_to_json(tenant_id)}});
    it->second.tenant_id = std::move(tenant_id);
    return it->second;
}

std::optional<Item> Catalog::find_item(ItemId item_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = items_.find(item_id);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Item> Catalog::list_items() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Item> result;
    result.reserve(items_.size());
    for (const auto& [id, item] : items_) {
        result.push_back(item);
    }
    return result;
}

std::optional<Location> Catalog::find_location(const TenantId& tenant_id, LocationId location_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = locations_.find(location_id);
    if (it == locations_.end() || it->second.tenant_id != tenant_id) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Location> Catalog::list_locations(const TenantId& tenant_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Location> result;
    for (const auto& [id, location] : locations_) {
        if (location.tenant_id == tenant_id) {
            result.push_back(location);
        }
    }
    std::sort(result.begin(), result.end(), [](const Location& a, const Location& b) {
        return a.name < b.name;
    });
    return result;
}

std::optional<MovementReason> Catalog::find_movement_reason(const TenantId& tenant_id,
                                                            const std::string& code) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [id, reason] : reasons_) {
        if (reason.tenant_id == tenant_id && reason.code == code) {
            return reason;
        }
    }
    return std::nullopt;
}

std::vector<MovementReason> Catalog::list_movement_reasons(const TenantId& tenant_id,
                                                           bool active_only) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<MovementReason> result;
    for (const auto& [id, reason] : reasons_) {
        if (reason.tenant_id == tenant_id && (!active_only || reason.is_active)) {
            result.push_back(reason);
        }
    }
    std::sort(result.begin(), result.end(), [](const MovementReason& a, const MovementReason& b) {
        return a.code < b.code;
    });
    return result;
}

std::optional<User> Catalog::find_user(UserId user_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Catalog::is_member(const TenantId& tenant_id, UserId user_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(user_id);
    return it != users_.end() && it->second.tenant_id && *it->second.tenant_id == tenant_id;
}

bool Catalog::replay(const nlohmann::json& record) {
    const auto type = record.value("type", std::string{});
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (type == "item") {
        auto item = record.at("item").get<Item>();
        next_item_id_ = std::max(next_item_id_, item.id + 1);
        items_[item.id] = std::move(item);
        return true;
    }
    if (type == "item_active") {
        auto it = items_.find(record.at("item_id").get<ItemId>());
        if (it != items_.end()) {
            it->second.is_active = record.at("is_active").get<bool>();
        }
        return true;
    }
    if (type == "location") {
        store_location(record.at("location").get<Location>());
        return true;
    }
    if (type == "location_active") {
        auto it = locations_.find(record.at("location_id").get<LocationId>());
        if (it != locations_.end()) {
            it->second.is_active = record.at("is_active").get<bool>();
        }
        return true;
    }
    if (type == "reason") {
        store_reason(record.at("reason").get<MovementReason>());
        return true;
    }
    if (type == "reason_active") {
        const auto tenant_id = record.at("tenant_id").get<TenantId>();
        const auto code = record.at("code").get<std::string>();
        for (auto& [id, reason] : reasons_) {
            if (reason.tenant_id == tenant_id && reason.code == code) {
                reason.is_active = record.at("is_active").get<bool>();
            }
        }
        return true;
    }
    if (type == "user") {
        auto user = record.at("user").get<User>();
        next_user_id_ = std::max(next_user_id_, user.id + 1);
        users_[user.id] = std::move(user);
        return true;
    }
    if (type == "user_tenant") {
        auto it = users_.find(record.at("user_id").get<UserId>());
        if (it != users_.end()) {
            it->second.tenant_id = optional_field<TenantId>(record, "tenant_id");
        }
        return true;
    }
    return false;
}

void Catalog::emit(const nlohmann::json& record) {
    if (sink_) {
        sink_(record);
    }
}

void Catalog::check_external_slot(const Location& candidate) const {
    if (!candidate.is_external || !candidate.is_active || !candidate.external_kind) {
        return;
    }
    for (const auto& [id, location] : locations_) {
        if (id != candidate.id &&
            location.tenant_id == candidate.tenant_id &&
            location.is_external &&
            location.is_active &&
            location.external_kind == candidate.external_kind) {
            throw CatalogError("Structure already has an active " + to_string(*candidate.external_kind) +
                               " location: " + location.code);
        }
    }
}

void Catalog::store_location(const Location& location) {
    next_location_id_ = std::max(next_location_id_, location.id + 1);
    locations_[location.id] = location;
}

void Catalog::store_reason(const MovementReason& reason) {
    next_reason_id_ = std::max(next_reason_id_, reason.id + 1);
    reasons_[reason.id] = reason;
}

} // namespace ledger
