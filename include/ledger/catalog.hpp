#pragma once

#include "ledger/codec.hpp"
#include "ledger/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace ledger {

// Reference data: global items, tenant-scoped locations and movement reasons,
// and user-to-tenant membership. Mutations are journaled through the sink
// before they become visible.
class Catalog {
public:
    Catalog() = default;

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    void set_record_sink(RecordSink sink) { sink_ = std::move(sink); }

    Item add_item(const std::string& name,
                  const std::string& code,
                  const std::string& category,
                  int stack_size = 64);
    Item set_item_active(ItemId item_id, bool active);

    Location add_location(const TenantId& tenant_id, const NewLocation& spec);
    Location set_location_active(const TenantId& tenant_id, LocationId location_id, bool active);

    MovementReason add_movement_reason(const TenantId& tenant_id,
                                       const std::string& code,
                                       const std::string& name);
    MovementReason set_movement_reason_active(const TenantId& tenant_id,
                                              const std::string& code,
                                              bool active);

    User add_user(const std::string& username, std::optional<TenantId> tenant_id);
    User assign_user_tenant(UserId user_id, std::optional<TenantId> tenant_id);

    [[nodiscard]] std::optional<Item> find_item(ItemId item_id) const;
    [[nodiscard]] std::vector<Item> list_items() const;

    // Only returns locations of the given tenant.
    [[nodiscard]] std::optional<Location> find_location(const TenantId& tenant_id, LocationId location_id) const;
    [[nodiscard]] std::vector<Location> list_locations(const TenantId& tenant_id) const;

    [[nodiscard]] std::optional<MovementReason> find_movement_reason(const TenantId& tenant_id,
                                                                     const std::string& code) const;
    [[nodiscard]] std::vector<MovementReason> list_movement_reasons(const TenantId& tenant_id,
                                                                    bool active_only) const;

    [[nodiscard]] std::optional<User> find_user(UserId user_id) const;
    [[nodiscard]] bool is_member(const TenantId& tenant_id, UserId user_id) const;

    // Applies a journal record written by this catalog. Returns false when the
    // record type is not a catalog record.
    bool replay(const nlohmann::json& record);

private:
    void emit(const nlohmann::json& record);
    void check_external_slot(const Location& candidate) const;
    void store_location(const Location& location);
    void store_reason(const MovementReason& reason);

    mutable std::shared_mutex mutex_;
    RecordSink sink_;

    std::map<ItemId, Item> items_;
    std::map<LocationId, Location> locations_;
    std::map<ReasonId, MovementReason> reasons_;
    std::map<UserId, User> users_;

    ItemId next_item_id_ = 1;
    LocationId next_location_id_ = 1;
    ReasonId next_reason_id_ = 1;
    UserId next_user_id_ = 1;
};

} // namespace ledger
