#pragma once

#include "journal/util.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ledger {

using TenantId = std::string;
using UserId = int64_t;
using ItemId = int64_t;
using LocationId = int64_t;
using ReasonId = int64_t;
using TradeId = int64_t;
using TradeLineId = int64_t;
using LedgerEntryId = int64_t;
using ValuationId = int64_t;
using Quantity = int64_t;
using Timestamp = journal::Timestamp;

// Fixed-point amount in thousandths of the tenant currency unit.
using Money = int64_t;
constexpr Money kMoneyScale = 1000;

// Empty on overflow.
std::optional<int64_t> checked_add(int64_t lhs, int64_t rhs);
std::optional<int64_t> checked_mul(int64_t lhs, int64_t rhs);

// Throw std::overflow_error on overflow.
int64_t safe_add(int64_t lhs, int64_t rhs);
int64_t safe_mul(int64_t lhs, int64_t rhs);

std::string format_money(Money amount);
Money parse_money(const std::string& text);
Money money_from_double(double value);

enum class Direction { Gained, Given };

enum class LocationType { Town, Outpost, Mine, Port, Other };

enum class ExternalKind { Import, Export };

std::string to_string(Direction direction);
std::string to_string(LocationType type);
std::string to_string(ExternalKind kind);

Direction parse_direction(const std::string& text);
LocationType parse_location_type(const std::string& text);
ExternalKind parse_external_kind(const std::string& text);

struct UserParty {
    UserId user_id = 0;
};

struct LocationParty {
    LocationId location_id = 0;
};

// One side of a movement: a player account or a location, never both.
using Party = std::variant<UserParty, LocationParty>;

// Builds a party from the raw nullable pair a collaborator submits.
// Throws InvalidPartyError unless exactly one of the two is present.
Party make_party(std::optional<UserId> user_id,
                 std::optional<LocationId> location_id,
                 const std::string& side);

std::optional<UserId> party_user(const Party& party);
std::optional<LocationId> party_location(const Party& party);

struct Item {
    ItemId id = 0;
    std::string name;
    std::string code;
    std::string category;
    int stack_size = 64;
    bool is_active = true;
};

struct NewLocation {
    std::string name;
    std::string code;
    LocationType type = LocationType::Other;
    std::string description;
    std::optional<int> x;
    std::optional<int> y;
    std::optional<int> z;
    bool is_active = true;
    bool is_external = false;
    std::optional<ExternalKind> external_kind;
};

struct Location {
    LocationId id = 0;
    TenantId tenant_id;
    std::string name;
    std::string code;
    LocationType type = LocationType::Other;
    std::string description;
    std::optional<int> x;
    std::optional<int> y;
    std::optional<int> z;
    bool is_active = true;
    bool is_external = false;
    std::optional<ExternalKind> external_kind;
};

struct MovementReason {
    ReasonId id = 0;
    TenantId tenant_id;
    std::string code;
    std::string name;
    bool is_active = true;
};

struct User {
    UserId id = 0;
    std::string username;
    std::optional<TenantId> tenant_id;
};

struct CallerContext {
    TenantId tenant_id;
    UserId user_id = 0;
};

struct Trade {
    TradeId id = 0;
    TenantId tenant_id;
    UserId recorded_by = 0;
    Timestamp timestamp{};
    std::optional<LocationId> default_from_location;
    std::optional<LocationId> default_to_location;
};

struct TradeLine {
    TradeLineId id = 0;
    TradeId trade_id = 0;
    ItemId item_id = 0;
    Direction direction = Direction::Gained;
    Quantity quantity = 0;
    Party from;
    Party to;
    std::optional<std::string> reason_code;
};

// A trade header loaded together with all of its lines.
struct TradeRecord {
    Trade trade;
    std::vector<TradeLine> lines;
};

struct LedgerEntry {
    LedgerEntryId id = 0;
    UserId user_id = 0;
    ItemId item_id = 0;
    TenantId tenant_id;
    Quantity delta_qty = 0;
    TradeId trade_id = 0;
    TradeLineId trade_line_id = 0;
    std::optional<std::string> reason_code;
    Timestamp timestamp{};
};

struct BalanceKey {
    UserId user_id = 0;
    ItemId item_id = 0;
    TenantId tenant_id;

    bool operator==(const BalanceKey& other) const {
        return user_id == other.user_id && item_id == other.item_id && tenant_id == other.tenant_id;
    }
};

struct BalanceKeyHash {
    std::size_t operator()(const BalanceKey& key) const noexcept {
        std::size_t seed = std::hash<TenantId>{}(key.tenant_id);
        seed ^= std::hash<int64_t>{}(key.user_id) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= std::hash<int64_t>{}(key.item_id) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

struct PlayerInventoryRow {
    BalanceKey key;
    Quantity quantity = 0;
    Timestamp updated_at{};
};

struct ItemValuation {
    ValuationId id = 0;
    TenantId tenant_id;
    ItemId item_id = 0;
    Money value = 0;
    Timestamp effective_from{};
    UserId recorded_by = 0;
};

// Line as submitted by a collaborator, before party resolution.
struct ProposedLine {
    ItemId item_id = 0;
    Direction direction = Direction::Gained;
    Quantity quantity = 0;
    std::optional<UserId> from_user_id;
    std::optional<LocationId> from_location_id;
    std::optional<UserId> to_user_id;
    std::optional<LocationId> to_location_id;
    std::optional<std::string> reason_code;
};

struct CreateTradeRequest {
    Timestamp timestamp{};
    std::optional<LocationId> from_location_id;
    std::optional<LocationId> to_location_id;
    std::vector<ProposedLine> lines;
};

} // namespace ledger
