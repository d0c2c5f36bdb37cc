#include "ledger/types.hpp"
#include "ledger/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace ledger {

std::optional<int64_t> checked_add(int64_t lhs, int64_t rhs) {
    if ((rhs > 0 && lhs > std::numeric_limits<int64_t>::max() - rhs) ||
        (rhs < 0 && lhs < std::numeric_limits<int64_t>::min() - rhs)) {
        return std::nullopt;
    }
    return lhs + rhs;
}

std::optional<int64_t> checked_mul(int64_t lhs, int64_t rhs) {
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    if (lhs == 0 || rhs == 0) {
        return int64_t{0};
    }
    if (lhs > 0) {
        if (rhs > 0 ? lhs > max / rhs : rhs < min / lhs) {
            return std::nullopt;
        }
    } else {
        if (rhs > 0 ? lhs < min / rhs : lhs < max / rhs) {
            return std::nullopt;
        }
    }
    return lhs * rhs;
}

int64_t safe_add(int64_t lhs, int64_t rhs) {
    const auto sum = checked_add(lhs, rhs);
    if (!sum) {
        throw std::overflow_error("Ledger integer overflow");
    }
    return *sum;
}

int64_t safe_mul(int64_t lhs, int64_t rhs) {
    const auto product = checked_mul(lhs, rhs);
    if (!product) {
        throw std::overflow_error("Ledger integer overflow");
    }
    return *product;
}

std::string format_money(Money amount) {
    const bool negative = amount < 0;
    // Negate in unsigned space so INT64_MIN does not overflow.
    const uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(amount) : static_cast<uint64_t>(amount);
    const uint64_t units = magnitude / kMoneyScale;
    const uint64_t fraction = magnitude % kMoneyScale;

    std::string fraction_text = std::to_string(fraction);
    while (fraction_text.size() < 3) {
        fraction_text.insert(fraction_text.begin(), '0');
    }
    return (negative ? "-" : "") + std::to_string(units) + "." + fraction_text;
}

Money parse_money(const std::string& text) {
    const auto trimmed = journal::trim(text);
    if (trimmed.empty()) {
        throw std::invalid_argument("Empty money amount");
    }

    std::size_t pos = 0;
    bool negative = false;
    if (trimmed[pos] == '-' || trimmed[pos] == '+') {
        negative = trimmed[pos] == '-';
        ++pos;
    }

    int64_t units = 0;
    int64_t fraction = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;
    for (; pos < trimmed.size(); ++pos) {
        const char c = trimmed[pos];
        if (c == '.' && !seen_point) {
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Malformed money amount: " + text);
        }
        seen_digit = true;
        if (seen_point) {
            if (++fraction_digits > 3) {
                throw std::invalid_argument("Money amount has more than 3 decimals: " + text);
            }
            fraction = fraction * 10 + (c - '0');
        } else {
            units = safe_add(safe_mul(units, 10), c - '0');
        }
    }
    if (!seen_digit) {
        throw std::invalid_argument("Malformed money amount: " + text);
    }
    for (; fraction_digits < 3; ++fraction_digits) {
        fraction *= 10;
    }

    const Money amount = safe_add(safe_mul(units, kMoneyScale), fraction);
    return negative ? -amount : amount;
}

Money money_from_double(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Money amount is not finite");
    }
    const double scaled = value * static_cast<double>(kMoneyScale);
    if (std::fabs(scaled) > static_cast<double>(std::numeric_limits<int64_t>::max() / 2)) {
        throw std::overflow_error("Money amount out of range");
    }
    return static_cast<Money>(std::llround(scaled));
}

std::string to_string(Direction direction) {
    return direction == Direction::Gained ? "GAINED" : "GIVEN";
}

std::string to_string(LocationType type) {
    switch (type) {
    case LocationType::Town:
        return "TOWN";
    case LocationType::Outpost:
        return "OUTPOST";
    case LocationType::Mine:
        return "MINE";
    case LocationType::Port:
        return "PORT";
    case LocationType::Other:
        break;
    }
    return "OTHER";
}

std::string to_string(ExternalKind kind) {
    return kind == ExternalKind::Import ? "IMPORT" : "EXPORT";
}

Direction parse_direction(const std::string& text) {
    const auto upper = journal::to_upper_copy(journal::trim(text));
    if (upper == "GAINED") {
        return Direction::Gained;
    }
    if (upper == "GIVEN") {
        return Direction::Given;
    }
    throw std::invalid_argument("Unknown direction: " + text);
}

LocationType parse_location_type(const std::string& text) {
    const auto upper = journal::to_upper_copy(journal::trim(text));
    if (upper == "TOWN") {
        return LocationType::Town;
    }
    if (upper == "OUTPOST") {
        return LocationType::Outpost;
    }
    if (upper == "MINE") {
        return LocationType::Mine;
    }
    if (upper == "PORT") {
        return LocationType::Port;
    }
    if (upper == "OTHER") {
        return LocationType::Other;
    }
    throw std::invalid_argument("Unknown location type: " + text);
}

ExternalKind parse_external_kind(const std::string& text) {
    const auto upper = journal::to_upper_copy(journal::trim(text));
    if (upper == "IMPORT") {
        return ExternalKind::Import;
    }
    if (upper == "EXPORT") {
        return ExternalKind::Export;
    }
    throw std::invalid_argument("Unknown external kind: " + text);
}

Party make_party(std::optional<UserId> user_id,
                 std::optional<LocationId> location_id,
                 const std::string& side) {
    if (user_id.has_value() == location_id.has_value()) {
        throw InvalidPartyError("Provide exactly one " + side +
                                " party (user XOR location; header default counts)");
    }
    if (user_id) {
        return UserParty{*user_id};
    }
    return LocationParty{*location_id};
}

std::optional<UserId> party_user(const Party& party) {
    if (const auto* user = std::get_if<UserParty>(&party)) {
        return user->user_id;
    }
    return std::nullopt;
}

std::optional<LocationId> party_location(const Party& party) {
    if (const auto* location = std::get_if<LocationParty>(&party)) {
        return location->location_id;
    }
    return std::nullopt;
}

} // namespace ledger
