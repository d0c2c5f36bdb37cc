#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ledger {

class LedgerError : public std::runtime_error {
public:
    LedgerError(const std::string& message, std::string code)
        : std::runtime_error(message), code_(std::move(code)) {}

    // Stable identifier reported to collaborators, e.g. "invalid_party".
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

// Rejected before any write; never partially applied.
class ValidationError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class InvalidPartyError : public ValidationError {
public:
    explicit InvalidPartyError(const std::string& message)
        : ValidationError(message, "invalid_party") {}
};

class CrossTenantUserError : public ValidationError {
public:
    explicit CrossTenantUserError(const std::string& message)
        : ValidationError(message, "cross_tenant_user") {}
};

class InvalidReasonError : public ValidationError {
public:
    explicit InvalidReasonError(const std::string& message)
        : ValidationError(message, "invalid_reason") {}
};

class ExternalBoundaryError : public ValidationError {
public:
    explicit ExternalBoundaryError(const std::string& message)
        : ValidationError(message, "external_boundary") {}
};

class InvalidLocationError : public ValidationError {
public:
    explicit InvalidLocationError(const std::string& message)
        : ValidationError(message, "invalid_location") {}
};

class InvalidItemError : public ValidationError {
public:
    explicit InvalidItemError(const std::string& message)
        : ValidationError(message, "invalid_item") {}
};

class InvalidQuantityError : public ValidationError {
public:
    explicit InvalidQuantityError(const std::string& message)
        : ValidationError(message, "invalid_quantity") {}
};

// Same report for "missing" and "belongs to another tenant".
class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerError(message, "not_found") {}
};

class CatalogError : public LedgerError {
public:
    explicit CatalogError(const std::string& message)
        : LedgerError(message, "catalog_conflict") {}
};

class PersistenceError : public LedgerError {
public:
    explicit PersistenceError(const std::string& message)
        : LedgerError(message, "persistence_failure") {}
};

} // namespace ledger
