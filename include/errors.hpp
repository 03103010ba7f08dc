#pragma once
#include <stdexcept>
#include <string>

/**
 * Error taxonomy of the state engine.
 *
 * Every public operation reports failure by throwing one of the StateError
 * subclasses below. Messages read "<operation> '<schema>': <detail>".
 * DbError is the driver-level failure raised by SQLConnection/SQLStatement;
 * State never lets it escape untranslated.
 */

class DbError : public std::runtime_error {
public:
    DbError(const std::string& msg, std::string sqlstate = "", std::string constraint = "")
        : std::runtime_error(msg), sqlstate_(std::move(sqlstate)), constraint_(std::move(constraint)) {}

    const std::string& sqlstate() const noexcept { return sqlstate_; }
    const std::string& constraint() const noexcept { return constraint_; }
    bool unique_violation() const noexcept { return sqlstate_ == "23505"; }

private:
    std::string sqlstate_;
    std::string constraint_; // empty when the driver does not report it
};

class StateError : public std::runtime_error {
public:
    StateError(std::string operation, std::string schema, const std::string& detail)
        : std::runtime_error(operation + " '" + schema + "': " + detail)
        , operation_(std::move(operation)), schema_(std::move(schema)) {}

    const std::string& operation() const noexcept { return operation_; }
    const std::string& schema_name() const noexcept { return schema_; }

private:
    std::string operation_;
    std::string schema_;
};

// Schema (or the in-progress migration of a schema) does not exist.
class NotFoundError : public StateError {
public:
    using StateError::StateError;
};

// Malformed or empty migration definition. Never retried.
class InvalidMigrationError : public StateError {
public:
    using StateError::StateError;
};

// Another migration for the same schema is in progress or being started.
class AlreadyActiveError : public StateError {
public:
    AlreadyActiveError(std::string operation, std::string schema)
        : StateError(std::move(operation), std::move(schema), "a migration is already active for this schema") {}
};

// Catalog query failed; what() includes the cause's message.
class IntrospectionError : public StateError {
public:
    IntrospectionError(std::string operation, std::string schema, const std::string& cause)
        : StateError(std::move(operation), std::move(schema), "introspection failed: " + cause)
        , cause_(cause) {}

    const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

class StoreError : public StateError {
public:
    StoreError(std::string operation, std::string schema, const std::string& detail, bool release_failed = false)
        : StateError(std::move(operation), std::move(schema), detail), release_failed_(release_failed) {}

    // True when the guard's rollback failed and its connection had to be closed.
    bool release_failed() const noexcept { return release_failed_; }

private:
    bool release_failed_;
};

class CancelledError : public StateError {
public:
    using StateError::StateError;
};
