#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "jsonhlp.hpp"

/**
 * Structured snapshot of one logical (database) schema.
 *
 * Mappings are keyed by name and carry no meaningful order; the column lists
 * inside keys and constraints keep their declared order. A Schema read from
 * the catalog is built once and never mutated afterwards.
 */
namespace schema {

struct Column {
    std::string name;
    std::string type;      // normalized catalog type name: "integer", "text", "character varying(255)"
    bool nullable = true;  // false when NOT NULL
    bool unique = false;   // sole column of a unique constraint or of the primary key

    bool operator==(const Column&) const = default;
};

struct Index {
    std::string name;

    bool operator==(const Index&) const = default;
};

struct UniqueConstraint {
    std::string name;
    std::vector<std::string> columns;

    bool operator==(const UniqueConstraint&) const = default;
};

struct ForeignKey {
    std::string name;
    std::vector<std::string> columns;
    std::string referenced_table;
    std::vector<std::string> referenced_columns;

    bool operator==(const ForeignKey&) const = default;
};

struct CheckConstraint {
    std::string name;
    std::vector<std::string> columns;
    std::string definition; // e.g. "CHECK ((age > 18))"

    bool operator==(const CheckConstraint&) const = default;
};

struct Table {
    std::string name;
    // Catalog identity. Not compared, not serialized.
    std::string oid;
    std::map<std::string, Column> columns;
    std::map<std::string, Index> indexes;
    std::vector<std::string> primary_key;
    std::map<std::string, UniqueConstraint> unique_constraints;
    std::map<std::string, ForeignKey> foreign_keys;
    std::map<std::string, CheckConstraint> check_constraints;

    bool operator==(const Table& other) const;

    const Column* column(const std::string& name) const;
};

struct Schema {
    std::string name;
    std::map<std::string, Table> tables;

    bool operator==(const Schema&) const = default;

    const Table* table(const std::string& name) const;

    // Invariant violations (empty when the snapshot is well formed).
    std::vector<std::string> validate() const;

    jval to_json(jalloc& a) const;
    std::string to_json() const;

    // Returns false on malformed input; schema is left in an unspecified state then.
    static bool from_json(const jval& value, Schema& schema);
    static bool from_json(const std::string& text, Schema& schema);
};

} // namespace schema
