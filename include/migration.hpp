#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "jsonhlp.hpp"
#include "schema.hpp"

/****************** Operations ******************/
// The engine records and replays operations; it never turns them into DDL.

enum class OpKind {
    CreateTable, RenameTable, DropTable,
    AddColumn, DropColumn, RenameColumn, AlterColumn,
    CreateIndex, DropIndex,
    SetNotNull, SetUnique, SetCheckConstraint, SetForeignKey, DropConstraint,
    RawSQL
};

std::string opkind(OpKind kind);                // OpKind::AddColumn -> "add_column"
std::optional<OpKind> opkind(const std::string& name);

struct ForeignKeyRef {
    std::string name;
    std::string table;
    std::string column;

    bool operator==(const ForeignKeyRef&) const = default;
};

struct CheckDef {
    std::string name;
    std::string constraint;

    bool operator==(const CheckDef&) const = default;
};

struct ColumnDef {
    std::string name;
    std::string type;
    bool nullable = true;
    bool unique = false;
    bool pk = false;
    std::optional<std::string> default_value;
    std::optional<ForeignKeyRef> references;
    std::optional<CheckDef> check;

    bool operator==(const ColumnDef&) const = default;
};

struct OpCreateTable {
    std::string name;
    std::vector<ColumnDef> columns;
    bool operator==(const OpCreateTable&) const = default;
};

struct OpRenameTable {
    std::string from;
    std::string to;
    bool operator==(const OpRenameTable&) const = default;
};

struct OpDropTable {
    std::string name;
    bool operator==(const OpDropTable&) const = default;
};

struct OpAddColumn {
    std::string table;
    ColumnDef column;
    std::optional<std::string> up;
    bool operator==(const OpAddColumn&) const = default;
};

struct OpDropColumn {
    std::string table;
    std::string column;
    std::optional<std::string> down;
    bool operator==(const OpDropColumn&) const = default;
};

struct OpRenameColumn {
    std::string table;
    std::string from;
    std::string to;
    bool operator==(const OpRenameColumn&) const = default;
};

struct OpAlterColumn {
    std::string table;
    std::string column;
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<bool> nullable;
    std::optional<std::string> up;
    std::optional<std::string> down;
    bool operator==(const OpAlterColumn&) const = default;
};

struct OpCreateIndex {
    std::string name;
    std::string table;
    std::vector<std::string> columns;
    bool operator==(const OpCreateIndex&) const = default;
};

struct OpDropIndex {
    std::string name;
    bool operator==(const OpDropIndex&) const = default;
};

struct OpSetNotNull {
    std::string table;
    std::string column;
    std::optional<std::string> up;
    std::optional<std::string> down;
    bool operator==(const OpSetNotNull&) const = default;
};

struct OpSetUnique {
    std::string name;
    std::string table;
    std::string column;
    std::optional<std::string> up;
    std::optional<std::string> down;
    bool operator==(const OpSetUnique&) const = default;
};

struct OpSetCheckConstraint {
    std::string table;
    std::string column;
    CheckDef check;
    std::optional<std::string> up;
    std::optional<std::string> down;
    bool operator==(const OpSetCheckConstraint&) const = default;
};

struct OpSetForeignKey {
    std::string table;
    std::string column;
    ForeignKeyRef references;
    std::optional<std::string> up;
    std::optional<std::string> down;
    bool operator==(const OpSetForeignKey&) const = default;
};

struct OpDropConstraint {
    std::string table;
    std::string column;
    std::string name;
    std::optional<std::string> up;
    std::optional<std::string> down;
    bool operator==(const OpDropConstraint&) const = default;
};

struct OpRawSQL {
    std::string up;
    std::optional<std::string> down;
    bool operator==(const OpRawSQL&) const = default;
};

// Alternative order matches OpKind.
using Operation = std::variant<
    OpCreateTable, OpRenameTable, OpDropTable,
    OpAddColumn, OpDropColumn, OpRenameColumn, OpAlterColumn,
    OpCreateIndex, OpDropIndex,
    OpSetNotNull, OpSetUnique, OpSetCheckConstraint, OpSetForeignKey, OpDropConstraint,
    OpRawSQL>;

OpKind kind_of(const Operation& op);

// Names of required fields that are empty, e.g. {"table", "column.type"}.
std::vector<std::string> missing_fields(const Operation& op);

// {"<kind>": {payload}}
jval operation_to_json(const Operation& op, jalloc& a);
// Throws std::runtime_error on an unknown kind or malformed payload.
Operation operation_from_json(const jval& value);

/****************** Migration ******************/

struct Migration {
    std::string name;
    std::vector<Operation> operations;

    bool operator==(const Migration&) const = default;

    // Empty when the migration may be started; otherwise one line per problem.
    std::vector<std::string> validate() const;

    jval to_json(jalloc& a) const;
    std::string to_json() const;

    // Throw std::runtime_error on malformed input.
    static Migration from_json(const jval& value);
    static Migration from_json(const std::string& text);
    static Migration from_file(const std::string& path);
};

/****************** Migration records ******************/

enum class MigrationStatus { InProgress, Complete, RolledBack };

std::string status_name(MigrationStatus status);          // "in_progress" | "complete" | "rolled_back"
std::optional<MigrationStatus> parse_status(const std::string& name);

// One persisted migration attempt against a schema.
struct MigrationRecord {
    int64_t id = 0;                  // monotonic per store; 0 until saved
    std::string schema_name;
    Migration migration;
    std::optional<std::string> parent; // name of the latest completed migration when this one started
    MigrationStatus status = MigrationStatus::InProgress;
    schema::Schema started_schema;
    std::optional<schema::Schema> completed_schema;
    std::string created_at;
    std::string updated_at;

    jval to_json(jalloc& a) const;
};
