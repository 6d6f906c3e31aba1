#include "db/postgresql/pg_schema_loader.hpp"
#include "core/utils.hpp"
#include "db/savepoint.hpp"
#include <format>
#include <string>

namespace sqlaudit {

namespace {

// Quoted so that mixed-case names from the parse tree resolve as written
std::string regclass_text(const TableName& table) {
    return table.schema
        ? std::format("{}.{}", utils::quote_identifier(*table.schema),
                      utils::quote_identifier(table.table))
        : utils::quote_identifier(table.table);
}

} // anonymous namespace

Result<TableName> PgSchemaLoader::resolve(IDbConnection& conn, const TableName& table) {
    static constexpr const char* RESOLVE_QUERY =
        "SELECT n.nspname, c.relname "
        "FROM pg_catalog.pg_class c "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "WHERE c.oid = to_regclass($1)";

    auto res = Savepoint::execute(conn, RESOLVE_QUERY, ParameterMap{{"$1", regclass_text(table)}});
    if (!res.success) {
        return Result<TableName>::error(
            ErrorCategory::CAPTURE_ERROR,
            std::format("Resolving {} failed: {}", table.full_name(), res.error_message));
    }
    if (res.rows.empty() || res.rows.front().size() < 2 ||
        !res.rows.front()[0] || !res.rows.front()[1]) {
        return Result<TableName>::error(ErrorCategory::CAPTURE_ERROR,
                                        std::format("Relation {} does not exist", table.full_name()));
    }
    return Result<TableName>::ok(TableName(*res.rows.front()[0], *res.rows.front()[1]));
}

Result<std::vector<std::string>> PgSchemaLoader::load_columns(IDbConnection& conn,
                                                             const TableName& table) {
    static constexpr const char* COLUMNS_QUERY =
        "SELECT attname "
        "FROM pg_catalog.pg_attribute "
        "WHERE attrelid = to_regclass($1) "
        "  AND attnum > 0 "
        "  AND NOT attisdropped "
        "ORDER BY attnum";

    auto res = Savepoint::execute(conn, COLUMNS_QUERY, ParameterMap{{"$1", regclass_text(table)}});
    if (!res.success) {
        return Result<std::vector<std::string>>::error(
            ErrorCategory::CAPTURE_ERROR,
            std::format("Column lookup for {} failed: {}", table.full_name(), res.error_message));
    }

    std::vector<std::string> columns;
    columns.reserve(res.rows.size());
    for (const auto& row : res.rows) {
        if (!row.empty() && row.front()) {
            columns.push_back(*row.front());
        }
    }

    if (columns.empty()) {
        return Result<std::vector<std::string>>::error(
            ErrorCategory::CAPTURE_ERROR,
            std::format("Table {} not found or has no columns", table.full_name()));
    }

    return Result<std::vector<std::string>>::ok(std::move(columns));
}

} // namespace sqlaudit
