#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <string>
#include <vector>

namespace sqlaudit {

/**
 * @brief Abstract catalog query channel
 *
 * Each backend queries its own catalog (pg_attribute for PG) for the
 * ordered column list of one table. Runs on the caller's connection so
 * an unqualified name resolves through the same search path as the
 * statement being audited.
 */
class ISchemaLoader {
public:
    virtual ~ISchemaLoader() = default;

    /**
     * @brief Name the relation an unqualified or qualified name denotes
     *
     * The result carries the schema and table exactly as stored in the
     * catalog, which makes it usable as a cache key: the same text can
     * denote different relations under different search paths.
     *
     * @param conn Connection whose search path applies
     * @param table Name as written in the statement, identifiers unfolded
     * @return Schema-qualified catalog name, or an error when no such relation exists
     */
    [[nodiscard]] virtual Result<TableName> resolve(IDbConnection& conn, const TableName& table) = 0;

    /**
     * @brief Load the ordered column names of a table
     * @param conn Connection to query on
     * @param table Table name, schema optional
     * @return Column names in ordinal order, or an error
     */
    [[nodiscard]] virtual Result<std::vector<std::string>> load_columns(
        IDbConnection& conn, const TableName& table) = 0;
};

} // namespace sqlaudit
