#pragma once

#include "db/ischema_loader.hpp"

namespace sqlaudit {

/**
 * @brief PostgreSQL schema loader
 *
 * Reads pg_attribute for the relation named by to_regclass(), which
 * resolves an unqualified name through search_path exactly as the audited
 * statement does. Dropped and system columns are skipped.
 *
 * Inside a transaction block each catalog query runs under a savepoint so
 * that its failure leaves the caller's transaction usable.
 */
class PgSchemaLoader : public ISchemaLoader {
public:
    ~PgSchemaLoader() override = default;

    [[nodiscard]] Result<TableName> resolve(IDbConnection& conn, const TableName& table) override;

    [[nodiscard]] Result<std::vector<std::string>> load_columns(
        IDbConnection& conn, const TableName& table) override;
};

} // namespace sqlaudit
