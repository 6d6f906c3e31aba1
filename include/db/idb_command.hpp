#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <string>

namespace sqlaudit {

/**
 * @brief A statement text plus its parameter bindings, bound to a connection
 *
 * The unit that application code executes. AuditingCommand decorates any
 * implementation without the caller noticing.
 */
class IDbCommand {
public:
    virtual ~IDbCommand() = default;

    [[nodiscard]] virtual const std::string& text() const = 0;
    virtual void set_text(std::string text) = 0;

    [[nodiscard]] virtual ParameterMap& parameters() = 0;
    [[nodiscard]] virtual const ParameterMap& parameters() const = 0;

    [[nodiscard]] virtual IDbConnection& connection() = 0;

    /**
     * @brief Prepare the current text on the server
     */
    [[nodiscard]] virtual Status prepare() = 0;

    /**
     * @brief Execute the current text with the current bindings
     * @return Result set, or EXECUTION_ERROR with the server message
     */
    [[nodiscard]] virtual Result<DbResultSet> execute() = 0;

    /**
     * @brief SQLSTATE of the last failed execute(), empty after a success
     */
    [[nodiscard]] virtual const std::string& last_sql_state() const = 0;

    /**
     * @brief Execute and return the first column of the first row
     *
     * A result without rows yields SQL NULL.
     */
    [[nodiscard]] virtual Result<SqlValue> execute_scalar() = 0;
};

} // namespace sqlaudit
