#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlaudit {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sql_state;      // five-character SQLSTATE of a server error, else empty

    // Rows (SELECT, or DML with RETURNING); values in text form, nullopt = NULL
    std::vector<std::string> column_names;
    std::vector<std::vector<SqlValue>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // Row-returning vs command result
    bool has_rows = false;

    static DbResultSet failure(std::string message, std::string state = {}) {
        DbResultSet r;
        r.error_message = std::move(message);
        r.sql_state = std::move(state);
        return r;
    }

    /// Row as column -> value (column order of the result)
    [[nodiscard]] RowSnapshot row_snapshot(size_t row) const {
        RowSnapshot snapshot;
        if (row >= rows.size()) return snapshot;
        const auto& values = rows[row];
        for (size_t c = 0; c < column_names.size() && c < values.size(); ++c) {
            snapshot[column_names[c]] = values[c];
        }
        return snapshot;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe: one caller thread per connection.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement with positional parameters
     * @param sql SQL text ($1, $2, ... placeholders)
     * @param params Bindings; ordered by parameter number before sending
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql,
                                              const ParameterMap& params) = 0;

    /**
     * @brief Create a named server-side prepared statement
     */
    [[nodiscard]] virtual Status prepare(const std::string& name, const std::string& sql,
                                         size_t param_count) = 0;

    /**
     * @brief Execute a statement created by prepare()
     */
    [[nodiscard]] virtual DbResultSet execute_prepared(const std::string& name,
                                                       const ParameterMap& params) = 0;

    /**
     * @brief Server version number (e.g. 180001), 0 when unknown
     */
    [[nodiscard]] virtual int server_version() const = 0;

    /**
     * @brief Inside an explicit transaction block, including one a failed
     *        statement has already aborted
     *
     * PostgreSQL: PQtransactionStatus() is PQTRANS_INTRANS or PQTRANS_INERROR
     */
    [[nodiscard]] virtual bool in_transaction() const = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET statement_timeout = N
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlaudit
