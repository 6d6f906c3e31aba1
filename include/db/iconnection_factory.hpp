#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlaudit {

/**
 * @brief Abstract factory for creating database connections
 *
 * Wraps the native connection function (PQconnectdb) so sinks and the
 * command-line tool can open connections without naming the backend.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string libpq connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace sqlaudit
