#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace sqlaudit {

/**
 * @brief IDbConnection over a libpq PGconn
 *
 * Calls are blocking. Bindings go out in text format, ordered by
 * parameter number; an unbound gap or a NULL binding is sent as SQL NULL.
 * Row values come back as text with SQL NULL as std::nullopt.
 */
class PgConnection : public IDbConnection {
public:
    /// Takes ownership of conn
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const ParameterMap& params) override;
    Status prepare(const std::string& name, const std::string& sql, size_t param_count) override;
    DbResultSet execute_prepared(const std::string& name, const ParameterMap& params) override;
    int server_version() const override;
    bool in_transaction() const override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    struct ResultDeleter {
        void operator()(PGresult* res) const { PQclear(res); }
    };
    using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

    /// Rows, affected count or the server's error message
    DbResultSet to_result_set(ResultPtr res) const;

    PGconn* conn_;
};

/**
 * @brief Opens PgConnections with PQconnectdb; nullptr and a logged error on failure
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace sqlaudit
