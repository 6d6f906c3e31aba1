#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstdlib>
#include <format>

namespace sqlaudit {

namespace {

// Bindings ordered by parameter number, as the parallel arrays libpq expects.
// Pointers stay valid while `values` is alive.
struct PgParams {
    std::vector<SqlValue> values;
    std::vector<const char*> pointers;

    explicit PgParams(const ParameterMap& params) : values(params.positional()) {
        pointers.reserve(values.size());
        for (const auto& v : values) {
            pointers.push_back(v ? v->c_str() : nullptr);
        }
    }

    int count() const { return static_cast<int>(pointers.size()); }
    const char* const* data() const { return pointers.empty() ? nullptr : pointers.data(); }
};

// "UPDATE 3" -> 3; 0 when the command reports no count
uint64_t command_rows(PGresult* res) {
    const char* tuples = PQcmdTuples(res);
    return (tuples && *tuples) ? std::strtoull(tuples, nullptr, 10) : 0;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const ParameterMap& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    if (params.empty()) {
        return to_result_set(ResultPtr(PQexec(conn_, sql.c_str())));
    }

    const PgParams bound(params);
    return to_result_set(ResultPtr(PQexecParams(conn_, sql.c_str(), bound.count(),
                                                nullptr, bound.data(), nullptr, nullptr, 0)));
}

Status PgConnection::prepare(const std::string& name, const std::string& sql,
                             size_t param_count) {
    if (!conn_) {
        return Status::error(ErrorCategory::EXECUTION_ERROR, "Connection is closed");
    }

    auto rs = to_result_set(ResultPtr(PQprepare(conn_, name.c_str(), sql.c_str(),
                                                static_cast<int>(param_count), nullptr)));
    if (!rs.success) {
        return Status::error(ErrorCategory::EXECUTION_ERROR, std::move(rs.error_message));
    }
    return Status::ok();
}

DbResultSet PgConnection::execute_prepared(const std::string& name, const ParameterMap& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    const PgParams bound(params);
    return to_result_set(ResultPtr(PQexecPrepared(conn_, name.c_str(), bound.count(),
                                                  bound.data(), nullptr, nullptr, 0)));
}

int PgConnection::server_version() const {
    return conn_ ? PQserverVersion(conn_) : 0;
}

bool PgConnection::in_transaction() const {
    if (!conn_) {
        return false;
    }
    const PGTransactionStatusType status = PQtransactionStatus(conn_);
    return status == PQTRANS_INTRANS || status == PQTRANS_INERROR;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const auto rs = to_result_set(ResultPtr(
        PQexec(conn_, std::format("SET statement_timeout = {}", timeout_ms).c_str())));
    if (!rs.success) {
        utils::log::warn(std::format("SET statement_timeout failed: {}", rs.error_message));
    }
    return rs.success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::to_result_set(ResultPtr res) const {
    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_));
    }

    DbResultSet result;
    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK: {
            result.success = true;
            result.has_rows = true;

            const int ncols = PQnfields(res.get());
            const int nrows = PQntuples(res.get());
            result.column_names.reserve(static_cast<size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                result.column_names.emplace_back(PQfname(res.get(), c));
            }

            result.rows.reserve(static_cast<size_t>(nrows));
            for (int r = 0; r < nrows; ++r) {
                auto& row = result.rows.emplace_back();
                row.reserve(static_cast<size_t>(ncols));
                for (int c = 0; c < ncols; ++c) {
                    if (PQgetisnull(res.get(), r, c)) {
                        row.emplace_back(std::nullopt);
                    } else {
                        row.emplace_back(std::string(PQgetvalue(res.get(), r, c),
                                                     static_cast<size_t>(PQgetlength(res.get(), r, c))));
                    }
                }
            }

            // DML ... RETURNING reports its own count; plain SELECT reports the row count
            result.affected_rows = command_rows(res.get());
            return result;
        }

        case PGRES_COMMAND_OK:
            result.success = true;
            result.affected_rows = command_rows(res.get());
            return result;

        default: {
            std::string error = PQresultErrorMessage(res.get());
            if (error.empty()) {
                error = PQerrorMessage(conn_);
            }
            // libpq messages end with a newline
            while (!error.empty() && (error.back() == '\n' || error.back() == ' ')) {
                error.pop_back();
            }
            const char* state = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
            return DbResultSet::failure(std::move(error), state ? state : "");
        }
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = PQerrorMessage(conn);
        while (!message.empty() && message.back() == '\n') message.pop_back();
        utils::log::error(std::format("Failed to connect: {}", message));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace sqlaudit
