#pragma once

#include "audit/audit_sink.hpp"
#include "db/iconnection_factory.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace sqlaudit {

/**
 * @brief Audit sink that inserts records into a PostgreSQL table
 *
 * Connects lazily on the first write through the connection factory and
 * creates the table with CREATE TABLE IF NOT EXISTS before the first
 * insert. Images, parameters and custom properties are stored as jsonb.
 *
 * A failed write drops the connection; the next write reconnects.
 */
class PgAuditSink : public IAuditSink {
public:
    struct Config {
        std::string connection_string;
        std::string table = "audit_logs";   // optionally schema-qualified
    };

    PgAuditSink(Config config, std::shared_ptr<IConnectionFactory> factory);
    ~PgAuditSink() override;

    [[nodiscard]] Status write(const AuditRecord& record) override;
    void flush() override {}
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    /// CREATE TABLE IF NOT EXISTS statement for the configured table
    [[nodiscard]] std::string create_table_sql() const;

    /// Parameterized INSERT statement for the configured table
    [[nodiscard]] std::string insert_sql() const;

private:
    Status ensure_ready();

    Config config_;
    std::string quoted_table_;
    std::shared_ptr<IConnectionFactory> factory_;

    std::mutex mutex_;
    std::unique_ptr<IDbConnection> connection_;
    bool table_ready_ = false;
};

} // namespace sqlaudit
