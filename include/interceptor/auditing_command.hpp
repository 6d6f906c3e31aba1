#pragma once

#include "db/idb_command.hpp"
#include "interceptor/audit_interceptor.hpp"

#include <memory>
#include <string>

namespace sqlaudit {

/**
 * @brief IDbCommand decorator that routes execution through an AuditInterceptor
 *
 * Text, bindings, connection and prepare() are forwarded to the wrapped
 * command. execute() and execute_scalar() go through the interceptor, so
 * application code sees exactly the wrapped command's results.
 */
class AuditingCommand : public IDbCommand {
public:
    AuditingCommand(std::unique_ptr<IDbCommand> inner,
                    std::shared_ptr<const AuditInterceptor> interceptor);

    const std::string& text() const override { return inner_->text(); }
    void set_text(std::string text) override { inner_->set_text(std::move(text)); }

    ParameterMap& parameters() override { return inner_->parameters(); }
    const ParameterMap& parameters() const override { return inner_->parameters(); }

    IDbConnection& connection() override { return inner_->connection(); }

    Status prepare() override { return inner_->prepare(); }
    Result<DbResultSet> execute() override;
    Result<SqlValue> execute_scalar() override;

    const std::string& last_sql_state() const override { return inner_->last_sql_state(); }

    /// Audit side of the most recent execution
    [[nodiscard]] const InterceptOutcome& last_outcome() const { return last_outcome_; }

    [[nodiscard]] IDbCommand& inner() { return *inner_; }

private:
    std::unique_ptr<IDbCommand> inner_;
    std::shared_ptr<const AuditInterceptor> interceptor_;
    InterceptOutcome last_outcome_;
};

/**
 * @brief Connection wrapper that hands out auditing commands
 *
 * Owns the underlying connection when constructed from a unique_ptr,
 * borrows it otherwise.
 */
class AuditableConnection {
public:
    AuditableConnection(std::unique_ptr<IDbConnection> connection,
                        std::shared_ptr<const AuditInterceptor> interceptor);

    AuditableConnection(IDbConnection& connection,
                        std::shared_ptr<const AuditInterceptor> interceptor);

    [[nodiscard]] std::unique_ptr<AuditingCommand> create_command(std::string text = {});

    [[nodiscard]] IDbConnection& connection() { return *connection_; }

private:
    std::unique_ptr<IDbConnection> owned_;
    IDbConnection* connection_;
    std::shared_ptr<const AuditInterceptor> interceptor_;
};

} // namespace sqlaudit
