#include "interceptor/auditing_command.hpp"
#include "db/db_command.hpp"

#include <stdexcept>

namespace sqlaudit {

AuditingCommand::AuditingCommand(std::unique_ptr<IDbCommand> inner,
                                 std::shared_ptr<const AuditInterceptor> interceptor)
    : inner_(std::move(inner)), interceptor_(std::move(interceptor)) {
    if (!inner_) {
        throw std::invalid_argument("AuditingCommand requires a command to wrap");
    }
}

Result<DbResultSet> AuditingCommand::execute() {
    if (!interceptor_) {
        last_outcome_ = InterceptOutcome{};
        return inner_->execute();
    }
    return interceptor_->execute(*inner_, &last_outcome_);
}

Result<SqlValue> AuditingCommand::execute_scalar() {
    auto result = execute();
    if (result.is_error()) {
        return Result<SqlValue>::error(result.error_category(), result.error_message());
    }

    const auto& rs = result.value();
    if (rs.rows.empty() || rs.rows.front().empty()) {
        return Result<SqlValue>::ok(std::nullopt);
    }
    return Result<SqlValue>::ok(rs.rows.front().front());
}

// ============================================================================
// AuditableConnection
// ============================================================================

AuditableConnection::AuditableConnection(std::unique_ptr<IDbConnection> connection,
                                         std::shared_ptr<const AuditInterceptor> interceptor)
    : owned_(std::move(connection)),
      connection_(owned_.get()),
      interceptor_(std::move(interceptor)) {
    if (!connection_) {
        throw std::invalid_argument("AuditableConnection requires a connection");
    }
}

AuditableConnection::AuditableConnection(IDbConnection& connection,
                                         std::shared_ptr<const AuditInterceptor> interceptor)
    : connection_(&connection), interceptor_(std::move(interceptor)) {}

std::unique_ptr<AuditingCommand> AuditableConnection::create_command(std::string text) {
    return std::make_unique<AuditingCommand>(
        std::make_unique<DbCommand>(*connection_, std::move(text)), interceptor_);
}

} // namespace sqlaudit
