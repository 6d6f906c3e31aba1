#include "db/db_command.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <format>

namespace sqlaudit {

namespace {

std::string next_statement_name() {
    static std::atomic<uint64_t> counter{0};
    return std::format("sqlaudit_stmt_{}", counter.fetch_add(1, std::memory_order_relaxed));
}

} // anonymous namespace

DbCommand::DbCommand(IDbConnection& connection, std::string text)
    : connection_(connection), text_(std::move(text)) {}

Status DbCommand::prepare() {
    if (utils::trim(text_).empty()) {
        return Status::error(ErrorCategory::EXECUTION_ERROR, "Cannot prepare an empty command");
    }

    std::string name = next_statement_name();
    auto status = connection_.prepare(name, text_, params_.positional().size());
    if (status.is_error()) {
        return status;
    }

    prepared_name_ = std::move(name);
    prepared_text_ = text_;
    return Status::ok();
}

Result<DbResultSet> DbCommand::execute() {
    DbResultSet result = (prepared_name_ && prepared_text_ == text_)
        ? connection_.execute_prepared(*prepared_name_, params_)
        : connection_.execute(text_, params_);

    last_sql_state_ = std::move(result.sql_state);
    if (!result.success) {
        return Result<DbResultSet>::error(ErrorCategory::EXECUTION_ERROR,
                                          std::move(result.error_message));
    }
    return Result<DbResultSet>::ok(std::move(result));
}

Result<SqlValue> DbCommand::execute_scalar() {
    auto result = execute();
    if (result.is_error()) {
        return Result<SqlValue>::error(result.error_category(), result.error_message());
    }
    const auto& rs = result.value();
    if (rs.rows.empty() || rs.rows.front().empty()) {
        return Result<SqlValue>::ok(SqlValue{});
    }
    return Result<SqlValue>::ok(rs.rows.front().front());
}

} // namespace sqlaudit
