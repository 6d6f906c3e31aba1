#include "capture/returning_capture.hpp"
#include "core/utils.hpp"
#include "db/savepoint.hpp"

#include <format>

namespace sqlaudit {

namespace {

/**
 * @brief Swaps the command text for the duration of a scope
 *
 * The caller's command always gets its own text back, whether the
 * rewritten statement succeeded, failed or threw.
 */
class CommandTextGuard {
public:
    CommandTextGuard(IDbCommand& command, std::string replacement)
        : command_(command), original_(command.text()) {
        command_.set_text(std::move(replacement));
    }

    ~CommandTextGuard() { command_.set_text(std::move(original_)); }

    CommandTextGuard(const CommandTextGuard&) = delete;
    CommandTextGuard& operator=(const CommandTextGuard&) = delete;

private:
    IDbCommand& command_;
    std::string original_;
};

// undefined_column: the cached column list no longer matches the table
constexpr std::string_view kUndefinedColumn = "42703";

// Number of RETURNING values produced per table column
size_t values_per_column(OperationKind kind) {
    return kind == OperationKind::UPDATE ? 2 : 1;
}

} // anonymous namespace

ReturningCapture::ReturningCapture(std::shared_ptr<TableMetadataCache> metadata,
                                   int min_server_version)
    : metadata_(std::move(metadata)),
      min_server_version_(min_server_version) {}

Result<std::string> ReturningCapture::build_rewrite(const StatementDescriptor& stmt,
                                                    std::string_view original,
                                                    const std::vector<std::string>& columns) {
    if (!stmt.is_auditable()) {
        return Result<std::string>::error(ErrorCategory::CAPTURE_ERROR, "Statement is not auditable");
    }
    if (stmt.has_returning) {
        return Result<std::string>::error(ErrorCategory::CAPTURE_ERROR,
                                          "Statement already has a RETURNING clause");
    }
    if (columns.empty()) {
        return Result<std::string>::error(ErrorCategory::CAPTURE_ERROR,
                                          std::format("No columns known for {}", stmt.table));
    }
    if (!stmt.returning_anchor || *stmt.returning_anchor > original.size()) {
        return Result<std::string>::error(ErrorCategory::CAPTURE_ERROR,
                                          "No position to append RETURNING");
    }

    std::string clause = std::format(" RETURNING WITH (OLD AS {}, NEW AS {}) ", kOldAlias, kNewAlias);
    bool first = true;
    for (const auto& column : columns) {
        const std::string quoted = utils::quote_identifier(column);
        if (!first) clause += ", ";
        first = false;
        switch (stmt.kind) {
            case OperationKind::INSERT:
                clause += std::format("{}.{}", kNewAlias, quoted);
                break;
            case OperationKind::UPDATE:
                clause += std::format("{}.{}, {}.{}", kOldAlias, quoted, kNewAlias, quoted);
                break;
            case OperationKind::DELETE:
                clause += std::format("{}.{}", kOldAlias, quoted);
                break;
            case OperationKind::UNKNOWN:
                break;
        }
    }

    const size_t anchor = *stmt.returning_anchor;
    std::string rewritten;
    rewritten.reserve(original.size() + clause.size());
    rewritten.append(original.substr(0, anchor));
    rewritten.append(clause);
    rewritten.append(original.substr(anchor));
    return Result<std::string>::ok(std::move(rewritten));
}

Status ReturningCapture::prepare(CaptureContext& ctx) {
    const int version = ctx.connection().server_version();
    if (version < min_server_version_) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
            std::format("Server version {} does not support RETURNING OLD/NEW (need {})",
                        version, min_server_version_));
    }
    if (ctx.statement.has_returning) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
                             "Statement already has a RETURNING clause");
    }

    auto columns = metadata_->get_columns(ctx.connection(), ctx.statement.table_name());
    auto rewritten = build_rewrite(ctx.statement, ctx.command.text(), columns);
    if (rewritten.is_error()) {
        return Status::error(rewritten.error_category(), rewritten.error_message());
    }

    ctx.columns = std::move(columns);
    ctx.rewritten_text = std::move(rewritten.value());
    return Status::ok();
}

Status ReturningCapture::capture_before(CaptureContext& /*ctx*/) {
    // Old values arrive with the RETURNING rows
    return Status::ok();
}

Result<DbResultSet> ReturningCapture::execute(CaptureContext& ctx) {
    Savepoint savepoint(ctx.connection());
    Result<DbResultSet> result = [&] {
        CommandTextGuard guard(ctx.command, ctx.rewritten_text);
        try {
            return ctx.command.execute();
        } catch (const std::exception&) {
            savepoint.dismiss();
            throw;
        }
    }();

    if (result.is_error()) {
        if (ctx.command.last_sql_state() != kUndefinedColumn) {
            // The caller's own failure: the transaction stays as it would without auditing
            savepoint.dismiss();
            return result;
        }
        return execute_original(ctx, savepoint, result.error_message());
    }

    if (const Status released = savepoint.release(); released.is_error()) {
        utils::log::error(released.error_message());
    }

    auto& rs = result.value();
    ctx.returned_rows = std::move(rs.rows);
    ctx.rows_affected = ctx.returned_rows.size();

    // Hide the capture rows: the caller sees a plain command result
    rs.rows.clear();
    rs.column_names.clear();
    rs.has_rows = false;
    rs.affected_rows = ctx.rows_affected;
    return result;
}

Result<DbResultSet> ReturningCapture::execute_original(CaptureContext& ctx, Savepoint& savepoint,
                                                       const std::string& rewrite_error) {
    // Column lists are stale after a DROP/RENAME COLUMN; the next statement reloads them
    metadata_->invalidate(ctx.statement.schema, ctx.statement.table);
    utils::log::warn(std::format("Capture clause rejected for {} ({}); running the statement as written",
                                 ctx.statement.table, rewrite_error));

    const Status undone = savepoint.rollback();
    if (undone.is_error()) {
        return Result<DbResultSet>::error(ErrorCategory::EXECUTION_ERROR, undone.error_message());
    }

    ctx.rewrite_abandoned = true;
    ctx.columns.clear();
    auto result = ctx.command.execute();
    if (result.is_ok()) {
        ctx.rows_affected = result.value().affected_rows;
    }
    return result;
}

Status ReturningCapture::capture_after(CaptureContext& ctx) {
    if (ctx.rewrite_abandoned) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
            std::format("Column list of {} was out of date; statement ran without capture",
                        ctx.statement.table));
    }

    const OperationKind kind = ctx.statement.kind;
    const size_t expected = ctx.columns.size() * values_per_column(kind);

    Status status = Status::ok();
    for (const auto& row : ctx.returned_rows) {
        if (row.size() < expected) {
            status = Status::error(ErrorCategory::CAPTURE_ERROR,
                std::format("RETURNING produced {} values, expected {}", row.size(), expected));
        }
        // Later rows overwrite earlier ones column by column
        for (size_t c = 0; c < ctx.columns.size(); ++c) {
            const std::string& column = ctx.columns[c];
            switch (kind) {
                case OperationKind::INSERT:
                    if (c < row.size()) ctx.after[column] = row[c];
                    break;
                case OperationKind::UPDATE:
                    if (2 * c < row.size()) ctx.before[column] = row[2 * c];
                    if (2 * c + 1 < row.size()) ctx.after[column] = row[2 * c + 1];
                    break;
                case OperationKind::DELETE:
                    if (c < row.size()) ctx.before[column] = row[c];
                    break;
                case OperationKind::UNKNOWN:
                    break;
            }
        }
    }
    return status;
}

} // namespace sqlaudit
