#include "capture/reload_capture.hpp"
#include "core/utils.hpp"
#include "db/savepoint.hpp"
#include "parser/sql_lexer.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <unordered_map>

namespace sqlaudit {

static constexpr std::array<std::string_view, 7> AUTO_GENERATED_COLUMNS = {
    "id", "createdat", "createddate", "timestamp", "rowversion", "modifiedat", "modifieddate",
};

namespace {

std::string qualified_table(const StatementDescriptor& stmt) {
    std::string ref;
    if (stmt.schema) {
        ref = utils::quote_identifier(*stmt.schema) + ".";
    }
    ref += utils::quote_identifier(stmt.table);
    return ref;
}

std::string table_reference(const StatementDescriptor& stmt) {
    std::string ref = qualified_table(stmt);
    if (stmt.alias) {
        ref += " AS " + utils::quote_identifier(*stmt.alias);
    }
    return ref;
}

// Name the target's columns are reachable under once other relations join in
std::string target_columns(const StatementDescriptor& stmt) {
    return (stmt.alias ? utils::quote_identifier(*stmt.alias) : qualified_table(stmt)) + ".*";
}

// Union of all rows; a later row overwrites an earlier one per column
RowSnapshot merge_rows(const DbResultSet& rs) {
    RowSnapshot snapshot;
    for (size_t r = 0; r < rs.rows.size(); ++r) {
        for (auto& [column, value] : rs.row_snapshot(r)) {
            snapshot[column] = std::move(value);
        }
    }
    return snapshot;
}

/**
 * @brief Rewrite $n references to $1..$k in order of first use
 *
 * The server rejects bindings a statement does not reference, so the
 * reload select carries only the parameters its WHERE clause uses.
 */
Result<std::string> renumber_parameters(std::string_view text, const ParameterMap& params,
                                        ParameterMap& out) {
    std::unordered_map<size_t, size_t> mapping;
    std::string result;
    result.reserve(text.size());
    size_t copied = 0;

    for (const auto& tok : SqlLexer::tokenize(text)) {
        if (tok.kind != SqlToken::Kind::PARAMETER) continue;

        const size_t original = SqlLexer::parameter_number(text, tok);
        auto it = mapping.find(original);
        if (it == mapping.end()) {
            const std::string name = std::format("{}{}", kParamSigil, original);
            const SqlValue* bound = params.find(name);
            if (!bound) {
                return Result<std::string>::error(ErrorCategory::CAPTURE_ERROR,
                    std::format("Parameter {} is not bound", name));
            }
            const size_t renumbered = mapping.size() + 1;
            it = mapping.emplace(original, renumbered).first;
            out.set(std::format("{}{}", kParamSigil, renumbered), *bound);
        }

        result.append(text.substr(copied, tok.begin - copied));
        result += std::format("{}{}", kParamSigil, it->second);
        copied = tok.end;
    }
    result.append(text.substr(copied));
    return Result<std::string>::ok(std::move(result));
}

} // anonymous namespace

bool ReloadCapture::is_auto_generated(std::string_view column) {
    std::string normalized;
    normalized.reserve(column.size());
    for (const char c : column) {
        if (c != '_') normalized += c;
    }
    normalized = utils::to_lower(normalized);

    for (const auto& pattern : AUTO_GENERATED_COLUMNS) {
        if (utils::iends_with(normalized, pattern)) {
            return true;
        }
    }
    return false;
}

Result<ReloadCapture::ReloadQuery> ReloadCapture::build_select(const StatementDescriptor& stmt,
                                                               const ParameterMap& params) {
    if (!stmt.where_clause || stmt.where_clause->empty()) {
        return Result<ReloadQuery>::error(ErrorCategory::CAPTURE_ERROR, "Statement has no WHERE clause");
    }

    ReloadQuery query;
    if (!stmt.from_clause) {
        auto where = renumber_parameters(*stmt.where_clause, params, query.params);
        if (where.is_error()) {
            return Result<ReloadQuery>::error(where.error_category(), where.error_message());
        }
        query.sql = std::format("SELECT * FROM {} WHERE {}", table_reference(stmt), where.value());
        return Result<ReloadQuery>::ok(std::move(query));
    }

    // UPDATE ... FROM / DELETE ... USING: the WHERE clause joins the other
    // relations, so they join the select too; only the target's columns are kept
    const std::string joined = std::format("{} WHERE {}", *stmt.from_clause, *stmt.where_clause);
    auto tail = renumber_parameters(joined, params, query.params);
    if (tail.is_error()) {
        return Result<ReloadQuery>::error(tail.error_category(), tail.error_message());
    }
    query.sql = std::format("SELECT {} FROM {}, {}", target_columns(stmt), table_reference(stmt),
                            tail.value());
    return Result<ReloadQuery>::ok(std::move(query));
}

Result<ReloadCapture::ReloadQuery> ReloadCapture::build_insert_lookup(const StatementDescriptor& stmt,
                                                                      const ParameterMap& params) {
    ReloadQuery query;
    std::string conditions;

    const size_t n = std::min(stmt.insert_columns.size(), stmt.insert_values.size());
    for (size_t i = 0; i < n; ++i) {
        const std::string& column = stmt.insert_columns[i];
        if (is_auto_generated(column)) continue;

        const auto value = stmt.insert_values[i].resolve(params);
        if (!value || !value->has_value()) continue;

        const std::string placeholder = std::format("{}{}", kParamSigil, query.params.size() + 1);
        if (!conditions.empty()) conditions += " AND ";
        // Compared as text: json, xml, point and others have no equality operator
        conditions += std::format("{}::text = {}", utils::quote_identifier(column), placeholder);
        query.params.set(placeholder, *value);
    }

    if (conditions.empty()) {
        return Result<ReloadQuery>::error(ErrorCategory::CAPTURE_ERROR,
                                          "No known column values to locate the inserted row");
    }

    StatementDescriptor target = stmt;
    target.alias.reset();
    query.sql = std::format("SELECT * FROM {} WHERE {} ORDER BY 1 DESC LIMIT 1",
                            table_reference(target), conditions);
    return Result<ReloadQuery>::ok(std::move(query));
}

RowSnapshot ReloadCapture::insert_fallback(const StatementDescriptor& stmt,
                                           const ParameterMap& params) {
    RowSnapshot snapshot;
    const size_t n = std::min(stmt.insert_columns.size(), stmt.insert_values.size());
    for (size_t i = 0; i < n; ++i) {
        if (auto value = stmt.insert_values[i].resolve(params)) {
            snapshot[stmt.insert_columns[i]] = std::move(*value);
        }
    }
    if (!snapshot.empty()) {
        return snapshot;
    }

    for (const auto& [name, value] : params) {
        snapshot[ParameterMap::strip_sigil(name)] = value;
    }
    return snapshot;
}

Status ReloadCapture::prepare(CaptureContext& ctx) {
    if (ctx.statement.table.empty()) {
        return Status::error(ErrorCategory::CAPTURE_ERROR, "Statement has no target table");
    }
    return Status::ok();
}

Status ReloadCapture::reload_where(CaptureContext& ctx, RowSnapshot& target) {
    auto query = build_select(ctx.statement, ctx.parameters());
    if (query.is_error()) {
        return Status::error(query.error_category(), query.error_message());
    }

    const auto rs = Savepoint::execute(ctx.connection(), query.value().sql, query.value().params);
    if (!rs.success) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
                             std::format("Reload of {} failed: {}", ctx.statement.table, rs.error_message));
    }
    target = merge_rows(rs);
    return Status::ok();
}

Status ReloadCapture::capture_before(CaptureContext& ctx) {
    if (ctx.statement.kind == OperationKind::INSERT || !ctx.statement.where_clause) {
        return Status::ok();
    }
    return reload_where(ctx, ctx.before);
}

Result<DbResultSet> ReloadCapture::execute(CaptureContext& ctx) {
    auto result = ctx.command.execute();
    if (result.is_ok()) {
        ctx.rows_affected = result.value().affected_rows;
    }
    return result;
}

Status ReloadCapture::capture_after(CaptureContext& ctx) {
    switch (ctx.statement.kind) {
        case OperationKind::UPDATE:
            if (!ctx.statement.where_clause) {
                return Status::ok();
            }
            return reload_where(ctx, ctx.after);

        case OperationKind::DELETE:
            ctx.after.clear();
            return Status::ok();

        case OperationKind::INSERT: {
            Status status = Status::ok();
            auto query = build_insert_lookup(ctx.statement, ctx.parameters());
            if (query.is_ok()) {
                const auto rs = Savepoint::execute(ctx.connection(), query.value().sql,
                                                   query.value().params);
                if (rs.success) {
                    ctx.after = merge_rows(rs);
                } else {
                    status = Status::error(ErrorCategory::CAPTURE_ERROR,
                        std::format("Reload of inserted row failed: {}", rs.error_message));
                }
            }
            if (ctx.after.empty()) {
                ctx.after = insert_fallback(ctx.statement, ctx.parameters());
            }
            return status;
        }

        case OperationKind::UNKNOWN:
            break;
    }
    return Status::ok();
}

} // namespace sqlaudit
