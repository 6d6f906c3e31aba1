#include "parser/sql_parser.hpp"
#include "parser/pg_ast.hpp"
#include "parser/sql_lexer.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <algorithm>
#include <format>
#include <unordered_map>

namespace sqlaudit {

// libpg_query node and field names used more than once
static constexpr std::string_view kRangeVar   = "RangeVar";
static constexpr std::string_view kRelname    = "relname";
static constexpr std::string_view kSchemaname = "schemaname";
static constexpr std::string_view kAliasFld   = "alias";
static constexpr std::string_view kAlias      = "Alias";
static constexpr std::string_view kAliasname  = "aliasname";
static constexpr std::string_view kResTarget  = "ResTarget";

static const std::unordered_map<std::string_view, OperationKind> STATEMENT_KIND_MAP = {
    {"InsertStmt", OperationKind::INSERT},
    {"UpdateStmt", OperationKind::UPDATE},
    {"DeleteStmt", OperationKind::DELETE},
};

namespace {

// Frees the libpg_query result on every path
struct PgParseResultGuard {
    PgQueryParseResult result;
    explicit PgParseResultGuard(const std::string& sql) : result(pg_query_parse(sql.c_str())) {}
    ~PgParseResultGuard() { pg_query_free_parse_result(result); }
    PgParseResultGuard(const PgParseResultGuard&) = delete;
    PgParseResultGuard& operator=(const PgParseResultGuard&) = delete;
};

// 1-based line/column of a 1-based byte cursor position
std::pair<size_t, size_t> line_and_column(std::string_view sql, int cursorpos) {
    size_t line = 1;
    size_t column = 1;
    const size_t limit = cursorpos > 0
        ? std::min(static_cast<size_t>(cursorpos - 1), sql.size())
        : 0;
    for (size_t i = 0; i < limit; ++i) {
        if (sql[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

// ============================================================================
// Value classification (INSERT VALUES items, SET right-hand sides)
// ============================================================================

ValueSource classify_const(const AstNode& a_const) {
    if (a_const["isnull"].as_bool()) {
        return ValueSource::null_value();
    }
    // Zero / false are omitted by the JSON output: {"ival": {}}
    if (a_const.contains("ival")) {
        const auto v = a_const["ival"].get_int("ival");
        return ValueSource::literal(std::to_string(v.value_or(0)));
    }
    if (a_const.contains("fval")) {
        return ValueSource::literal(a_const["fval"].get_string("fval"));
    }
    if (a_const.contains("sval")) {
        return ValueSource::literal(a_const["sval"].get_string("sval"));
    }
    if (a_const.contains("boolval")) {
        return ValueSource::literal(a_const["boolval"]["boolval"].as_bool() ? "true" : "false");
    }
    if (a_const.contains("bsval")) {
        return ValueSource::literal(a_const["bsval"].get_string("bsval"));
    }
    return ValueSource::expression("A_Const");
}

ValueSource classify_value(const AstNode& expr) {
    const std::string tag = expr.tag();
    const AstNode body = expr.body();

    if (tag == "ParamRef") {
        const auto number = body.get_int("number");
        if (!number || *number <= 0) {
            return ValueSource::expression(tag);
        }
        return ValueSource::parameter(std::format("{}{}", kParamSigil, *number));
    }
    if (tag == "A_Const") {
        return classify_const(body);
    }
    if (tag == "SetToDefault") {
        return ValueSource::default_value();
    }
    if (tag == "TypeCast") {
        return classify_value(body["arg"]);
    }
    if (tag == "MultiAssignRef") {
        // SET (a, b) = ($1, $2): one ResTarget per column, sharing the row
        const auto colno = body.get_int("colno").value_or(0);
        const AstNode row = body["source"].unwrap("RowExpr");
        const AstNode item = row["args"][static_cast<size_t>(colno > 0 ? colno - 1 : 0)];
        if (colno > 0 && !item.is_null()) {
            return classify_value(item);
        }
    }
    return ValueSource::expression(tag);
}

// ============================================================================
// Token positions
// ============================================================================

// Statement-relative positions computed with the lexer
struct StatementTokens {
    std::string_view text;              // the statement slice
    size_t offset = 0;                  // slice start within the full text
    std::vector<SqlToken> tokens;

    // End of the last token that is not a terminating semicolon
    std::optional<size_t> last_token_end() const {
        for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
            if (it->kind == SqlToken::Kind::PUNCT && text[it->begin] == ';') continue;
            return it->end;
        }
        return std::nullopt;
    }

    // Last keyword token ending at or before the (slice-relative) limit
    const SqlToken* last_keyword_before(std::string_view keyword, size_t limit) const {
        const SqlToken* found = nullptr;
        for (const auto& tok : tokens) {
            if (tok.end > limit) break;
            if (SqlLexer::is_keyword(text, tok, keyword)) found = &tok;
        }
        return found;
    }
};

std::optional<size_t> relative_location(const AstNode& node, size_t offset) {
    const auto loc = node.min_location();
    if (!loc || static_cast<size_t>(*loc) < offset) return std::nullopt;
    return static_cast<size_t>(*loc) - offset;
}

// The WHERE keyword introducing the statement's own condition
const SqlToken* where_keyword(const AstNode& stmt, const StatementTokens& st) {
    if (!stmt.has("whereClause")) {
        return nullptr;
    }
    const auto cond_loc = relative_location(stmt["whereClause"], st.offset);
    if (!cond_loc) {
        return nullptr;
    }
    return st.last_keyword_before("WHERE", *cond_loc);
}

// End of the clause starting after `from`: RETURNING or the statement end
size_t clause_end(const AstNode& stmt, const StatementTokens& st, size_t from) {
    size_t end = st.last_token_end().value_or(st.text.size());
    if (stmt.has("returningList")) {
        if (const auto ret_loc = relative_location(stmt["returningList"], st.offset)) {
            if (const SqlToken* ret_kw = st.last_keyword_before("RETURNING", *ret_loc)) {
                if (ret_kw->begin >= from) end = std::min(end, ret_kw->begin);
            }
        }
    }
    return end;
}

std::optional<std::string> trimmed_slice(const StatementTokens& st, size_t begin, size_t end) {
    if (end <= begin) {
        return std::nullopt;
    }
    std::string text = utils::trim(st.text.substr(begin, end - begin));
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<std::string> extract_where(const AstNode& stmt, const StatementTokens& st) {
    const SqlToken* where_kw = where_keyword(stmt, st);
    if (!where_kw) {
        return std::nullopt;
    }
    return trimmed_slice(st, where_kw->end, clause_end(stmt, st, where_kw->end));
}

// UPDATE ... FROM <list> / DELETE ... USING <list>, up to WHERE or RETURNING
std::optional<std::string> extract_from_list(const AstNode& stmt, const StatementTokens& st,
                                             std::string_view field, std::string_view keyword) {
    if (stmt[field].size() == 0) {
        return std::nullopt;
    }
    const auto list_loc = relative_location(stmt[field], st.offset);
    if (!list_loc) {
        return std::nullopt;
    }
    const SqlToken* list_kw = st.last_keyword_before(keyword, *list_loc);
    if (!list_kw) {
        return std::nullopt;
    }

    size_t end = clause_end(stmt, st, list_kw->end);
    if (const SqlToken* where_kw = where_keyword(stmt, st); where_kw && where_kw->begin >= list_kw->end) {
        end = std::min(end, where_kw->begin);
    }
    return trimmed_slice(st, list_kw->end, end);
}

void extract_relation(const AstNode& stmt, StatementDescriptor& desc) {
    const AstNode relation = stmt["relation"].unwrap(kRangeVar);
    desc.table = relation.get_string(kRelname);
    const std::string schema = relation.get_string(kSchemaname);
    if (!schema.empty()) {
        desc.schema = schema;
    }
    const AstNode alias = relation[kAliasFld].unwrap(kAlias);
    const std::string alias_name = alias.get_string(kAliasname);
    if (!alias_name.empty()) {
        desc.alias = alias_name;
    }
}

void extract_insert(const AstNode& stmt, StatementDescriptor& desc) {
    for (const auto& col : stmt["cols"]) {
        desc.insert_columns.push_back(col.unwrap(kResTarget).get_string("name"));
    }

    const AstNode select = stmt["selectStmt"].unwrap("SelectStmt");
    const AstNode first_row = select["valuesLists"][size_t{0}].unwrap("List")["items"];

    if (first_row.is_null()) {
        // INSERT ... SELECT / DEFAULT VALUES: every value is computed by the server
        desc.insert_values.assign(desc.insert_columns.size(), ValueSource::expression("SelectStmt"));
        return;
    }
    if (desc.insert_columns.empty()) {
        // Without an explicit column list the values cannot be paired
        return;
    }

    for (const auto& item : first_row) {
        if (desc.insert_values.size() == desc.insert_columns.size()) break;
        desc.insert_values.push_back(classify_value(item));
    }
    desc.insert_values.resize(desc.insert_columns.size(), ValueSource::expression("missing"));
}

void extract_update(const AstNode& stmt, StatementDescriptor& desc) {
    for (const auto& target : stmt["targetList"]) {
        const AstNode res = target.unwrap(kResTarget);
        desc.update_fields.push_back({res.get_string("name"), classify_value(res["val"])});
    }
}

} // anonymous namespace

bool StatementParser::is_auditable(std::string_view sql) const {
    return parse(sql).is_auditable();
}

StatementDescriptor StatementParser::parse(std::string_view sql) const {
    try {
        auto result = try_parse(sql);
        if (result.is_error()) {
            utils::log::debug(std::format("Not auditable: {}", result.error_message()));
            return StatementDescriptor{};
        }
        return std::move(result.value());
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Statement analysis failed, treated as not auditable: {}", e.what()));
        return StatementDescriptor{};
    }
}

Result<StatementDescriptor> StatementParser::try_parse(std::string_view sql) const {
    if (utils::trim(sql).empty()) {
        return Result<StatementDescriptor>::error(ErrorCategory::PARSE_ERROR, "Empty SQL statement");
    }

    const std::string sql_text(sql);
    PgParseResultGuard guard(sql_text);

    // Early return: grammar error (the grammar produces no partial tree)
    if (guard.result.error) {
        const std::string message = guard.result.error->message
            ? guard.result.error->message
            : "Unknown parse error";
        const auto [line, column] = line_and_column(sql, guard.result.error->cursorpos);
        utils::log::warn(std::format("SQL parse error at line {}, column {}: {}",
                                     line, column, message));
        return Result<StatementDescriptor>::error(
            ErrorCategory::PARSE_ERROR,
            std::format("line {}, column {}: {}", line, column, message));
    }

    if (!guard.result.parse_tree) {
        return Result<StatementDescriptor>::error(ErrorCategory::PARSE_ERROR, "No parse tree");
    }

    AstNode root;
    try {
        root = AstNode::parse(guard.result.parse_tree);
    } catch (const AstNode::parse_error& e) {
        return Result<StatementDescriptor>::error(ErrorCategory::PARSE_ERROR, e.what());
    }

    const AstNode stmts = root["stmts"];
    if (stmts.size() == 0) {
        return Result<StatementDescriptor>::error(ErrorCategory::PARSE_ERROR, "No statement");
    }
    if (stmts.size() > 1) {
        return Result<StatementDescriptor>::error(
            ErrorCategory::PARSE_ERROR,
            std::format("Batch of {} statements is not audited", stmts.size()));
    }

    const AstNode raw_stmt = stmts[size_t{0}];
    const AstNode wrapped = raw_stmt["stmt"];
    const std::string node_type = wrapped.tag();

    const auto it = STATEMENT_KIND_MAP.find(node_type);
    if (it == STATEMENT_KIND_MAP.end()) {
        return Result<StatementDescriptor>::error(
            ErrorCategory::PARSE_ERROR,
            std::format("{} is not a data-mutating statement", node_type.empty() ? "Statement" : node_type));
    }

    const AstNode stmt = wrapped.body();
    if (stmt.has("withClause")) {
        return Result<StatementDescriptor>::error(
            ErrorCategory::PARSE_ERROR, "Statements with a WITH clause are not audited");
    }

    // Statement slice: stmt_len 0 means "to the end of the text"
    const auto location = static_cast<size_t>(raw_stmt.get_int("stmt_location").value_or(0));
    const auto length = static_cast<size_t>(raw_stmt.get_int("stmt_len").value_or(0));
    const size_t begin = std::min(location, sql.size());
    const size_t end = (length == 0) ? sql.size() : std::min(begin + length, sql.size());

    StatementTokens st;
    st.text = sql.substr(begin, end - begin);
    st.offset = begin;
    st.tokens = SqlLexer::tokenize(st.text);

    StatementDescriptor desc;
    desc.kind = it->second;
    extract_relation(stmt, desc);
    if (desc.table.empty()) {
        return Result<StatementDescriptor>::error(ErrorCategory::PARSE_ERROR, "Target table not found");
    }

    desc.has_returning = stmt["returningList"].size() > 0;
    if (const auto anchor = st.last_token_end()) {
        desc.returning_anchor = begin + *anchor;
    }

    switch (desc.kind) {
        case OperationKind::INSERT:
            extract_insert(stmt, desc);
            break;
        case OperationKind::UPDATE:
            extract_update(stmt, desc);
            desc.from_clause = extract_from_list(stmt, st, "fromClause", "FROM");
            desc.where_clause = extract_where(stmt, st);
            break;
        case OperationKind::DELETE:
            desc.from_clause = extract_from_list(stmt, st, "usingClause", "USING");
            desc.where_clause = extract_where(stmt, st);
            break;
        case OperationKind::UNKNOWN:
            break;
    }

    return Result<StatementDescriptor>::ok(std::move(desc));
}

} // namespace sqlaudit
