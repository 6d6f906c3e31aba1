#include <catch2/catch_test_macros.hpp>
#include "parser/sql_parser.hpp"

#include <string>

using namespace sqlaudit;

TEST_CASE("StatementParser statement kind detection", "[parser]") {

    StatementParser parser;

    SECTION("INSERT statement") {
        auto desc = parser.parse("INSERT INTO users (name) VALUES ('test')");
        REQUIRE(desc.kind == OperationKind::INSERT);
        REQUIRE(desc.is_auditable());
        REQUIRE(desc.table == "users");
    }

    SECTION("UPDATE statement") {
        auto desc = parser.parse("UPDATE users SET name = 'test' WHERE id = 1");
        REQUIRE(desc.kind == OperationKind::UPDATE);
    }

    SECTION("DELETE statement") {
        auto desc = parser.parse("DELETE FROM users WHERE id = 1");
        REQUIRE(desc.kind == OperationKind::DELETE);
    }

    SECTION("SELECT is not auditable") {
        REQUIRE_FALSE(parser.is_auditable("SELECT * FROM users"));
    }

    SECTION("DDL is not auditable") {
        REQUIRE_FALSE(parser.is_auditable("CREATE TABLE t (id INTEGER PRIMARY KEY)"));
        REQUIRE_FALSE(parser.is_auditable("TRUNCATE users"));
    }

    SECTION("Transaction control is not auditable") {
        REQUIRE_FALSE(parser.is_auditable("BEGIN"));
        REQUIRE_FALSE(parser.is_auditable("COMMIT"));
    }

    SECTION("Lower-case keywords") {
        REQUIRE(parser.parse("delete from users where id = 1").kind == OperationKind::DELETE);
    }
}

TEST_CASE("StatementParser rejects what it cannot audit", "[parser]") {

    StatementParser parser;

    SECTION("Syntax error") {
        auto result = parser.try_parse("UPDATE users SET WHERE");
        REQUIRE(result.is_error());
        REQUIRE(result.error_category() == ErrorCategory::PARSE_ERROR);
        REQUIRE(result.error_message().find("line 1") != std::string::npos);
        REQUIRE(parser.parse("UPDATE users SET WHERE").kind == OperationKind::UNKNOWN);
    }

    SECTION("Syntax error on a later line") {
        auto result = parser.try_parse("DELETE FROM users\nWHERE id = = 1");
        REQUIRE(result.is_error());
        REQUIRE(result.error_message().find("line 2") != std::string::npos);
    }

    SECTION("Empty and blank text") {
        REQUIRE(parser.try_parse("").is_error());
        REQUIRE(parser.try_parse("   \n\t").is_error());
        REQUIRE_FALSE(parser.is_auditable(""));
    }

    SECTION("Batch of statements") {
        auto result = parser.try_parse("DELETE FROM a WHERE id = 1; DELETE FROM b WHERE id = 2");
        REQUIRE(result.is_error());
        REQUIRE(result.error_category() == ErrorCategory::PARSE_ERROR);
    }

    SECTION("WITH clause") {
        REQUIRE_FALSE(parser.is_auditable(
            "WITH old AS (SELECT id FROM t WHERE stale) DELETE FROM t WHERE id IN (SELECT id FROM old)"));
    }
}

TEST_CASE("StatementParser is_auditable is idempotent", "[parser]") {
    StatementParser parser;
    const std::string sql = "UPDATE users SET email = $1 WHERE id = $2";

    const bool first = parser.is_auditable(sql);
    for (int i = 0; i < 5; ++i) {
        REQUIRE(parser.is_auditable(sql) == first);
    }
    REQUIRE(first);
}

TEST_CASE("StatementParser table names", "[parser]") {

    StatementParser parser;

    SECTION("Unqualified") {
        auto desc = parser.parse("DELETE FROM orders WHERE id = 1");
        REQUIRE_FALSE(desc.schema.has_value());
        REQUIRE(desc.table == "orders");
        REQUIRE(desc.table_name().full_name() == "orders");
    }

    SECTION("Schema-qualified with alias") {
        auto desc = parser.parse("UPDATE public.users AS u SET name = $1 WHERE u.id = $2");
        REQUIRE(desc.schema == "public");
        REQUIRE(desc.table == "users");
        REQUIRE(desc.alias == "u");
        REQUIRE(desc.where_clause == "u.id = $2");
    }

    SECTION("Three-part name keeps schema and table") {
        auto desc = parser.parse("DELETE FROM shop.sales.orders WHERE id = 1");
        REQUIRE(desc.schema == "sales");
        REQUIRE(desc.table == "orders");
    }

    SECTION("Quoted identifiers keep their case") {
        auto desc = parser.parse(R"(UPDATE "Users" SET "Email" = $1 WHERE "Id" = $2)");
        REQUIRE(desc.table == "Users");
        REQUIRE(desc.update_fields.size() == 1);
        REQUIRE(desc.update_fields[0].column == "Email");
        REQUIRE(desc.where_clause == R"("Id" = $2)");
    }

    SECTION("Unquoted identifiers are folded to lower case") {
        auto desc = parser.parse("UPDATE Users SET Email = $1 WHERE Id = $2");
        REQUIRE(desc.table == "users");
        REQUIRE(desc.update_fields[0].column == "email");
    }
}

TEST_CASE("StatementParser INSERT columns and values", "[parser]") {

    StatementParser parser;

    SECTION("Columns pair with the first VALUES row") {
        auto desc = parser.parse("INSERT INTO users (name, email, age) VALUES ($1, 'a@b.com', 42)");
        REQUIRE(desc.insert_columns == std::vector<std::string>{"name", "email", "age"});
        REQUIRE(desc.insert_values.size() == desc.insert_columns.size());

        REQUIRE(desc.insert_values[0].kind == ValueSource::Kind::PARAMETER);
        REQUIRE(desc.insert_values[0].text == "$1");
        REQUIRE(desc.insert_values[1].kind == ValueSource::Kind::LITERAL);
        REQUIRE(desc.insert_values[1].text == "a@b.com");
        REQUIRE(desc.insert_values[2].kind == ValueSource::Kind::LITERAL);
        REQUIRE(desc.insert_values[2].text == "42");
    }

    SECTION("NULL, DEFAULT and expressions") {
        auto desc = parser.parse("INSERT INTO t (a, b, c, d) VALUES (NULL, DEFAULT, now(), 1.5)");
        REQUIRE(desc.insert_values.size() == 4);
        REQUIRE(desc.insert_values[0].kind == ValueSource::Kind::NULL_VALUE);
        REQUIRE(desc.insert_values[1].kind == ValueSource::Kind::DEFAULT_VALUE);
        REQUIRE(desc.insert_values[2].kind == ValueSource::Kind::EXPRESSION);
        REQUIRE(desc.insert_values[3].kind == ValueSource::Kind::LITERAL);
        REQUIRE(desc.insert_values[3].text == "1.5");
    }

    SECTION("Casts are looked through") {
        auto desc = parser.parse("INSERT INTO t (a, b) VALUES ($2::int, '7'::bigint)");
        REQUIRE(desc.insert_values[0].kind == ValueSource::Kind::PARAMETER);
        REQUIRE(desc.insert_values[0].text == "$2");
        REQUIRE(desc.insert_values[1].kind == ValueSource::Kind::LITERAL);
        REQUIRE(desc.insert_values[1].text == "7");
    }

    SECTION("Only the first row of a multi-row insert") {
        auto desc = parser.parse("INSERT INTO t (a) VALUES ($1), ($2), ($3)");
        REQUIRE(desc.insert_values.size() == 1);
        REQUIRE(desc.insert_values[0].text == "$1");
    }

    SECTION("Keywords inside literals do not confuse the parse") {
        auto desc = parser.parse("INSERT INTO notes (body, tag) VALUES ('VALUES (1) WHERE x', $1)");
        REQUIRE(desc.insert_columns.size() == 2);
        REQUIRE(desc.insert_values[0].text == "VALUES (1) WHERE x");
        REQUIRE(desc.insert_values[1].text == "$1");
    }

    SECTION("No column list gives no pairs") {
        auto desc = parser.parse("INSERT INTO t VALUES (1, 2)");
        REQUIRE(desc.kind == OperationKind::INSERT);
        REQUIRE(desc.insert_columns.empty());
        REQUIRE(desc.insert_values.empty());
    }

    SECTION("INSERT ... SELECT values are server-computed") {
        auto desc = parser.parse("INSERT INTO t (a, b) SELECT x, y FROM u");
        REQUIRE(desc.insert_values.size() == 2);
        REQUIRE(desc.insert_values[0].kind == ValueSource::Kind::EXPRESSION);
        REQUIRE_FALSE(desc.where_clause.has_value());
    }
}

TEST_CASE("StatementParser UPDATE SET targets", "[parser]") {

    StatementParser parser;

    SECTION("Simple assignments in source order") {
        auto desc = parser.parse("UPDATE users SET email = $1, name = 'Bob', score = score + 1 WHERE id = $2");
        REQUIRE(desc.update_fields.size() == 3);
        REQUIRE(desc.update_fields[0].column == "email");
        REQUIRE(desc.update_fields[0].value.kind == ValueSource::Kind::PARAMETER);
        REQUIRE(desc.update_fields[1].column == "name");
        REQUIRE(desc.update_fields[1].value.text == "Bob");
        REQUIRE(desc.update_fields[2].column == "score");
        REQUIRE(desc.update_fields[2].value.kind == ValueSource::Kind::EXPRESSION);
    }

    SECTION("Row assignment") {
        auto desc = parser.parse("UPDATE t SET (a, b) = ($1, 'x') WHERE id = 1");
        REQUIRE(desc.update_fields.size() == 2);
        REQUIRE(desc.update_fields[0].column == "a");
        REQUIRE(desc.update_fields[0].value.text == "$1");
        REQUIRE(desc.update_fields[1].column == "b");
        REQUIRE(desc.update_fields[1].value.text == "x");
    }
}

TEST_CASE("StatementParser WHERE text", "[parser]") {

    StatementParser parser;

    SECTION("Verbatim, parameters preserved") {
        auto desc = parser.parse("UPDATE users SET email = $1 WHERE id = $2 AND status = 'active'");
        REQUIRE(desc.where_clause == "id = $2 AND status = 'active'");
    }

    SECTION("Formatting preserved across lines") {
        auto desc = parser.parse("DELETE FROM t\nWHERE a = 1\n  AND b = 2");
        REQUIRE(desc.where_clause == "a = 1\n  AND b = 2");
    }

    SECTION("WHERE inside a SET literal") {
        auto desc = parser.parse("UPDATE t SET note = 'moved WHERE it belongs' WHERE id = 1");
        REQUIRE(desc.where_clause == "id = 1");
    }

    SECTION("WHERE inside a comment before the real one") {
        auto desc = parser.parse("UPDATE t SET a = 1 /* WHERE nothing */ WHERE id = 3");
        REQUIRE(desc.where_clause == "id = 3");
    }

    SECTION("Sub-query WHERE stays inside the condition") {
        auto desc = parser.parse("DELETE FROM t WHERE id IN (SELECT id FROM u WHERE flag)");
        REQUIRE(desc.where_clause == "id IN (SELECT id FROM u WHERE flag)");
    }

    SECTION("Sub-query WHERE in SET before the real one") {
        auto desc = parser.parse(
            "UPDATE t SET a = (SELECT max(b) FROM u WHERE u.k = t.k) WHERE t.id = $1");
        REQUIRE(desc.where_clause == "t.id = $1");
    }

    SECTION("Trailing comment and semicolon are not part of it") {
        auto desc = parser.parse("DELETE FROM t WHERE id = 1; -- remove it");
        REQUIRE(desc.where_clause == "id = 1");
    }

    SECTION("RETURNING is cut off") {
        auto desc = parser.parse("UPDATE t SET a = 1 WHERE id = 2 RETURNING *");
        REQUIRE(desc.has_returning);
        REQUIRE(desc.where_clause == "id = 2");
    }

    SECTION("No WHERE") {
        auto desc = parser.parse("DELETE FROM t");
        REQUIRE_FALSE(desc.where_clause.has_value());
    }
}

TEST_CASE("StatementParser joined relations", "[parser]") {

    StatementParser parser;

    SECTION("UPDATE ... FROM") {
        auto desc = parser.parse("UPDATE t SET a = u.a FROM u WHERE t.id = u.id");
        REQUIRE(desc.table == "t");
        REQUIRE(desc.from_clause == "u");
        REQUIRE(desc.where_clause == "t.id = u.id");
    }

    SECTION("UPDATE ... FROM with several relations and a sub-select") {
        auto desc = parser.parse(
            "UPDATE t SET a = x.a FROM u JOIN v ON v.k = u.k, (SELECT a FROM w WHERE b = $1) x "
            "WHERE t.id = u.id AND x.a > $2 RETURNING t.id");
        REQUIRE(desc.from_clause == "u JOIN v ON v.k = u.k, (SELECT a FROM w WHERE b = $1) x");
        REQUIRE(desc.where_clause == "t.id = u.id AND x.a > $2");
        REQUIRE(desc.has_returning);
    }

    SECTION("FROM inside a SET sub-select is not the join list") {
        auto desc = parser.parse("UPDATE t SET a = (SELECT max(b) FROM u) WHERE id = 1");
        REQUIRE_FALSE(desc.from_clause.has_value());
    }

    SECTION("DELETE ... USING") {
        auto desc = parser.parse("DELETE FROM orders o USING customers c WHERE o.customer_id = c.id AND c.banned");
        REQUIRE(desc.table == "orders");
        REQUIRE(desc.alias == "o");
        REQUIRE(desc.from_clause == "customers c");
        REQUIRE(desc.where_clause == "o.customer_id = c.id AND c.banned");
    }

    SECTION("USING without WHERE") {
        auto desc = parser.parse("DELETE FROM t USING u");
        REQUIRE(desc.from_clause == "u");
        REQUIRE_FALSE(desc.where_clause.has_value());
    }

    SECTION("Plain statements carry none") {
        REQUIRE_FALSE(parser.parse("UPDATE t SET a = 1 WHERE id = 2").from_clause.has_value());
        REQUIRE_FALSE(parser.parse("DELETE FROM t WHERE id = 2").from_clause.has_value());
    }
}

TEST_CASE("StatementParser rewrite anchor", "[parser]") {

    StatementParser parser;

    SECTION("End of text") {
        const std::string sql = "DELETE FROM t WHERE id = 1";
        REQUIRE(parser.parse(sql).returning_anchor == sql.size());
    }

    SECTION("Before the terminating semicolon") {
        const std::string sql = "DELETE FROM t WHERE id = 1;";
        REQUIRE(parser.parse(sql).returning_anchor == sql.size() - 1);
    }

    SECTION("Before a trailing comment") {
        const std::string sql = "UPDATE t SET a = $1 WHERE id = $2 -- bump";
        REQUIRE(parser.parse(sql).returning_anchor == sql.find(" -- bump"));
    }

    SECTION("After a leading comment") {
        const std::string sql = "/* job 7 */ INSERT INTO t (a) VALUES (1)";
        REQUIRE(parser.parse(sql).returning_anchor == sql.size());
    }

    SECTION("Caller RETURNING is flagged") {
        REQUIRE_FALSE(parser.parse("INSERT INTO t (a) VALUES (1)").has_returning);
        REQUIRE(parser.parse("INSERT INTO t (a) VALUES (1) RETURNING id").has_returning);
    }
}

TEST_CASE("ValueSource resolve", "[parser]") {
    const ParameterMap params{{"$1", SqlValue{"a@b.com"}}, {"$2", std::nullopt}};

    REQUIRE(ValueSource::literal("x").resolve(params) == std::optional<SqlValue>{SqlValue{"x"}});

    auto null_value = ValueSource::null_value().resolve(params);
    REQUIRE(null_value.has_value());
    REQUIRE_FALSE(null_value->has_value());

    REQUIRE(ValueSource::parameter("$1").resolve(params)->value() == "a@b.com");

    auto bound_null = ValueSource::parameter("$2").resolve(params);
    REQUIRE(bound_null.has_value());
    REQUIRE_FALSE(bound_null->has_value());

    REQUIRE_FALSE(ValueSource::parameter("$3").resolve(params).has_value());
    REQUIRE_FALSE(ValueSource::default_value().resolve(params).has_value());
    REQUIRE_FALSE(ValueSource::expression("now()").resolve(params).has_value());
}
