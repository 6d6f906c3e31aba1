#include <catch2/catch_test_macros.hpp>
#include "interceptor/audit_interceptor.hpp"
#include "interceptor/auditing_command.hpp"
#include "capture/reload_capture.hpp"
#include "capture/returning_capture.hpp"
#include "catalog/table_metadata_cache.hpp"
#include "db/db_command.hpp"
#include "mocks/mock_audit_sink.hpp"
#include "mocks/mock_db_connection.hpp"
#include "mocks/mock_schema_loader.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace sqlaudit;
using namespace sqlaudit::testing;

namespace {

constexpr const char* kUpdateUsers = R"(UPDATE "Users" SET "Email" = $1 WHERE "Id" = $2)";

struct InterceptorFixture {
    MockDbConnection conn;
    std::shared_ptr<CountingSchemaLoader> loader = std::make_shared<CountingSchemaLoader>();
    std::shared_ptr<TableMetadataCache> cache = std::make_shared<TableMetadataCache>(loader);
    std::shared_ptr<MockAuditSink> sink = std::make_shared<MockAuditSink>();
    std::shared_ptr<AuditAssembler> assembler = std::make_shared<AuditAssembler>(
        sink, std::make_shared<StaticActorContextProvider>());

    explicit InterceptorFixture(bool with_fallback = true) {
        loader->set_columns("Users", {"Id", "Email", "Name"});
        interceptor = std::make_shared<AuditInterceptor>(
            std::make_shared<ReturningCapture>(cache),
            with_fallback ? std::make_shared<ReloadCapture>() : nullptr,
            assembler);
    }

    std::unique_ptr<AuditingCommand> command(const std::string& sql) {
        return std::make_unique<AuditingCommand>(std::make_unique<DbCommand>(conn, sql), interceptor);
    }

    void script_update_returning() {
        conn.on("RETURNING WITH", MockDbConnection::rows(
            {"Id", "Id", "Email", "Email", "Name", "Name"},
            {{SqlValue{"5"}, SqlValue{"5"}, SqlValue{"old@x.com"}, SqlValue{"a@b.com"},
              SqlValue{"Bob"}, SqlValue{"Bob"}}}));
    }

    void script_update_reload() {
        conn.on("SELECT * FROM", MockDbConnection::rows({"Id", "Email", "Name"},
            {{SqlValue{"5"}, SqlValue{"old@x.com"}, SqlValue{"Bob"}}}));
        conn.on("SELECT * FROM", MockDbConnection::rows({"Id", "Email", "Name"},
            {{SqlValue{"5"}, SqlValue{"a@b.com"}, SqlValue{"Bob"}}}));
        conn.on("UPDATE", MockDbConnection::command(1));
    }

    std::shared_ptr<AuditInterceptor> interceptor;
};

// Command whose text cannot be read the first time it is asked for
class UnreadableOnceCommand : public DbCommand {
public:
    using DbCommand::DbCommand;

    const std::string& text() const override {
        if (!read_) {
            read_ = true;
            throw std::runtime_error("command text unavailable");
        }
        return DbCommand::text();
    }

private:
    mutable bool read_ = false;
};

void bind_update_params(IDbCommand& cmd) {
    cmd.parameters().set("$1", "a@b.com");
    cmd.parameters().set("$2", "5");
}

} // anonymous namespace

// ============================================================================
// Audited paths
// ============================================================================

TEST_CASE("Interceptor audits an UPDATE with the rewrite strategy", "[interceptor]") {
    InterceptorFixture f;
    f.script_update_returning();

    auto cmd = f.command(kUpdateUsers);
    bind_update_params(*cmd);

    auto result = cmd->execute();
    REQUIRE(result.is_ok());
    REQUIRE(result.value().affected_rows == 1);
    REQUIRE(result.value().rows.empty());
    REQUIRE(cmd->text() == kUpdateUsers);
    REQUIRE(f.conn.count_calls("UPDATE") == 1);

    const auto& outcome = cmd->last_outcome();
    REQUIRE(outcome.auditable);
    REQUIRE(outcome.dispatched);
    REQUIRE(outcome.strategy == "returning");
    REQUIRE(outcome.last_state == InterceptState::DISPATCH);
    REQUIRE_FALSE(outcome.degraded());

    const auto records = f.sink->records();
    REQUIRE(records.size() == 1);
    const auto& rec = records[0];
    REQUIRE(rec.event_name == "Users_Modified");
    REQUIRE(rec.operation == OperationKind::UPDATE);
    REQUIRE(rec.table_name == "Users");
    REQUIRE(rec.query == kUpdateUsers);
    REQUIRE(rec.parameters.find("$1")->value() == "a@b.com");
    REQUIRE(rec.rows_affected == 1);
    REQUIRE(rec.capture_strategy == "returning");
    REQUIRE(rec.before == RowSnapshot{{"Id", "5"}, {"Email", "old@x.com"}, {"Name", "Bob"}});
    REQUIRE(rec.after == RowSnapshot{{"Id", "5"}, {"Email", "a@b.com"}, {"Name", "Bob"}});
    REQUIRE(rec.actor_id == "system");
    REQUIRE_FALSE(rec.host_name.empty());
    REQUIRE(rec.process_id > 0);
}

TEST_CASE("Interceptor falls back to reload on older servers", "[interceptor]") {
    InterceptorFixture f;
    f.conn.set_server_version(160002);
    f.script_update_reload();

    auto cmd = f.command(kUpdateUsers);
    bind_update_params(*cmd);

    auto result = cmd->execute();
    REQUIRE(result.is_ok());
    REQUIRE(f.conn.count_calls("UPDATE") == 1);
    REQUIRE(f.conn.count_calls("RETURNING") == 0);

    const auto& outcome = cmd->last_outcome();
    REQUIRE(outcome.strategy == "reload");
    REQUIRE(outcome.capture_status.is_ok());
    REQUIRE(outcome.dispatched);

    const auto records = f.sink->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].event_name == "Users_Modified");
    REQUIRE(records[0].capture_strategy == "reload");
    REQUIRE(records[0].before == RowSnapshot{{"Id", "5"}, {"Email", "old@x.com"}, {"Name", "Bob"}});
    REQUIRE(records[0].after == RowSnapshot{{"Id", "5"}, {"Email", "a@b.com"}, {"Name", "Bob"}});
}

TEST_CASE("Interceptor without a usable strategy runs the statement unaudited", "[interceptor]") {
    InterceptorFixture f(false);
    f.conn.set_server_version(150000);
    f.conn.on("DELETE", MockDbConnection::command(2));

    auto cmd = f.command(R"(DELETE FROM "Users" WHERE "Id" > 10)");
    auto result = cmd->execute();

    REQUIRE(result.is_ok());
    REQUIRE(result.value().affected_rows == 2);
    REQUIRE(f.conn.count_calls("DELETE") == 1);
    REQUIRE(f.sink->record_count() == 0);

    const auto& outcome = cmd->last_outcome();
    REQUIRE(outcome.auditable);
    REQUIRE(outcome.last_state == InterceptState::PASS_THROUGH);
    REQUIRE(outcome.capture_status.is_error());
    REQUIRE(outcome.degraded());
}

TEST_CASE("Interceptor INSERT and DELETE images", "[interceptor]") {
    InterceptorFixture f;

    SECTION("INSERT: empty before, server-generated columns after") {
        f.conn.on("RETURNING WITH", MockDbConnection::rows({"Id", "Email", "Name"},
            {{SqlValue{"11"}, SqlValue{"n@x.com"}, std::nullopt}}));

        auto cmd = f.command(R"(INSERT INTO "Users" ("Email", "Name") VALUES ($1, $2))");
        cmd->parameters().set("$1", "n@x.com");
        cmd->parameters().set("$2", std::nullopt);
        REQUIRE(cmd->execute().is_ok());

        const auto rec = f.sink->records().at(0);
        REQUIRE(rec.event_name == "Users_Created");
        REQUIRE(rec.before.empty());
        REQUIRE(rec.after.at("Id") == SqlValue{"11"});
        REQUIRE(rec.after.contains("Name"));
        REQUIRE_FALSE(rec.after.at("Name").has_value());
    }

    SECTION("DELETE: after is always empty") {
        f.conn.on("RETURNING WITH", MockDbConnection::rows({"Id", "Email", "Name"},
            {{SqlValue{"5"}, SqlValue{"a@b.com"}, SqlValue{"Bob"}}}));

        auto cmd = f.command(R"(DELETE FROM "Users" WHERE "Id" = $1)");
        cmd->parameters().set("$1", "5");
        REQUIRE(cmd->execute().is_ok());

        const auto rec = f.sink->records().at(0);
        REQUIRE(rec.event_name == "Users_Deleted");
        REQUIRE(rec.before.size() == 3);
        REQUIRE(rec.after.empty());
    }
}

// ============================================================================
// Pass-through paths
// ============================================================================

TEST_CASE("Interceptor passes non-mutating statements through", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("SELECT", MockDbConnection::rows({"n"}, {{SqlValue{"42"}}}));

    auto cmd = f.command("SELECT count(*) AS n FROM \"Users\"");
    auto result = cmd->execute();

    REQUIRE(result.is_ok());
    REQUIRE(result.value().rows.size() == 1);
    REQUIRE(f.conn.calls().size() == 1);
    REQUIRE(f.sink->record_count() == 0);
    REQUIRE_FALSE(cmd->last_outcome().auditable);
    REQUIRE(cmd->last_outcome().last_state == InterceptState::PASS_THROUGH);
    REQUIRE_FALSE(cmd->last_outcome().degraded());

    auto scalar = cmd->execute_scalar();
    REQUIRE(scalar.is_ok());
    REQUIRE(scalar.value() == SqlValue{"42"});
}

TEST_CASE("Interceptor executes unparsable SQL without a record", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("UPDAT", DbResultSet::failure("syntax error at or near \"UPDAT\""));

    auto cmd = f.command("UPDAT users SET x = 1");
    auto result = cmd->execute();

    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::EXECUTION_ERROR);
    REQUIRE(f.conn.calls().size() == 1);
    REQUIRE(f.sink->record_count() == 0);
}

TEST_CASE("Interceptor leaves batches and CTEs alone", "[interceptor]") {
    InterceptorFixture f;

    auto batch = f.command(R"(DELETE FROM "Users" WHERE "Id" = 1; DELETE FROM "Users" WHERE "Id" = 2)");
    REQUIRE(batch->execute().is_ok());
    REQUIRE(f.conn.calls().size() == 1);
    REQUIRE(f.conn.calls()[0].sql.find("RETURNING") == std::string::npos);
    REQUIRE(f.sink->record_count() == 0);
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_CASE("Interceptor returns statement failures unchanged", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("RETURNING WITH",
              DbResultSet::failure("new row violates check constraint \"users_email_check\""));

    auto cmd = f.command(kUpdateUsers);
    bind_update_params(*cmd);
    auto result = cmd->execute();

    REQUIRE(result.is_error());
    REQUIRE(result.error_category() == ErrorCategory::EXECUTION_ERROR);
    REQUIRE(result.error_message().find("users_email_check") != std::string::npos);
    REQUIRE(f.conn.count_calls("UPDATE") == 1);
    REQUIRE(f.sink->record_count() == 0);
    REQUIRE(cmd->last_outcome().last_state == InterceptState::EXECUTE);
    REQUIRE(cmd->text() == kUpdateUsers);
}

TEST_CASE("Interceptor result is unaffected by sink failures", "[interceptor]") {
    InterceptorFixture f;
    f.script_update_returning();

    SECTION("Sink reports an error") {
        f.sink->set_mode(MockAuditSink::Mode::FAIL);
    }
    SECTION("Sink throws") {
        f.sink->set_mode(MockAuditSink::Mode::THROW);
    }

    auto cmd = f.command(kUpdateUsers);
    bind_update_params(*cmd);
    auto result = cmd->execute();

    REQUIRE(result.is_ok());
    REQUIRE(result.value().affected_rows == 1);
    REQUIRE(f.conn.count_calls("UPDATE") == 1);

    const auto& outcome = cmd->last_outcome();
    REQUIRE_FALSE(outcome.dispatched);
    REQUIRE(outcome.dispatch_status.error_category() == ErrorCategory::DISPATCH_ERROR);
    REQUIRE(outcome.degraded());
}

TEST_CASE("Interceptor capture failure still audits what it can", "[interceptor]") {
    InterceptorFixture f;
    f.conn.set_server_version(160000);
    f.conn.throw_on("SELECT * FROM");
    f.conn.on("UPDATE", MockDbConnection::command(1));

    auto cmd = f.command(kUpdateUsers);
    bind_update_params(*cmd);
    auto result = cmd->execute();

    REQUIRE(result.is_ok());
    REQUIRE(f.conn.count_calls("UPDATE") == 1);

    const auto& outcome = cmd->last_outcome();
    REQUIRE(outcome.strategy == "reload");
    REQUIRE(outcome.capture_status.error_category() == ErrorCategory::CAPTURE_ERROR);
    REQUIRE(outcome.dispatched);
    REQUIRE(outcome.degraded());

    const auto records = f.sink->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].before.empty());
    REQUIRE(records[0].after.empty());
}

TEST_CASE("Interceptor prefers the fallback when the table has no known columns", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("DELETE", MockDbConnection::command(1));

    auto cmd = f.command("DELETE FROM unknown_table WHERE id = 1");
    REQUIRE(cmd->execute().is_ok());

    REQUIRE(cmd->last_outcome().strategy == "reload");
    REQUIRE(f.conn.count_calls("RETURNING") == 0);
    REQUIRE(f.sink->records().at(0).event_name == "unknown_table_Deleted");
}

TEST_CASE("Interceptor names events after folded identifiers", "[interceptor]") {
    InterceptorFixture f;
    f.loader->set_columns("users", {"id", "email", "name"});
    f.script_update_returning();

    auto cmd = f.command("UPDATE Users SET Email=$1 WHERE Id=$2");
    bind_update_params(*cmd);
    REQUIRE(cmd->execute().is_ok());

    REQUIRE(f.conn.calls()[0].sql.find(R"(audit_old."email")") != std::string::npos);
    const auto records = f.sink->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].table_name == "users");
    REQUIRE(records[0].event_name == "users_Modified");
    REQUIRE(records[0].after.at("email") == SqlValue{"a@b.com"});
}

TEST_CASE("Interceptor runs the statement unaudited when classification throws", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("UPDATE", MockDbConnection::command(1));

    UnreadableOnceCommand cmd(f.conn, kUpdateUsers);
    bind_update_params(cmd);

    InterceptOutcome outcome;
    auto result = f.interceptor->execute(cmd, &outcome);

    REQUIRE(result.is_ok());
    REQUIRE(result.value().affected_rows == 1);
    REQUIRE(outcome.last_state == InterceptState::PASS_THROUGH);
    REQUIRE_FALSE(outcome.auditable);
    REQUIRE(f.conn.calls().size() == 1);
    REQUIRE(f.conn.calls()[0].sql == kUpdateUsers);
    REQUIRE(f.sink->record_count() == 0);
}

TEST_CASE("Interceptor recovers from a column list that went stale", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("RETURNING WITH",
              DbResultSet::failure(R"(column audit_old.Name does not exist)", "42703"));
    f.script_update_returning();
    f.conn.on("UPDATE", MockDbConnection::command(1));

    auto first = f.command(kUpdateUsers);
    bind_update_params(*first);

    SECTION("Outside a transaction block") {
        auto result = first->execute();
        REQUIRE(result.is_ok());
        REQUIRE(result.value().affected_rows == 1);
        REQUIRE(f.conn.count_calls("RETURNING") == 1);
        REQUIRE(f.conn.count_calls("UPDATE") == 2);
        REQUIRE(f.conn.calls()[1].sql == kUpdateUsers);

        const auto& outcome = first->last_outcome();
        REQUIRE(outcome.capture_status.error_category() == ErrorCategory::CAPTURE_ERROR);
        REQUIRE(outcome.dispatched);
        REQUIRE(f.sink->records().at(0).before.empty());

        // The stale entry is gone: the next statement reloads the columns and is captured
        REQUIRE(f.cache->get_stats().entries == 0);
        auto second = f.command(kUpdateUsers);
        bind_update_params(*second);
        REQUIRE(second->execute().is_ok());
        REQUIRE(f.loader->load_count() == 2);
        REQUIRE_FALSE(second->last_outcome().degraded());
        REQUIRE(f.sink->records().at(1).after.at("Email") == SqlValue{"a@b.com"});
    }

    SECTION("Inside a transaction block") {
        f.conn.begin_transaction();

        auto result = first->execute();
        REQUIRE(result.is_ok());
        REQUIRE_FALSE(f.conn.transaction_aborted());
        REQUIRE(f.conn.savepoint_rollbacks() == 1);
        REQUIRE(f.conn.savepoint_depth() == 0);
        REQUIRE(f.conn.count_calls("UPDATE") == 2);
    }
}

TEST_CASE("Interceptor leaves the caller's failed transaction as it was", "[interceptor]") {
    InterceptorFixture f;
    f.conn.begin_transaction();
    f.conn.on("RETURNING WITH",
              DbResultSet::failure(R"(duplicate key value violates unique constraint "users_email_key")", "23505"));

    auto cmd = f.command(kUpdateUsers);
    bind_update_params(*cmd);
    auto result = cmd->execute();

    REQUIRE(result.is_error());
    REQUIRE(cmd->last_sql_state() == "23505");
    REQUIRE(f.conn.count_calls("UPDATE") == 1);
    REQUIRE(f.conn.transaction_aborted());
    REQUIRE(f.conn.savepoint_rollbacks() == 0);
    REQUIRE(f.sink->record_count() == 0);
}

TEST_CASE("Interceptor capture failure inside a transaction block", "[interceptor]") {
    InterceptorFixture f;
    f.conn.set_server_version(160000);
    f.conn.begin_transaction();
    f.conn.on("SELECT * FROM", DbResultSet::failure("permission denied for table Users", "42501"));
    f.conn.on("UPDATE", MockDbConnection::command(1));

    auto cmd = f.command(kUpdateUsers);
    bind_update_params(*cmd);
    auto result = cmd->execute();

    REQUIRE(result.is_ok());
    REQUIRE(result.value().affected_rows == 1);
    REQUIRE_FALSE(f.conn.transaction_aborted());
    REQUIRE(f.conn.savepoint_rollbacks() == 2);
    REQUIRE(f.conn.savepoint_depth() == 0);
    REQUIRE(cmd->last_outcome().strategy == "reload");
    REQUIRE(cmd->last_outcome().degraded());
    REQUIRE(f.sink->record_count() == 1);

    // The caller's transaction still commits
    REQUIRE(f.conn.execute("COMMIT", {}).success);
}

// ============================================================================
// Command decoration
// ============================================================================

TEST_CASE("AuditableConnection hands out auditing commands", "[interceptor]") {
    InterceptorFixture f;
    f.script_update_returning();
    AuditableConnection db(f.conn, f.interceptor);

    auto cmd = db.create_command(kUpdateUsers);
    bind_update_params(*cmd);
    REQUIRE(&cmd->connection() == &f.conn);
    REQUIRE(cmd->execute().is_ok());
    REQUIRE(f.sink->record_count() == 1);
}

TEST_CASE("AuditingCommand forwards prepare", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("SELECT", MockDbConnection::rows({"n"}, {{SqlValue{"1"}}}));

    auto cmd = f.command("SELECT 1 AS n");
    REQUIRE(cmd->prepare().is_ok());
    REQUIRE(cmd->execute().is_ok());
    REQUIRE(f.conn.prepared_executions() == 1);
}

TEST_CASE("AuditingCommand set_text changes what is audited", "[interceptor]") {
    InterceptorFixture f;
    f.conn.on("RETURNING WITH", MockDbConnection::rows({"Id", "Email", "Name"},
        {{SqlValue{"1"}, SqlValue{"x"}, SqlValue{"y"}}}));

    auto cmd = f.command("SELECT 1");
    REQUIRE(cmd->execute().is_ok());
    REQUIRE(f.sink->record_count() == 0);

    cmd->set_text(R"(DELETE FROM "Users" WHERE "Id" = 1)");
    REQUIRE(cmd->execute().is_ok());
    REQUIRE(f.sink->record_count() == 1);
    REQUIRE(cmd->last_outcome().dispatched);
}

TEST_CASE("InterceptState names", "[interceptor]") {
    CHECK(intercept_state_to_string(InterceptState::IDLE) == "idle");
    CHECK(intercept_state_to_string(InterceptState::PASS_THROUGH) == "pass_through");
    CHECK(intercept_state_to_string(InterceptState::DISPATCH) == "dispatch");
}
