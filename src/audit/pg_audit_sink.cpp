#include "audit/pg_audit_sink.hpp"
#include "audit/audit_serializer.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlaudit {

namespace {

// "audit.audit_logs" -> "audit"."audit_logs"
std::string quote_qualified(std::string_view name) {
    std::string result;
    size_t start = 0;
    while (true) {
        const size_t dot = name.find('.', start);
        if (!result.empty()) result += '.';
        result += utils::quote_identifier(name.substr(start, dot == std::string_view::npos
                                                                 ? std::string_view::npos
                                                                 : dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return result;
}

SqlValue optional_value(const std::optional<std::string>& v) {
    return v ? SqlValue{*v} : SqlValue{};
}

} // anonymous namespace

PgAuditSink::PgAuditSink(Config config, std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)),
      quoted_table_(quote_qualified(config_.table)),
      factory_(std::move(factory)) {}

PgAuditSink::~PgAuditSink() {
    shutdown();
}

std::string PgAuditSink::name() const {
    return "postgresql:" + config_.table;
}

std::string PgAuditSink::create_table_sql() const {
    return std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "id bigserial PRIMARY KEY, "
        "audit_id uuid NOT NULL, "
        "event_timestamp timestamptz NOT NULL, "
        "event_name text NOT NULL, "
        "query_text text NOT NULL, "
        "parameters jsonb, "
        "before_image jsonb, "
        "after_image jsonb, "
        "schema_name text, "
        "table_name text NOT NULL, "
        "operation_type text NOT NULL, "
        "rows_affected bigint, "
        "capture_strategy text, "
        "actor_id text, "
        "actor_name text, "
        "network_address text, "
        "agent_string text, "
        "host_name text, "
        "process_id bigint, "
        "thread_id text, "
        "custom_properties jsonb, "
        "record_hash text, "
        "previous_hash text, "
        "created_at timestamptz NOT NULL DEFAULT now())",
        quoted_table_);
}

std::string PgAuditSink::insert_sql() const {
    return std::format(
        "INSERT INTO {} (audit_id, event_timestamp, event_name, query_text, parameters, "
        "before_image, after_image, schema_name, table_name, operation_type, rows_affected, "
        "capture_strategy, actor_id, actor_name, network_address, agent_string, host_name, "
        "process_id, thread_id, custom_properties, record_hash, previous_hash) "
        "VALUES ($1::uuid, $2::timestamptz, $3, $4, $5::jsonb, $6::jsonb, $7::jsonb, $8, $9, "
        "$10, $11::bigint, $12, $13, $14, $15, $16, $17, $18::bigint, $19, $20::jsonb, $21, $22)",
        quoted_table_);
}

Status PgAuditSink::ensure_ready() {
    if (!connection_ || !connection_->is_connected()) {
        table_ready_ = false;
        connection_ = factory_ ? factory_->create(config_.connection_string) : nullptr;
        if (!connection_) {
            return Status::error(ErrorCategory::DISPATCH_ERROR,
                                 std::format("{}: cannot connect", name()));
        }
    }

    if (!table_ready_) {
        auto rs = connection_->execute(create_table_sql(), ParameterMap{});
        if (!rs.success) {
            return Status::error(ErrorCategory::DISPATCH_ERROR,
                                 std::format("{}: create table failed: {}", name(), rs.error_message));
        }
        table_ready_ = true;
    }
    return Status::ok();
}

Status PgAuditSink::write(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto status = ensure_ready();
    if (status.is_error()) {
        connection_.reset();
        return status;
    }

    ParameterMap params{
        {"$1", record.audit_id},
        {"$2", utils::format_timestamp(record.timestamp)},
        {"$3", record.event_name},
        {"$4", record.query},
        {"$5", parameters_to_json(record.parameters)},
        {"$6", snapshot_to_json(record.before)},
        {"$7", snapshot_to_json(record.after)},
        {"$8", optional_value(record.schema_name)},
        {"$9", record.table_name},
        {"$10", std::string(operation_kind_to_string(record.operation))},
        {"$11", std::to_string(record.rows_affected)},
        {"$12", record.capture_strategy},
        {"$13", optional_value(record.actor_id)},
        {"$14", optional_value(record.actor_name)},
        {"$15", optional_value(record.network_address)},
        {"$16", optional_value(record.agent_string)},
        {"$17", record.host_name},
        {"$18", std::to_string(record.process_id)},
        {"$19", record.thread_id},
        {"$20", properties_to_json(record.custom_properties)},
        {"$21", record.record_hash.empty() ? SqlValue{} : SqlValue{record.record_hash}},
        {"$22", record.previous_hash.empty() ? SqlValue{} : SqlValue{record.previous_hash}},
    };

    auto rs = connection_->execute(insert_sql(), params);
    if (!rs.success) {
        connection_.reset();
        return Status::error(ErrorCategory::DISPATCH_ERROR,
                             std::format("{}: insert failed: {}", name(), rs.error_message));
    }
    return Status::ok();
}

void PgAuditSink::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
    table_ready_ = false;
}

} // namespace sqlaudit
