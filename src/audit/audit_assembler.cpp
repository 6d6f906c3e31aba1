#include "audit/audit_assembler.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlaudit {

AuditAssembler::AuditAssembler(std::shared_ptr<IAuditSink> sink,
                               std::shared_ptr<IActorContextProvider> actors)
    : sink_(std::move(sink)), actors_(std::move(actors)) {}

std::string AuditAssembler::event_name(std::string_view table, OperationKind kind) {
    std::string_view suffix = "Changed";
    switch (kind) {
        case OperationKind::INSERT:  suffix = "Created"; break;
        case OperationKind::UPDATE:  suffix = "Modified"; break;
        case OperationKind::DELETE:  suffix = "Deleted"; break;
        case OperationKind::UNKNOWN: break;
    }
    return std::format("{}_{}", table, suffix);
}

AuditRecord AuditAssembler::build(Capture capture) const {
    AuditRecord record;
    record.event_name = event_name(capture.statement.table, capture.statement.kind);

    record.query = std::move(capture.query);
    record.parameters = std::move(capture.parameters);
    record.operation = capture.statement.kind;
    record.schema_name = capture.statement.schema;
    record.table_name = capture.statement.table;
    record.rows_affected = capture.rows_affected;
    record.capture_strategy = std::move(capture.strategy);

    record.before = std::move(capture.before);
    record.after = std::move(capture.after);

    record.host_name = utils::host_name();
    record.process_id = utils::process_id();
    record.thread_id = utils::thread_id();

    if (actors_) {
        if (auto actor = actors_->current_context()) {
            record.actor_id = std::move(actor->actor_id);
            record.actor_name = std::move(actor->actor_name);
            record.network_address = std::move(actor->network_address);
            record.agent_string = std::move(actor->agent_string);
            record.custom_properties = std::move(actor->custom_properties);
        }
    }

    return record;
}

Status AuditAssembler::dispatch(const AuditRecord& record) const {
    if (!sink_) {
        return Status::error(ErrorCategory::DISPATCH_ERROR, "No audit sink configured");
    }

    try {
        auto status = sink_->write(record);
        if (status.is_error()) {
            utils::log::error(std::format("Audit dispatch of {} to {} failed: {}",
                                          record.event_name, sink_->name(), status.error_message()));
            return Status::error(ErrorCategory::DISPATCH_ERROR, status.error_message());
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Audit dispatch of {} threw: {}", record.event_name, e.what()));
        return Status::error(ErrorCategory::DISPATCH_ERROR, e.what());
    }

    utils::log::debug(std::format("Audited {} ({})", record.event_name, record.audit_id));
    return Status::ok();
}

} // namespace sqlaudit
