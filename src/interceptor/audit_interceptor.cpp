#include "interceptor/audit_interceptor.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlaudit {

namespace {

// Runs one phase, converting exceptions into the phase's error category
template <typename Fn>
Status guarded(std::string_view phase, ErrorCategory category, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return Status::error(category, std::format("{} threw: {}", phase, e.what()));
    }
}

void note_capture_problem(InterceptOutcome& outcome, const Status& status,
                          std::string_view phase, const std::string& table) {
    if (status.is_ok()) return;
    utils::log::warn(std::format("Audit {} for {} degraded: {}", phase, table, status.error_message()));
    if (outcome.capture_status.is_ok()) {
        outcome.capture_status = status;
    }
}

} // anonymous namespace

AuditInterceptor::AuditInterceptor(std::shared_ptr<ICaptureStrategy> primary,
                                   std::shared_ptr<ICaptureStrategy> fallback,
                                   std::shared_ptr<AuditAssembler> assembler)
    : primary_(std::move(primary)),
      fallback_(std::move(fallback)),
      assembler_(std::move(assembler)) {}

ICaptureStrategy* AuditInterceptor::select_strategy(CaptureContext& ctx,
                                                    InterceptOutcome& outcome) const {
    for (ICaptureStrategy* candidate : {primary_.get(), fallback_.get()}) {
        if (!candidate) continue;

        auto status = guarded("prepare", ErrorCategory::CAPTURE_ERROR,
                              [&] { return candidate->prepare(ctx); });
        if (status.is_ok()) {
            outcome.capture_status = Status::ok();
            return candidate;
        }

        utils::log::info(std::format("Capture strategy {} not applicable to {}: {}",
                                     candidate->name(), ctx.statement.table, status.error_message()));
        outcome.capture_status = status;
    }
    return nullptr;
}

Result<DbResultSet> AuditInterceptor::execute(IDbCommand& command, InterceptOutcome* out) const {
    InterceptOutcome local;
    InterceptOutcome& outcome = out ? *out : local;
    outcome = InterceptOutcome{};

    // ---- Classify ----------------------------------------------------------
    outcome.last_state = InterceptState::CLASSIFYING;
    StatementDescriptor statement;
    try {
        statement = parser_.parse(command.text());
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Statement could not be classified, executing without audit: {}",
                                     e.what()));
        outcome.last_state = InterceptState::PASS_THROUGH;
        return command.execute();
    }

    if (!statement.is_auditable()) {
        outcome.last_state = InterceptState::PASS_THROUGH;
        return command.execute();
    }
    outcome.auditable = true;

    CaptureContext ctx(command, statement);
    ICaptureStrategy* strategy = select_strategy(ctx, outcome);
    if (!strategy) {
        utils::log::warn(std::format("Executing {} on {} without audit: no capture strategy applies",
                                     operation_kind_to_string(statement.kind), statement.table));
        outcome.last_state = InterceptState::PASS_THROUGH;
        return command.execute();
    }
    outcome.strategy = std::string(strategy->name());

    const std::string query = command.text();
    const ParameterMap parameters = command.parameters();

    // ---- Before image ------------------------------------------------------
    outcome.last_state = InterceptState::CAPTURE_BEFORE;
    note_capture_problem(outcome,
                         guarded("capture_before", ErrorCategory::CAPTURE_ERROR,
                                 [&] { return strategy->capture_before(ctx); }),
                         "before-image", statement.table);

    // ---- The real statement, exactly once ----------------------------------
    outcome.last_state = InterceptState::EXECUTE;
    Result<DbResultSet> result = strategy->execute(ctx);
    if (result.is_error()) {
        utils::log::debug(std::format("Statement on {} failed, nothing audited: {}",
                                      statement.table, result.error_message()));
        return result;
    }

    // ---- After image -------------------------------------------------------
    outcome.last_state = InterceptState::CAPTURE_AFTER;
    note_capture_problem(outcome,
                         guarded("capture_after", ErrorCategory::CAPTURE_ERROR,
                                 [&] { return strategy->capture_after(ctx); }),
                         "after-image", statement.table);

    // ---- Assemble ----------------------------------------------------------
    outcome.last_state = InterceptState::ASSEMBLE;
    if (!assembler_) {
        outcome.dispatch_status = Status::error(ErrorCategory::INTERNAL_ERROR, "No audit assembler");
        return result;
    }

    AuditRecord record;
    try {
        record = assembler_->build(AuditAssembler::Capture{
            .statement = statement,
            .query = query,
            .parameters = parameters,
            .before = std::move(ctx.before),
            .after = std::move(ctx.after),
            .rows_affected = ctx.rows_affected,
            .strategy = outcome.strategy,
        });
    } catch (const std::exception& e) {
        utils::log::error(std::format("Audit record for {} could not be built: {}",
                                      statement.table, e.what()));
        outcome.dispatch_status = Status::error(ErrorCategory::INTERNAL_ERROR, e.what());
        return result;
    }

    // ---- Dispatch ----------------------------------------------------------
    outcome.last_state = InterceptState::DISPATCH;
    outcome.dispatch_status = assembler_->dispatch(record);
    outcome.dispatched = outcome.dispatch_status.is_ok();

    return result;
}

} // namespace sqlaudit
