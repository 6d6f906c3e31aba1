#pragma once

#include "audit/audit_assembler.hpp"
#include "capture/capture_strategy.hpp"
#include "core/error.hpp"
#include "db/idb_command.hpp"
#include "parser/sql_parser.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace sqlaudit {

/**
 * @brief Phases of one intercepted execution
 *
 *   IDLE -> CLASSIFYING -> PASS_THROUGH -> IDLE
 *   IDLE -> CLASSIFYING -> CAPTURE_BEFORE -> EXECUTE -> CAPTURE_AFTER
 *        -> ASSEMBLE -> DISPATCH -> IDLE
 */
enum class InterceptState {
    IDLE,
    CLASSIFYING,
    PASS_THROUGH,
    CAPTURE_BEFORE,
    EXECUTE,
    CAPTURE_AFTER,
    ASSEMBLE,
    DISPATCH
};

[[nodiscard]] inline constexpr std::string_view intercept_state_to_string(InterceptState s) {
    switch (s) {
        case InterceptState::IDLE:           return "idle";
        case InterceptState::CLASSIFYING:    return "classifying";
        case InterceptState::PASS_THROUGH:   return "pass_through";
        case InterceptState::CAPTURE_BEFORE: return "capture_before";
        case InterceptState::EXECUTE:        return "execute";
        case InterceptState::CAPTURE_AFTER:  return "capture_after";
        case InterceptState::ASSEMBLE:       return "assemble";
        case InterceptState::DISPATCH:       return "dispatch";
    }
    return "unknown";
}

/**
 * @brief What happened to the audit side of one execution
 *
 * The caller's result is independent of this: it is the statement's own
 * result whenever the statement ran. The outcome distinguishes
 * "audited", "degraded but executed" and "not audited".
 */
struct InterceptOutcome {
    InterceptState last_state = InterceptState::IDLE;   // last phase entered
    bool auditable = false;
    bool dispatched = false;
    std::string strategy;            // strategy used, empty when none
    Status capture_status;           // first capture problem, if any
    Status dispatch_status;

    [[nodiscard]] bool degraded() const {
        return auditable && (!dispatched || capture_status.is_error());
    }
};

/**
 * @brief Orchestrates classify -> capture -> execute -> capture -> dispatch
 *
 * The real statement is executed exactly once on every path. Only the
 * statement's own failure reaches the caller (unchanged, no record);
 * everything that goes wrong around it is logged and reported in the
 * InterceptOutcome.
 *
 * Strategy selection: the primary strategy is used when its prepare()
 * succeeds; otherwise the fallback (if any); otherwise the statement runs
 * without audit.
 *
 * Thread-safety: stateless between calls; safe to share when the
 * strategies and assembler are.
 */
class AuditInterceptor {
public:
    AuditInterceptor(std::shared_ptr<ICaptureStrategy> primary,
                     std::shared_ptr<ICaptureStrategy> fallback,
                     std::shared_ptr<AuditAssembler> assembler);

    /**
     * @brief Execute the command, auditing it when it is data-mutating
     * @param outcome Optional out-parameter describing the audit side
     */
    [[nodiscard]] Result<DbResultSet> execute(IDbCommand& command,
                                              InterceptOutcome* outcome = nullptr) const;

    [[nodiscard]] const StatementParser& parser() const { return parser_; }

private:
    /// Strategy whose prepare() accepted the statement, or nullptr
    ICaptureStrategy* select_strategy(CaptureContext& ctx, InterceptOutcome& outcome) const;

    StatementParser parser_;
    std::shared_ptr<ICaptureStrategy> primary_;
    std::shared_ptr<ICaptureStrategy> fallback_;
    std::shared_ptr<AuditAssembler> assembler_;
};

} // namespace sqlaudit
