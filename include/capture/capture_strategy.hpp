#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/idb_command.hpp"
#include "parser/statement.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlaudit {

/**
 * @brief Per-execution state shared by the phases of a capture strategy
 *
 * Lives on the interceptor's stack for one execution. The strategy fills
 * before/after; the interceptor reads them when assembling the record.
 */
struct CaptureContext {
    IDbCommand& command;
    const StatementDescriptor& statement;

    RowSnapshot before;
    RowSnapshot after;

    /// Rows affected by the real statement, as the caller will see it
    uint64_t rows_affected = 0;

    /// Query-rewrite only: rewritten text, the column layout it requests and
    /// the rows it returned (removed from the caller's result)
    std::string rewritten_text;
    std::vector<std::string> columns;
    std::vector<std::vector<SqlValue>> returned_rows;

    /// Set when the rewritten text was rejected and the original ran instead
    bool rewrite_abandoned = false;

    CaptureContext(IDbCommand& cmd, const StatementDescriptor& stmt)
        : command(cmd), statement(stmt) {}

    [[nodiscard]] IDbConnection& connection() { return command.connection(); }
    [[nodiscard]] const ParameterMap& parameters() const { return command.parameters(); }
};

/**
 * @brief One way of obtaining before/after images around a statement
 *
 * Phases are called in order by AuditInterceptor:
 *   prepare -> capture_before -> execute -> capture_after
 *
 * prepare() decides applicability without touching the database state;
 * when it fails the interceptor may pick another strategy. execute() runs
 * the caller's statement exactly once: a retry is allowed only after the
 * server rejected a text before modifying anything. Capture phases report problems as
 * CAPTURE_ERROR and leave the snapshot empty or partial.
 */
class ICaptureStrategy {
public:
    virtual ~ICaptureStrategy() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual Status prepare(CaptureContext& ctx) = 0;

    [[nodiscard]] virtual Status capture_before(CaptureContext& ctx) = 0;

    /**
     * @brief Run the real statement
     * @return The caller's result, or EXECUTION_ERROR
     */
    [[nodiscard]] virtual Result<DbResultSet> execute(CaptureContext& ctx) = 0;

    [[nodiscard]] virtual Status capture_after(CaptureContext& ctx) = 0;
};

} // namespace sqlaudit
