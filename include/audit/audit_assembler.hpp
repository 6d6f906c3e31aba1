#pragma once

#include "audit/actor_context.hpp"
#include "audit/audit_record.hpp"
#include "audit/audit_sink.hpp"
#include "core/error.hpp"
#include "parser/statement.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace sqlaudit {

/**
 * @brief Turns a captured execution into an AuditRecord and hands it off
 *
 * build() never touches the database. dispatch() never throws: sink
 * errors and exceptions come back as DISPATCH_ERROR and are logged.
 */
class AuditAssembler {
public:
    /**
     * @param sink Destination of finished records
     * @param actors Actor source; nullptr means no actor fields
     */
    AuditAssembler(std::shared_ptr<IAuditSink> sink,
                   std::shared_ptr<IActorContextProvider> actors);

    /**
     * @brief Inputs of one record
     */
    struct Capture {
        const StatementDescriptor& statement;
        std::string query;
        ParameterMap parameters;
        RowSnapshot before;
        RowSnapshot after;
        uint64_t rows_affected = 0;
        std::string strategy;
    };

    [[nodiscard]] AuditRecord build(Capture capture) const;

    [[nodiscard]] Status dispatch(const AuditRecord& record) const;

    /// "{table}_Created" / "_Modified" / "_Deleted" / "_Changed"
    [[nodiscard]] static std::string event_name(std::string_view table, OperationKind kind);

private:
    std::shared_ptr<IAuditSink> sink_;
    std::shared_ptr<IActorContextProvider> actors_;
};

} // namespace sqlaudit
