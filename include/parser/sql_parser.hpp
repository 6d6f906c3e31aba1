#pragma once

#include "core/error.hpp"
#include "parser/statement.hpp"

#include <string_view>

namespace sqlaudit {

/**
 * @brief Statement classifier and parser - wraps libpg_query
 *
 * Uses PostgreSQL's own grammar extracted as a C library, so the kind of
 * a statement, its target table and its clauses are identified exactly as
 * the server will identify them.
 *
 * Only single INSERT / UPDATE / DELETE statements without a WITH clause
 * are auditable. Everything else (other statements, batches, syntax errors)
 * yields OperationKind::UNKNOWN.
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class StatementParser {
public:
    StatementParser() = default;

    /**
     * @brief True iff the text is a single auditable statement
     */
    [[nodiscard]] bool is_auditable(std::string_view sql) const;

    /**
     * @brief Parse into a descriptor; never throws
     * @return Descriptor, kind UNKNOWN on any failure
     */
    [[nodiscard]] StatementDescriptor parse(std::string_view sql) const;

    /**
     * @brief Parse, reporting why a statement is not auditable
     * @return Descriptor, or PARSE_ERROR with a message
     */
    [[nodiscard]] Result<StatementDescriptor> try_parse(std::string_view sql) const;
};

} // namespace sqlaudit
