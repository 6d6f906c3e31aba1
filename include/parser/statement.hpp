#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sqlaudit {

/**
 * @brief Where an inserted value or SET right-hand side comes from
 */
struct ValueSource {
    enum class Kind {
        LITERAL,        // constant in the statement text
        PARAMETER,      // $n placeholder
        NULL_VALUE,     // NULL keyword
        DEFAULT_VALUE,  // DEFAULT keyword
        EXPRESSION      // anything the server has to evaluate
    };

    Kind kind = Kind::EXPRESSION;
    std::string text;   // literal text, parameter name ("$2") or expression source

    static ValueSource literal(std::string v) { return {Kind::LITERAL, std::move(v)}; }
    static ValueSource parameter(std::string name) { return {Kind::PARAMETER, std::move(name)}; }
    static ValueSource null_value() { return {Kind::NULL_VALUE, {}}; }
    static ValueSource default_value() { return {Kind::DEFAULT_VALUE, {}}; }
    static ValueSource expression(std::string src) { return {Kind::EXPRESSION, std::move(src)}; }

    /**
     * @brief The value when it can be known without asking the server
     *
     * Outer nullopt: unknown (default, expression, unbound parameter).
     * Inner nullopt: SQL NULL.
     */
    [[nodiscard]] std::optional<SqlValue> resolve(const ParameterMap& params) const {
        switch (kind) {
            case Kind::LITERAL:
                return SqlValue{text};
            case Kind::NULL_VALUE:
                return SqlValue{};
            case Kind::PARAMETER:
                if (const SqlValue* bound = params.find(text)) {
                    return *bound;
                }
                return std::nullopt;
            case Kind::DEFAULT_VALUE:
            case Kind::EXPRESSION:
                return std::nullopt;
        }
        return std::nullopt;
    }
};

/// One SET target of an UPDATE
struct UpdateField {
    std::string column;
    ValueSource value;
};

/**
 * @brief Structured description of a single data-mutating statement
 *
 * kind == UNKNOWN means "not auditable"; the remaining fields are then empty.
 */
struct StatementDescriptor {
    OperationKind kind = OperationKind::UNKNOWN;

    std::optional<std::string> schema;
    std::string table;
    std::optional<std::string> alias;

    /// Verbatim source after the WHERE keyword (UPDATE / DELETE), trimmed
    std::optional<std::string> where_clause;

    /// Verbatim relation list of UPDATE ... FROM / DELETE ... USING, trimmed.
    /// The WHERE clause may reference these relations.
    std::optional<std::string> from_clause;

    /// INSERT: column list paired with the first VALUES row (same length)
    std::vector<std::string> insert_columns;
    std::vector<ValueSource> insert_values;

    /// UPDATE: SET targets in source order
    std::vector<UpdateField> update_fields;

    /// Caller already asked for RETURNING
    bool has_returning = false;

    /// Byte offset directly after the last token of the statement
    std::optional<size_t> returning_anchor;

    [[nodiscard]] bool is_auditable() const { return kind != OperationKind::UNKNOWN; }

    [[nodiscard]] TableName table_name() const { return TableName(schema, table); }
};

} // namespace sqlaudit
