#pragma once

#include "capture/capture_strategy.hpp"

#include <string>
#include <string_view>

namespace sqlaudit {

/**
 * @brief Select-reload capture: read the rows before and after the statement
 *
 * Before (UPDATE / DELETE with a WHERE clause):
 *   SELECT * FROM "t" [AS "alias"] WHERE <where clause>
 * with the statement's parameters renumbered so only the ones the WHERE
 * clause references are sent. UPDATE ... FROM and DELETE ... USING join
 * their extra relations and select only the target's columns:
 *   SELECT "t".* FROM "t", <from list> WHERE <where clause>
 * The statement itself runs unmodified.
 *
 * After: UPDATE repeats the select, DELETE is empty, INSERT looks the new
 * row up by its known non-generated column values and falls back to the
 * values found in the statement, then to the raw bindings.
 *
 * The reads are separate statements: concurrent writers can change the
 * rows in between. Inside a transaction block each read runs under a
 * savepoint, so a failed read (timeout, permissions) does not abort the
 * caller's transaction. Works on every server version.
 */
class ReloadCapture : public ICaptureStrategy {
public:
    /// A read statement with its own bindings
    struct ReloadQuery {
        std::string sql;
        ParameterMap params;
    };

    ReloadCapture() = default;

    std::string_view name() const override { return "reload"; }

    Status prepare(CaptureContext& ctx) override;
    Status capture_before(CaptureContext& ctx) override;
    Result<DbResultSet> execute(CaptureContext& ctx) override;
    Status capture_after(CaptureContext& ctx) override;

    /**
     * @brief SELECT * over the rows matched by the statement's WHERE clause
     */
    [[nodiscard]] static Result<ReloadQuery> build_select(const StatementDescriptor& stmt,
                                                          const ParameterMap& params);

    /**
     * @brief SELECT of the most recent row matching the inserted values
     *
     * Uses every column whose value is known and non-NULL and whose name
     * does not look server-generated.
     */
    [[nodiscard]] static Result<ReloadQuery> build_insert_lookup(const StatementDescriptor& stmt,
                                                                 const ParameterMap& params);

    /**
     * @brief Insert image without a database read
     *
     * Column/value pairs from the statement; when none are known, the
     * bindings keyed by name without the parameter sigil.
     */
    [[nodiscard]] static RowSnapshot insert_fallback(const StatementDescriptor& stmt,
                                                     const ParameterMap& params);

    /**
     * @brief Column names the server usually fills in itself
     *
     * id, createdat, createddate, timestamp, rowversion, modifiedat,
     * modifieddate: exact or suffix match, case-insensitive, underscores
     * ignored.
     */
    [[nodiscard]] static bool is_auto_generated(std::string_view column);

private:
    Status reload_where(CaptureContext& ctx, RowSnapshot& target);
};

} // namespace sqlaudit
