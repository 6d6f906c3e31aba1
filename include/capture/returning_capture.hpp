#pragma once

#include "capture/capture_strategy.hpp"
#include "catalog/table_metadata_cache.hpp"
#include "db/savepoint.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlaudit {

/**
 * @brief Query-rewrite capture: one round trip via RETURNING OLD/NEW
 *
 * Appends
 *   RETURNING WITH (OLD AS audit_old, NEW AS audit_new) audit_old."c", audit_new."c", ...
 * to the statement, executes it once and reads both images from the
 * returned rows. The caller's result no longer contains those rows and
 * reports the number of returned rows as affected rows.
 *
 * Requires PostgreSQL 18 (RETURNING OLD/NEW), a statement without its own
 * RETURNING clause and a known column list for the target table.
 *
 * A cached column list can outlive a DROP or RENAME COLUMN. When the server
 * rejects the rewritten statement with undefined_column (42703) nothing has
 * been modified yet: the table's cache entry is dropped and the statement
 * runs once more as written, without capture. Inside a transaction block
 * the rewritten statement runs under a savepoint so that this rejection
 * can be undone.
 */
class ReturningCapture : public ICaptureStrategy {
public:
    static constexpr int kDefaultMinServerVersion = 180000;
    static constexpr std::string_view kOldAlias = "audit_old";
    static constexpr std::string_view kNewAlias = "audit_new";

    explicit ReturningCapture(std::shared_ptr<TableMetadataCache> metadata,
                              int min_server_version = kDefaultMinServerVersion);

    std::string_view name() const override { return "returning"; }

    Status prepare(CaptureContext& ctx) override;
    Status capture_before(CaptureContext& ctx) override;
    Result<DbResultSet> execute(CaptureContext& ctx) override;
    Status capture_after(CaptureContext& ctx) override;

    /**
     * @brief Statement text with the capture clause inserted at the anchor
     * @return Rewritten text, or CAPTURE_ERROR when the statement cannot be rewritten
     */
    [[nodiscard]] static Result<std::string> build_rewrite(const StatementDescriptor& stmt,
                                                           std::string_view original,
                                                           const std::vector<std::string>& columns);

private:
    Result<DbResultSet> execute_original(CaptureContext& ctx, Savepoint& savepoint,
                                         const std::string& rewrite_error);

    std::shared_ptr<TableMetadataCache> metadata_;
    int min_server_version_;
};

} // namespace sqlaudit
