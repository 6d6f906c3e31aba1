#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <string>
#include <string_view>

namespace sqlaudit {

/**
 * @brief Confines the failure of an auxiliary statement to itself
 *
 * Inside a transaction block a failed statement aborts the whole block:
 * the caller's next statement fails and its COMMIT rolls back. A Savepoint
 * issued before the auxiliary work lets a failure be undone with
 * ROLLBACK TO SAVEPOINT, leaving the caller's transaction usable.
 *
 * Outside a transaction block nothing is sent: each statement already is
 * its own transaction. Inside an already aborted block SAVEPOINT fails
 * and the object stays inactive.
 *
 * A savepoint still open at destruction is rolled back.
 */
class Savepoint {
public:
    static constexpr std::string_view kDefaultName = "sqlaudit_capture";

    explicit Savepoint(IDbConnection& conn, std::string name = std::string(kDefaultName));
    ~Savepoint();

    Savepoint(const Savepoint&) = delete;
    Savepoint& operator=(const Savepoint&) = delete;

    [[nodiscard]] bool active() const { return active_; }

    /// Keep everything done since the savepoint
    Status release();

    /// Undo everything done since the savepoint and clear an aborted state
    Status rollback();

    /// Leave the savepoint to the enclosing transaction, sending nothing
    void dismiss() { active_ = false; }

    /**
     * @brief Run one read so that its failure cannot abort the transaction
     * @return The read's own result, failure included
     */
    [[nodiscard]] static DbResultSet execute(IDbConnection& conn, const std::string& sql,
                                             const ParameterMap& params);

private:
    IDbConnection& conn_;
    std::string name_;
    bool active_ = false;
};

} // namespace sqlaudit
