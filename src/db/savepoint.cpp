#include "db/savepoint.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlaudit {

Savepoint::Savepoint(IDbConnection& conn, std::string name)
    : conn_(conn), name_(std::move(name)) {
    if (!conn_.in_transaction()) {
        return;
    }
    const auto rs = conn_.execute("SAVEPOINT " + name_, {});
    if (!rs.success) {
        utils::log::warn(std::format("SAVEPOINT {} failed: {}", name_, rs.error_message));
        return;
    }
    active_ = true;
}

Savepoint::~Savepoint() {
    if (!active_) {
        return;
    }
    try {
        const auto status = rollback();
        if (status.is_error()) {
            utils::log::error(status.error_message());
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Rolling back to savepoint {} threw: {}", name_, e.what()));
    }
}

Status Savepoint::release() {
    if (!active_) {
        return Status::ok();
    }
    active_ = false;
    const auto rs = conn_.execute("RELEASE SAVEPOINT " + name_, {});
    if (!rs.success) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
                             std::format("RELEASE SAVEPOINT {} failed: {}", name_, rs.error_message));
    }
    return Status::ok();
}

Status Savepoint::rollback() {
    if (!active_) {
        return Status::ok();
    }
    active_ = false;
    const auto undo = conn_.execute("ROLLBACK TO SAVEPOINT " + name_, {});
    if (!undo.success) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
                             std::format("ROLLBACK TO SAVEPOINT {} failed: {}", name_, undo.error_message));
    }
    // ROLLBACK TO keeps the savepoint itself
    const auto drop = conn_.execute("RELEASE SAVEPOINT " + name_, {});
    if (!drop.success) {
        return Status::error(ErrorCategory::CAPTURE_ERROR,
                             std::format("RELEASE SAVEPOINT {} failed: {}", name_, drop.error_message));
    }
    return Status::ok();
}

DbResultSet Savepoint::execute(IDbConnection& conn, const std::string& sql,
                               const ParameterMap& params) {
    Savepoint savepoint(conn);
    DbResultSet rs = conn.execute(sql, params);

    const Status status = rs.success ? savepoint.release() : savepoint.rollback();
    if (status.is_error()) {
        utils::log::error(status.error_message());
    }
    return rs;
}

} // namespace sqlaudit
