#pragma once

#include "db/idb_command.hpp"
#include <optional>
#include <string>

namespace sqlaudit {

/**
 * @brief Plain command executing directly on an IDbConnection
 *
 * After prepare(), executions whose text still equals the prepared text
 * run the server-side prepared statement; any other text (a rewrite, a
 * later set_text) is sent as is.
 */
class DbCommand : public IDbCommand {
public:
    explicit DbCommand(IDbConnection& connection, std::string text = {});

    const std::string& text() const override { return text_; }
    void set_text(std::string text) override { text_ = std::move(text); }

    ParameterMap& parameters() override { return params_; }
    const ParameterMap& parameters() const override { return params_; }

    IDbConnection& connection() override { return connection_; }

    Status prepare() override;
    Result<DbResultSet> execute() override;
    Result<SqlValue> execute_scalar() override;

    const std::string& last_sql_state() const override { return last_sql_state_; }

private:
    IDbConnection& connection_;
    std::string text_;
    ParameterMap params_;
    std::string last_sql_state_;

    // Name and text of the server-side prepared statement, if any
    std::optional<std::string> prepared_name_;
    std::string prepared_text_;
};

} // namespace sqlaudit
