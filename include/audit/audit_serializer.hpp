#pragma once

#include "audit/audit_record.hpp"
#include <string>

namespace sqlaudit {

/**
 * @brief One-line JSON object for a record (no trailing newline)
 *
 * SQL NULL values in images and parameters serialize as JSON null;
 * absent actor fields are omitted.
 */
[[nodiscard]] std::string audit_to_json(const AuditRecord& record);

/// {"col": "value", "other": null}
[[nodiscard]] std::string snapshot_to_json(const RowSnapshot& snapshot);

/// {"$1": "value", "$2": null}
[[nodiscard]] std::string parameters_to_json(const ParameterMap& params);

/// {"key": "value"}
[[nodiscard]] std::string properties_to_json(const PropertyMap& properties);

} // namespace sqlaudit
