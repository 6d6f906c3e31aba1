#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sqlaudit {

// ============================================================================
// Audit Record
// ============================================================================

struct AuditRecord {
    std::string audit_id;               // UUID v4
    uint64_t sequence_num;              // Assigned by AuditEmitter, for gap detection
    std::chrono::system_clock::time_point timestamp;
    std::string event_name;             // "{table}_{Created|Modified|Deleted|Changed}"

    // Statement
    std::string query;
    ParameterMap parameters;
    OperationKind operation;
    std::optional<std::string> schema_name;
    std::string table_name;
    uint64_t rows_affected;
    std::string capture_strategy;       // "returning" / "reload"

    // Images
    RowSnapshot before;
    RowSnapshot after;

    // Actor
    std::optional<std::string> actor_id;
    std::optional<std::string> actor_name;
    std::optional<std::string> network_address;
    std::optional<std::string> agent_string;

    // Origin
    std::string host_name;
    int64_t process_id;
    std::string thread_id;

    PropertyMap custom_properties;

    // Integrity (hash chain, filled by AuditEmitter)
    std::string record_hash;            // SHA-256 of this record's content
    std::string previous_hash;          // Hash of previous record (chain link)

    AuditRecord()
        : audit_id(utils::generate_uuid()),
          sequence_num(0),
          timestamp(utils::now()),
          operation(OperationKind::UNKNOWN),
          rows_affected(0),
          process_id(0) {}
};

} // namespace sqlaudit
