#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlaudit {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;
    std::chrono::milliseconds query_timeout;    // 0 = server default

    DatabaseConfig()
        : query_timeout(0) {}
};

struct CaptureConfig {
    std::string strategy;                       // "returning" or "reload"
    bool fallback_to_reload;
    int min_server_version;                     // PQserverVersion() form, e.g. 180000

    CaptureConfig()
        : strategy("returning"),
          fallback_to_reload(true),
          min_server_version(180000) {}
};

struct MetadataCacheConfig {
    int ttl_seconds = 0;                        // 0 = entries never expire
};

struct AuditConfig {
    bool async_mode;
    size_t queue_capacity;
    std::chrono::milliseconds batch_flush_interval;
    bool integrity_enabled = true;

    // Table filters ("table" or "schema.table", case-insensitive)
    std::vector<std::string> include_tables;
    std::vector<std::string> exclude_tables;

    // PostgreSQL sink
    bool database_enabled = false;
    std::string database_table = "audit_logs";
    std::string database_connection_string;     // empty = database.connection_string

    // File sink
    bool file_enabled = true;
    std::string output_file = "sqlaudit.jsonl";
    size_t rotation_max_file_size_mb = 100;
    int rotation_max_files = 10;
    int rotation_interval_hours = 24;
    bool rotation_time_based = true;
    bool rotation_size_based = true;

    AuditConfig()
        : async_mode(true),
          queue_capacity(65536),
          batch_flush_interval(100) {}
};

struct ActorConfig {
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::optional<std::string> network_address;
    std::optional<std::string> agent_string;
    std::vector<std::pair<std::string, std::string>> properties;
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// SqlAuditConfig - Complete parsed configuration
// ============================================================================

struct SqlAuditConfig {
    DatabaseConfig database;
    CaptureConfig capture;
    MetadataCacheConfig metadata_cache;
    AuditConfig audit;
    ActorConfig actor;
    LoggingConfig logging;
};

} // namespace sqlaudit
