#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlaudit {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

// Substitutes ${VAR} in every string value, at any depth
void expand_env(toml::node& node) {
    if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) {
            expand_env(child);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) {
            expand_env(child);
        }
    } else if (auto* str = node.as_string()) {
        *str = ConfigLoader::expand_env_vars(str->get());
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.query_timeout = std::chrono::milliseconds(d["query_timeout_ms"].value_or(0));
    return cfg;
}

CaptureConfig ConfigLoader::extract_capture(const toml::table& root) {
    CaptureConfig cfg;
    const auto* capture = root["capture"].as_table();
    if (!capture) return cfg;
    const auto& c = *capture;

    cfg.strategy = utils::to_lower(c["strategy"].value_or(cfg.strategy));
    cfg.fallback_to_reload = c["fallback_to_reload"].value_or(cfg.fallback_to_reload);
    cfg.min_server_version = c["min_server_version"].value_or(cfg.min_server_version);
    return cfg;
}

MetadataCacheConfig ConfigLoader::extract_metadata_cache(const toml::table& root) {
    MetadataCacheConfig cfg;
    const auto* cache = root["metadata_cache"].as_table();
    if (!cache) return cfg;

    cfg.ttl_seconds = (*cache)["ttl_seconds"].value_or(0);
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.async_mode = a["async"].value_or(true);
    cfg.queue_capacity = static_cast<size_t>(a["queue_capacity"].value_or(int64_t{65536}));
    cfg.batch_flush_interval = std::chrono::milliseconds(a["flush_interval_ms"].value_or(100));
    cfg.integrity_enabled = a["integrity"].value_or(true);
    cfg.include_tables = toml_string_array(a, "include_tables");
    cfg.exclude_tables = toml_string_array(a, "exclude_tables");

    if (const auto* db_tbl = a["database"].as_table()) {
        const auto& db = *db_tbl;
        cfg.database_enabled = db["enabled"].value_or(false);
        cfg.database_table = db["table"].value_or(cfg.database_table);
        cfg.database_connection_string = db["connection_string"].value_or(""s);
    }

    if (const auto* f = a["file"].as_table()) {
        const auto& file = *f;
        cfg.file_enabled = file["enabled"].value_or(true);
        cfg.output_file = file["output_file"].value_or(cfg.output_file);
        cfg.rotation_max_file_size_mb =
            static_cast<size_t>(file["max_file_size_mb"].value_or(int64_t{100}));
        cfg.rotation_max_files = file["max_files"].value_or(10);
        cfg.rotation_interval_hours = file["rotation_interval_hours"].value_or(24);
        cfg.rotation_time_based = file["time_based"].value_or(true);
        cfg.rotation_size_based = file["size_based"].value_or(true);
    }

    return cfg;
}

ActorConfig ConfigLoader::extract_actor(const toml::table& root) {
    ActorConfig cfg;
    const auto* actor = root["actor"].as_table();
    if (!actor) return cfg;
    const auto& a = *actor;

    cfg.id = toml_optional_string(a, "id");
    cfg.name = toml_optional_string(a, "name");
    cfg.network_address = toml_optional_string(a, "network_address");
    cfg.agent_string = toml_optional_string(a, "agent_string");

    if (const auto* props = a["properties"].as_table()) {
        for (const auto& [key, val] : *props) {
            if (const auto* s = val.as_string()) {
                cfg.properties.emplace_back(std::string(key.str()), s->get());
            }
        }
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

SqlAuditConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    SqlAuditConfig config;
    config.database = extract_database(tbl);
    config.capture = extract_capture(tbl);
    config.metadata_cache = extract_metadata_cache(tbl);
    config.audit = extract_audit(tbl);
    config.actor = extract_actor(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SqlAuditConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SqlAuditConfig& config) {
    std::vector<std::string> errors;

    if (config.database.query_timeout.count() < 0) {
        errors.push_back(std::format("database.query_timeout_ms must be >= 0, got {}",
                                     config.database.query_timeout.count()));
    }

    if (config.capture.strategy != "returning" && config.capture.strategy != "reload") {
        errors.push_back(std::format(
            "capture.strategy must be \"returning\" or \"reload\", got \"{}\"",
            config.capture.strategy));
    }
    if (config.capture.min_server_version <= 0) {
        errors.push_back("capture.min_server_version must be > 0");
    }

    if (config.metadata_cache.ttl_seconds < 0) {
        errors.push_back(std::format("metadata_cache.ttl_seconds must be >= 0, got {}",
                                     config.metadata_cache.ttl_seconds));
    }

    if (config.audit.async_mode && config.audit.queue_capacity == 0) {
        errors.push_back("audit.queue_capacity must be > 0 when async is enabled");
    }
    if (config.audit.batch_flush_interval.count() <= 0) {
        errors.push_back("audit.flush_interval_ms must be > 0");
    }

    if (!config.audit.database_enabled && !config.audit.file_enabled) {
        errors.push_back("at least one of audit.database or audit.file must be enabled");
    }
    if (config.audit.database_enabled) {
        if (config.audit.database_table.empty()) {
            errors.push_back("audit.database.table must not be empty");
        }
        if (config.audit.database_connection_string.empty()
            && config.database.connection_string.empty()) {
            errors.push_back(
                "audit.database.connection_string or database.connection_string required "
                "when the database sink is enabled");
        }
    }
    if (config.audit.file_enabled) {
        if (config.audit.output_file.empty()) {
            errors.push_back("audit.file.output_file must not be empty");
        }
        if (config.audit.rotation_max_files <= 0) {
            errors.push_back("audit.file.max_files must be > 0");
        }
    }

    const std::string level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn"
        && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got \"{}\"",
                                     config.logging.level));
    }

    return errors;
}

} // namespace sqlaudit
