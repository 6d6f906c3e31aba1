#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace sqlaudit {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads sqlaudit.toml
 *
 * String values may reference environment variables as ${VAR_NAME}; unset
 * variables expand to the empty string. Validation errors are collected
 * and reported together.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SqlAuditConfig config;

        static LoadResult ok(SqlAuditConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sqlaudit.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All problems found in a config (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SqlAuditConfig& config);

    /**
     * @brief Expand ${VAR_NAME} patterns with environment variables
     * @throws std::runtime_error on an unclosed ${
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static DatabaseConfig extract_database(const toml::table& root);
    static CaptureConfig extract_capture(const toml::table& root);
    static MetadataCacheConfig extract_metadata_cache(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static ActorConfig extract_actor(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static SqlAuditConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(SqlAuditConfig config);
};

} // namespace sqlaudit
