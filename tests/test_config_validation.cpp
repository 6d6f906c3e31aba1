#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <filesystem>
#include <fstream>

using namespace sqlaudit;

TEST_CASE("ConfigValidation: empty document gives defaults", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& c = result.config;
    CHECK(c.database.query_timeout.count() == 0);
    CHECK(c.capture.strategy == "returning");
    CHECK(c.capture.fallback_to_reload);
    CHECK(c.capture.min_server_version == 180000);
    CHECK(c.metadata_cache.ttl_seconds == 0);
    CHECK(c.audit.async_mode);
    CHECK(c.audit.integrity_enabled);
    CHECK(c.audit.file_enabled);
    CHECK_FALSE(c.audit.database_enabled);
    CHECK(c.audit.database_table == "audit_logs");
    CHECK_FALSE(c.actor.id.has_value());
    CHECK(c.logging.level == "info");
}

TEST_CASE("ConfigValidation: full document", "[config][validation]") {
    const std::string toml = R"(
[database]
connection_string = "host=db dbname=shop"
query_timeout_ms = 5000

[capture]
strategy = "Reload"
fallback_to_reload = false
min_server_version = 170000

[metadata_cache]
ttl_seconds = 300

[audit]
async = false
flush_interval_ms = 250
integrity = false
include_tables = ["orders", "sales.invoices"]

[audit.database]
enabled = true
table = "audit.audit_logs"

[audit.file]
enabled = false

[actor]
id = "batch-7"
name = "Nightly Import"
agent_string = "importer/1.4"

[actor.properties]
job = "import"

[logging]
level = "debug"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& c = result.config;
    CHECK(c.database.connection_string == "host=db dbname=shop");
    CHECK(c.database.query_timeout == std::chrono::milliseconds(5000));
    CHECK(c.capture.strategy == "reload");
    CHECK_FALSE(c.capture.fallback_to_reload);
    CHECK(c.capture.min_server_version == 170000);
    CHECK(c.metadata_cache.ttl_seconds == 300);
    CHECK_FALSE(c.audit.async_mode);
    CHECK(c.audit.batch_flush_interval == std::chrono::milliseconds(250));
    CHECK_FALSE(c.audit.integrity_enabled);
    CHECK(c.audit.include_tables.size() == 2);
    CHECK(c.audit.database_enabled);
    CHECK(c.audit.database_table == "audit.audit_logs");
    CHECK_FALSE(c.audit.file_enabled);
    CHECK(c.actor.id == std::optional<std::string>("batch-7"));
    CHECK(c.actor.name == std::optional<std::string>("Nightly Import"));
    CHECK_FALSE(c.actor.network_address.has_value());
    CHECK(c.actor.agent_string == std::optional<std::string>("importer/1.4"));
    REQUIRE(c.actor.properties.size() == 1);
    CHECK(c.actor.properties[0] == std::pair<std::string, std::string>{"job", "import"});
    CHECK(c.logging.level == "debug");
}

TEST_CASE("ConfigValidation: unknown capture strategy fails", "[config][validation]") {
    const std::string toml = R"(
[capture]
strategy = "triggers"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("capture.strategy") != std::string::npos);
}

TEST_CASE("ConfigValidation: no sink enabled fails", "[config][validation]") {
    const std::string toml = R"(
[audit.file]
enabled = false
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("at least one") != std::string::npos);
}

TEST_CASE("ConfigValidation: database sink needs a connection string", "[config][validation]") {
    const std::string toml = R"(
[audit.database]
enabled = true
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("connection_string") != std::string::npos);

    // The monitored database's string is an acceptable default
    auto with_default = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=db"

[audit.database]
enabled = true
)");
    CHECK(with_default.success);
}

TEST_CASE("ConfigValidation: errors are reported together", "[config][validation]") {
    const std::string toml = R"(
[database]
query_timeout_ms = -1

[metadata_cache]
ttl_seconds = -5

[audit]
queue_capacity = 0
flush_interval_ms = 0

[audit.file]
max_files = 0

[logging]
level = "verbose"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.starts_with("Config validation failed:"));
    CHECK(msg.find("query_timeout_ms") != std::string::npos);
    CHECK(msg.find("ttl_seconds") != std::string::npos);
    CHECK(msg.find("queue_capacity") != std::string::npos);
    CHECK(msg.find("flush_interval_ms") != std::string::npos);
    CHECK(msg.find("max_files") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: synchronous mode ignores queue capacity", "[config][validation]") {
    const std::string toml = R"(
[audit]
async = false
queue_capacity = 0
)";
    CHECK(ConfigLoader::load_from_string(toml).success);
}

TEST_CASE("ConfigValidation: malformed TOML", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[database\nconnection_string = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigValidation: load_from_file", "[config][validation]") {
    SECTION("Missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/sqlaudit.toml");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Failed to load config") != std::string::npos);
    }

    SECTION("File on disk") {
        const std::string path = "/tmp/test_sqlaudit_config.toml";
        {
            std::ofstream out(path);
            out << "[capture]\nstrategy = \"reload\"\n\n[logging]\nlevel = \"warn\"\n";
        }
        auto result = ConfigLoader::load_from_file(path);
        REQUIRE(result.success);
        CHECK(result.config.capture.strategy == "reload");
        CHECK(result.config.logging.level == "warn");
        std::filesystem::remove(path);
    }
}
