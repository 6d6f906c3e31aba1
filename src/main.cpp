#include "audit/actor_context.hpp"
#include "audit/audit_assembler.hpp"
#include "audit/audit_emitter.hpp"
#include "audit/file_sink.hpp"
#include "audit/pg_audit_sink.hpp"
#include "capture/reload_capture.hpp"
#include "capture/returning_capture.hpp"
#include "catalog/table_metadata_cache.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_loader.hpp"
#include "interceptor/audit_interceptor.hpp"
#include "interceptor/auditing_command.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>

using namespace sqlaudit;

namespace {

void print_usage(const char* program) {
    std::cerr << std::format("Usage: {} <config.toml> \"<sql>\" [param ...]\n", program)
              << "  Parameters bind to $1, $2, ... in order; the word NULL binds SQL NULL.\n";
}

// Downstream sinks enabled in [audit.file] / [audit.database]
std::vector<std::unique_ptr<IAuditSink>> build_sinks(const SqlAuditConfig& cfg,
                                                     const std::shared_ptr<IConnectionFactory>& factory) {
    std::vector<std::unique_ptr<IAuditSink>> sinks;

    if (cfg.audit.file_enabled) {
        FileSink::Config file_cfg;
        file_cfg.output_file = cfg.audit.output_file;
        file_cfg.max_file_size_bytes = cfg.audit.rotation_max_file_size_mb * 1024 * 1024;
        file_cfg.max_files = cfg.audit.rotation_max_files;
        file_cfg.rotation_interval = std::chrono::hours(cfg.audit.rotation_interval_hours);
        file_cfg.time_based_rotation = cfg.audit.rotation_time_based;
        file_cfg.size_based_rotation = cfg.audit.rotation_size_based;
        sinks.push_back(std::make_unique<FileSink>(file_cfg));
    }

    if (cfg.audit.database_enabled) {
        PgAuditSink::Config pg_cfg;
        pg_cfg.connection_string = cfg.audit.database_connection_string.empty()
            ? cfg.database.connection_string
            : cfg.audit.database_connection_string;
        pg_cfg.table = cfg.audit.database_table;
        sinks.push_back(std::make_unique<PgAuditSink>(std::move(pg_cfg), factory));
    }

    return sinks;
}

// A single sink is used directly in synchronous mode; several are fanned
// out by an emitter either way.
std::shared_ptr<IAuditSink> build_audit_sink(const SqlAuditConfig& cfg,
                                             const std::shared_ptr<IConnectionFactory>& factory) {
    auto sinks = build_sinks(cfg, factory);

    if (!cfg.audit.async_mode && sinks.size() == 1) {
        return std::shared_ptr<IAuditSink>(std::move(sinks.front()));
    }

    AuditEmitter::Config emitter_cfg;
    emitter_cfg.queue_capacity = cfg.audit.queue_capacity;
    emitter_cfg.batch_flush_interval = cfg.audit.batch_flush_interval;
    emitter_cfg.include_tables = cfg.audit.include_tables;
    emitter_cfg.exclude_tables = cfg.audit.exclude_tables;
    emitter_cfg.integrity_enabled = cfg.audit.integrity_enabled;
    return std::make_shared<AuditEmitter>(emitter_cfg, std::move(sinks));
}

std::shared_ptr<IActorContextProvider> build_actor_provider(const ActorConfig& cfg) {
    if (!cfg.id && !cfg.name && !cfg.network_address && !cfg.agent_string && cfg.properties.empty()) {
        return std::make_shared<StaticActorContextProvider>();
    }

    ActorContext ctx;
    ctx.actor_id = cfg.id;
    ctx.actor_name = cfg.name;
    ctx.network_address = cfg.network_address;
    ctx.agent_string = cfg.agent_string;
    for (const auto& [key, value] : cfg.properties) {
        ctx.custom_properties[key] = value;
    }
    return std::make_shared<StaticActorContextProvider>(std::move(ctx));
}

std::shared_ptr<AuditInterceptor> build_interceptor(const SqlAuditConfig& cfg,
                                                    std::shared_ptr<AuditAssembler> assembler) {
    auto metadata = std::make_shared<TableMetadataCache>(
        std::make_shared<PgSchemaLoader>(),
        std::chrono::seconds(cfg.metadata_cache.ttl_seconds));

    auto reload = std::make_shared<ReloadCapture>();
    if (cfg.capture.strategy == "reload") {
        return std::make_shared<AuditInterceptor>(reload, nullptr, std::move(assembler));
    }

    auto returning = std::make_shared<ReturningCapture>(metadata, cfg.capture.min_server_version);
    return std::make_shared<AuditInterceptor>(
        returning, cfg.capture.fallback_to_reload ? reload : nullptr, std::move(assembler));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        const std::string config_file = argv[1];
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return EXIT_FAILURE;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        utils::log::debug(std::format("Configuration loaded from {}", config_file));

        auto factory = std::make_shared<PgConnectionFactory>();
        auto connection = factory->create(cfg.database.connection_string);
        if (!connection) {
            utils::log::error("Could not connect to the database");
            return EXIT_FAILURE;
        }
        if (cfg.database.query_timeout.count() > 0
            && !connection->set_query_timeout(static_cast<uint32_t>(cfg.database.query_timeout.count()))) {
            utils::log::warn("Could not apply database.query_timeout_ms");
        }

        auto sink = build_audit_sink(cfg, factory);
        auto assembler = std::make_shared<AuditAssembler>(sink, build_actor_provider(cfg.actor));
        auto interceptor = build_interceptor(cfg, assembler);

        AuditableConnection db(std::move(connection), interceptor);
        auto command = db.create_command(argv[2]);
        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            command->parameters().set(std::format("${}", i - 2),
                                      arg == "NULL" ? SqlValue{} : SqlValue{arg});
        }

        auto result = command->execute();

        const auto& outcome = command->last_outcome();
        if (outcome.degraded()) {
            utils::log::warn(std::format("Statement was not fully audited (stopped at {})",
                                         intercept_state_to_string(outcome.last_state)));
        }

        sink->shutdown();

        if (result.is_error()) {
            std::cerr << result.error_message() << "\n";
            return EXIT_FAILURE;
        }

        const auto& rs = result.value();
        for (const auto& row : rs.rows) {
            std::string line;
            for (size_t c = 0; c < row.size(); ++c) {
                if (c > 0) line += '\t';
                line += row[c].value_or("NULL");
            }
            std::cout << line << "\n";
        }
        std::cout << std::format("{} row(s) affected\n", rs.affected_rows);
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
