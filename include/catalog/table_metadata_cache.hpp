#pragma once

#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include "db/ischema_loader.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlaudit {

/**
 * @brief Process-wide cache of table column lists
 *
 * Populated lazily through an ISchemaLoader on first use of a table and
 * shared by every command.
 *
 * - Readers take a shared lock; a hit never blocks on other readers.
 * - A miss is loaded at most once: the first caller installs a shared
 *   future and loads outside the lock, concurrent callers for the same key
 *   wait on that future, callers for other keys are unaffected.
 * - A failed load is logged and returns an empty list; nothing is
 *   memoised, so the next call retries.
 * - Entries live until invalidate()/clear() or, when a TTL is set, until
 *   they are older than the TTL.
 *
 * Entries are keyed by the relation a name denotes, not by its text: an
 * unqualified name is first resolved through the loader on the caller's
 * connection, so two sessions with different search paths never share an
 * entry. Keys keep case exactly ("Users" and "users" are different tables).
 *
 * Thread-safety: all methods are safe for concurrent use
 */
class TableMetadataCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFunc = std::function<Clock::time_point()>;

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t load_failures = 0;
        size_t entries = 0;
    };

    /**
     * @param loader Catalog query channel
     * @param ttl Entry lifetime; zero means entries never expire
     */
    explicit TableMetadataCache(std::shared_ptr<ISchemaLoader> loader,
                                std::chrono::seconds ttl = std::chrono::seconds{0});

    /**
     * @brief Ordered column names of a table, loading them on a miss
     * @return Column names, empty when the table is unknown or loading failed
     */
    [[nodiscard]] std::vector<std::string> get_columns(IDbConnection& conn,
                                                       const std::optional<std::string>& schema,
                                                       const std::string& table);

    [[nodiscard]] std::vector<std::string> get_columns(IDbConnection& conn, const TableName& name) {
        return get_columns(conn, name.schema, name.table);
    }

    /**
     * @brief Drop one table (e.g. after DDL)
     *
     * Without a schema the table is dropped from every schema it was cached under.
     */
    void invalidate(const std::optional<std::string>& schema, const std::string& table);

    /**
     * @brief Drop every table
     */
    void clear();

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] std::chrono::seconds ttl() const { return ttl_; }

    /**
     * @brief Replace the clock used for TTL checks (for testing)
     */
    void set_clock(NowFunc now) { now_ = std::move(now); }

    /// "schema"."table" quoted, case kept
    [[nodiscard]] static std::string make_key(const TableName& resolved);

private:
    struct Entry {
        TableName name;
        std::shared_future<std::vector<std::string>> columns;
        Clock::time_point loaded_at;
        uint64_t generation = 0;
    };

    [[nodiscard]] bool is_expired(const Entry& entry, Clock::time_point now) const;

    std::optional<TableName> resolve(IDbConnection& conn, const TableName& name);

    std::vector<std::string> load(IDbConnection& conn, const TableName& resolved);

    std::shared_ptr<ISchemaLoader> loader_;
    std::chrono::seconds ttl_;
    NowFunc now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t next_generation_ = 0;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> load_failures_{0};
};

} // namespace sqlaudit
