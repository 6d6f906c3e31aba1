#include "catalog/table_metadata_cache.hpp"
#include "core/utils.hpp"

#include <format>
#include <mutex>

namespace sqlaudit {

static constexpr char kDot = '.';

TableMetadataCache::TableMetadataCache(std::shared_ptr<ISchemaLoader> loader,
                                       std::chrono::seconds ttl)
    : loader_(std::move(loader)),
      ttl_(ttl),
      now_([] { return Clock::now(); }) {}

std::string TableMetadataCache::make_key(const TableName& resolved) {
    if (resolved.schema && !resolved.schema->empty()) {
        return utils::quote_identifier(*resolved.schema) + kDot + utils::quote_identifier(resolved.table);
    }
    return utils::quote_identifier(resolved.table);
}

bool TableMetadataCache::is_expired(const Entry& entry, Clock::time_point now) const {
    if (ttl_.count() <= 0) {
        return false;
    }
    // A load in progress is never evicted
    if (entry.columns.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
        return false;
    }
    return now - entry.loaded_at >= ttl_;
}

std::vector<std::string> TableMetadataCache::get_columns(IDbConnection& conn,
                                                         const std::optional<std::string>& schema,
                                                         const std::string& table) {
    const auto resolved = resolve(conn, TableName(schema, table));
    if (!resolved) {
        return {};
    }
    const std::string key = make_key(*resolved);

    // Fast path: shared lock
    {
        std::shared_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it != entries_.end() && !is_expired(it->second, now_())) {
            auto future = it->second.columns;
            lock.unlock();
            hits_.fetch_add(1, std::memory_order_relaxed);
            return future.get();
        }
    }

    // Slow path: install a pending entry unless another caller just did
    std::promise<std::vector<std::string>> promise;
    uint64_t generation = 0;
    {
        std::unique_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it != entries_.end() && !is_expired(it->second, now_())) {
            auto future = it->second.columns;
            lock.unlock();
            hits_.fetch_add(1, std::memory_order_relaxed);
            return future.get();
        }

        generation = ++next_generation_;
        entries_[key] = Entry{*resolved, promise.get_future().share(), now_(), generation};
    }
    misses_.fetch_add(1, std::memory_order_relaxed);

    auto columns = load(conn, *resolved);
    promise.set_value(columns);

    if (columns.empty()) {
        std::unique_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it != entries_.end() && it->second.generation == generation) {
            entries_.erase(it);
        }
    }

    return columns;
}

std::optional<TableName> TableMetadataCache::resolve(IDbConnection& conn, const TableName& name) {
    if (!loader_) {
        load_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("No schema loader configured for {}", name.full_name()));
        return std::nullopt;
    }
    if (name.schema && !name.schema->empty()) {
        return name;
    }

    try {
        auto result = loader_->resolve(conn, name);
        if (result.is_error()) {
            load_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Cannot resolve {}: {}", name.full_name(), result.error_message()));
            return std::nullopt;
        }
        return std::move(result.value());
    } catch (const std::exception& e) {
        load_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Resolving {} threw: {}", name.full_name(), e.what()));
        return std::nullopt;
    }
}

// Only reached after resolve(), which rejects a missing loader
std::vector<std::string> TableMetadataCache::load(IDbConnection& conn, const TableName& name) {
    try {
        auto result = loader_->load_columns(conn, name);
        if (result.is_error()) {
            load_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Metadata load failed for {}: {}",
                                         name.full_name(), result.error_message()));
            return {};
        }
        utils::log::debug(std::format("Loaded {} columns for {}",
                                      result.value().size(), name.full_name()));
        return std::move(result.value());
    } catch (const std::exception& e) {
        load_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Metadata load threw for {}: {}", name.full_name(), e.what()));
        return {};
    }
}

void TableMetadataCache::invalidate(const std::optional<std::string>& schema,
                                    const std::string& table) {
    std::unique_lock lock(mutex_);
    if (schema && !schema->empty()) {
        entries_.erase(make_key(TableName(schema, table)));
        return;
    }
    std::erase_if(entries_, [&table](const auto& item) { return item.second.name.table == table; });
}

void TableMetadataCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

TableMetadataCache::Stats TableMetadataCache::get_stats() const {
    Stats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.load_failures = load_failures_.load(std::memory_order_relaxed);
    std::shared_lock lock(mutex_);
    stats.entries = entries_.size();
    return stats;
}

} // namespace sqlaudit
