#include "audit/audit_emitter.hpp"
#include "audit/audit_serializer.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <future>
#include <stdexcept>

namespace sqlaudit {

namespace {

std::vector<std::string> lower_all(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& n : names) {
        out.push_back(utils::to_lower(n));
    }
    return out;
}

bool matches_any(const std::vector<std::string>& patterns,
                 const std::string& table, const std::string& qualified) {
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& p) {
        return p == table || p == qualified;
    });
}

} // anonymous namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

AuditEmitter::AuditEmitter(const Config& config, std::vector<std::unique_ptr<IAuditSink>> sinks)
    : sinks_(std::move(sinks)),
      queue_(config.queue_capacity),
      batch_flush_interval_(config.batch_flush_interval),
      include_tables_(lower_all(config.include_tables)),
      exclude_tables_(lower_all(config.exclude_tables)),
      integrity_enabled_(config.integrity_enabled) {
    start();
}

void AuditEmitter::start() {
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AuditEmitter::writer_thread_func, this);
}

AuditEmitter::~AuditEmitter() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

bool AuditEmitter::should_audit(const std::optional<std::string>& schema,
                                const std::string& table) const {
    const std::string lower_table = utils::to_lower(table);
    const std::string qualified = schema
        ? utils::to_lower(*schema) + "." + lower_table
        : lower_table;

    if (!include_tables_.empty() && !matches_any(include_tables_, lower_table, qualified)) {
        return false;
    }
    return !matches_any(exclude_tables_, lower_table, qualified);
}

Status AuditEmitter::write(const AuditRecord& record) {
    if (!running_.load(std::memory_order_acquire)) {
        return Status::error(ErrorCategory::DISPATCH_ERROR, "Audit emitter is stopped");
    }

    if (!should_audit(record.schema_name, record.table_name)) {
        filtered_.fetch_add(1, std::memory_order_relaxed);
        return Status::ok();
    }

    if (!queue_.try_push(record)) {
        return Status::error(ErrorCategory::DISPATCH_ERROR,
                             "Audit queue is full, record dropped");
    }
    total_emitted_.fetch_add(1, std::memory_order_relaxed);
    return Status::ok();
}

void AuditEmitter::flush() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        flush_requested_.store(true, std::memory_order_release);
    }
    flush_cv_.notify_one();

    while (flush_requested_.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
    }
}

void AuditEmitter::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    flush_cv_.notify_one();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

std::string AuditEmitter::name() const {
    std::string result = "emitter[";
    for (size_t i = 0; i < sinks_.size(); ++i) {
        if (i > 0) result += ',';
        result += sinks_[i]->name();
    }
    result += ']';
    return result;
}

AuditEmitter::Stats AuditEmitter::get_stats() const {
    return Stats{
        .total_emitted = total_emitted_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .overflow_dropped = queue_.overflow_count(),
        .queue_depth = queue_.depth(),
        .filtered = filtered_.load(std::memory_order_relaxed),
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Sink Helpers
// ============================================================================

void AuditEmitter::write_to_sinks(const std::vector<AuditRecord>& batch) {
    // Writes one batch to one sink; returns the number of failed records
    auto write_batch = [&batch](IAuditSink& sink) {
        uint64_t failures = 0;
        for (const auto& record : batch) {
            try {
                auto status = sink.write(record);
                if (status.is_error()) {
                    ++failures;
                    utils::log::warn(std::format("Audit sink {}: {}", sink.name(), status.error_message()));
                }
            } catch (const std::exception& e) {
                ++failures;
                utils::log::error(std::format("Audit sink {} threw: {}", sink.name(), e.what()));
            }
        }
        return failures;
    };

    if (sinks_.size() <= 1) {
        // Single sink: no parallelization overhead
        for (auto& sink : sinks_) {
            sink_write_failures_.fetch_add(write_batch(*sink), std::memory_order_relaxed);
        }
        return;
    }

    // Multiple sinks: write concurrently (e.g. file + database). The batch
    // stays valid because we wait for all futures before returning.
    std::vector<std::future<uint64_t>> futures;
    futures.reserve(sinks_.size());

    for (auto& sink : sinks_) {
        futures.push_back(std::async(std::launch::async,
            [&write_batch, &sink] { return write_batch(*sink); }));
    }

    for (auto& f : futures) {
        sink_write_failures_.fetch_add(f.get(), std::memory_order_relaxed);
    }
}

void AuditEmitter::flush_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void AuditEmitter::shutdown_sinks() {
    for (auto& sink : sinks_) {
        sink->flush();
        sink->shutdown();
    }
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void AuditEmitter::number_records(std::vector<AuditRecord>& batch) {
    for (auto& record : batch) {
        record.sequence_num = next_sequence_++;
    }
}

void AuditEmitter::chain_hashes(std::vector<AuditRecord>& batch) {
    for (auto& record : batch) {
        record.previous_hash = previous_hash_;
        record.record_hash = compute_record_hash(record, previous_hash_);
        previous_hash_ = record.record_hash;
    }
}

size_t AuditEmitter::drain_queue(std::vector<AuditRecord>& batch) {
    size_t drained = 0;
    for (;;) {
        batch.clear();
        if (queue_.drain(batch, kMaxBatchSize) == 0) {
            return drained;
        }
        drained += batch.size();

        number_records(batch);
        if (integrity_enabled_) {
            chain_hashes(batch);
        }
        write_to_sinks(batch);
        total_written_.fetch_add(batch.size(), std::memory_order_relaxed);
        flush_count_.fetch_add(1, std::memory_order_relaxed);

        if (++batches_since_fsync_ >= kFsyncInterval) {
            flush_sinks();
            batches_since_fsync_ = 0;
        }
    }
}

void AuditEmitter::writer_thread_func() {
    std::vector<AuditRecord> batch;
    batch.reserve(kMaxBatchSize);

    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            flush_cv_.wait_for(lock, batch_flush_interval_, [this] {
                return flush_requested_.load(std::memory_order_acquire)
                    || !running_.load(std::memory_order_acquire);
            });
        }

        drain_queue(batch);

        if (flush_requested_.load(std::memory_order_acquire)) {
            // A record pushed before flush() may land after the drain above
            drain_queue(batch);
            flush_sinks();
            batches_since_fsync_ = 0;
            flush_requested_.store(false, std::memory_order_release);
        }
    }

    drain_queue(batch);
    shutdown_sinks();
}

std::string AuditEmitter::compute_record_hash(
    const AuditRecord& record, const std::string& prev_hash) {

    AuditRecord content = record;
    content.record_hash.clear();
    content.previous_hash.clear();
    const std::string input = audit_to_json(content) + '|' + prev_hash;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        utils::log::error(std::format("SHA-256 failed for audit record {}", record.sequence_num));
        return {};
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

} // namespace sqlaudit
