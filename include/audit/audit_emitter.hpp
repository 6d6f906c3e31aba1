#pragma once

#include "audit/record_queue.hpp"
#include "audit/audit_sink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sqlaudit {

/**
 * @brief Asynchronous audit fan-out
 *
 * An IAuditSink whose write() only enqueues. A background writer thread
 * drains the RecordQueue in batches, numbers and chains the records and
 * hands each batch to every downstream sink. Sequence numbers follow the
 * order records leave the queue, so a record dropped on overflow leaves no
 * gap; it is counted in overflow_dropped instead. Executing threads never wait for
 * persistence; with the queue full the record is dropped and counted.
 *
 *   [Thread 1] --write()--> [RecordQueue] --drain()--> [Writer Thread] --> [Sink 1: File]
 *   [Thread N] --write()-->                                            --> [Sink 2: PostgreSQL]
 *
 * Table filters: a record is kept when include_tables is empty or names
 * its table, and exclude_tables does not. Entries match "table" or
 * "schema.table", case-insensitively.
 */
class AuditEmitter : public IAuditSink {
public:
    struct Config {
        size_t queue_capacity = 65536;
        std::chrono::milliseconds batch_flush_interval{100};
        std::vector<std::string> include_tables;
        std::vector<std::string> exclude_tables;
        bool integrity_enabled = true;
    };

    /**
     * @brief Start the writer thread over the given sinks
     */
    AuditEmitter(const Config& config, std::vector<std::unique_ptr<IAuditSink>> sinks);

    ~AuditEmitter() override;

    // Owns the writer thread and the queue
    AuditEmitter(const AuditEmitter&) = delete;
    AuditEmitter& operator=(const AuditEmitter&) = delete;
    AuditEmitter(AuditEmitter&&) = delete;
    AuditEmitter& operator=(AuditEmitter&&) = delete;

    /**
     * @brief Enqueue a record (non-blocking)
     *
     * Filtered records are accepted and discarded; a full queue or a
     * stopped emitter is a DISPATCH_ERROR.
     */
    [[nodiscard]] Status write(const AuditRecord& record) override;

    /// Block until everything enqueued so far reached the sinks
    void flush() override;

    /// Graceful shutdown: drain, flush, and close all sinks
    void shutdown() override;

    [[nodiscard]] std::string name() const override;

    /**
     * @brief Table filter check
     */
    [[nodiscard]] bool should_audit(const std::optional<std::string>& schema,
                                    const std::string& table) const;

    struct Stats {
        uint64_t total_emitted;      ///< Records accepted into the queue
        uint64_t total_written;      ///< Records handed to sinks
        uint64_t overflow_dropped;   ///< Records dropped (queue full)
        size_t queue_depth;          ///< Records waiting for the writer thread
        uint64_t filtered;           ///< Records skipped by table filters
        uint64_t flush_count;        ///< Number of batch flushes performed
        uint64_t sink_write_failures;///< Failed sink write attempts
        size_t active_sinks;         ///< Number of downstream sinks
    };

    [[nodiscard]] Stats get_stats() const;

    /**
     * @brief SHA-256 over the record content and the previous hash (hex)
     *
     * The content is the record's JSON form without its integrity fields,
     * so every persisted field (actor, parameters, table, operation, row
     * count, images, origin) is covered.
     */
    static std::string compute_record_hash(const AuditRecord& record, const std::string& prev_hash);

private:
    void writer_thread_func();
    void start();

    /// Writer thread: drain until empty, returns the number of records handled
    size_t drain_queue(std::vector<AuditRecord>& batch);
    void number_records(std::vector<AuditRecord>& batch);
    void chain_hashes(std::vector<AuditRecord>& batch);

    void write_to_sinks(const std::vector<AuditRecord>& batch);
    void flush_sinks();
    void shutdown_sinks();

    // -- Constants --
    static constexpr size_t kMaxBatchSize = 1000;
    static constexpr size_t kFsyncInterval = 10;

    // -- Sinks --
    std::vector<std::unique_ptr<IAuditSink>> sinks_;

    // -- Queue --
    RecordQueue<AuditRecord> queue_;

    // -- Background writer thread --
    std::thread writer_thread_;
    std::atomic<bool> running_{false};

    // -- Flush synchronization --
    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    std::atomic<bool> flush_requested_{false};

    // -- Config --
    std::chrono::milliseconds batch_flush_interval_;
    std::vector<std::string> include_tables_;   // lower-cased
    std::vector<std::string> exclude_tables_;   // lower-cased

    // -- Stats --
    std::atomic<uint64_t> total_emitted_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> filtered_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> sink_write_failures_{0};

    // -- Writer thread only --
    bool integrity_enabled_{true};
    uint64_t next_sequence_ = 0;
    std::string previous_hash_;
    size_t batches_since_fsync_ = 0;
};

} // namespace sqlaudit
