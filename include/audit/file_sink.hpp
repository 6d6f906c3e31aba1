#pragma once

#include "audit/audit_sink.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace sqlaudit {

/**
 * @brief Audit records as JSON lines in a local file, with rotation
 *
 * A line is never split across files. Before appending, the live file is
 * rotated when the line would take it past max_file_size_bytes or when
 * rotation_interval has elapsed; an empty file is never rotated. Rotation
 * renames the live file to "<output_file>.1", shifting older files up
 * and deleting "<output_file>.<max_files>".
 *
 * Safe to call from several threads.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "sqlaudit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = true;
        bool size_based_rotation = true;
    };

    /// @throws std::runtime_error when output_file cannot be opened
    explicit FileSink(Config config);
    ~FileSink() override;

    [[nodiscard]] Status write(const AuditRecord& record) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const;
    [[nodiscard]] size_t current_file_size() const;
    [[nodiscard]] uint64_t records_written() const;

private:
    bool due_for_rotation(size_t incoming_bytes) const;
    Status rotate();
    std::string rotated_path(int index) const;

    Config config_;
    mutable std::mutex mutex_;
    std::ofstream out_;
    size_t file_size_ = 0;
    size_t rotations_ = 0;
    uint64_t records_ = 0;
    std::chrono::system_clock::time_point opened_at_;
};

} // namespace sqlaudit
