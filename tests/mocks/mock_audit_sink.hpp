#pragma once

#include "audit/audit_sink.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlaudit::testing {

/**
 * @brief Sink that keeps every record in memory
 *
 * hold() makes write() wait until release(), to keep a writer thread busy.
 */
class MockAuditSink : public IAuditSink {
public:
    enum class Mode { ACCEPT, FAIL, THROW };

    explicit MockAuditSink(Mode mode = Mode::ACCEPT) : mode_(mode) {}

    Status write(const AuditRecord& record) override {
        {
            std::unique_lock<std::mutex> lock(gate_mutex_);
            waiting_ = held_;
            gate_cv_.notify_all();
            gate_cv_.wait(lock, [this] { return !held_; });
            waiting_ = false;
        }
        if (mode_ == Mode::THROW) {
            throw std::runtime_error("Mock sink exploded");
        }
        if (mode_ == Mode::FAIL) {
            return Status::error(ErrorCategory::DISPATCH_ERROR, "Mock sink rejected record");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        return Status::ok();
    }

    void flush() override { flush_count_.fetch_add(1, std::memory_order_relaxed); }
    void shutdown() override { shut_down_ = true; }
    std::string name() const override { return "mock"; }

    void set_mode(Mode mode) { mode_ = mode; }

    void hold() {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            held_ = false;
        }
        gate_cv_.notify_all();
    }

    /// Block until a write() is parked at the gate
    void wait_until_held() {
        std::unique_lock<std::mutex> lock(gate_mutex_);
        gate_cv_.wait(lock, [this] { return waiting_; });
    }

    [[nodiscard]] std::vector<AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] size_t record_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    [[nodiscard]] bool shut_down() const { return shut_down_; }
    [[nodiscard]] uint64_t flush_count() const { return flush_count_.load(); }

private:
    std::atomic<Mode> mode_;
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<bool> shut_down_{false};

    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool held_ = false;
    bool waiting_ = false;
};

} // namespace sqlaudit::testing
