#include "audit/file_sink.hpp"
#include "audit/audit_serializer.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace sqlaudit {

FileSink::FileSink(Config config)
    : config_(std::move(config)),
      opened_at_(std::chrono::system_clock::now()) {
    out_.open(config_.output_file, std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }

    // Appending to an existing file counts toward its size limit
    std::error_code ec;
    const auto existing = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        file_size_ = static_cast<size_t>(existing);
    }
}

FileSink::~FileSink() {
    shutdown();
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

Status FileSink::write(const AuditRecord& record) {
    std::string line = audit_to_json(record);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        return Status::error(ErrorCategory::DISPATCH_ERROR, std::format("{} is closed", name()));
    }

    if (due_for_rotation(line.size())) {
        auto status = rotate();
        if (status.is_error()) {
            return status;
        }
    }

    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!out_.good()) {
        return Status::error(ErrorCategory::DISPATCH_ERROR, std::format("Write to {} failed", name()));
    }
    file_size_ += line.size();
    ++records_;
    return Status::ok();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

void FileSink::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

size_t FileSink::rotation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotations_;
}

size_t FileSink::current_file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_size_;
}

uint64_t FileSink::records_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

bool FileSink::due_for_rotation(size_t incoming_bytes) const {
    if (file_size_ == 0) {
        return false;
    }
    if (config_.size_based_rotation && file_size_ + incoming_bytes > config_.max_file_size_bytes) {
        return true;
    }
    return config_.time_based_rotation
        && std::chrono::system_clock::now() - opened_at_ >= config_.rotation_interval;
}

std::string FileSink::rotated_path(int index) const {
    return std::format("{}.{}", config_.output_file, index);
}

Status FileSink::rotate() {
    out_.flush();
    out_.close();

    // Gaps in the numbered chain are skipped
    std::error_code ec;
    std::filesystem::remove(rotated_path(config_.max_files), ec);
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(rotated_path(i), rotated_path(i + 1), ec);
    }
    std::filesystem::rename(config_.output_file, rotated_path(1), ec);
    if (ec) {
        utils::log::warn(std::format("Rotating {}: {}", config_.output_file, ec.message()));
    }

    out_.open(config_.output_file, std::ios::app);
    if (!out_.is_open()) {
        return Status::error(ErrorCategory::DISPATCH_ERROR,
                             std::format("Cannot reopen {} after rotation", config_.output_file));
    }
    file_size_ = 0;
    opened_at_ = std::chrono::system_clock::now();
    ++rotations_;
    utils::log::info(std::format("Rotated audit file {} ({} rotations)", config_.output_file, rotations_));
    return Status::ok();
}

} // namespace sqlaudit
