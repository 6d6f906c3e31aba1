#pragma once

#include "audit/audit_record.hpp"
#include "core/error.hpp"
#include <string>

namespace sqlaudit {

/**
 * @brief Abstract interface for audit output destinations
 *
 * A sink persists finished records. Sinks behind an AuditEmitter are only
 * called from its writer thread; a sink handed directly to the assembler
 * is called from the executing thread and must lock if it is shared.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Persist a single record. Errors are reported, never thrown.
    [[nodiscard]] virtual Status write(const AuditRecord& record) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/sqlaudit.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace sqlaudit
