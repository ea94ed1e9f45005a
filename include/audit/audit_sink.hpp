#pragma once

#include <string>
#include <string_view>

namespace codegate {

/**
 * @brief Destination for serialized audit lines
 *
 * Only the AuditRecorder writer thread calls a sink, so implementations
 * need no locking of their own. Each write receives one or more complete
 * JSONL lines.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /// Returns false if the data could not be persisted
    [[nodiscard]] virtual bool write(std::string_view lines) = 0;

    virtual void flush() = 0;

    /// Flush and release handles; later writes fail
    virtual void shutdown() = 0;

    /// e.g. "file:/var/log/code-gateway/audit.jsonl"
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace codegate
