#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codegate {

class AuditRecorder;
class ContainerSandboxBackend;
class ExecutionPolicy;
class PerformanceTracker;

/**
 * @brief Operator control directives (/status, /audit ...)
 *
 * Works on the pipeline's own components and never runs submitted source.
 * Every component pointer may be null; the directive then reports the
 * component as disabled.
 */
class CommandInterpreter {
public:
    struct Context {
        const ExecutionPolicy* policy = nullptr;
        ContainerSandboxBackend* container = nullptr;
        const PerformanceTracker* performance = nullptr;
        const AuditRecorder* audit = nullptr;
    };

    static constexpr size_t kDefaultListing = 10;

    explicit CommandInterpreter(Context ctx) : ctx_(ctx) {}

    /// True if `code` starts with one of the known directives
    [[nodiscard]] static bool recognizes(std::string_view code);

    [[nodiscard]] static const std::vector<std::string>& directives();

    [[nodiscard]] ExecutionBackendResult execute(const CodeSubmission& submission);

private:
    std::string help() const;
    std::string status() const;
    ExecutionBackendResult container(const std::vector<std::string>& args);
    std::string performance(size_t limit) const;
    std::string audit(size_t limit) const;

    Context ctx_;
};

} // namespace codegate
