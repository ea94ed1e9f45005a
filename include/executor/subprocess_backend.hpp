#pragma once

#include "config/config_types.hpp"
#include "executor/execution_backend.hpp"
#include "policy/execution_policy.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codegate {

/**
 * @brief Runs code with the host interpreter in a private temp directory
 *
 * Weaker isolation than the container sandbox: no network or filesystem
 * confinement, only the policy wall-clock limit and output caps. The
 * working directory is created per execution and removed on every path.
 */
class SubprocessBackend : public IExecutionBackend {
public:
    SubprocessBackend(SubprocessConfig config,
                      std::vector<RuntimeConfig> runtimes,
                      const ExecutionPolicy& policy);

    [[nodiscard]] ExecutionBackendResult execute(
        const CodeSubmission& submission, SecurityLevel level) override;

    [[nodiscard]] BackendKind kind() const override { return BackendKind::SUBPROCESS; }
    [[nodiscard]] bool is_available() override;
    [[nodiscard]] std::string name() const override { return "subprocess"; }

    /// True if the host interpreter for `language` is installed
    [[nodiscard]] bool supports(std::string_view language) const;

private:
    [[nodiscard]] const RuntimeConfig* find_runtime(std::string_view language) const;

    SubprocessConfig config_;
    std::vector<RuntimeConfig> runtimes_;
    const ExecutionPolicy& policy_;
};

} // namespace codegate
