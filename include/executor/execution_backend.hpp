#pragma once

#include "core/types.hpp"
#include <string>

namespace codegate {

/**
 * @brief Interface for backends that run submitted source
 *
 * execute() never throws for runtime conditions: a missing runtime is a
 * BACKEND_UNAVAILABLE result, an overrun is EXECUTION_TIMEOUT. The result
 * always names the backend and isolation level actually applied.
 */
class IExecutionBackend {
public:
    virtual ~IExecutionBackend() = default;

    [[nodiscard]] virtual ExecutionBackendResult execute(
        const CodeSubmission& submission, SecurityLevel level) = 0;

    [[nodiscard]] virtual BackendKind kind() const = 0;

    /// May probe the host on first call; implementations cache the answer
    [[nodiscard]] virtual bool is_available() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace codegate
