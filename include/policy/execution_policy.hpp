#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codegate {

/**
 * @brief Execution Policy - immutable limits shared by every component
 *
 * Built once at startup from the validated [policy] section and handed
 * out by const reference. The language allow-list is the only hard gate
 * in the pipeline; risk never blocks.
 */
class ExecutionPolicy {
public:
    struct Config {
        SecurityLevel security_level = SecurityLevel::BALANCED;
        std::vector<std::string> allowed_languages{"python", "javascript", "bash"};
        std::chrono::seconds max_execution_time{30};
        uint64_t max_memory_mb = 256;
        bool enterprise_mode = false;
    };

    ExecutionPolicy() : ExecutionPolicy(Config{}) {}
    explicit ExecutionPolicy(Config config);

    /// Validated config section -> policy; unknown levels fall back to balanced
    [[nodiscard]] static ExecutionPolicy from_config(const PolicyConfig& cfg);

    [[nodiscard]] bool allows(std::string_view language) const;

    /// Submission's requested level when present, else the policy level
    [[nodiscard]] SecurityLevel effective_level(const CodeSubmission& submission) const {
        return submission.requested_level.value_or(config_.security_level);
    }

    [[nodiscard]] SecurityLevel security_level() const { return config_.security_level; }
    [[nodiscard]] const std::vector<std::string>& allowed_languages() const { return config_.allowed_languages; }
    [[nodiscard]] std::chrono::seconds max_execution_time() const { return config_.max_execution_time; }
    [[nodiscard]] uint64_t max_memory_mb() const { return config_.max_memory_mb; }
    [[nodiscard]] bool enterprise_mode() const { return config_.enterprise_mode; }

private:
    Config config_;
};

} // namespace codegate
