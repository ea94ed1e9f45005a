#pragma once

#include "core/types.hpp"
#include "policy/execution_policy.hpp"

#include <span>
#include <string>
#include <string_view>

namespace codegate {

// Availability snapshot taken before routing
struct BackendAvailability {
    bool container = false;
    bool subprocess = true;
};

struct RouteDecision {
    BackendKind backend = BackendKind::NONE;
    IsolationLevel isolation = IsolationLevel::DENIED;
    SecurityLevel effective_level = SecurityLevel::BALANCED;
    bool alert = false;                     // high/critical risk on a real execution
    std::string_view rule;                  // name of the routing rule that matched
    ErrorCode denial_code = ErrorCode::NONE;
    std::string denial_reason;

    [[nodiscard]] bool denied() const { return backend == BackendKind::NONE; }
};

struct RouteInput {
    const CodeSubmission& submission;
    const RiskAssessment& assessment;
    const ExecutionPolicy& policy;
    const BackendAvailability& availability;
    SecurityLevel level;
};

// First matching rule wins
struct RoutingRule {
    std::string_view name;
    bool (*matches)(const RouteInput&);
    BackendKind backend;
};

/**
 * @brief Pure routing: (submission, assessment, policy, availability) -> decision
 *
 * Rule order:
 *   1. control directives go to the command interpreter
 *   2. languages outside the allow-list are denied
 *   3. maximum/balanced go to the container sandbox when it is up
 *   4. everything else runs as a host subprocess
 *   5. no backend left: denied as unavailable
 *
 * Risk never changes the route; HIGH/CRITICAL only raises the alert flag.
 */
class ExecutionRouter {
public:
    [[nodiscard]] static RouteDecision route(const CodeSubmission& submission,
                                             const RiskAssessment& assessment,
                                             const ExecutionPolicy& policy,
                                             const BackendAvailability& availability);

    /// "/status", "/container list" ... or anything submitted as language "slash"
    [[nodiscard]] static bool is_directive(const CodeSubmission& submission);

    [[nodiscard]] static std::span<const RoutingRule> rules();
};

} // namespace codegate
