#include "executor/execution_router.hpp"
#include "executor/command_interpreter.hpp"

#include <array>
#include <format>

namespace codegate {

namespace {

bool match_directive(const RouteInput& in) {
    return ExecutionRouter::is_directive(in.submission);
}

bool match_language_denied(const RouteInput& in) {
    return !in.policy.allows(in.submission.language);
}

bool match_container(const RouteInput& in) {
    return in.availability.container &&
           (in.level == SecurityLevel::MAXIMUM || in.level == SecurityLevel::BALANCED);
}

bool match_subprocess(const RouteInput& in) {
    return in.availability.subprocess;
}

bool match_any(const RouteInput&) {
    return true;
}

constexpr std::array<RoutingRule, 5> kRules{{
    {"control_directive",   &match_directive,       BackendKind::COMMAND},
    {"language_denied",     &match_language_denied, BackendKind::NONE},
    {"container_sandbox",   &match_container,       BackendKind::CONTAINER},
    {"subprocess_fallback", &match_subprocess,      BackendKind::SUBPROCESS},
    {"no_backend",          &match_any,             BackendKind::NONE},
}};

IsolationLevel isolation_for(BackendKind backend, SecurityLevel level) {
    switch (backend) {
        case BackendKind::CONTAINER:
            return level == SecurityLevel::MAXIMUM ? IsolationLevel::SANDBOX_MAXIMUM
                                                   : IsolationLevel::SANDBOX_BALANCED;
        case BackendKind::SUBPROCESS: return IsolationLevel::SUBPROCESS;
        case BackendKind::COMMAND:    return IsolationLevel::COMMAND;
        case BackendKind::NONE:       return IsolationLevel::DENIED;
    }
    return IsolationLevel::DENIED;
}

} // anonymous namespace

std::span<const RoutingRule> ExecutionRouter::rules() {
    return kRules;
}

bool ExecutionRouter::is_directive(const CodeSubmission& submission) {
    if (submission.language == "slash") return true;
    return CommandInterpreter::recognizes(submission.code);
}

RouteDecision ExecutionRouter::route(const CodeSubmission& submission,
                                     const RiskAssessment& assessment,
                                     const ExecutionPolicy& policy,
                                     const BackendAvailability& availability) {
    const SecurityLevel level = policy.effective_level(submission);
    const RouteInput input{submission, assessment, policy, availability, level};

    RouteDecision decision;
    decision.effective_level = level;

    for (const auto& rule : kRules) {
        if (!rule.matches(input)) continue;

        decision.backend = rule.backend;
        decision.rule = rule.name;
        decision.isolation = isolation_for(rule.backend, level);
        break;
    }

    if (decision.denied()) {
        if (decision.rule == "language_denied") {
            decision.denial_code = ErrorCode::CONFIGURATION_DENIED;
            decision.denial_reason = std::format("Language '{}' is not allowed by policy",
                                                 submission.language);
        } else {
            decision.denial_code = ErrorCode::BACKEND_UNAVAILABLE;
            decision.denial_reason = "No execution backend is available";
        }
        return decision;
    }

    decision.alert = decision.backend != BackendKind::COMMAND &&
                     (assessment.risk_level == RiskLevel::HIGH ||
                      assessment.risk_level == RiskLevel::CRITICAL);
    return decision;
}

} // namespace codegate
