#include "executor/command_interpreter.hpp"
#include "audit/audit_recorder.hpp"
#include "core/performance_tracker.hpp"
#include "core/utils.hpp"
#include "executor/container_sandbox_backend.hpp"
#include "policy/execution_policy.hpp"

#include <algorithm>
#include <format>

namespace codegate {

namespace {

ExecutionBackendResult command_output(std::string text, std::chrono::microseconds elapsed) {
    ExecutionBackendResult r;
    r.success = true;
    r.backend = BackendKind::COMMAND;
    r.isolation = IsolationLevel::COMMAND;
    r.exit_code = 0;
    r.stdout_data = std::move(text);
    r.elapsed = elapsed;
    return r;
}

ExecutionBackendResult command_error(std::string message) {
    auto r = ExecutionBackendResult::failure(BackendKind::COMMAND, IsolationLevel::COMMAND,
                                             ErrorCode::INVALID_REQUEST, std::move(message));
    r.exit_code = 2;
    return r;
}

size_t listing_limit(const std::vector<std::string>& args, size_t index) {
    if (args.size() <= index) return CommandInterpreter::kDefaultListing;
    const auto n = utils::try_parse_int<size_t>(args[index]);
    return (n && *n > 0) ? *n : CommandInterpreter::kDefaultListing;
}

} // anonymous namespace

const std::vector<std::string>& CommandInterpreter::directives() {
    static const std::vector<std::string> kDirectives{
        "/help", "/status", "/container", "/performance", "/audit", "/cleanup"};
    return kDirectives;
}

bool CommandInterpreter::recognizes(std::string_view code) {
    const auto tokens = utils::split_whitespace(code);
    if (tokens.empty() || !tokens.front().starts_with('/')) return false;
    const auto& known = directives();
    return std::find(known.begin(), known.end(), utils::to_lower(tokens.front())) != known.end();
}

ExecutionBackendResult CommandInterpreter::execute(const CodeSubmission& submission) {
    utils::Timer timer;
    auto args = utils::split_whitespace(submission.code);
    if (args.empty()) {
        return command_error("Empty command. Try /help");
    }
    for (auto& a : args) a = utils::to_lower(a);

    const std::string& cmd = args.front();
    utils::log::debug(std::format("Control directive: {}", cmd));

    if (cmd == "/help") return command_output(help(), timer.elapsed_us());
    if (cmd == "/status") return command_output(status(), timer.elapsed_us());
    if (cmd == "/performance") {
        return command_output(performance(listing_limit(args, 1)), timer.elapsed_us());
    }
    if (cmd == "/audit") return command_output(audit(listing_limit(args, 1)), timer.elapsed_us());
    if (cmd == "/container") {
        auto r = container(args);
        r.elapsed = timer.elapsed_us();
        return r;
    }
    if (cmd == "/cleanup") {
        auto r = container({"/container", "cleanup"});
        r.elapsed = timer.elapsed_us();
        return r;
    }

    return command_error(std::format("Unknown command '{}'. Try /help", cmd));
}

// ============================================================================
// Directives
// ============================================================================

std::string CommandInterpreter::help() const {
    return "Available commands:\n"
           "  /help                     show this message\n"
           "  /status                   gateway policy and backend status\n"
           "  /container status         container runtime information\n"
           "  /container list           running gateway containers\n"
           "  /container cleanup        remove leftover gateway containers\n"
           "  /performance [N]          performance summary and last N samples\n"
           "  /audit [N]                last N audit entries\n"
           "  /cleanup                  alias for /container cleanup\n";
}

std::string CommandInterpreter::status() const {
    std::string out = "Gateway status\n";
    if (ctx_.policy) {
        out += std::format("  security level:   {}\n", security_level_to_string(ctx_.policy->security_level()));
        out += std::format("  languages:        {}\n", utils::join(ctx_.policy->allowed_languages(), ", "));
        out += std::format("  max time:         {}s\n", ctx_.policy->max_execution_time().count());
        out += std::format("  max memory:       {}MB\n", ctx_.policy->max_memory_mb());
        out += std::format("  enterprise mode:  {}\n", utils::booltostr(ctx_.policy->enterprise_mode()));
    }
    if (ctx_.container) {
        out += std::format("  container ({}):  {}\n", ctx_.container->name(),
                           ctx_.container->is_available() ? "available" : "unavailable");
    } else {
        out += "  container:        disabled\n";
    }
    if (ctx_.performance) {
        const auto s = ctx_.performance->summary();
        out += std::format("  samples:          {} (trend: {})\n", s.samples, trend_to_string(s.trend));
    }
    if (ctx_.audit) {
        const auto stats = ctx_.audit->get_stats();
        out += std::format("  audit entries:    {} (write failures: {})\n",
                           ctx_.audit->size(), stats.sink_write_failures + stats.record_failures);
    }
    return out;
}

ExecutionBackendResult CommandInterpreter::container(const std::vector<std::string>& args) {
    if (!ctx_.container) {
        return command_output("Container backend is disabled\n", {});
    }

    const std::string sub = args.size() > 1 ? args[1] : "status";
    if (sub == "status") {
        // Explicit status request re-probes the runtime
        ctx_.container->reset_availability();
        const auto info = ctx_.container->system_info();
        if (!info) {
            return command_output(std::format("Container runtime '{}' is not available\n",
                                              ctx_.container->name()), {});
        }
        return command_output(std::format("Container runtime '{}'\n{}\n",
                                          ctx_.container->name(), *info), {});
    }
    if (sub == "list") {
        const auto names = ctx_.container->list_instances();
        if (names.empty()) return command_output("No gateway containers running\n", {});
        std::string out = std::format("{} gateway container(s):\n", names.size());
        for (const auto& n : names) out += std::format("  {}\n", n);
        return command_output(std::move(out), {});
    }
    if (sub == "cleanup") {
        const size_t removed = ctx_.container->cleanup();
        return command_output(std::format("Removed {} container(s)\n", removed), {});
    }

    return command_error(std::format("Unknown container command '{}'. Use status, list or cleanup", sub));
}

std::string CommandInterpreter::performance(size_t limit) const {
    if (!ctx_.performance) return "Performance tracking is disabled\n";

    const auto s = ctx_.performance->summary();
    if (s.samples == 0) return "No performance samples recorded\n";

    std::string out = std::format(
        "Performance summary: {} samples, {} successful, mean {}us, mean memory {} bytes, trend {}\n",
        s.samples, s.successful, s.mean_elapsed.count(), s.mean_memory_bytes, trend_to_string(s.trend));
    for (const auto& [backend, count] : s.by_backend) {
        out += std::format("  {}: {}\n", backend, count);
    }
    out += std::format("Last {} samples:\n", std::min(limit, s.samples));
    for (const auto& sample : ctx_.performance->recent(limit)) {
        out += std::format("  {} {} {}us {} bytes complexity={} {}\n",
                           utils::format_timestamp(sample.timestamp), sample.language,
                           sample.elapsed.count(), sample.memory_bytes, sample.complexity_score,
                           sample.success ? "ok" : "failed");
    }
    return out;
}

std::string CommandInterpreter::audit(size_t limit) const {
    if (!ctx_.audit) return "Audit log is disabled\n";

    const auto entries = ctx_.audit->recent(limit);
    if (entries.empty()) return "No audit entries recorded\n";

    std::string out = std::format("Last {} audit entries:\n", entries.size());
    for (const auto& e : entries) {
        out += std::format("  #{} {} {} risk={} backend={} isolation={} {}\n",
                           e.sequence_num, e.execution_id, e.language,
                           risk_level_to_string(e.risk_level), backend_to_string(e.backend),
                           isolation_to_string(e.isolation),
                           e.success ? "ok" : error_code_to_string(e.error_code));
    }
    return out;
}

} // namespace codegate
