#include "executor/subprocess_backend.hpp"
#include "core/process_runner.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>

namespace codegate {

SubprocessBackend::SubprocessBackend(SubprocessConfig config,
                                     std::vector<RuntimeConfig> runtimes,
                                     const ExecutionPolicy& policy)
    : config_(std::move(config)),
      runtimes_(std::move(runtimes)),
      policy_(policy) {}

const RuntimeConfig* SubprocessBackend::find_runtime(std::string_view language) const {
    for (const auto& rt : runtimes_) {
        if (rt.language == language) return &rt;
    }
    return nullptr;
}

bool SubprocessBackend::supports(std::string_view language) const {
    const auto* rt = find_runtime(language);
    return rt != nullptr && !rt->host_command.empty() &&
           ProcessRunner::find_executable(rt->host_command.front());
}

bool SubprocessBackend::is_available() {
    if (!config_.enabled) return false;
    for (const auto& rt : runtimes_) {
        if (supports(rt.language)) return true;
    }
    return false;
}

ExecutionBackendResult SubprocessBackend::execute(const CodeSubmission& submission,
                                                  SecurityLevel /*level*/) {
    constexpr auto kIsolation = IsolationLevel::SUBPROCESS;

    if (!config_.enabled) {
        return ExecutionBackendResult::failure(BackendKind::SUBPROCESS, kIsolation,
            ErrorCode::BACKEND_UNAVAILABLE, "Subprocess execution is disabled");
    }

    const auto* runtime = find_runtime(submission.language);
    if (runtime == nullptr || runtime->host_command.empty()) {
        return ExecutionBackendResult::failure(BackendKind::SUBPROCESS, kIsolation,
            ErrorCode::INVALID_REQUEST,
            std::format("No host interpreter configured for '{}'", submission.language));
    }

    ScopedTempDir workdir(config_.temp_root);
    if (!workdir.valid()) {
        return ExecutionBackendResult::failure(BackendKind::SUBPROCESS, kIsolation,
            ErrorCode::INTERNAL_ERROR, "Failed to create temporary working directory");
    }

    ProcessSpec spec;
    spec.argv = runtime->host_command;
    spec.working_dir = workdir.path().string();
    spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(policy_.max_execution_time());
    spec.max_output_bytes = config_.max_output_bytes;

    if (runtime->inline_code) {
        spec.argv.push_back(submission.code);
    } else {
        const auto script = workdir.path() / std::format("main{}", runtime->script_extension);
        std::ofstream out(script, std::ios::binary);
        out << submission.code;
        out.close();
        if (!out) {
            return ExecutionBackendResult::failure(BackendKind::SUBPROCESS, kIsolation,
                ErrorCode::INTERNAL_ERROR,
                std::format("Failed to write script file {}", script.string()));
        }
        spec.argv.push_back(script.string());
    }

    const auto outcome = ProcessRunner::run(spec);

    if (!outcome.launched) {
        return ExecutionBackendResult::failure(BackendKind::SUBPROCESS, kIsolation,
            ErrorCode::BACKEND_UNAVAILABLE,
            std::format("Failed to launch '{}': {}", runtime->host_command.front(),
                        outcome.launch_error));
    }

    ExecutionBackendResult result;
    result.backend = BackendKind::SUBPROCESS;
    result.isolation = kIsolation;
    result.stdout_data = outcome.stdout_data;
    result.stderr_data = outcome.stderr_data;
    result.elapsed = outcome.elapsed;
    result.memory_used_bytes = outcome.peak_rss_bytes;
    result.exit_code = outcome.exit_code;

    if (outcome.timed_out) {
        result.success = false;
        result.error_code = ErrorCode::EXECUTION_TIMEOUT;
        result.stderr_data += std::format("\nExecution timed out after {}s",
                                          policy_.max_execution_time().count());
        utils::log::warn(std::format("Subprocess ({}) killed after timeout", submission.language));
        return result;
    }

    result.success = (outcome.exit_code == 0);
    result.error_code = result.success ? ErrorCode::NONE : ErrorCode::EXECUTION_FAILURE;
    return result;
}

} // namespace codegate
