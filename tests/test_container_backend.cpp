#include <catch2/catch_test_macros.hpp>
#include "core/scoped_temp_dir.hpp"
#include "core/utils.hpp"
#include "executor/container_sandbox_backend.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace codegate;

namespace {

// Stands in for podman: answers the probe, stats, ps, rm and version
// subcommands and runs the last `run` argument with /bin/sh
constexpr const char* kFakeRuntime = R"(#!/bin/sh
dir=$(dirname "$0")
case "$1" in
  --version) echo "fakeman version 9.9.9" ;;
  version)   echo "Version: 9.9.9" ;;
  stats)     echo "12.5MiB / 256MiB" ;;
  ps)        printf 'codegate-python-0000aaaa\ncodegate-bash-0000bbbb\nunrelated-box\n' ;;
  rm)        echo "$3" >> "$dir/removed.log" ;;
  run)
    printf '%s\n' "$@" > "$dir/run.args"
    for last; do :; done
    exec /bin/sh -c "$last"
    ;;
  *) exit 64 ;;
esac
)";

std::string read_file_contents(const std::filesystem::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

struct FakeRuntime {
    ScopedTempDir dir{{}, "codegate-fakeman-"};
    std::filesystem::path script;

    FakeRuntime() {
        script = dir.path() / "fakeman";
        {
            std::ofstream f(script);
            f << kFakeRuntime;
        }
        std::filesystem::permissions(script, std::filesystem::perms::owner_all);
    }

    [[nodiscard]] ContainerConfig config() const {
        ContainerConfig cfg;
        cfg.runtime = script.string();
        cfg.grace_period_s = 3;
        cfg.probe_timeout_s = 5;
        cfg.stats_interval_ms = 20;
        return cfg;
    }

    [[nodiscard]] std::vector<std::string> run_args() const {
        return utils::split(read_file_contents(dir.path() / "run.args"), '\n');
    }

    [[nodiscard]] std::string removed() const {
        return read_file_contents(dir.path() / "removed.log");
    }
};

ExecutionPolicy short_policy(int seconds = 30) {
    ExecutionPolicy::Config cfg;
    cfg.max_execution_time = std::chrono::seconds(seconds);
    cfg.max_memory_mb = 128;
    return ExecutionPolicy(cfg);
}

} // anonymous namespace

// ============================================================================
// Pure helpers
// ============================================================================

TEST_CASE("ContainerBackend: run arguments for maximum isolation", "[container]") {
    ContainerSandboxBackend::Profile profile;
    profile.container_name = "codegate-python-deadbeef";
    profile.image = "python:3.11-alpine";
    profile.command = {"python", "-c"};
    profile.memory_mb = 256;
    profile.timeout_s = 30;
    profile.network_disabled = true;
    profile.read_only_root = true;

    const auto args = ContainerSandboxBackend::build_run_args("podman", profile, "print(1)");
    const std::vector<std::string> expected{
        "podman", "run", "--rm", "--name", "codegate-python-deadbeef",
        "--memory", "256m", "--timeout", "30", "--network", "none", "--read-only",
        "--cap-drop", "ALL", "python:3.11-alpine", "python", "-c", "print(1)"};
    CHECK(args == expected);
}

TEST_CASE("ContainerBackend: balanced keeps network and a writable root", "[container]") {
    ContainerSandboxBackend::Profile profile;
    profile.container_name = "c";
    profile.image = "alpine:latest";
    profile.command = {"sh", "-c"};
    profile.network_disabled = false;
    profile.read_only_root = false;

    const auto args = ContainerSandboxBackend::build_run_args("podman", profile, "echo hi");
    CHECK(std::find(args.begin(), args.end(), "slirp4netns") != args.end());
    CHECK(std::find(args.begin(), args.end(), "--read-only=false") != args.end());
    CHECK(std::find(args.begin(), args.end(), "--read-only") == args.end());
    CHECK(args.back() == "echo hi");
}

TEST_CASE("ContainerBackend: profiles follow policy and level", "[container]") {
    const auto policy = short_policy(12);
    ContainerSandboxBackend backend(ContainerConfig{}, GatewayConfig::default_runtimes(), policy);

    const auto maximum = backend.make_profile("python", SecurityLevel::MAXIMUM);
    REQUIRE(maximum.has_value());
    CHECK(maximum->image == "python:3.11-alpine");
    CHECK(maximum->command == std::vector<std::string>{"python", "-c"});
    CHECK(maximum->memory_mb == 128);
    CHECK(maximum->timeout_s == 12);
    CHECK(maximum->network_disabled);
    CHECK(maximum->read_only_root);
    CHECK(maximum->container_name.starts_with("codegate-python-"));
    CHECK(maximum->container_name.size() == std::string("codegate-python-").size() + 8);

    const auto balanced = backend.make_profile("python", SecurityLevel::BALANCED);
    REQUIRE(balanced.has_value());
    CHECK_FALSE(balanced->network_disabled);
    CHECK_FALSE(balanced->read_only_root);
    CHECK(balanced->container_name != maximum->container_name);

    CHECK_FALSE(backend.make_profile("cobol", SecurityLevel::MAXIMUM).has_value());
}

TEST_CASE("ContainerBackend: parse_mem_usage", "[container]") {
    CHECK(ContainerSandboxBackend::parse_mem_usage("12.5MiB / 256MiB") == 13107200);
    CHECK(ContainerSandboxBackend::parse_mem_usage("1GiB / 2GiB") == 1073741824ULL);
    CHECK(ContainerSandboxBackend::parse_mem_usage("512KiB / 1GiB") == 524288);
    CHECK(ContainerSandboxBackend::parse_mem_usage("2.5MB / 1GB") == 2500000);
    CHECK(ContainerSandboxBackend::parse_mem_usage("900B / 1GB") == 900);
    CHECK(ContainerSandboxBackend::parse_mem_usage("  3kB / 1GB\n") == 3000);
    CHECK(ContainerSandboxBackend::parse_mem_usage("--") == 0);
    CHECK(ContainerSandboxBackend::parse_mem_usage("") == 0);
    CHECK(ContainerSandboxBackend::parse_mem_usage("12 parsecs / 1GB") == 0);
}

TEST_CASE("ContainerBackend: isolation labels", "[container]") {
    CHECK(ContainerSandboxBackend::isolation_for(SecurityLevel::MAXIMUM) == IsolationLevel::SANDBOX_MAXIMUM);
    CHECK(ContainerSandboxBackend::isolation_for(SecurityLevel::BALANCED) == IsolationLevel::SANDBOX_BALANCED);
}

// ============================================================================
// Availability
// ============================================================================

TEST_CASE("ContainerBackend: missing runtime is unavailable", "[container][availability]") {
    const auto policy = short_policy();
    ContainerConfig cfg;
    cfg.runtime = "/nonexistent/codegate/podman";
    ContainerSandboxBackend backend(cfg, GatewayConfig::default_runtimes(), policy);

    CHECK_FALSE(backend.is_available());
    CHECK_FALSE(backend.system_info().has_value());
    CHECK(backend.list_instances().empty());
    CHECK(backend.cleanup() == 0);

    const auto result = backend.execute(CodeSubmission("python", "print(1)"), SecurityLevel::MAXIMUM);
    CHECK_FALSE(result.success);
    CHECK(result.unavailable());
    CHECK(result.backend == BackendKind::CONTAINER);
    CHECK(result.stderr_data.find("is not available") != std::string::npos);
}

TEST_CASE("ContainerBackend: disabled config is never available", "[container][availability]") {
    FakeRuntime fake;
    const auto policy = short_policy();
    auto cfg = fake.config();
    cfg.enabled = false;
    ContainerSandboxBackend backend(cfg, GatewayConfig::default_runtimes(), policy);

    CHECK_FALSE(backend.is_available());
}

TEST_CASE("ContainerBackend: probe result is cached until reset", "[container][availability]") {
    ScopedTempDir dir({}, "codegate-probe-");
    REQUIRE(dir.valid());
    const auto script = dir.path() / "lateman";

    const auto policy = short_policy();
    ContainerConfig cfg;
    cfg.runtime = script.string();
    ContainerSandboxBackend backend(cfg, GatewayConfig::default_runtimes(), policy);

    CHECK_FALSE(backend.is_available());

    {
        std::ofstream f(script);
        f << "#!/bin/sh\necho lateman 1.0\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    CHECK_FALSE(backend.is_available());
    backend.reset_availability();
    CHECK(backend.is_available());
}

TEST_CASE("ContainerBackend: failed probe is retried after the interval", "[container][availability]") {
    ScopedTempDir dir({}, "codegate-probe-");
    REQUIRE(dir.valid());
    const auto script = dir.path() / "lateman";

    const auto policy = short_policy();
    ContainerConfig cfg;
    cfg.runtime = script.string();
    cfg.probe_retry_s = 0;
    ContainerSandboxBackend backend(cfg, GatewayConfig::default_runtimes(), policy);

    CHECK_FALSE(backend.is_available());
    {
        std::ofstream f(script);
        f << "#!/bin/sh\necho lateman 1.0\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    CHECK(backend.is_available());
}

TEST_CASE("ContainerBackend: concurrent probes do not queue behind each other", "[container][availability]") {
    ScopedTempDir dir({}, "codegate-probe-");
    REQUIRE(dir.valid());
    const auto script = dir.path() / "slowman";
    {
        std::ofstream f(script);
        f << "#!/bin/sh\nsleep 1\necho slowman 1.0\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    const auto policy = short_policy();
    ContainerConfig cfg;
    cfg.runtime = script.string();
    ContainerSandboxBackend backend(cfg, GatewayConfig::default_runtimes(), policy);

    const utils::Timer timer;
    bool first = false;
    bool second = false;
    std::thread a([&] { first = backend.is_available(); });
    std::thread b([&] { second = backend.is_available(); });
    a.join();
    b.join();

    CHECK(first);
    CHECK(second);
    CHECK(timer.elapsed_ms() < std::chrono::milliseconds(1800));
}

// ============================================================================
// Execution against a fake runtime
// ============================================================================

TEST_CASE("ContainerBackend: successful run", "[container][execute]") {
    FakeRuntime fake;
    REQUIRE(fake.dir.valid());
    const auto policy = short_policy();
    ContainerSandboxBackend backend(fake.config(), GatewayConfig::default_runtimes(), policy);
    REQUIRE(backend.is_available());

    const auto result = backend.execute(CodeSubmission("bash", "sleep 0.3; echo sandboxed"),
                                        SecurityLevel::MAXIMUM);
    CHECK(result.success);
    CHECK(result.error_code == ErrorCode::NONE);
    CHECK(result.exit_code == 0);
    CHECK(result.stdout_data == "sandboxed\n");
    CHECK(result.backend == BackendKind::CONTAINER);
    CHECK(result.isolation == IsolationLevel::SANDBOX_MAXIMUM);
    REQUIRE(result.sandbox_id.has_value());
    CHECK(result.sandbox_id->starts_with("codegate-bash-"));
    CHECK(result.memory_used_bytes == 13107200);

    const auto args = fake.run_args();
    REQUIRE(args.size() >= 3);
    CHECK(args[0] == "run");
    CHECK(std::find(args.begin(), args.end(), "128m") != args.end());
    CHECK(std::find(args.begin(), args.end(), "alpine:latest") != args.end());
    CHECK(std::find(args.begin(), args.end(), *result.sandbox_id) != args.end());
}

TEST_CASE("ContainerBackend: non-zero exit is an execution failure", "[container][execute]") {
    FakeRuntime fake;
    const auto policy = short_policy();
    ContainerSandboxBackend backend(fake.config(), GatewayConfig::default_runtimes(), policy);

    const auto result = backend.execute(CodeSubmission("bash", "echo oops >&2; exit 7"),
                                        SecurityLevel::BALANCED);
    CHECK_FALSE(result.success);
    CHECK(result.error_code == ErrorCode::EXECUTION_FAILURE);
    CHECK(result.exit_code == 7);
    CHECK(result.stderr_data == "oops\n");
    CHECK(result.isolation == IsolationLevel::SANDBOX_BALANCED);
}

TEST_CASE("ContainerBackend: host deadline removes the container", "[container][execute][timeout]") {
    FakeRuntime fake;
    const auto policy = short_policy(1);
    auto cfg = fake.config();
    cfg.grace_period_s = 1;
    ContainerSandboxBackend backend(cfg, GatewayConfig::default_runtimes(), policy);

    const auto result = backend.execute(CodeSubmission("bash", "sleep 10"), SecurityLevel::MAXIMUM);
    CHECK_FALSE(result.success);
    CHECK(result.timed_out());
    CHECK(result.stderr_data.find("Execution timed out after 1s") != std::string::npos);
    REQUIRE(result.sandbox_id.has_value());
    CHECK(fake.removed().find(*result.sandbox_id) != std::string::npos);
}

TEST_CASE("ContainerBackend: runtime-side timeout is reported as timeout", "[container][execute][timeout]") {
    FakeRuntime fake;
    const auto policy = short_policy(1);
    ContainerSandboxBackend backend(fake.config(), GatewayConfig::default_runtimes(), policy);

    // Exits non-zero once the runtime's own --timeout would have fired
    const auto result = backend.execute(CodeSubmission("bash", "sleep 1; exit 124"),
                                        SecurityLevel::MAXIMUM);
    CHECK_FALSE(result.success);
    CHECK(result.timed_out());
    CHECK(result.exit_code == 124);
}

TEST_CASE("ContainerBackend: in-flight containers are tracked and removable", "[container][execute][cleanup]") {
    FakeRuntime fake;
    const auto policy = short_policy();
    ContainerSandboxBackend backend(fake.config(), GatewayConfig::default_runtimes(), policy);
    REQUIRE(backend.is_available());

    ExecutionBackendResult result;
    std::thread runner([&] {
        result = backend.execute(CodeSubmission("bash", "sleep 1; echo done"), SecurityLevel::MAXIMUM);
    });

    std::vector<std::string> active;
    for (int i = 0; i < 200 && active.empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        active = backend.active_instances();
    }
    REQUIRE(active.size() == 1);
    CHECK(active[0].starts_with("codegate-bash-"));
    CHECK(backend.remove_active() == 1);
    CHECK(fake.removed() == active[0] + "\n");

    runner.join();
    CHECK(result.success);
    CHECK(result.sandbox_id == active[0]);
    CHECK(backend.active_instances().empty());
}

TEST_CASE("ContainerBackend: language without an image", "[container][execute]") {
    FakeRuntime fake;
    const auto policy = short_policy();
    ContainerSandboxBackend backend(fake.config(), GatewayConfig::default_runtimes(), policy);

    const auto result = backend.execute(CodeSubmission("cobol", "DISPLAY 'HI'"), SecurityLevel::MAXIMUM);
    CHECK_FALSE(result.success);
    CHECK(result.error_code == ErrorCode::INVALID_REQUEST);
}

// ============================================================================
// Management
// ============================================================================

TEST_CASE("ContainerBackend: system_info and listing", "[container][manage]") {
    FakeRuntime fake;
    const auto policy = short_policy();
    ContainerSandboxBackend backend(fake.config(), GatewayConfig::default_runtimes(), policy);

    const auto info = backend.system_info();
    REQUIRE(info.has_value());
    CHECK(*info == "Version: 9.9.9");

    const auto names = backend.list_instances();
    CHECK(names == std::vector<std::string>{"codegate-python-0000aaaa", "codegate-bash-0000bbbb"});
}

TEST_CASE("ContainerBackend: cleanup removes prefixed containers", "[container][manage]") {
    FakeRuntime fake;
    const auto policy = short_policy();
    ContainerSandboxBackend backend(fake.config(), GatewayConfig::default_runtimes(), policy);

    CHECK(backend.cleanup() == 2);
    CHECK(fake.removed() == "codegate-python-0000aaaa\ncodegate-bash-0000bbbb\n");
}
