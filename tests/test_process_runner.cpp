#include <catch2/catch_test_macros.hpp>
#include "core/process_runner.hpp"
#include "core/scoped_temp_dir.hpp"
#include "core/utils.hpp"

#include <signal.h>

#include <filesystem>
#include <fstream>
#include <thread>

using namespace codegate;

namespace {

ProcessSpec shell(const std::string& script, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.timeout = timeout;
    return spec;
}

// Dead or a zombie waiting for init; waits up to two seconds
bool process_gone(pid_t pid) {
    const auto stat_path = std::filesystem::path("/proc") / std::to_string(pid) / "stat";
    for (int i = 0; i < 200; ++i) {
        std::ifstream f(stat_path);
        if (!f.is_open()) return true;
        std::string line;
        std::getline(f, line);
        const auto paren = line.rfind(')');
        if (paren != std::string::npos && paren + 2 < line.size()) {
            const char state = line[paren + 2];
            if (state == 'Z' || state == 'X') return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

pid_t background_pid(const ProcessOutcome& outcome) {
    const auto pid = utils::try_parse_int<pid_t>(utils::trim(outcome.stdout_data));
    return pid.value_or(-1);
}

} // anonymous namespace

TEST_CASE("ProcessRunner: captures stdout and exit code", "[process]") {
    const auto outcome = ProcessRunner::run(shell("echo hello"));
    REQUIRE(outcome.launched);
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.stdout_data == "hello\n");
    CHECK(outcome.stderr_data.empty());
    CHECK_FALSE(outcome.timed_out);
    CHECK(outcome.exited_cleanly());
    CHECK(outcome.pid > 0);
}

TEST_CASE("ProcessRunner: separates stderr and reports failure", "[process]") {
    const auto outcome = ProcessRunner::run(shell("echo out; echo err >&2; exit 3"));
    REQUIRE(outcome.launched);
    CHECK(outcome.exit_code == 3);
    CHECK(outcome.stdout_data == "out\n");
    CHECK(outcome.stderr_data == "err\n");
    CHECK_FALSE(outcome.exited_cleanly());
}

TEST_CASE("ProcessRunner: stdin is /dev/null", "[process]") {
    const auto outcome = ProcessRunner::run(shell("cat; echo done"));
    REQUIRE(outcome.launched);
    CHECK(outcome.stdout_data == "done\n");
}

TEST_CASE("ProcessRunner: deadline kills the process group", "[process][timeout]") {
    const auto outcome = ProcessRunner::run(shell("sleep 5 & sleep 5", std::chrono::milliseconds(200)));
    REQUIRE(outcome.launched);
    CHECK(outcome.timed_out);
    CHECK(outcome.term_signal == SIGKILL);
    CHECK(outcome.exit_code == -1);
    CHECK(outcome.elapsed < std::chrono::seconds(3));
}

TEST_CASE("ProcessRunner: background children die with the run", "[process][cleanup]") {
    SECTION("detached from the output pipes") {
        const auto outcome = ProcessRunner::run(shell("sleep 37 >/dev/null 2>&1 & echo $!"));
        REQUIRE(outcome.launched);
        CHECK_FALSE(outcome.timed_out);
        CHECK(outcome.exit_code == 0);
        const pid_t child = background_pid(outcome);
        REQUIRE(child > 0);
        CHECK(process_gone(child));
    }

    SECTION("holding the output pipe open") {
        const auto outcome = ProcessRunner::run(shell("sleep 38 & echo $!"));
        REQUIRE(outcome.launched);
        CHECK(outcome.exit_code == 0);
        CHECK(outcome.elapsed < std::chrono::seconds(3));
        const pid_t child = background_pid(outcome);
        REQUIRE(child > 0);
        CHECK(process_gone(child));
    }

    SECTION("after a timeout") {
        const auto outcome = ProcessRunner::run(
            shell("sleep 39 >/dev/null 2>&1 & echo $!; sleep 10", std::chrono::milliseconds(300)));
        REQUIRE(outcome.launched);
        CHECK(outcome.timed_out);
        const pid_t child = background_pid(outcome);
        REQUIRE(child > 0);
        CHECK(process_gone(child));
    }

    CHECK(ProcessRunner::running() == 0);
}

TEST_CASE("ProcessRunner: kill_all stops in-flight runs", "[process][cleanup]") {
    ProcessOutcome outcome;
    std::thread runner([&outcome] {
        outcome = ProcessRunner::run(shell("sleep 30", std::chrono::seconds(20)));
    });

    for (int i = 0; i < 200 && ProcessRunner::running() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(ProcessRunner::running() == 1);
    CHECK(ProcessRunner::kill_all() == 1);
    runner.join();

    REQUIRE(outcome.launched);
    CHECK_FALSE(outcome.timed_out);
    CHECK(outcome.term_signal == SIGKILL);
    CHECK(outcome.elapsed < std::chrono::seconds(10));
    CHECK(ProcessRunner::running() == 0);
}

TEST_CASE("ProcessRunner: output beyond the cap is discarded", "[process]") {
    auto spec = shell("i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done");
    spec.max_output_bytes = 100;
    const auto outcome = ProcessRunner::run(spec);
    REQUIRE(outcome.launched);
    CHECK(outcome.exit_code == 0);
    CHECK(outcome.stdout_data.size() == 100);
}

TEST_CASE("ProcessRunner: large output does not deadlock", "[process]") {
    auto spec = shell("head -c 200000 /dev/zero");
    const auto outcome = ProcessRunner::run(spec);
    REQUIRE(outcome.launched);
    CHECK_FALSE(outcome.timed_out);
    CHECK(outcome.stdout_data.size() == 200000);
}

TEST_CASE("ProcessRunner: working directory", "[process]") {
    ScopedTempDir dir({}, "codegate-runner-");
    REQUIRE(dir.valid());
    {
        std::ofstream f(dir.path() / "marker.txt");
        f << "present";
    }

    auto spec = shell("cat marker.txt");
    spec.working_dir = dir.path().string();
    const auto outcome = ProcessRunner::run(spec);
    REQUIRE(outcome.launched);
    CHECK(outcome.stdout_data == "present");
}

TEST_CASE("ProcessRunner: missing executable is a launch error", "[process]") {
    ProcessSpec spec;
    spec.argv = {"codegate-definitely-not-a-real-binary"};
    const auto outcome = ProcessRunner::run(spec);
    CHECK_FALSE(outcome.launched);
    CHECK(outcome.launch_error.find("exec codegate-definitely-not-a-real-binary failed") !=
          std::string::npos);
}

TEST_CASE("ProcessRunner: empty argv is rejected", "[process]") {
    const auto outcome = ProcessRunner::run(ProcessSpec{});
    CHECK_FALSE(outcome.launched);
    CHECK(outcome.launch_error == "empty command");
}

TEST_CASE("ProcessRunner: missing working directory is a launch error", "[process]") {
    auto spec = shell("true");
    spec.working_dir = "/nonexistent/codegate/dir";
    const auto outcome = ProcessRunner::run(spec);
    CHECK_FALSE(outcome.launched);
    CHECK_FALSE(outcome.launch_error.empty());
}

TEST_CASE("ProcessRunner: find_executable", "[process]") {
    CHECK(ProcessRunner::find_executable("sh"));
    CHECK(ProcessRunner::find_executable("/bin/sh"));
    CHECK_FALSE(ProcessRunner::find_executable("codegate-definitely-not-a-real-binary"));
    CHECK_FALSE(ProcessRunner::find_executable("/nonexistent/sh"));
    CHECK_FALSE(ProcessRunner::find_executable(""));
}

TEST_CASE("ProcessRunner: reports peak memory", "[process]") {
    const auto outcome = ProcessRunner::run(shell("true"));
    REQUIRE(outcome.launched);
    CHECK(outcome.peak_rss_bytes > 0);
}
