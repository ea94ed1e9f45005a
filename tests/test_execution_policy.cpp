#include <catch2/catch_test_macros.hpp>
#include "policy/execution_policy.hpp"

using namespace codegate;

TEST_CASE("ExecutionPolicy: defaults", "[policy]") {
    ExecutionPolicy policy;
    CHECK(policy.security_level() == SecurityLevel::BALANCED);
    CHECK(policy.max_execution_time() == std::chrono::seconds(30));
    CHECK(policy.max_memory_mb() == 256);
    CHECK_FALSE(policy.enterprise_mode());
    CHECK(policy.allows("python"));
    CHECK(policy.allows("javascript"));
    CHECK(policy.allows("bash"));
}

TEST_CASE("ExecutionPolicy: allow-list is normalized", "[policy]") {
    ExecutionPolicy::Config cfg;
    cfg.allowed_languages = {" Python ", "JS", ""};
    ExecutionPolicy policy(cfg);

    CHECK(policy.allowed_languages() == std::vector<std::string>{"python", "javascript"});
    CHECK(policy.allows("PYTHON"));
    CHECK(policy.allows("node"));
    CHECK_FALSE(policy.allows("bash"));
    CHECK_FALSE(policy.allows(""));
}

TEST_CASE("ExecutionPolicy: from_config", "[policy]") {
    PolicyConfig section;
    section.security_level = "Maximum";
    section.allowed_languages = {"python"};
    section.max_execution_time_s = 7;
    section.max_memory_mb = 64;
    section.enterprise_mode = true;

    const auto policy = ExecutionPolicy::from_config(section);
    CHECK(policy.security_level() == SecurityLevel::MAXIMUM);
    CHECK(policy.max_execution_time() == std::chrono::seconds(7));
    CHECK(policy.max_memory_mb() == 64);
    CHECK(policy.enterprise_mode());
    CHECK_FALSE(policy.allows("javascript"));
}

TEST_CASE("ExecutionPolicy: unknown level falls back to balanced", "[policy]") {
    PolicyConfig section;
    section.security_level = "paranoid";
    CHECK(ExecutionPolicy::from_config(section).security_level() == SecurityLevel::BALANCED);
}

TEST_CASE("ExecutionPolicy: requested level overrides the policy level", "[policy]") {
    ExecutionPolicy::Config cfg;
    cfg.security_level = SecurityLevel::MAXIMUM;
    ExecutionPolicy policy(cfg);

    CodeSubmission plain("python", "print(1)");
    CHECK(policy.effective_level(plain) == SecurityLevel::MAXIMUM);

    CodeSubmission dev("python", "print(1)", SecurityLevel::DEVELOPMENT);
    CHECK(policy.effective_level(dev) == SecurityLevel::DEVELOPMENT);
}

TEST_CASE("Types: language aliases", "[policy][types]") {
    CHECK(normalize_language("JS") == "javascript");
    CHECK(normalize_language("node") == "javascript");
    CHECK(normalize_language("sh") == "bash");
    CHECK(normalize_language("python3") == "python");
    CHECK(normalize_language(" Ruby ") == "ruby");

    CodeSubmission s("Py", "x = 1");
    CHECK(s.language == "python");
}

TEST_CASE("Types: enum strings", "[policy][types]") {
    CHECK(std::string(isolation_to_string(IsolationLevel::SANDBOX_MAXIMUM)) == "maximum");
    CHECK(std::string(isolation_to_string(IsolationLevel::SUBPROCESS)) == "subprocess");
    CHECK(std::string(error_code_to_string(ErrorCode::CONFIGURATION_DENIED)) == "CONFIGURATION_DENIED");
    CHECK(parse_security_level(" BALANCED ") == SecurityLevel::BALANCED);
    CHECK_FALSE(parse_security_level("strict").has_value());
    CHECK(is_sandboxed(IsolationLevel::SANDBOX_BALANCED));
    CHECK_FALSE(is_sandboxed(IsolationLevel::SUBPROCESS));
    CHECK_FALSE(is_sandboxed(IsolationLevel::COMMAND));
}
