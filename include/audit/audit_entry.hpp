#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codegate {

// One immutable record per execution. The source itself is only attached
// in enterprise mode; otherwise code_sha256 identifies it.
struct AuditEntry {
    // Identity / ordering
    std::string execution_id;
    uint64_t sequence_num = 0;
    std::chrono::system_clock::time_point received_at;
    std::chrono::system_clock::time_point completed_at;

    // Submission
    std::string language;
    std::string code_sha256;
    size_t code_length = 0;
    SecurityLevel requested_level = SecurityLevel::BALANCED;
    bool quantum = false;

    // Risk summary
    RiskLevel risk_level = RiskLevel::LOW;
    int risk_score = 0;
    int complexity_score = 1;
    size_t violation_count = 0;
    std::vector<std::string> failed_frameworks;
    bool alerted = false;

    // Routing / outcome
    std::string routing_rule;
    BackendKind backend = BackendKind::NONE;
    IsolationLevel isolation = IsolationLevel::DENIED;
    std::optional<std::string> sandbox_id;
    bool success = false;
    ErrorCode error_code = ErrorCode::NONE;
    int exit_code = -1;
    std::chrono::microseconds elapsed{0};
    uint64_t memory_used_bytes = 0;

    // Enterprise attachments
    std::optional<std::string> source;
    std::optional<nlohmann::json> detail;       // full assessment + backend result

    // Integrity (hash chain)
    std::string previous_hash;
    std::string record_hash;
};

} // namespace codegate
