#pragma once

#include "audit/audit_entry.hpp"
#include "audit/audit_sink.hpp"
#include "config/config_types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace codegate {

/**
 * @brief Append-only audit log for executions
 *
 * Sequence numbers are reserved when a request arrives, so entries() returns
 * submission order even when executions complete out of order. record()
 * never throws: serialization or sink failures are logged and counted.
 *
 * Persistence is asynchronous. record() links the entry into the SHA-256
 * hash chain and queues its JSONL line under the lock; a background writer
 * drains the queue into every sink:
 *
 *   record() --> [pending lines] --writer thread--> [FileSink] ...
 */
class AuditRecorder {
public:
    struct Config {
        std::chrono::milliseconds flush_interval{100};
        bool integrity_enabled = true;
    };

    /// In-memory only (no sinks)
    AuditRecorder() : AuditRecorder(Config{}, {}) {}

    /// Builds a FileSink from [audit] when enabled. An unopenable file is
    /// logged and the recorder continues in memory.
    explicit AuditRecorder(const AuditConfig& config);

    AuditRecorder(Config config, std::vector<std::unique_ptr<IAuditSink>> sinks);

    ~AuditRecorder();

    AuditRecorder(const AuditRecorder&) = delete;
    AuditRecorder& operator=(const AuditRecorder&) = delete;

    /// Next submission sequence number (starts at 1)
    [[nodiscard]] uint64_t reserve_sequence();

    void record(AuditEntry entry) noexcept;

    /// All entries ordered by sequence number
    [[nodiscard]] std::vector<AuditEntry> entries() const;

    /// Last `n` entries in sequence order
    [[nodiscard]] std::vector<AuditEntry> recent(size_t n) const;

    [[nodiscard]] size_t size() const;

    /// Block until queued lines reach the sinks
    void flush();

    /// Drain, flush and close all sinks. Idempotent.
    void shutdown();

    struct Stats {
        uint64_t total_recorded;
        uint64_t total_written;
        uint64_t record_failures;
        uint64_t sink_write_failures;
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] static std::string compute_record_hash(const AuditEntry& entry,
                                                         const std::string& prev_hash);

    [[nodiscard]] static nlohmann::json to_json(const AuditEntry& entry);

private:
    void start();
    void writer_thread_func();
    void write_to_sinks(const std::string& data);

    Config config_;
    std::vector<std::unique_ptr<IAuditSink>> sinks_;

    // -- In-memory log, chain head and outbound queue --
    mutable std::mutex mutex_;
    std::map<uint64_t, AuditEntry> entries_;
    std::string previous_hash_;
    std::string pending_;
    size_t pending_count_ = 0;

    // -- Writer thread --
    std::thread writer_thread_;
    std::atomic<bool> running_{false};
    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    std::atomic<bool> flush_requested_{false};

    // -- Stats --
    std::atomic<uint64_t> sequence_counter_{0};
    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> record_failures_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
};

} // namespace codegate
