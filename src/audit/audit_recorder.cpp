#include "audit/audit_recorder.hpp"
#include "audit/file_sink.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace codegate {

// ============================================================================
// Construction / Destruction
// ============================================================================

AuditRecorder::AuditRecorder(const AuditConfig& config)
    : config_{config.flush_interval, config.integrity_enabled} {

    if (config.enabled) {
        FileSink::Config file_cfg;
        file_cfg.output_file = config.output_file;
        file_cfg.max_file_size_bytes = config.rotation_max_file_size_mb * 1024ULL * 1024;
        file_cfg.max_files = config.rotation_max_files;
        file_cfg.rotation_interval = std::chrono::hours(config.rotation_interval_hours);
        file_cfg.time_based_rotation = config.rotation_time_based;
        file_cfg.size_based_rotation = config.rotation_size_based;
        try {
            sinks_.push_back(std::make_unique<FileSink>(file_cfg));
        } catch (const std::exception& e) {
            utils::log::error(std::format("Audit persistence disabled: {}", e.what()));
        }
    }

    start();
}

AuditRecorder::AuditRecorder(Config config, std::vector<std::unique_ptr<IAuditSink>> sinks)
    : config_(config),
      sinks_(std::move(sinks)) {
    start();
}

AuditRecorder::~AuditRecorder() {
    shutdown();
}

void AuditRecorder::start() {
    if (sinks_.empty()) return;
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&AuditRecorder::writer_thread_func, this);
}

// ============================================================================
// Public Interface
// ============================================================================

uint64_t AuditRecorder::reserve_sequence() {
    return sequence_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
}

void AuditRecorder::record(AuditEntry entry) noexcept {
    try {
        if (entry.sequence_num == 0) {
            entry.sequence_num = reserve_sequence();
        }

        std::lock_guard lock(mutex_);
        if (config_.integrity_enabled) {
            entry.previous_hash = previous_hash_;
            entry.record_hash = compute_record_hash(entry, previous_hash_);
            previous_hash_ = entry.record_hash;
        }

        if (running_.load(std::memory_order_acquire)) {
            pending_ += to_json(entry).dump();
            pending_ += '\n';
            ++pending_count_;
        }

        const uint64_t seq = entry.sequence_num;
        entries_.insert_or_assign(seq, std::move(entry));
        total_recorded_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        record_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Audit record failed: {}", e.what()));
    }
}

std::vector<AuditEntry> AuditRecorder::entries() const {
    std::lock_guard lock(mutex_);
    std::vector<AuditEntry> out;
    out.reserve(entries_.size());
    for (const auto& [seq, entry] : entries_) {
        out.push_back(entry);
    }
    return out;
}

std::vector<AuditEntry> AuditRecorder::recent(size_t n) const {
    std::lock_guard lock(mutex_);
    std::vector<AuditEntry> out;
    const size_t skip = entries_.size() > n ? entries_.size() - n : 0;
    auto it = entries_.begin();
    std::advance(it, static_cast<std::ptrdiff_t>(skip));
    for (; it != entries_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

size_t AuditRecorder::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void AuditRecorder::flush() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        flush_requested_.store(true, std::memory_order_release);
    }
    flush_cv_.notify_one();

    while (flush_requested_.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
    }
}

void AuditRecorder::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    flush_cv_.notify_one();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
}

AuditRecorder::Stats AuditRecorder::get_stats() const {
    return Stats{
        .total_recorded = total_recorded_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .record_failures = record_failures_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void AuditRecorder::write_to_sinks(const std::string& data) {
    for (auto& sink : sinks_) {
        if (!sink->write(data)) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::error(std::format("Audit sink {} write failed", sink->name()));
        }
    }
}

void AuditRecorder::writer_thread_func() {
    const auto drain = [this] {
        std::string batch;
        size_t count = 0;
        {
            std::lock_guard lock(mutex_);
            batch.swap(pending_);
            count = pending_count_;
            pending_count_ = 0;
        }
        if (count == 0) return false;
        write_to_sinks(batch);
        total_written_.fetch_add(count, std::memory_order_relaxed);
        return true;
    };

    while (true) {
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            flush_cv_.wait_for(lock, config_.flush_interval, [this] {
                return flush_requested_.load(std::memory_order_acquire)
                    || !running_.load(std::memory_order_acquire);
            });
        }

        drain();

        if (flush_requested_.load(std::memory_order_acquire)) {
            // Lines recorded before flush() may have missed the drain above
            drain();
            for (auto& sink : sinks_) sink->flush();
            flush_requested_.store(false, std::memory_order_release);
        }

        if (!running_.load(std::memory_order_acquire)) {
            drain();
            for (auto& sink : sinks_) {
                sink->flush();
                sink->shutdown();
            }
            return;
        }
    }
}

// ============================================================================
// Serialization / Integrity
// ============================================================================

nlohmann::json AuditRecorder::to_json(const AuditEntry& e) {
    nlohmann::json j = {
        {"execution_id", e.execution_id},
        {"sequence_num", e.sequence_num},
        {"received_at", utils::format_timestamp(e.received_at)},
        {"completed_at", utils::format_timestamp(e.completed_at)},
        {"language", e.language},
        {"code_sha256", e.code_sha256},
        {"code_length", e.code_length},
        {"requested_level", security_level_to_string(e.requested_level)},
        {"quantum", e.quantum},
        {"risk_level", risk_level_to_string(e.risk_level)},
        {"risk_score", e.risk_score},
        {"complexity_score", e.complexity_score},
        {"violation_count", e.violation_count},
        {"failed_frameworks", e.failed_frameworks},
        {"alerted", e.alerted},
        {"routing_rule", e.routing_rule},
        {"backend", backend_to_string(e.backend)},
        {"isolation", isolation_to_string(e.isolation)},
        {"success", e.success},
        {"error_code", error_code_to_string(e.error_code)},
        {"exit_code", e.exit_code},
        {"elapsed_us", e.elapsed.count()},
        {"memory_used_bytes", e.memory_used_bytes},
    };
    if (e.sandbox_id) j["sandbox_id"] = *e.sandbox_id;
    if (e.source) j["source"] = *e.source;
    if (e.detail) j["detail"] = *e.detail;
    if (!e.record_hash.empty()) {
        j["record_hash"] = e.record_hash;
        j["previous_hash"] = e.previous_hash;
    }
    return j;
}

std::string AuditRecorder::compute_record_hash(const AuditEntry& entry,
                                               const std::string& prev_hash) {
    // sequence|completed_at|execution_id|code_sha256|risk|backend|isolation|success|previous
    const std::string input = std::format("{}|{}|{}|{}|{}|{}|{}|{}|{}",
        entry.sequence_num,
        utils::format_timestamp(entry.completed_at),
        entry.execution_id,
        entry.code_sha256,
        risk_level_to_string(entry.risk_level),
        backend_to_string(entry.backend),
        isolation_to_string(entry.isolation),
        utils::booltostr(entry.success),
        prev_hash);
    return digest::sha256_hex(input);
}

} // namespace codegate
