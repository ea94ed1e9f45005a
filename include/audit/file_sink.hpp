#pragma once

#include "audit/audit_sink.hpp"
#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>

namespace codegate {

/**
 * @brief Append-only JSONL audit file with size/time rotation
 *
 * Rotated generations are audit.jsonl.1 (newest) .. audit.jsonl.<max_files>
 * (oldest, deleted on the next rotation). Missing parent directories are
 * created on open. Throws std::runtime_error if the file cannot be opened.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = false;
        bool size_based_rotation = true;
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view lines) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    [[nodiscard]] bool rotation_due() const;
    void rotate();
    [[nodiscard]] std::string generation_name(int n) const;

    Config config_;
    std::ofstream out_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    std::chrono::system_clock::time_point opened_at_;
};

} // namespace codegate
