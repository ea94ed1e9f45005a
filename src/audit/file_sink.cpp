#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace codegate {

FileSink::FileSink(const Config& config)
    : config_(config),
      opened_at_(std::chrono::system_clock::now()) {
    std::error_code ec;
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    out_.open(config_.output_file, std::ios::app | std::ios::binary);
    if (!out_.is_open()) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }

    const auto size = std::filesystem::file_size(config_.output_file, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(size);
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view lines) {
    if (!out_.is_open()) return false;
    if (rotation_due()) rotate();

    out_.write(lines.data(), static_cast<std::streamsize>(lines.size()));
    current_file_size_ += lines.size();
    return out_.good();
}

void FileSink::flush() {
    if (out_.is_open()) out_.flush();
}

void FileSink::shutdown() {
    if (!out_.is_open()) return;
    out_.flush();
    out_.close();
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

bool FileSink::rotation_due() const {
    if (config_.size_based_rotation && current_file_size_ >= config_.max_file_size_bytes) {
        return true;
    }
    return config_.time_based_rotation &&
           std::chrono::system_clock::now() - opened_at_ >= config_.rotation_interval;
}

std::string FileSink::generation_name(int n) const {
    return std::format("{}.{}", config_.output_file, n);
}

void FileSink::rotate() {
    out_.flush();
    out_.close();

    // Missing generations are expected; rename/remove errors are ignored
    std::error_code ec;
    std::filesystem::remove(generation_name(config_.max_files), ec);
    for (int n = config_.max_files - 1; n >= 1; --n) {
        std::filesystem::rename(generation_name(n), generation_name(n + 1), ec);
    }
    std::filesystem::rename(config_.output_file, generation_name(1), ec);

    out_.open(config_.output_file, std::ios::app | std::ios::binary);
    if (!out_.is_open()) {
        utils::log::error(std::format("Audit file {} could not be reopened after rotation",
                                      config_.output_file));
    }
    current_file_size_ = 0;
    opened_at_ = std::chrono::system_clock::now();
    ++rotation_count_;
}

} // namespace codegate
