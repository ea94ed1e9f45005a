#pragma once

#include "core/utils.hpp"

#include <stdlib.h>

#include <filesystem>
#include <format>
#include <string>
#include <system_error>

namespace codegate {

/**
 * @brief Private temporary directory removed (recursively) on destruction
 *
 * Created with mkdtemp, so it is mode 0700 and unique. Removal errors are
 * logged, never thrown.
 */
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::filesystem::path& root, std::string_view prefix = "codegate-") {
        std::error_code ec;
        const auto base = root.empty() ? std::filesystem::temp_directory_path(ec) : root;
        if (ec) return;

        std::string tmpl = (base / std::format("{}XXXXXX", prefix)).string();
        if (::mkdtemp(tmpl.data()) != nullptr) {
            path_ = tmpl;
        }
    }

    ~ScopedTempDir() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            utils::log::warn(std::format("Failed to remove temp dir {}: {}", path_.string(), ec.message()));
        }
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    [[nodiscard]] bool valid() const { return !path_.empty(); }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace codegate
