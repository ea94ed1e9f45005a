#pragma once

#include <string>
#include <string_view>

namespace codegate::digest {

/**
 * @brief SHA-256 of the input as lowercase hex (OpenSSL EVP)
 * @return 64 hex chars, or empty string if the digest context cannot be created
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

} // namespace codegate::digest
