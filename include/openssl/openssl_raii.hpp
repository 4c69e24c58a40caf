#pragma once

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>
#include <string>

namespace devlaunch {
namespace opensslutil {

using EVP_MD_CTX_ptr =
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Lowercase hex SHA-256 of `data`. Throws std::runtime_error when the
// digest cannot be computed.
std::string sha256_hex(const std::string &data);

// Drain the OpenSSL error queue into one line.
std::string last_error_string();

} // namespace opensslutil
} // namespace devlaunch
