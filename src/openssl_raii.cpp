#include "openssl/openssl_raii.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace devlaunch {
namespace opensslutil {

std::string last_error_string() {
  std::string out;
  unsigned long err_code;
  while ((err_code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(err_code, buf, sizeof(buf));
    if (!out.empty()) {
      out += "; ";
    }
    out += buf;
  }
  return out.empty() ? std::string("unknown OpenSSL error") : out;
}

std::string sha256_hex(const std::string &data) {
  EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!context) throw std::runtime_error("Failed to create digest context");

  if (1 != EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw std::runtime_error("Failed to initialize digest: " +
                             last_error_string());
  }
  if (1 != EVP_DigestUpdate(context.get(), data.data(), data.size())) {
    throw std::runtime_error("Failed to update digest: " +
                             last_error_string());
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (1 != EVP_DigestFinal_ex(context.get(), hash, &length)) {
    throw std::runtime_error("Failed to finalize digest: " +
                             last_error_string());
  }

  std::ostringstream ss;
  for (unsigned int i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

} // namespace opensslutil
} // namespace devlaunch
