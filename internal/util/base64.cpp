#include "base64.hpp"

#include <openssl/evp.h>

#include <limits>
#include <stdexcept>

namespace bidsub::util {

std::string Base64Encode(std::string_view bytes) {
  if (bytes.empty()) return {};

  // EVP_EncodeBlock takes an int length and writes 4 chars per 3 bytes plus a NUL.
  if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
    throw std::length_error("base64 input too large: " + std::to_string(bytes.size()) + " bytes");
  }

  std::string out(((bytes.size() + 2) / 3) * 4 + 1, '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
  if (written < 0) {
    throw std::runtime_error("base64 encode failed");
  }
  out.resize(static_cast<size_t>(written));
  return out;
}

} // namespace bidsub::util
