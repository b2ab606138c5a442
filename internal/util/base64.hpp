#pragma once

#include <string>
#include <string_view>

namespace bidsub::util {

// RFC 4648 base64 with padding, no line breaks. Backed by OpenSSL EVP_EncodeBlock.
std::string Base64Encode(std::string_view bytes);

} // namespace bidsub::util
