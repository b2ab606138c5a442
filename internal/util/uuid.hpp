#pragma once

#include <string>

namespace bidsub::util {

// Random RFC 4122 version 4 UUID, canonical lower-case form. Used for job ids.
std::string GenerateUUIDString();

} // namespace bidsub::util
