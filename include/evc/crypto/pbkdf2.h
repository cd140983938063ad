#pragma once

#include <cstdint>
#include <span>

namespace evc::crypto {

// PBKDF2 (RFC 8018) with HMAC-SHA256 as the PRF. Fills all of |output|,
// concatenating as many 32-byte blocks as needed. An iteration count of zero
// is treated as one.
void PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                        std::span<const uint8_t> salt,
                        uint32_t iterations,
                        std::span<uint8_t> output);

}  // namespace evc::crypto
