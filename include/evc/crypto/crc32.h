#pragma once

#include <cstdint>
#include <span>

namespace evc::crypto {

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320). Pass the previous
// return value as |seed| to continue over split input.
uint32_t Crc32(std::span<const uint8_t> data, uint32_t seed = 0) noexcept;

}  // namespace evc::crypto
