#include "evc/crypto/crc32.h"

#include <array>

namespace evc::crypto {
namespace {

constexpr uint32_t kCRC32Polynomial = 0xEDB88320u;

constexpr std::array<uint32_t, 256> MakeCRC32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < table.size(); ++i) {
    uint32_t value = i;
    for (uint32_t bit = 0; bit < 8; ++bit) {
      if (value & 1u) {
        value = (value >> 1) ^ kCRC32Polynomial;
      } else {
        value >>= 1;
      }
    }
    table[i] = value;
  }
  return table;
}

constexpr auto kCRC32Table = MakeCRC32Table();

}  // namespace

uint32_t Crc32(std::span<const uint8_t> data, uint32_t seed) noexcept {
  uint32_t crc = ~seed;
  for (uint8_t byte : data) {
    crc = kCRC32Table[(crc ^ byte) & 0xFFu] ^ (crc >> 8);
  }
  return ~crc;
}

}  // namespace evc::crypto
