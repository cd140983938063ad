#include "evc/codec/hex.h"

#include <iomanip>
#include <sstream>

namespace evc::codec {

std::string HexEncode(std::span<const uint8_t> bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

}  // namespace evc::codec
