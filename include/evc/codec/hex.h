#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace evc::codec {

// Lowercase hex, two digits per byte. Used by the record printers.
std::string HexEncode(std::span<const uint8_t> bytes);

}  // namespace evc::codec
