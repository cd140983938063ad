#pragma once

#include <cstdint>
#include <span>

namespace evc::crypto {

// Fills |out| from the operating system CSPRNG. Throws IO/kEntropyUnavailable
// when no source can be read.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace evc::crypto
