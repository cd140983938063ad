#pragma once

#include <cstdint>

namespace evc::format {

// Record identifiers, stored big-endian so they read as ASCII in a hex dump.
inline constexpr uint32_t kChunkHeaderIdentifier = 0x7A666643;       // "zffC"
inline constexpr uint32_t kCompressionHeaderIdentifier = 0x7A666663; // "zffc"
inline constexpr uint32_t kEncryptionHeaderIdentifier = 0x7A666665;  // "zffe"
inline constexpr uint32_t kPbeHeaderIdentifier = 0x7A666670;         // "zffp"
inline constexpr uint32_t kSegmentHeaderIdentifier = 0x7A666673;     // "zffs"
inline constexpr uint32_t kMainFooterIdentifier = 0x7A66664D;        // "zffM"
inline constexpr uint32_t kPbkdf2Sha256ParametersIdentifier = 0x6B646670; // "kdfp"

inline constexpr uint8_t kDefaultChunkHeaderVersion = 1;
inline constexpr uint8_t kDefaultCompressionHeaderVersion = 1;
inline constexpr uint8_t kDefaultEncryptionHeaderVersion = 1;
inline constexpr uint8_t kDefaultPbeHeaderVersion = 1;
inline constexpr uint8_t kDefaultSegmentHeaderVersion = 2;
inline constexpr uint8_t kDefaultMainFooterVersion = 1;

inline constexpr uint64_t kFirstChunkNumber = 1;
inline constexpr uint64_t kFirstSegmentNumber = 1;

}  // namespace evc::format
