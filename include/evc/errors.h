#pragma once

#include <string_view>

namespace evc::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kUnexpectedEof{"Unexpected end of buffer"};
inline constexpr std::string_view kBufferTooLarge{"Byte buffer exceeds the 32-bit length prefix"};
inline constexpr std::string_view kHeaderLength{"Unable to read header length from given data"};
inline constexpr std::string_view kDeclaredLengthTooShort{"Declared record length is shorter than the envelope prefix"};
inline constexpr std::string_view kMismatchIdentifier{"The read identifier does not match the header identifier"};
inline constexpr std::string_view kMismatchIdentifierKdf{"The read identifier does not match to any known KDF header identifier"};
inline constexpr std::string_view kUnexpectedTrailingBytes{"Unexpected trailing bytes after record"};
inline constexpr std::string_view kUnknownCompressionAlgorithm{"Unknown compression algorithm value"};
inline constexpr std::string_view kUnknownEncryptionAlgorithm{"Unknown encryption algorithm value"};
inline constexpr std::string_view kUnknownKdfScheme{"Unknown KDF scheme value"};
inline constexpr std::string_view kUnknownPbeScheme{"Unknown PBEncryption scheme value"};
inline constexpr std::string_view kKdfParametersMismatch{"KDF parameters do not belong to the KDF scheme"};
inline constexpr std::string_view kUnknownValueType{"Unknown or unexpected value type tag"};
inline constexpr std::string_view kKeyNotInPosition{"Key not in position"};
inline constexpr std::string_view kKeyTooLong{"Encoding key exceeds 255 bytes"};
inline constexpr std::string_view kChunkBodyLength{"Chunk header body is shorter than its fixed fields"};
inline constexpr std::string_view kChunkSequenceGap{"Chunk number out of sequence"};
inline constexpr std::string_view kChunkNumberExhausted{"Chunk number space exhausted"};
inline constexpr std::string_view kSegmentNumberExhausted{"Segment number space exhausted"};
inline constexpr std::string_view kDecryptionFailed{"Decryption failed"};
inline constexpr std::string_view kRawKeyLengthMismatch{"Raw key length does not match the encryption algorithm"};
inline constexpr std::string_view kCipherKeyLengthMismatch{"Cipher key length does not match the cipher variant"};
inline constexpr std::string_view kEntropyUnavailable{"System entropy source unavailable"};
}  // namespace evc::errors::msg
