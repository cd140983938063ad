#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "evc/codec/envelope.h"
#include "evc/format/constants.h"

namespace evc::format {

// Precedes every stored chunk. The payload-derived fields stay zero until
// Finalize() runs once the chunk has been compressed and encrypted.
class ChunkHeader {
public:
  static constexpr uint32_t kIdentifier = kChunkHeaderIdentifier;
  static constexpr codec::LengthConvention kLengthConvention = codec::LengthConvention::kIncludesPrefix;
  static constexpr std::string_view kRecordName{"ChunkHeader"};

  static constexpr size_t kSignatureSize = 64;
  static constexpr size_t kUnsignedBodySize = 1 + 8 + 8 + 4;
  static constexpr size_t kSignedBodySize = kUnsignedBodySize + kSignatureSize;

  using Signature = std::array<uint8_t, kSignatureSize>;

  ChunkHeader() = default;

  static ChunkHeader Create(uint8_t version, uint64_t starting_number);

  void Finalize(uint64_t chunk_size, uint32_t checksum, std::optional<Signature> signature);

  // Computes the checksum over the decoded payload; |stored_size| is the
  // length after compression and encryption.
  void FinalizeFromPayload(uint64_t stored_size, std::span<const uint8_t> decoded_payload,
                           std::optional<Signature> signature);

  // Header for the following chunk: number + 1, payload fields reset.
  // Throws State/kSequenceExhausted at the end of the number space.
  [[nodiscard]] ChunkHeader Advance() const;

  uint8_t version() const noexcept { return version_; }
  uint64_t chunk_number() const noexcept { return chunk_number_; }
  uint64_t chunk_size() const noexcept { return chunk_size_; }
  uint32_t checksum() const noexcept { return checksum_; }
  const std::optional<Signature>& signature() const noexcept { return signature_; }

  std::vector<uint8_t> EncodeBody() const;
  static ChunkHeader DecodeBody(std::span<const uint8_t> body);

  bool operator==(const ChunkHeader&) const = default;

private:
  uint8_t version_{kDefaultChunkHeaderVersion};
  uint64_t chunk_number_{kFirstChunkNumber};
  uint64_t chunk_size_{0};
  uint32_t checksum_{0};
  std::optional<Signature> signature_{};
};

// Reader-side check that decoded chunk headers arrive as an unbroken run.
class ChunkSequenceValidator {
public:
  explicit ChunkSequenceValidator(uint64_t first_number = kFirstChunkNumber) noexcept
      : expected_(first_number) {}

  // Throws Decode/kChunkSequenceGap on a gap or a repeated number.
  void Observe(const ChunkHeader& header);

  uint64_t expected() const noexcept { return expected_; }
  uint64_t observed() const noexcept { return observed_; }

private:
  uint64_t expected_;
  uint64_t observed_{0};
  bool exhausted_{false};
};

std::ostream& operator<<(std::ostream& os, const ChunkHeader& header);

}  // namespace evc::format
