#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "evc/codec/envelope.h"
#include "evc/format/constants.h"

namespace evc::format {

enum class CompressionAlgorithm : uint8_t {
  kNone = 0,
  kZstd = 1,
};

constexpr uint8_t ToCode(CompressionAlgorithm algorithm) noexcept {
  return static_cast<uint8_t>(algorithm);
}
std::optional<CompressionAlgorithm> CompressionAlgorithmFromCode(uint8_t code) noexcept;
std::string_view ToString(CompressionAlgorithm algorithm) noexcept;

class CompressionHeader {
public:
  static constexpr uint32_t kIdentifier = kCompressionHeaderIdentifier;
  static constexpr codec::LengthConvention kLengthConvention = codec::LengthConvention::kBodyOnly;
  static constexpr std::string_view kRecordName{"CompressionHeader"};

  static CompressionHeader Create(uint8_t version, CompressionAlgorithm algorithm, uint8_t level);

  uint8_t version() const noexcept { return version_; }
  CompressionAlgorithm algorithm() const noexcept { return algorithm_; }
  uint8_t level() const noexcept { return level_; }

  // True when the linked zstd accepts |level|. Always true for kNone, which
  // ignores the level.
  bool LevelSupported() const noexcept;

  std::vector<uint8_t> EncodeBody() const;
  static CompressionHeader DecodeBody(std::span<const uint8_t> body);

  bool operator==(const CompressionHeader&) const = default;

private:
  CompressionHeader(uint8_t version, CompressionAlgorithm algorithm, uint8_t level) noexcept
      : version_(version), algorithm_(algorithm), level_(level) {}

  uint8_t version_;
  CompressionAlgorithm algorithm_;
  uint8_t level_;
};

// One compression header describes every chunk of an object.
using SharedCompressionHeader = std::shared_ptr<const CompressionHeader>;

std::ostream& operator<<(std::ostream& os, const CompressionHeader& header);

}  // namespace evc::format
