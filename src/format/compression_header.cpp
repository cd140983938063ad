#include "evc/format/compression_header.h"

#include <ostream>
#include <string>

#include <zstd.h>

#include "evc/error.h"
#include "evc/errors.h"

namespace evc::format {

std::optional<CompressionAlgorithm> CompressionAlgorithmFromCode(uint8_t code) noexcept {
  switch (code) {
    case 0:
      return CompressionAlgorithm::kNone;
    case 1:
      return CompressionAlgorithm::kZstd;
    default:
      return std::nullopt;
  }
}

std::string_view ToString(CompressionAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case CompressionAlgorithm::kNone:
      return "none";
    case CompressionAlgorithm::kZstd:
      return "zstd";
  }
  return "unknown";
}

CompressionHeader CompressionHeader::Create(uint8_t version, CompressionAlgorithm algorithm, uint8_t level) {
  return CompressionHeader(version, algorithm, level);
}

bool CompressionHeader::LevelSupported() const noexcept {
  if (algorithm_ == CompressionAlgorithm::kNone) {
    return true;
  }
  const int level = static_cast<int>(level_);
  return level >= ZSTD_minCLevel() && level <= ZSTD_maxCLevel();
}

std::vector<uint8_t> CompressionHeader::EncodeBody() const {
  codec::ByteWriter writer(3);
  writer.WriteU8(version_);
  writer.WriteU8(ToCode(algorithm_));
  writer.WriteU8(level_);
  return writer.Release();
}

CompressionHeader CompressionHeader::DecodeBody(std::span<const uint8_t> body) {
  codec::ByteCursor cursor(body);
  const uint8_t version = cursor.ReadU8();
  const uint8_t code = cursor.ReadU8();
  const auto algorithm = CompressionAlgorithmFromCode(code);
  if (!algorithm) {
    codec::ThrowDecodeError(evc::errors::decode::kUnknownCode,
                            std::string(evc::errors::msg::kUnknownCompressionAlgorithm) + " (" +
                                std::to_string(code) + ")",
                            kRecordName);
  }
  const uint8_t level = cursor.ReadU8();
  return CompressionHeader(version, *algorithm, level);
}

std::ostream& operator<<(std::ostream& os, const CompressionHeader& header) {
  return os << "CompressionHeader{version=" << static_cast<unsigned>(header.version())
            << ", algorithm=" << ToString(header.algorithm()) << ", level=" << static_cast<unsigned>(header.level())
            << '}';
}

}  // namespace evc::format
