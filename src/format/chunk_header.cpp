#include "evc/format/chunk_header.h"

#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "evc/codec/hex.h"
#include "evc/crypto/crc32.h"
#include "evc/error.h"
#include "evc/errors.h"

namespace evc::format {

ChunkHeader ChunkHeader::Create(uint8_t version, uint64_t starting_number) {
  ChunkHeader header;
  header.version_ = version;
  header.chunk_number_ = starting_number;
  return header;
}

void ChunkHeader::Finalize(uint64_t chunk_size, uint32_t checksum, std::optional<Signature> signature) {
  chunk_size_ = chunk_size;
  checksum_ = checksum;
  signature_ = std::move(signature);
}

void ChunkHeader::FinalizeFromPayload(uint64_t stored_size, std::span<const uint8_t> decoded_payload,
                                      std::optional<Signature> signature) {
  Finalize(stored_size, evc::crypto::Crc32(decoded_payload), std::move(signature));
}

ChunkHeader ChunkHeader::Advance() const {
  if (chunk_number_ == std::numeric_limits<uint64_t>::max()) {
    throw evc::Error{evc::ErrorDomain::State, evc::errors::state::kSequenceExhausted,
                     std::string(evc::errors::msg::kChunkNumberExhausted)};
  }
  return Create(version_, chunk_number_ + 1);
}

std::vector<uint8_t> ChunkHeader::EncodeBody() const {
  codec::ByteWriter writer(signature_ ? kSignedBodySize : kUnsignedBodySize);
  writer.WriteU8(version_);
  writer.WriteU64(chunk_number_);
  writer.WriteU64(chunk_size_);
  writer.WriteU32(checksum_);
  if (signature_) {
    writer.WriteArray(*signature_);
  }
  return writer.Release();
}

ChunkHeader ChunkHeader::DecodeBody(std::span<const uint8_t> body) {
  // The signature has no presence flag; the body length is the only signal.
  // Bytes past the known fields belong to newer header versions and are skipped.
  if (body.size() < kUnsignedBodySize) {
    codec::ThrowDecodeError(evc::errors::decode::kMalformedLength,
                            std::string(evc::errors::msg::kChunkBodyLength) + " (" + std::to_string(body.size()) +
                                " bytes)",
                            kRecordName);
  }
  codec::ByteCursor cursor(body);
  ChunkHeader header;
  header.version_ = cursor.ReadU8();
  header.chunk_number_ = cursor.ReadU64();
  header.chunk_size_ = cursor.ReadU64();
  header.checksum_ = cursor.ReadU32();
  if (body.size() >= kSignedBodySize) {
    header.signature_ = cursor.ReadArray<kSignatureSize>();
  }
  return header;
}

void ChunkSequenceValidator::Observe(const ChunkHeader& header) {
  if (exhausted_ || header.chunk_number() != expected_) {
    const std::string detail = exhausted_ ? std::string("after the last representable number")
                                          : "expected " + std::to_string(expected_);
    codec::ThrowDecodeError(evc::errors::decode::kChunkSequenceGap,
                            std::string(evc::errors::msg::kChunkSequenceGap) + ": got " +
                                std::to_string(header.chunk_number()) + ", " + detail,
                            ChunkHeader::kRecordName);
  }
  ++observed_;
  if (expected_ == std::numeric_limits<uint64_t>::max()) {
    exhausted_ = true;
  } else {
    ++expected_;
  }
}

std::ostream& operator<<(std::ostream& os, const ChunkHeader& header) {
  std::ostringstream checksum;
  checksum << std::hex << std::setw(8) << std::setfill('0') << header.checksum();
  os << "ChunkHeader{version=" << static_cast<unsigned>(header.version())
     << ", chunk_number=" << header.chunk_number() << ", chunk_size=" << header.chunk_size()
     << ", checksum=0x" << checksum.str() << ", signature=";
  if (header.signature()) {
    os << codec::HexEncode(*header.signature());
  } else {
    os << "none";
  }
  return os << '}';
}

}  // namespace evc::format
