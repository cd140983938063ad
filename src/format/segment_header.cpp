#include "evc/format/segment_header.h"

#include <limits>
#include <ostream>
#include <string>

#include "evc/error.h"
#include "evc/errors.h"

namespace evc::format {

SegmentHeader SegmentHeader::Create(uint8_t version, int64_t unique_identifier, uint64_t segment_number,
                                    uint64_t length_of_segment) {
  return SegmentHeader(version, unique_identifier, segment_number, length_of_segment);
}

SegmentHeader SegmentHeader::Next() const {
  if (segment_number_ == std::numeric_limits<uint64_t>::max()) {
    throw evc::Error{evc::ErrorDomain::State, evc::errors::state::kSequenceExhausted,
                     std::string(evc::errors::msg::kSegmentNumberExhausted)};
  }
  return SegmentHeader(version_, unique_identifier_, segment_number_ + 1, 0);
}

bool SegmentHeader::SameFields(const SegmentHeader& other) const noexcept {
  return version_ == other.version_ && unique_identifier_ == other.unique_identifier_ &&
         segment_number_ == other.segment_number_ && length_of_segment_ == other.length_of_segment_;
}

std::vector<uint8_t> SegmentHeader::EncodeBody() const {
  codec::ByteWriter writer(1 + 3 * sizeof(uint64_t));
  writer.WriteU8(version_);
  writer.WriteI64(unique_identifier_);
  writer.WriteU64(segment_number_);
  writer.WriteU64(length_of_segment_);
  return writer.Release();
}

SegmentHeader SegmentHeader::DecodeBody(std::span<const uint8_t> body) {
  codec::ByteCursor cursor(body);
  const uint8_t version = cursor.ReadU8();
  const int64_t unique_identifier = cursor.ReadI64();
  const uint64_t segment_number = cursor.ReadU64();
  const uint64_t length_of_segment = cursor.ReadU64();
  return SegmentHeader(version, unique_identifier, segment_number, length_of_segment);
}

std::ostream& operator<<(std::ostream& os, const SegmentHeader& header) {
  return os << "SegmentHeader{version=" << static_cast<unsigned>(header.version())
            << ", unique_identifier=" << header.unique_identifier()
            << ", segment_number=" << header.segment_number()
            << ", length_of_segment=" << header.length_of_segment() << '}';
}

}  // namespace evc::format
