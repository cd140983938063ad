#pragma once

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

#include "evc/codec/envelope.h"
#include "evc/format/constants.h"

namespace evc::format {

// First record of every segment file. All segments of one container share
// unique_identifier.
class SegmentHeader {
public:
  static constexpr uint32_t kIdentifier = kSegmentHeaderIdentifier;
  static constexpr codec::LengthConvention kLengthConvention = codec::LengthConvention::kBodyOnly;
  static constexpr std::string_view kRecordName{"SegmentHeader"};

  static SegmentHeader Create(uint8_t version, int64_t unique_identifier, uint64_t segment_number,
                              uint64_t length_of_segment = 0);

  // The length is unknown until the segment has been written out.
  void PatchLength(uint64_t length_of_segment) noexcept { length_of_segment_ = length_of_segment; }

  // Same container, segment_number + 1, length 0. Throws
  // State/kSequenceExhausted at the end of the number space.
  [[nodiscard]] SegmentHeader Next() const;

  uint8_t version() const noexcept { return version_; }
  int64_t unique_identifier() const noexcept { return unique_identifier_; }
  uint64_t segment_number() const noexcept { return segment_number_; }
  uint64_t length_of_segment() const noexcept { return length_of_segment_; }

  std::vector<uint8_t> EncodeBody() const;
  static SegmentHeader DecodeBody(std::span<const uint8_t> body);

  // Compares segment_number only. Two headers from different containers
  // with the same number compare equal; use SameFields() for a full check.
  bool operator==(const SegmentHeader& other) const noexcept { return segment_number_ == other.segment_number_; }
  bool SameFields(const SegmentHeader& other) const noexcept;

private:
  SegmentHeader(uint8_t version, int64_t unique_identifier, uint64_t segment_number,
                uint64_t length_of_segment) noexcept
      : version_(version),
        unique_identifier_(unique_identifier),
        segment_number_(segment_number),
        length_of_segment_(length_of_segment) {}

  uint8_t version_;
  int64_t unique_identifier_;
  uint64_t segment_number_;
  uint64_t length_of_segment_;
};

std::ostream& operator<<(std::ostream& os, const SegmentHeader& header);

}  // namespace evc::format
