#pragma once

#include <cstdint>
#include <iosfwd>
#include <span>
#include <string_view>
#include <vector>

#include "evc/codec/envelope.h"
#include "evc/format/constants.h"

namespace evc::format {

// Last record of the last segment. Its encoded size never varies, so a reader
// finds it at end - kEncodedSize.
class MainFooter {
public:
  static constexpr uint32_t kIdentifier = kMainFooterIdentifier;
  static constexpr codec::LengthConvention kLengthConvention = codec::LengthConvention::kBodyOnly;
  static constexpr std::string_view kRecordName{"MainFooter"};
  static constexpr size_t kBodySize = 1 + 3 * sizeof(uint64_t);
  static constexpr size_t kEncodedSize = codec::kEnvelopePrefixSize + kBodySize;

  static MainFooter Create(uint8_t version, uint64_t number_of_segments, uint64_t number_of_objects,
                           uint64_t footer_offset);

  uint8_t version() const noexcept { return version_; }
  uint64_t number_of_segments() const noexcept { return number_of_segments_; }
  uint64_t number_of_objects() const noexcept { return number_of_objects_; }
  uint64_t footer_offset() const noexcept { return footer_offset_; }

  std::vector<uint8_t> EncodeBody() const;
  static MainFooter DecodeBody(std::span<const uint8_t> body);

  bool operator==(const MainFooter&) const = default;

private:
  MainFooter(uint8_t version, uint64_t number_of_segments, uint64_t number_of_objects,
             uint64_t footer_offset) noexcept
      : version_(version),
        number_of_segments_(number_of_segments),
        number_of_objects_(number_of_objects),
        footer_offset_(footer_offset) {}

  uint8_t version_;
  uint64_t number_of_segments_;
  uint64_t number_of_objects_;
  uint64_t footer_offset_;
};

static_assert(MainFooter::kEncodedSize == 37, "main footer must stay 37 bytes on disk");

std::ostream& operator<<(std::ostream& os, const MainFooter& footer);

}  // namespace evc::format
