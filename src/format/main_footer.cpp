#include "evc/format/main_footer.h"

#include <ostream>

namespace evc::format {

MainFooter MainFooter::Create(uint8_t version, uint64_t number_of_segments, uint64_t number_of_objects,
                              uint64_t footer_offset) {
  return MainFooter(version, number_of_segments, number_of_objects, footer_offset);
}

std::vector<uint8_t> MainFooter::EncodeBody() const {
  codec::ByteWriter writer(kBodySize);
  writer.WriteU8(version_);
  writer.WriteU64(number_of_segments_);
  writer.WriteU64(number_of_objects_);
  writer.WriteU64(footer_offset_);
  return writer.Release();
}

MainFooter MainFooter::DecodeBody(std::span<const uint8_t> body) {
  codec::ByteCursor cursor(body);
  const uint8_t version = cursor.ReadU8();
  const uint64_t number_of_segments = cursor.ReadU64();
  const uint64_t number_of_objects = cursor.ReadU64();
  const uint64_t footer_offset = cursor.ReadU64();
  return MainFooter(version, number_of_segments, number_of_objects, footer_offset);
}

std::ostream& operator<<(std::ostream& os, const MainFooter& footer) {
  return os << "MainFooter{version=" << static_cast<unsigned>(footer.version())
            << ", number_of_segments=" << footer.number_of_segments()
            << ", number_of_objects=" << footer.number_of_objects()
            << ", footer_offset=" << footer.footer_offset() << '}';
}

}  // namespace evc::format
