#include <cstddef>
#include <cstdint>
#include <span>

#include "evc/codec/envelope.h"
#include "evc/format/chunk_header.h"
#include "evc/format/compression_header.h"
#include "evc/format/encryption_header.h"
#include "evc/format/main_footer.h"
#include "evc/format/segment_header.h"

namespace {

// Decodes records back to back, picking the decoder from each identifier.
void DecodeStream(std::span<const uint8_t> bytes) {
  evc::codec::ByteCursor cursor(bytes);
  while (!cursor.empty()) {
    switch (evc::codec::PeekIdentifier(cursor)) {
      case evc::format::kChunkHeaderIdentifier:
        (void)evc::codec::DecodeAndValidate<evc::format::ChunkHeader>(cursor);
        break;
      case evc::format::kCompressionHeaderIdentifier:
        (void)evc::codec::DecodeAndValidate<evc::format::CompressionHeader>(cursor);
        break;
      case evc::format::kEncryptionHeaderIdentifier:
        (void)evc::codec::DecodeAndValidate<evc::format::EncryptionHeader>(cursor);
        break;
      case evc::format::kPbeHeaderIdentifier:
        (void)evc::codec::DecodeAndValidate<evc::format::PbeHeader>(cursor);
        break;
      case evc::format::kSegmentHeaderIdentifier:
        (void)evc::codec::DecodeAndValidate<evc::format::SegmentHeader>(cursor);
        break;
      case evc::format::kMainFooterIdentifier:
        (void)evc::codec::DecodeAndValidate<evc::format::MainFooter>(cursor);
        break;
      default:
        return;
    }
  }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return 0;
  }
  std::span<const uint8_t> bytes(data, size);
  try {
    DecodeStream(bytes);
  } catch (const evc::Error&) {
    // Rejected input is the expected outcome for most mutations.
  }
  return 0;
}
