#include "evc/format/compression_header.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

#include "test_support.h"

namespace {

using evc::format::CompressionAlgorithm;
using evc::format::CompressionHeader;
using evc::test::CaptureError;

void TestKnownEncoding() {
  const auto header = CompressionHeader::Create(1, CompressionAlgorithm::kZstd, 5);
  [[maybe_unused]] const auto encoded = evc::codec::Encode(header);
  [[maybe_unused]] const std::vector<uint8_t> expected{
      0x7A, 0x66, 0x66, 0x63, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x01, 0x05};
  assert(encoded == expected && "15-byte compression header");

  [[maybe_unused]] const auto decoded = evc::codec::Decode<CompressionHeader>(expected);
  assert(decoded.version() == 1 && decoded.algorithm() == CompressionAlgorithm::kZstd && decoded.level() == 5);
}

void TestUnknownAlgorithm() {
  const std::vector<uint8_t> encoded{
      0x7A, 0x66, 0x66, 0x63, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02, 0x05};
  [[maybe_unused]] auto error = CaptureError([&] { (void)evc::codec::Decode<CompressionHeader>(encoded); });
  assert(error && error->domain == evc::ErrorDomain::Decode && error->code == evc::errors::decode::kUnknownCode &&
         "algorithm 2 is outside the closed set");
  assert(evc::test::ContextNames(*error, "CompressionHeader"));
}

void TestTruncatedBody() {
  const std::vector<uint8_t> encoded{
      0x7A, 0x66, 0x66, 0x63, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x01};
  [[maybe_unused]] auto error = CaptureError([&] { (void)evc::codec::Decode<CompressionHeader>(encoded); });
  assert(error && error->domain == evc::ErrorDomain::IO && error->code == evc::errors::io::kUnexpectedEof &&
         "body ends before the level");
}

void TestCodes() {
  assert(evc::format::ToCode(CompressionAlgorithm::kNone) == 0);
  assert(evc::format::ToCode(CompressionAlgorithm::kZstd) == 1);
  assert(evc::format::CompressionAlgorithmFromCode(1) == CompressionAlgorithm::kZstd);
  assert(!evc::format::CompressionAlgorithmFromCode(2).has_value());
  assert(evc::format::ToString(CompressionAlgorithm::kZstd) == "zstd");
}

void TestLevelSupported() {
  assert(CompressionHeader::Create(1, CompressionAlgorithm::kZstd, 3).LevelSupported());
  assert(CompressionHeader::Create(1, CompressionAlgorithm::kZstd, 19).LevelSupported());
  assert(!CompressionHeader::Create(1, CompressionAlgorithm::kZstd, 200).LevelSupported() &&
         "zstd tops out well below 200");
  assert(CompressionHeader::Create(1, CompressionAlgorithm::kNone, 200).LevelSupported() &&
         "level is ignored without compression");
}

void TestSharedAcrossChunks() {
  const evc::format::SharedCompressionHeader shared =
      std::make_shared<const CompressionHeader>(CompressionHeader::Create(1, CompressionAlgorithm::kZstd, 3));
  [[maybe_unused]] const auto first_user = shared;
  [[maybe_unused]] const auto second_user = shared;
  assert(shared.use_count() == 3 && first_user->level() == second_user->level());
}

}  // namespace

int main() {
  TestKnownEncoding();
  TestUnknownAlgorithm();
  TestTruncatedBody();
  TestCodes();
  TestLevelSupported();
  TestSharedAcrossChunks();
  std::cout << "compression header test ok\n";
  return 0;
}
