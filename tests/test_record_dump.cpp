#include "evc/codec/hex.h"
#include "evc/common.h"
#include "evc/format/chunk_header.h"
#include "evc/format/compression_header.h"
#include "evc/format/encryption_header.h"
#include "evc/format/main_footer.h"
#include "evc/format/pbe_header.h"
#include "evc/format/segment_header.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

#include "test_support.h"

namespace {

template <class T>
std::string Dump(const T& record) {
  std::ostringstream oss;
  oss << record;
  return oss.str();
}

void TestHexEncode() {
  [[maybe_unused]] const std::array<uint8_t, 4> bytes{0x00, 0x0f, 0xa0, 0xff};
  assert(evc::codec::HexEncode(bytes) == "000fa0ff" && "two lowercase digits per byte");
  assert(evc::codec::HexEncode({}).empty());
}

void TestPlainRecords() {
  [[maybe_unused]] const auto compression =
      evc::format::CompressionHeader::Create(1, evc::format::CompressionAlgorithm::kZstd, 5);
  assert(Dump(compression) == "CompressionHeader{version=1, algorithm=zstd, level=5}");

  [[maybe_unused]] const auto segment = evc::format::SegmentHeader::Create(2, -7, 3, 1024);
  assert(Dump(segment) ==
         "SegmentHeader{version=2, unique_identifier=-7, segment_number=3, length_of_segment=1024}");

  [[maybe_unused]] const auto footer = evc::format::MainFooter::Create(2, 3, 10, 4096);
  assert(Dump(footer) == "MainFooter{version=2, number_of_segments=3, number_of_objects=10, footer_offset=4096}");
}

void TestChunkHeader() {
  auto chunk = evc::format::ChunkHeader::Create(1, 9);
  chunk.Finalize(512, 0x00ABCDEF, std::nullopt);
  assert(Dump(chunk) ==
         "ChunkHeader{version=1, chunk_number=9, chunk_size=512, checksum=0x00abcdef, signature=none}");

  evc::format::ChunkHeader::Signature signature{};
  signature.fill(0x11);
  chunk.Finalize(512, 0x00ABCDEF, signature);
  [[maybe_unused]] const auto dumped = Dump(chunk);
  assert(dumped.find("signature=" + std::string(128, '1') + "}") != std::string::npos &&
         "signature printed as 64 hex bytes");
}

void TestEncryptionHeader() {
  const std::array<uint8_t, 16> raw_key{};
  evc::format::EncryptionHeader::Salt salt{};
  salt.fill(0x01);
  evc::format::PbeHeader::Nonce iv{};
  iv.fill(0x02);
  evc::format::EncryptionHeader::HeaderNonce header_nonce{};
  header_nonce.fill(0x03);
  const auto header = evc::format::EncryptionHeader::WrapKey(
      raw_key, evc::AsBytes("passphrase"), evc::format::EncryptionAlgorithm::kAes128GcmSiv,
      evc::format::PbeScheme::kAes256Cbc, 2, salt, iv, header_nonce);

  [[maybe_unused]] const auto dumped = Dump(header);
  assert(dumped.rfind("EncryptionHeader{version=1, pbe_header=PbeHeader{version=1, ", 0) == 0);
  assert(dumped.find("kdf_scheme=pbkdf2-hmac-sha256, pbe_scheme=aes-256-cbc") != std::string::npos);

  assert(dumped.find("Pbkdf2Sha256Parameters{iterations=2, salt=" + evc::codec::HexEncode(salt) + "}") !=
         std::string::npos);
  assert(dumped.find(", nonce=02020202020202020202020202020202}") != std::string::npos &&
         "CBC IV printed after the parameters");
  assert(dumped.find("algorithm=aes-128-gcm-siv") != std::string::npos);
  assert(dumped.find("encrypted_key=" + evc::codec::HexEncode(header.encrypted_key())) != std::string::npos);
  assert(dumped.find("header_nonce=030303030303030303030303}") != std::string::npos &&
         "header nonce printed, not the key a second time");
  assert(header.encrypted_key().size() == 32 && "16 byte key plus a padding block");
}

}  // namespace

int main() {
  TestHexEncode();
  TestPlainRecords();
  TestChunkHeader();
  TestEncryptionHeader();
  std::cout << "record dump test ok\n";
  return 0;
}
