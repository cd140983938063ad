#include "evc/codec/value_codec.h"
#include "evc/error.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using evc::codec::ByteCursor;
using evc::codec::ByteWriter;
using evc::test::CaptureError;

void TestIntegersAreLittleEndian() {
  ByteWriter writer;
  writer.WriteU16(0x0102);
  writer.WriteU32(0x01020304);
  writer.WriteU64(0x0102030405060708ULL);
  writer.WriteI64(-2);
  writer.WriteU32BigEndian(0x7A666663);
  [[maybe_unused]] const std::vector<uint8_t> expected{
      0x02, 0x01,
      0x04, 0x03, 0x02, 0x01,
      0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,
      0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
      0x7A, 0x66, 0x66, 0x63};
  assert(writer.bytes() == expected && "integers must be fixed-width little-endian");
}

void TestPrefixedBuffers() {
  ByteWriter writer;
  const std::vector<uint8_t> payload{0xAA, 0xBB, 0xCC};
  writer.WriteBytes(payload);
  writer.WriteString("ab");
  [[maybe_unused]] const std::vector<uint8_t> expected{
      0x03, 0x00, 0x00, 0x00, 0xAA, 0xBB, 0xCC,
      0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 'a', 'b'};
  assert(writer.bytes() == expected && "bytes carry a u32 prefix, strings a u64 prefix");

  const auto encoded = writer.Release();
  ByteCursor cursor(encoded);
  [[maybe_unused]] const auto bytes = cursor.ReadBytes();
  [[maybe_unused]] const auto text = cursor.ReadString();
  assert(bytes == payload && "byte buffer must decode");
  assert(text == "ab" && "string must decode");
  assert(cursor.empty() && cursor.consumed() == encoded.size());
}

void TestMixedSequence() {
  ByteWriter writer;
  writer.WriteU8(7);
  writer.WriteBool(true);
  writer.WriteI8(-5);
  writer.WriteI16(-300);
  writer.WriteI32(-70000);
  writer.WriteArray(std::array<uint8_t, 4>{1, 2, 3, 4});
  writer.WriteU64(std::numeric_limits<uint64_t>::max());
  const auto encoded = writer.Release();

  ByteCursor cursor(encoded);
  [[maybe_unused]] auto u8 = cursor.ReadU8();
  [[maybe_unused]] auto flag = cursor.ReadBool();
  [[maybe_unused]] auto i8 = cursor.ReadI8();
  [[maybe_unused]] auto i16 = cursor.ReadI16();
  [[maybe_unused]] auto i32 = cursor.ReadI32();
  [[maybe_unused]] auto array = cursor.ReadArray<4>();
  [[maybe_unused]] auto u64 = cursor.ReadU64();
  assert(u8 == 7 && flag && i8 == -5 && i16 == -300 && i32 == -70000);
  assert((array == std::array<uint8_t, 4>{1, 2, 3, 4}) && "arrays are raw");
  assert(u64 == std::numeric_limits<uint64_t>::max());
  assert(cursor.remaining() == 0);
}

void TestShortReadLeavesCursorUnchanged() {
  const std::vector<uint8_t> three{0x01, 0x02, 0x03};
  ByteCursor cursor(three);
  [[maybe_unused]] auto error = CaptureError([&] { (void)cursor.ReadU32(); });
  assert(error && "short read must throw");
  assert(error->domain == evc::ErrorDomain::IO && error->code == evc::errors::io::kUnexpectedEof);
  assert(cursor.consumed() == 0 && "failed read must not move the cursor");
  [[maybe_unused]] auto first = cursor.ReadU8();
  assert(first == 0x01 && "cursor still usable after a failed read");
}

void TestDeclaredLengthBeyondBuffer() {
  {
    const std::vector<uint8_t> data{0x10, 0x00, 0x00, 0x00, 0xAA, 0xBB};
    ByteCursor cursor(data);
    [[maybe_unused]] auto error = CaptureError([&] { (void)cursor.ReadBytes(); });
    assert(error && error->code == evc::errors::io::kUnexpectedEof && "buffer prefix beyond data");
    assert(cursor.consumed() == 0 && "prefix must not be consumed on failure");
  }
  {
    std::vector<uint8_t> data(8, 0xFF);
    data.push_back('x');
    ByteCursor cursor(data);
    [[maybe_unused]] auto error = CaptureError([&] { (void)cursor.ReadString(); });
    assert(error && error->code == evc::errors::io::kUnexpectedEof && "huge string length must not wrap");
    assert(cursor.consumed() == 0);
  }
}

void TestEmptyInput() {
  ByteCursor cursor(std::span<const uint8_t>{});
  [[maybe_unused]] auto error = CaptureError([&] { (void)cursor.ReadU8(); });
  assert(error && error->code == evc::errors::io::kUnexpectedEof);
  [[maybe_unused]] auto none = cursor.ReadRaw(0);
  assert(none.empty() && "zero-length read always succeeds");
}

}  // namespace

int main() {
  TestIntegersAreLittleEndian();
  TestPrefixedBuffers();
  TestMixedSequence();
  TestShortReadLeavesCursorUnchanged();
  TestDeclaredLengthBeyondBuffer();
  TestEmptyInput();
  std::cout << "value codec test ok\n";
  return 0;
}
