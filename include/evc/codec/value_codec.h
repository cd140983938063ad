#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evc::codec {

// Forward-only reader over an in-memory buffer. Every Read* either returns a
// whole value and advances, or throws evc::Error (IO/kUnexpectedEof) and
// leaves the position untouched.
class ByteCursor {
 public:
  explicit ByteCursor(std::span<const uint8_t> buffer) noexcept : buffer_(buffer) {}

  [[nodiscard]] std::size_t consumed() const noexcept { return offset_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return buffer_.size() - offset_; }
  [[nodiscard]] bool empty() const noexcept { return remaining() == 0; }
  [[nodiscard]] std::span<const uint8_t> rest() const noexcept { return buffer_.subspan(offset_); }

  uint8_t ReadU8();
  uint16_t ReadU16();
  uint32_t ReadU32();
  uint64_t ReadU64();
  int8_t ReadI8();
  int16_t ReadI16();
  int32_t ReadI32();
  int64_t ReadI64();
  bool ReadBool();
  uint32_t ReadU32BigEndian();

  // Exactly |count| raw bytes, viewed in place.
  std::span<const uint8_t> ReadRaw(std::size_t count);

  // u32 LE length prefix, then that many bytes.
  std::vector<uint8_t> ReadBytes();

  // u64 LE length prefix, then that many bytes.
  std::string ReadString();

  template <std::size_t N>
  std::array<uint8_t, N> ReadArray() {
    const auto raw = ReadRaw(N);
    std::array<uint8_t, N> out{};
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
  }

 private:
  void Require(std::size_t count) const;

  std::span<const uint8_t> buffer_;
  std::size_t offset_{0};
};

// Append-only builder producing the little-endian wire form.
class ByteWriter {
 public:
  ByteWriter() = default;
  explicit ByteWriter(std::size_t reserve) { buffer_.reserve(reserve); }

  void WriteU8(uint8_t value);
  void WriteU16(uint16_t value);
  void WriteU32(uint32_t value);
  void WriteU64(uint64_t value);
  void WriteI8(int8_t value);
  void WriteI16(int16_t value);
  void WriteI32(int32_t value);
  void WriteI64(int64_t value);
  void WriteBool(bool value);
  void WriteU32BigEndian(uint32_t value);

  void WriteRaw(std::span<const uint8_t> bytes);
  void WriteBytes(std::span<const uint8_t> bytes);
  void WriteString(std::string_view text);

  template <std::size_t N>
  void WriteArray(const std::array<uint8_t, N>& bytes) {
    WriteRaw(std::span<const uint8_t>(bytes.data(), bytes.size()));
  }

  [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }
  [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<uint8_t> Release() noexcept { return std::move(buffer_); }

 private:
  std::vector<uint8_t> buffer_;
};

}  // namespace evc::codec
