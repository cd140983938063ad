#include "evc/codec/value_codec.h"

#include <cstring>
#include <limits>
#include <string>
#include <type_traits>

#include "evc/common.h"
#include "evc/error.h"
#include "evc/errors.h"

namespace evc::codec {

namespace {

template <class T>
T LoadLittleEndian(std::span<const uint8_t> raw) {
  static_assert(std::is_unsigned_v<T>, "load unsigned and cast afterwards");
  T value = 0;
  std::memcpy(&value, raw.data(), sizeof(T));
  if constexpr (sizeof(T) == 2) {
    return evc::FromLittleEndian16(value);
  } else if constexpr (sizeof(T) == 4) {
    return evc::FromLittleEndian32(value);
  } else if constexpr (sizeof(T) == 8) {
    return evc::FromLittleEndian64(value);
  } else {
    return value;
  }
}

template <class T>
void StoreLittleEndian(std::vector<uint8_t>& buffer, T value) {
  static_assert(std::is_unsigned_v<T>, "store unsigned and cast beforehand");
  T le = value;
  if constexpr (sizeof(T) == 2) {
    le = evc::ToLittleEndian16(value);
  } else if constexpr (sizeof(T) == 4) {
    le = evc::ToLittleEndian32(value);
  } else if constexpr (sizeof(T) == 8) {
    le = evc::ToLittleEndian64(value);
  }
  const auto bytes = evc::AsBytesConst(le);
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

[[noreturn]] void ThrowUnexpectedEof(uint64_t needed, std::size_t available) {
  throw evc::Error{evc::ErrorDomain::IO, evc::errors::io::kUnexpectedEof,
                   std::string(evc::errors::msg::kUnexpectedEof) + " (need " + std::to_string(needed) +
                       ", have " + std::to_string(available) + ")"};
}

}  // namespace

// --- ByteCursor -----------------------------------------------------------------

void ByteCursor::Require(std::size_t count) const {
  if (count > remaining()) {
    ThrowUnexpectedEof(count, remaining());
  }
}

std::span<const uint8_t> ByteCursor::ReadRaw(std::size_t count) {
  Require(count);
  auto view = buffer_.subspan(offset_, count);
  offset_ += count;
  return view;
}

uint8_t ByteCursor::ReadU8() { return ReadRaw(1)[0]; }

uint16_t ByteCursor::ReadU16() { return LoadLittleEndian<uint16_t>(ReadRaw(sizeof(uint16_t))); }

uint32_t ByteCursor::ReadU32() { return LoadLittleEndian<uint32_t>(ReadRaw(sizeof(uint32_t))); }

uint64_t ByteCursor::ReadU64() { return LoadLittleEndian<uint64_t>(ReadRaw(sizeof(uint64_t))); }

int8_t ByteCursor::ReadI8() { return static_cast<int8_t>(ReadU8()); }

int16_t ByteCursor::ReadI16() { return static_cast<int16_t>(ReadU16()); }

int32_t ByteCursor::ReadI32() { return static_cast<int32_t>(ReadU32()); }

int64_t ByteCursor::ReadI64() { return static_cast<int64_t>(ReadU64()); }

bool ByteCursor::ReadBool() { return ReadU8() != 0; }

uint32_t ByteCursor::ReadU32BigEndian() {
  const auto raw = ReadRaw(sizeof(uint32_t));
  uint32_t be = 0;
  std::memcpy(&be, raw.data(), sizeof(be));
  return evc::FromBigEndian32(be);
}

std::vector<uint8_t> ByteCursor::ReadBytes() {
  Require(sizeof(uint32_t));
  const auto length = LoadLittleEndian<uint32_t>(buffer_.subspan(offset_, sizeof(uint32_t)));
  Require(sizeof(uint32_t) + static_cast<std::size_t>(length));
  offset_ += sizeof(uint32_t);
  const auto payload = ReadRaw(length);
  return std::vector<uint8_t>(payload.begin(), payload.end());
}

std::string ByteCursor::ReadString() {
  Require(sizeof(uint64_t));
  const auto length = LoadLittleEndian<uint64_t>(buffer_.subspan(offset_, sizeof(uint64_t)));
  if (length > remaining() - sizeof(uint64_t)) {
    ThrowUnexpectedEof(length, remaining() - sizeof(uint64_t));
  }
  offset_ += sizeof(uint64_t);
  const auto payload = ReadRaw(static_cast<std::size_t>(length));
  return std::string(reinterpret_cast<const char*>(payload.data()), payload.size());
}

// --- ByteWriter -----------------------------------------------------------------

void ByteWriter::WriteU8(uint8_t value) { buffer_.push_back(value); }

void ByteWriter::WriteU16(uint16_t value) { StoreLittleEndian(buffer_, value); }

void ByteWriter::WriteU32(uint32_t value) { StoreLittleEndian(buffer_, value); }

void ByteWriter::WriteU64(uint64_t value) { StoreLittleEndian(buffer_, value); }

void ByteWriter::WriteI8(int8_t value) { WriteU8(static_cast<uint8_t>(value)); }

void ByteWriter::WriteI16(int16_t value) { WriteU16(static_cast<uint16_t>(value)); }

void ByteWriter::WriteI32(int32_t value) { WriteU32(static_cast<uint32_t>(value)); }

void ByteWriter::WriteI64(int64_t value) { WriteU64(static_cast<uint64_t>(value)); }

void ByteWriter::WriteBool(bool value) { WriteU8(value ? 1 : 0); }

void ByteWriter::WriteU32BigEndian(uint32_t value) {
  const uint32_t be = evc::ToBigEndian32(value);
  WriteRaw(evc::AsBytesConst(be));
}

void ByteWriter::WriteRaw(std::span<const uint8_t> bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::WriteBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
    throw evc::Error{evc::ErrorDomain::State, evc::errors::state::kFieldTooLarge,
                     std::string(evc::errors::msg::kBufferTooLarge)};
  }
  WriteU32(static_cast<uint32_t>(bytes.size()));
  WriteRaw(bytes);
}

void ByteWriter::WriteString(std::string_view text) {
  WriteU64(static_cast<uint64_t>(text.size()));
  WriteRaw(evc::AsBytes(text));
}

}  // namespace evc::codec
