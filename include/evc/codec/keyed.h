#pragma once

// Keyed encoding for free-form metadata fields: a short string key, a one-byte
// value-kind tag, then the value in its ordinary encoding.
//
//   key length (u8) | key bytes | ValueType (u8) | value

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "evc/codec/envelope.h"
#include "evc/codec/value_codec.h"

namespace evc::codec {

enum class ValueType : uint8_t {
  kBool = 0,
  kUInt8 = 1,
  kUInt16 = 2,
  kUInt32 = 3,
  kUInt64 = 4,
  kInt8 = 5,
  kInt16 = 6,
  kInt32 = 7,
  kInt64 = 8,
  kString = 9,
  kBytes = 10,
  kObject = 11,
};

std::optional<ValueType> ValueTypeFromCode(uint8_t code) noexcept;

namespace keys {
inline constexpr std::string_view kCaseNumber{"cn"};
inline constexpr std::string_view kEvidenceNumber{"ev"};
inline constexpr std::string_view kExaminerName{"ex"};
inline constexpr std::string_view kNotes{"no"};
inline constexpr std::string_view kAcquisitionStart{"as"};
inline constexpr std::string_view kAcquisitionEnd{"ae"};
inline constexpr std::string_view kDescriptionNotes{"dn"};
}  // namespace keys

inline constexpr std::size_t kMaxKeyLength = 255;

void WriteKey(ByteWriter& writer, std::string_view key);
std::vector<uint8_t> EncodeKey(std::string_view key);

// Consumes the key at the cursor. Throws Decode/kKeyNotInPosition when it is
// not |key|.
void ExpectKey(ByteCursor& cursor, std::string_view key);

namespace detail {

template <class T>
constexpr ValueType ValueTypeOf() {
  if constexpr (std::is_same_v<T, bool>) {
    return ValueType::kBool;
  } else if constexpr (std::is_same_v<T, uint8_t>) {
    return ValueType::kUInt8;
  } else if constexpr (std::is_same_v<T, uint16_t>) {
    return ValueType::kUInt16;
  } else if constexpr (std::is_same_v<T, uint32_t>) {
    return ValueType::kUInt32;
  } else if constexpr (std::is_same_v<T, uint64_t>) {
    return ValueType::kUInt64;
  } else if constexpr (std::is_same_v<T, int8_t>) {
    return ValueType::kInt8;
  } else if constexpr (std::is_same_v<T, int16_t>) {
    return ValueType::kInt16;
  } else if constexpr (std::is_same_v<T, int32_t>) {
    return ValueType::kInt32;
  } else if constexpr (std::is_same_v<T, int64_t>) {
    return ValueType::kInt64;
  } else if constexpr (std::is_same_v<T, std::string>) {
    return ValueType::kString;
  } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
    return ValueType::kBytes;
  } else {
    static_assert(EnvelopedRecord<T>, "unsupported keyed value type");
    return ValueType::kObject;
  }
}

template <class T>
void WriteValue(ByteWriter& writer, const T& value) {
  if constexpr (std::is_same_v<T, bool>) {
    writer.WriteBool(value);
  } else if constexpr (std::is_same_v<T, uint8_t>) {
    writer.WriteU8(value);
  } else if constexpr (std::is_same_v<T, uint16_t>) {
    writer.WriteU16(value);
  } else if constexpr (std::is_same_v<T, uint32_t>) {
    writer.WriteU32(value);
  } else if constexpr (std::is_same_v<T, uint64_t>) {
    writer.WriteU64(value);
  } else if constexpr (std::is_same_v<T, int8_t>) {
    writer.WriteI8(value);
  } else if constexpr (std::is_same_v<T, int16_t>) {
    writer.WriteI16(value);
  } else if constexpr (std::is_same_v<T, int32_t>) {
    writer.WriteI32(value);
  } else if constexpr (std::is_same_v<T, int64_t>) {
    writer.WriteI64(value);
  } else if constexpr (std::is_same_v<T, std::string>) {
    writer.WriteString(value);
  } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
    writer.WriteBytes(std::span<const uint8_t>(value.data(), value.size()));
  } else {
    EncodeInto(writer, value);
  }
}

template <class T>
T ReadValue(ByteCursor& cursor) {
  if constexpr (std::is_same_v<T, bool>) {
    return cursor.ReadBool();
  } else if constexpr (std::is_same_v<T, uint8_t>) {
    return cursor.ReadU8();
  } else if constexpr (std::is_same_v<T, uint16_t>) {
    return cursor.ReadU16();
  } else if constexpr (std::is_same_v<T, uint32_t>) {
    return cursor.ReadU32();
  } else if constexpr (std::is_same_v<T, uint64_t>) {
    return cursor.ReadU64();
  } else if constexpr (std::is_same_v<T, int8_t>) {
    return cursor.ReadI8();
  } else if constexpr (std::is_same_v<T, int16_t>) {
    return cursor.ReadI16();
  } else if constexpr (std::is_same_v<T, int32_t>) {
    return cursor.ReadI32();
  } else if constexpr (std::is_same_v<T, int64_t>) {
    return cursor.ReadI64();
  } else if constexpr (std::is_same_v<T, std::string>) {
    return cursor.ReadString();
  } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
    return cursor.ReadBytes();
  } else {
    return DecodeAndValidate<T>(cursor);
  }
}

void ExpectValueType(ByteCursor& cursor, ValueType expected);

}  // namespace detail

template <class T>
void WriteForKey(ByteWriter& writer, std::string_view key, const T& value) {
  WriteKey(writer, key);
  writer.WriteU8(static_cast<uint8_t>(detail::ValueTypeOf<T>()));
  detail::WriteValue(writer, value);
}

template <class T>
std::vector<uint8_t> EncodeForKey(std::string_view key, const T& value) {
  ByteWriter writer;
  WriteForKey(writer, key, value);
  return writer.Release();
}

// Reads a value stored under |key|. The cursor only advances on success.
template <class T>
T DecodeForKey(ByteCursor& cursor, std::string_view key) {
  ByteCursor lookahead = cursor;
  ExpectKey(lookahead, key);
  detail::ExpectValueType(lookahead, detail::ValueTypeOf<T>());
  T value = detail::ReadValue<T>(lookahead);
  cursor = lookahead;
  return value;
}

}  // namespace evc::codec
