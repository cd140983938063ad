#include "evc/codec/keyed.h"

#include <algorithm>

#include "evc/common.h"
#include "evc/error.h"
#include "evc/errors.h"

namespace evc::codec {

std::optional<ValueType> ValueTypeFromCode(uint8_t code) noexcept {
  switch (code) {
    case 0:
      return ValueType::kBool;
    case 1:
      return ValueType::kUInt8;
    case 2:
      return ValueType::kUInt16;
    case 3:
      return ValueType::kUInt32;
    case 4:
      return ValueType::kUInt64;
    case 5:
      return ValueType::kInt8;
    case 6:
      return ValueType::kInt16;
    case 7:
      return ValueType::kInt32;
    case 8:
      return ValueType::kInt64;
    case 9:
      return ValueType::kString;
    case 10:
      return ValueType::kBytes;
    case 11:
      return ValueType::kObject;
    default:
      return std::nullopt;
  }
}

void WriteKey(ByteWriter& writer, std::string_view key) {
  if (key.size() > kMaxKeyLength) {
    throw evc::Error{evc::ErrorDomain::State, evc::errors::state::kFieldTooLarge,
                     std::string(evc::errors::msg::kKeyTooLong)};
  }
  writer.WriteU8(static_cast<uint8_t>(key.size()));
  writer.WriteRaw(evc::AsBytes(key));
}

std::vector<uint8_t> EncodeKey(std::string_view key) {
  ByteWriter writer(1 + key.size());
  WriteKey(writer, key);
  return writer.Release();
}

void ExpectKey(ByteCursor& cursor, std::string_view key) {
  ByteCursor lookahead = cursor;
  const auto length = lookahead.ReadU8();
  const auto stored = lookahead.ReadRaw(length);
  const auto wanted = evc::AsBytes(key);
  if (!std::equal(stored.begin(), stored.end(), wanted.begin(), wanted.end())) {
    throw evc::Error{evc::ErrorDomain::Decode, evc::errors::decode::kKeyNotInPosition,
                     std::string(evc::errors::msg::kKeyNotInPosition) + ": expected '" + std::string(key) + "'"};
  }
  cursor = lookahead;
}

namespace detail {

void ExpectValueType(ByteCursor& cursor, ValueType expected) {
  const auto code = cursor.ReadU8();
  const auto type = ValueTypeFromCode(code);
  if (!type || *type != expected) {
    throw evc::Error{evc::ErrorDomain::Decode, evc::errors::decode::kUnknownCode,
                     std::string(evc::errors::msg::kUnknownValueType) + " (" + std::to_string(code) + ")"};
  }
}

}  // namespace detail

}  // namespace evc::codec
