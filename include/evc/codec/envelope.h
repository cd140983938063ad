#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "evc/codec/value_codec.h"
#include "evc/error.h"
#include "evc/errors.h"

namespace evc::codec {

// Every header and footer is framed as
//   identifier (4 bytes, big-endian) | length (8 bytes, little-endian) | body
inline constexpr std::size_t kIdentifierSize = 4;
inline constexpr std::size_t kLengthFieldSize = 8;
inline constexpr std::size_t kEnvelopePrefixSize = kIdentifierSize + kLengthFieldSize;

// What the length field counts. This differs between record families and is
// part of the on-disk format: chunk headers count the 12 prefix bytes, every
// other record counts its body alone.
enum class LengthConvention : uint8_t {
  kBodyOnly,
  kIncludesPrefix,
};

struct Envelope {
  uint32_t identifier{0};
  uint64_t length{0};               // as stored
  std::span<const uint8_t> body{};  // view into the decoded buffer
};

std::vector<uint8_t> EncodeEnvelope(uint32_t identifier, std::span<const uint8_t> body,
                                    LengthConvention convention);

// Reads one envelope and advances |cursor| past it. Throws Decode/kMalformedLength
// when the declared length does not fit the available bytes.
Envelope DecodeEnvelope(ByteCursor& cursor, LengthConvention convention);

// Leading identifier of |bytes|, or nullopt when fewer than four bytes exist.
std::optional<uint32_t> PeekIdentifier(std::span<const uint8_t> bytes) noexcept;

// Same as PeekIdentifier but throws IO/kUnexpectedEof on a short buffer.
uint32_t PeekIdentifier(const ByteCursor& cursor);

[[noreturn]] void ThrowDecodeError(int code, std::string_view message, std::string_view record);

// Appends |record| to the error's context unless it already names it last.
void AddRecordContext(evc::Error& error, std::string_view record);

// Decode<T> calls this after the outermost record. Body decoders do not: the
// envelope length bounds the body, and fields appended by a newer record version
// are skipped.
void RequireFullyConsumed(const ByteCursor& cursor, std::string_view record);

// A record that knows its identifier, length convention and body codec.
template <class T>
concept EnvelopedRecord = requires(const T& record, std::span<const uint8_t> body) {
  { T::kIdentifier } -> std::convertible_to<uint32_t>;
  { T::kLengthConvention } -> std::convertible_to<LengthConvention>;
  { T::kRecordName } -> std::convertible_to<std::string_view>;
  { record.EncodeBody() } -> std::same_as<std::vector<uint8_t>>;
  { T::DecodeBody(body) } -> std::same_as<T>;
};

template <EnvelopedRecord T>
std::vector<uint8_t> Encode(const T& record) {
  const auto body = record.EncodeBody();
  return EncodeEnvelope(T::kIdentifier, std::span<const uint8_t>(body.data(), body.size()),
                        T::kLengthConvention);
}

template <EnvelopedRecord T>
void EncodeInto(ByteWriter& writer, const T& record) {
  const auto framed = Encode(record);
  writer.WriteRaw(std::span<const uint8_t>(framed.data(), framed.size()));
}

// Decodes one record of type T from |cursor|. The identifier is checked before
// the length, so a reader probing for the record type always gets
// kIdentifierMismatch for foreign bytes. |cursor| only advances on success.
template <EnvelopedRecord T>
T DecodeAndValidate(ByteCursor& cursor) {
  if (PeekIdentifier(cursor) != T::kIdentifier) {
    ThrowDecodeError(errors::decode::kIdentifierMismatch, errors::msg::kMismatchIdentifier, T::kRecordName);
  }
  ByteCursor lookahead = cursor;
  Envelope envelope{};
  try {
    envelope = DecodeEnvelope(lookahead, T::kLengthConvention);
  } catch (evc::Error& error) {
    AddRecordContext(error, T::kRecordName);
    throw;
  }
  T record = [&]() {
    try {
      return T::DecodeBody(envelope.body);
    } catch (evc::Error& error) {
      AddRecordContext(error, T::kRecordName);
      throw;
    }
  }();
  cursor = lookahead;
  return record;
}

// Decodes exactly one record occupying all of |bytes|.
template <EnvelopedRecord T>
T Decode(std::span<const uint8_t> bytes) {
  ByteCursor cursor(bytes);
  T record = DecodeAndValidate<T>(cursor);
  RequireFullyConsumed(cursor, T::kRecordName);
  return record;
}

}  // namespace evc::codec
