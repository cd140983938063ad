#include "evc/codec/envelope.h"

#include <cstring>
#include <sstream>

#include "evc/common.h"

namespace evc::codec {

namespace {

std::string DescribeLength(uint64_t declared, std::size_t available) {
  std::ostringstream oss;
  oss << evc::errors::msg::kHeaderLength << " (declared " << declared << ", available " << available << ")";
  return oss.str();
}

}  // namespace

void ThrowDecodeError(int code, std::string_view message, std::string_view record) {
  std::vector<std::string> context;
  if (!record.empty()) {
    context.emplace_back(record);
  }
  throw evc::Error{evc::ErrorDomain::Decode, code, std::string(message), std::nullopt,
                   evc::Retryability::kFatal, std::move(context)};
}

void AddRecordContext(evc::Error& error, std::string_view record) {
  if (error.context.empty() || error.context.back() != record) {
    error.context.emplace_back(record);
  }
}

void RequireFullyConsumed(const ByteCursor& cursor, std::string_view record) {
  if (!cursor.empty()) {
    ThrowDecodeError(evc::errors::decode::kTrailingBytes, evc::errors::msg::kUnexpectedTrailingBytes, record);
  }
}

std::vector<uint8_t> EncodeEnvelope(uint32_t identifier, std::span<const uint8_t> body,
                                    LengthConvention convention) {
  uint64_t length = static_cast<uint64_t>(body.size());
  if (convention == LengthConvention::kIncludesPrefix) {
    length += kEnvelopePrefixSize;
  }
  ByteWriter writer(kEnvelopePrefixSize + body.size());
  writer.WriteU32BigEndian(identifier);
  writer.WriteU64(length);
  writer.WriteRaw(body);
  return writer.Release();
}

Envelope DecodeEnvelope(ByteCursor& cursor, LengthConvention convention) {
  ByteCursor lookahead = cursor;
  Envelope envelope{};
  envelope.identifier = lookahead.ReadU32BigEndian();
  envelope.length = lookahead.ReadU64();

  uint64_t body_length = envelope.length;
  if (convention == LengthConvention::kIncludesPrefix) {
    if (body_length < kEnvelopePrefixSize) {
      ThrowDecodeError(evc::errors::decode::kMalformedLength, evc::errors::msg::kDeclaredLengthTooShort, {});
    }
    body_length -= kEnvelopePrefixSize;
  }
  if (body_length > lookahead.remaining()) {
    ThrowDecodeError(evc::errors::decode::kMalformedLength, DescribeLength(envelope.length, lookahead.remaining()),
                     {});
  }

  envelope.body = lookahead.ReadRaw(static_cast<std::size_t>(body_length));
  cursor = lookahead;
  return envelope;
}

std::optional<uint32_t> PeekIdentifier(std::span<const uint8_t> bytes) noexcept {
  if (bytes.size() < kIdentifierSize) {
    return std::nullopt;
  }
  uint32_t be = 0;
  std::memcpy(&be, bytes.data(), sizeof(be));
  return evc::FromBigEndian32(be);
}

uint32_t PeekIdentifier(const ByteCursor& cursor) {
  ByteCursor lookahead = cursor;
  return lookahead.ReadU32BigEndian();
}

}  // namespace evc::codec
