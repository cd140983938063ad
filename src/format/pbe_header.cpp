#include "evc/format/pbe_header.h"

#include <ostream>
#include <string>
#include <variant>

#include "evc/codec/hex.h"
#include "evc/error.h"
#include "evc/errors.h"

namespace evc::format {

namespace {

[[noreturn]] void ThrowUnknownCode(std::string_view message, uint8_t code, std::string_view record) {
  codec::ThrowDecodeError(evc::errors::decode::kUnknownCode,
                          std::string(message) + " (" + std::to_string(code) + ")", record);
}

}  // namespace

std::optional<KdfScheme> KdfSchemeFromCode(uint8_t code) noexcept {
  switch (code) {
    case 0:
      return KdfScheme::kPbkdf2Sha256;
    default:
      return std::nullopt;
  }
}

std::optional<PbeScheme> PbeSchemeFromCode(uint8_t code) noexcept {
  switch (code) {
    case 0:
      return PbeScheme::kAes128Cbc;
    case 1:
      return PbeScheme::kAes256Cbc;
    default:
      return std::nullopt;
  }
}

std::string_view ToString(KdfScheme scheme) noexcept {
  switch (scheme) {
    case KdfScheme::kPbkdf2Sha256:
      return "pbkdf2-hmac-sha256";
  }
  return "unknown";
}

std::string_view ToString(PbeScheme scheme) noexcept {
  switch (scheme) {
    case PbeScheme::kAes128Cbc:
      return "aes-128-cbc";
    case PbeScheme::kAes256Cbc:
      return "aes-256-cbc";
  }
  return "unknown";
}

std::vector<uint8_t> Pbkdf2Sha256Parameters::EncodeBody() const {
  codec::ByteWriter writer(sizeof(uint32_t) + kSaltSize);
  writer.WriteU32(iterations);
  writer.WriteArray(salt);
  return writer.Release();
}

Pbkdf2Sha256Parameters Pbkdf2Sha256Parameters::DecodeBody(std::span<const uint8_t> body) {
  codec::ByteCursor cursor(body);
  Pbkdf2Sha256Parameters parameters;
  parameters.iterations = cursor.ReadU32();
  parameters.salt = cursor.ReadArray<kSaltSize>();
  return parameters;
}

bool ParametersMatch(KdfScheme scheme, const KdfParameters& parameters) noexcept {
  switch (scheme) {
    case KdfScheme::kPbkdf2Sha256:
      return std::holds_alternative<Pbkdf2Sha256Parameters>(parameters);
  }
  return false;
}

KdfParameters DecodeKdfParameters(codec::ByteCursor& cursor) {
  const uint32_t identifier = codec::PeekIdentifier(cursor);
  if (identifier == Pbkdf2Sha256Parameters::kIdentifier) {
    return codec::DecodeAndValidate<Pbkdf2Sha256Parameters>(cursor);
  }
  codec::ThrowDecodeError(evc::errors::decode::kIdentifierMismatch, evc::errors::msg::kMismatchIdentifierKdf,
                          PbeHeader::kRecordName);
}

void EncodeKdfParameters(codec::ByteWriter& writer, const KdfParameters& parameters) {
  std::visit([&writer](const auto& record) { codec::EncodeInto(writer, record); }, parameters);
}

PbeHeader PbeHeader::Create(uint8_t version, KdfScheme kdf_scheme, PbeScheme pbe_scheme,
                            KdfParameters kdf_parameters, const Nonce& nonce) {
  if (!ParametersMatch(kdf_scheme, kdf_parameters)) {
    codec::ThrowDecodeError(evc::errors::decode::kUnknownCode, evc::errors::msg::kKdfParametersMismatch,
                            kRecordName);
  }
  return PbeHeader(version, kdf_scheme, pbe_scheme, std::move(kdf_parameters), nonce);
}

std::vector<uint8_t> PbeHeader::EncodeBody() const {
  codec::ByteWriter writer;
  writer.WriteU8(version_);
  writer.WriteU8(ToCode(kdf_scheme_));
  writer.WriteU8(ToCode(pbe_scheme_));
  EncodeKdfParameters(writer, kdf_parameters_);
  writer.WriteArray(nonce_);
  return writer.Release();
}

PbeHeader PbeHeader::DecodeBody(std::span<const uint8_t> body) {
  codec::ByteCursor cursor(body);
  const uint8_t version = cursor.ReadU8();
  const uint8_t kdf_code = cursor.ReadU8();
  const auto kdf_scheme = KdfSchemeFromCode(kdf_code);
  if (!kdf_scheme) {
    ThrowUnknownCode(evc::errors::msg::kUnknownKdfScheme, kdf_code, kRecordName);
  }
  const uint8_t pbe_code = cursor.ReadU8();
  const auto pbe_scheme = PbeSchemeFromCode(pbe_code);
  if (!pbe_scheme) {
    ThrowUnknownCode(evc::errors::msg::kUnknownPbeScheme, pbe_code, kRecordName);
  }
  KdfParameters parameters = DecodeKdfParameters(cursor);
  const Nonce nonce = cursor.ReadArray<kNonceSize>();
  return Create(version, *kdf_scheme, *pbe_scheme, std::move(parameters), nonce);
}

std::ostream& operator<<(std::ostream& os, const Pbkdf2Sha256Parameters& parameters) {
  return os << "Pbkdf2Sha256Parameters{iterations=" << parameters.iterations
            << ", salt=" << codec::HexEncode(parameters.salt) << '}';
}

std::ostream& operator<<(std::ostream& os, const PbeHeader& header) {
  os << "PbeHeader{version=" << static_cast<unsigned>(header.version())
     << ", kdf_scheme=" << ToString(header.kdf_scheme()) << ", pbe_scheme=" << ToString(header.pbe_scheme())
     << ", kdf_parameters=";
  std::visit([&os](const auto& parameters) { os << parameters; }, header.kdf_parameters());
  return os << ", nonce=" << codec::HexEncode(header.nonce()) << '}';
}

}  // namespace evc::format
