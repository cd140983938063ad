#include "evc/format/encryption_header.h"

#include <algorithm>
#include <ostream>
#include <string>
#include <variant>

#include "evc/codec/hex.h"
#include "evc/common.h"
#include "evc/crypto/aes_cbc.h"
#include "evc/crypto/pbkdf2.h"
#include "evc/crypto/random.h"
#include "evc/error.h"
#include "evc/errors.h"

namespace evc::format {

namespace {

// Wrong passphrase, bad padding and a key of the wrong length look identical
// to the caller.
[[noreturn]] void ThrowDecryptionFailed() {
  throw evc::Error{evc::ErrorDomain::Crypto, evc::errors::crypto::kDecryptionFailed,
                   std::string(evc::errors::msg::kDecryptionFailed), std::nullopt,
                   evc::Retryability::kRetryable};
}

void DeriveKeyEncryptionKey(const PbeHeader& pbe_header, std::span<const uint8_t> passphrase,
                            std::span<uint8_t> kek) {
  switch (pbe_header.kdf_scheme()) {
    case KdfScheme::kPbkdf2Sha256: {
      const auto* parameters = std::get_if<Pbkdf2Sha256Parameters>(&pbe_header.kdf_parameters());
      if (parameters == nullptr) {
        break;
      }
      crypto::PBKDF2_HMAC_SHA256(passphrase, parameters->salt, parameters->iterations, kek);
      return;
    }
  }
  codec::ThrowDecodeError(evc::errors::decode::kUnknownCode, evc::errors::msg::kKdfParametersMismatch,
                          PbeHeader::kRecordName);
}

}  // namespace

std::optional<EncryptionAlgorithm> EncryptionAlgorithmFromCode(uint8_t code) noexcept {
  switch (code) {
    case 0:
      return EncryptionAlgorithm::kAes128GcmSiv;
    case 1:
      return EncryptionAlgorithm::kAes256GcmSiv;
    default:
      return std::nullopt;
  }
}

std::string_view ToString(EncryptionAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case EncryptionAlgorithm::kAes128GcmSiv:
      return "aes-128-gcm-siv";
    case EncryptionAlgorithm::kAes256GcmSiv:
      return "aes-256-gcm-siv";
  }
  return "unknown";
}

EncryptionHeader EncryptionHeader::Create(uint8_t version, PbeHeader pbe_header, EncryptionAlgorithm algorithm,
                                          std::vector<uint8_t> encrypted_key, const HeaderNonce& header_nonce) {
  return EncryptionHeader(version, std::move(pbe_header), algorithm, std::move(encrypted_key), header_nonce);
}

EncryptionHeader EncryptionHeader::WrapKey(std::span<const uint8_t> raw_key, std::span<const uint8_t> passphrase,
                                           EncryptionAlgorithm algorithm, PbeScheme pbe_scheme,
                                           uint32_t iterations) {
  Salt salt{};
  PbeHeader::Nonce iv{};
  HeaderNonce header_nonce{};
  crypto::SystemRandomBytes(salt);
  crypto::SystemRandomBytes(iv);
  crypto::SystemRandomBytes(header_nonce);
  return WrapKey(raw_key, passphrase, algorithm, pbe_scheme, iterations, salt, iv, header_nonce);
}

EncryptionHeader EncryptionHeader::WrapKey(std::span<const uint8_t> raw_key, std::span<const uint8_t> passphrase,
                                           EncryptionAlgorithm algorithm, PbeScheme pbe_scheme, uint32_t iterations,
                                           const Salt& salt, const PbeHeader::Nonce& iv,
                                           const HeaderNonce& header_nonce) {
  if (raw_key.size() != KeyLength(algorithm)) {
    throw evc::Error{evc::ErrorDomain::Crypto, evc::errors::crypto::kKeyLengthMismatch,
                     std::string(evc::errors::msg::kRawKeyLengthMismatch) + " (got " +
                         std::to_string(raw_key.size()) + ", need " + std::to_string(KeyLength(algorithm)) + ")"};
  }

  Pbkdf2Sha256Parameters parameters;
  parameters.iterations = iterations;
  parameters.salt = salt;
  PbeHeader pbe_header =
      PbeHeader::Create(kDefaultPbeHeaderVersion, KdfScheme::kPbkdf2Sha256, pbe_scheme, parameters, iv);

  const auto variant = CipherVariant(pbe_scheme);
  security::SecureBuffer<uint8_t> kek(crypto::KeySize(variant));
  DeriveKeyEncryptionKey(pbe_header, passphrase, kek.AsSpan());
  auto encrypted_key = crypto::AES_CBC_Encrypt(variant, raw_key, iv, kek.AsSpan());

  return Create(kDefaultEncryptionHeaderVersion, std::move(pbe_header), algorithm, std::move(encrypted_key),
                header_nonce);
}

security::SecureBuffer<uint8_t> EncryptionHeader::UnwrapKey(std::span<const uint8_t> passphrase) const {
  const auto variant = CipherVariant(pbe_header_.pbe_scheme());
  security::SecureBuffer<uint8_t> kek(crypto::KeySize(variant));
  DeriveKeyEncryptionKey(pbe_header_, passphrase, kek.AsSpan());

  security::SecureBuffer<uint8_t> plaintext(encrypted_key_.size() + crypto::AES_CBC::BLOCK_SIZE);
  size_t recovered = 0;
  try {
    recovered = crypto::AES_CBC_Decrypt_Secure(variant, encrypted_key_, pbe_header_.nonce(), kek.AsSpan(),
                                               plaintext);
  } catch (const evc::AuthenticationFailureError&) {
    ThrowDecryptionFailed();
  }

  const size_t expected = KeyLength(algorithm_);
  if (recovered != expected) {
    ThrowDecryptionFailed();
  }
  security::SecureBuffer<uint8_t> key(expected);
  std::copy_n(plaintext.data(), expected, key.data());
  return key;
}

security::SecureBuffer<uint8_t> EncryptionHeader::UnwrapKey(std::string_view passphrase) const {
  return UnwrapKey(evc::AsBytes(passphrase));
}

std::vector<uint8_t> EncryptionHeader::EncodeBody() const {
  codec::ByteWriter writer;
  writer.WriteU8(version_);
  codec::EncodeInto(writer, pbe_header_);
  writer.WriteU8(ToCode(algorithm_));
  writer.WriteBytes(std::span<const uint8_t>(encrypted_key_.data(), encrypted_key_.size()));
  writer.WriteArray(header_nonce_);
  return writer.Release();
}

EncryptionHeader EncryptionHeader::DecodeBody(std::span<const uint8_t> body) {
  codec::ByteCursor cursor(body);
  const uint8_t version = cursor.ReadU8();
  PbeHeader pbe_header = codec::DecodeAndValidate<PbeHeader>(cursor);
  const uint8_t code = cursor.ReadU8();
  const auto algorithm = EncryptionAlgorithmFromCode(code);
  if (!algorithm) {
    codec::ThrowDecodeError(evc::errors::decode::kUnknownCode,
                            std::string(evc::errors::msg::kUnknownEncryptionAlgorithm) + " (" +
                                std::to_string(code) + ")",
                            kRecordName);
  }
  std::vector<uint8_t> encrypted_key = cursor.ReadBytes();
  const HeaderNonce header_nonce = cursor.ReadArray<kHeaderNonceSize>();
  return EncryptionHeader(version, std::move(pbe_header), *algorithm, std::move(encrypted_key), header_nonce);
}

// The wrapped key is ciphertext; printing it leaks nothing the file does not.
std::ostream& operator<<(std::ostream& os, const EncryptionHeader& header) {
  return os << "EncryptionHeader{version=" << static_cast<unsigned>(header.version())
            << ", pbe_header=" << header.pbe_header() << ", algorithm=" << ToString(header.algorithm())
            << ", encrypted_key=" << codec::HexEncode(header.encrypted_key())
            << ", header_nonce=" << codec::HexEncode(header.header_nonce()) << '}';
}

}  // namespace evc::format
