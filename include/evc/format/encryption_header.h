#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "evc/codec/envelope.h"
#include "evc/format/constants.h"
#include "evc/format/pbe_header.h"
#include "evc/security/secure_buffer.h"

namespace evc::format {

// Cipher of the payload key that the encryption header wraps.
enum class EncryptionAlgorithm : uint8_t {
  kAes128GcmSiv = 0,
  kAes256GcmSiv = 1,
};

constexpr uint8_t ToCode(EncryptionAlgorithm algorithm) noexcept { return static_cast<uint8_t>(algorithm); }
std::optional<EncryptionAlgorithm> EncryptionAlgorithmFromCode(uint8_t code) noexcept;
std::string_view ToString(EncryptionAlgorithm algorithm) noexcept;

constexpr size_t KeyLength(EncryptionAlgorithm algorithm) noexcept {
  return algorithm == EncryptionAlgorithm::kAes128GcmSiv ? 16 : 32;
}

inline constexpr uint32_t kDefaultPbkdf2Iterations = 310000;

class EncryptionHeader {
public:
  static constexpr uint32_t kIdentifier = kEncryptionHeaderIdentifier;
  static constexpr codec::LengthConvention kLengthConvention = codec::LengthConvention::kBodyOnly;
  static constexpr std::string_view kRecordName{"EncryptionHeader"};
  static constexpr size_t kHeaderNonceSize = 12;

  using HeaderNonce = std::array<uint8_t, kHeaderNonceSize>;
  using Salt = std::array<uint8_t, Pbkdf2Sha256Parameters::kSaltSize>;

  static EncryptionHeader Create(uint8_t version, PbeHeader pbe_header, EncryptionAlgorithm algorithm,
                                 std::vector<uint8_t> encrypted_key, const HeaderNonce& header_nonce);

  // Wraps |raw_key| under |passphrase| with PBKDF2-HMAC-SHA256 and the CBC
  // cipher of |pbe_scheme|. Salt, IV and header nonce come from the system
  // CSPRNG. Throws Crypto/kKeyLengthMismatch when |raw_key| does not fit
  // |algorithm|.
  static EncryptionHeader WrapKey(std::span<const uint8_t> raw_key, std::span<const uint8_t> passphrase,
                                  EncryptionAlgorithm algorithm, PbeScheme pbe_scheme,
                                  uint32_t iterations = kDefaultPbkdf2Iterations);

  // Deterministic variant with caller-supplied salt, IV and header nonce.
  static EncryptionHeader WrapKey(std::span<const uint8_t> raw_key, std::span<const uint8_t> passphrase,
                                  EncryptionAlgorithm algorithm, PbeScheme pbe_scheme, uint32_t iterations,
                                  const Salt& salt, const PbeHeader::Nonce& iv, const HeaderNonce& header_nonce);

  // Recovers the payload key. Every failure, a wrong passphrase included,
  // throws the same retryable Crypto/kDecryptionFailed error. The first crypto
  // call in a process logs the provider self-test; run
  // crypto::EnsureCryptoProviderInitialized() at startup to keep it off this path.
  security::SecureBuffer<uint8_t> UnwrapKey(std::span<const uint8_t> passphrase) const;
  security::SecureBuffer<uint8_t> UnwrapKey(std::string_view passphrase) const;

  uint8_t version() const noexcept { return version_; }
  const PbeHeader& pbe_header() const noexcept { return pbe_header_; }
  EncryptionAlgorithm algorithm() const noexcept { return algorithm_; }
  const std::vector<uint8_t>& encrypted_key() const noexcept { return encrypted_key_; }
  const HeaderNonce& header_nonce() const noexcept { return header_nonce_; }

  std::vector<uint8_t> EncodeBody() const;
  static EncryptionHeader DecodeBody(std::span<const uint8_t> body);

  bool operator==(const EncryptionHeader&) const = default;

private:
  EncryptionHeader(uint8_t version, PbeHeader pbe_header, EncryptionAlgorithm algorithm,
                   std::vector<uint8_t> encrypted_key, const HeaderNonce& header_nonce)
      : version_(version),
        pbe_header_(std::move(pbe_header)),
        algorithm_(algorithm),
        encrypted_key_(std::move(encrypted_key)),
        header_nonce_(header_nonce) {}

  uint8_t version_;
  PbeHeader pbe_header_;
  EncryptionAlgorithm algorithm_;
  std::vector<uint8_t> encrypted_key_;
  HeaderNonce header_nonce_;
};

std::ostream& operator<<(std::ostream& os, const EncryptionHeader& header);

}  // namespace evc::format
