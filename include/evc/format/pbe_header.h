#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "evc/codec/envelope.h"
#include "evc/crypto/aes_cbc.h"
#include "evc/format/constants.h"

namespace evc::format {

enum class KdfScheme : uint8_t {
  kPbkdf2Sha256 = 0,
};

enum class PbeScheme : uint8_t {
  kAes128Cbc = 0,
  kAes256Cbc = 1,
};

constexpr uint8_t ToCode(KdfScheme scheme) noexcept { return static_cast<uint8_t>(scheme); }
constexpr uint8_t ToCode(PbeScheme scheme) noexcept { return static_cast<uint8_t>(scheme); }
std::optional<KdfScheme> KdfSchemeFromCode(uint8_t code) noexcept;
std::optional<PbeScheme> PbeSchemeFromCode(uint8_t code) noexcept;
std::string_view ToString(KdfScheme scheme) noexcept;
std::string_view ToString(PbeScheme scheme) noexcept;

constexpr crypto::AesCbcVariant CipherVariant(PbeScheme scheme) noexcept {
  return scheme == PbeScheme::kAes128Cbc ? crypto::AesCbcVariant::kAes128 : crypto::AesCbcVariant::kAes256;
}

struct Pbkdf2Sha256Parameters {
  static constexpr uint32_t kIdentifier = kPbkdf2Sha256ParametersIdentifier;
  static constexpr codec::LengthConvention kLengthConvention = codec::LengthConvention::kBodyOnly;
  static constexpr std::string_view kRecordName{"Pbkdf2Sha256Parameters"};
  static constexpr size_t kSaltSize = 32;

  uint32_t iterations{0};
  std::array<uint8_t, kSaltSize> salt{};

  std::vector<uint8_t> EncodeBody() const;
  static Pbkdf2Sha256Parameters DecodeBody(std::span<const uint8_t> body);

  bool operator==(const Pbkdf2Sha256Parameters&) const = default;
};

// One alternative per KdfScheme.
using KdfParameters = std::variant<Pbkdf2Sha256Parameters>;

bool ParametersMatch(KdfScheme scheme, const KdfParameters& parameters) noexcept;

// Picks the parameter decoder from the nested identifier. Throws
// Decode/kIdentifierMismatch when no known parameter record matches.
KdfParameters DecodeKdfParameters(codec::ByteCursor& cursor);
void EncodeKdfParameters(codec::ByteWriter& writer, const KdfParameters& parameters);

class PbeHeader {
public:
  static constexpr uint32_t kIdentifier = kPbeHeaderIdentifier;
  static constexpr codec::LengthConvention kLengthConvention = codec::LengthConvention::kBodyOnly;
  static constexpr std::string_view kRecordName{"PbeHeader"};
  static constexpr size_t kNonceSize = crypto::AES_CBC::IV_SIZE;

  using Nonce = std::array<uint8_t, kNonceSize>;

  // Throws Decode/kUnknownCode when |kdf_parameters| does not belong to
  // |kdf_scheme|.
  static PbeHeader Create(uint8_t version, KdfScheme kdf_scheme, PbeScheme pbe_scheme,
                          KdfParameters kdf_parameters, const Nonce& nonce);

  uint8_t version() const noexcept { return version_; }
  KdfScheme kdf_scheme() const noexcept { return kdf_scheme_; }
  PbeScheme pbe_scheme() const noexcept { return pbe_scheme_; }
  const KdfParameters& kdf_parameters() const noexcept { return kdf_parameters_; }
  const Nonce& nonce() const noexcept { return nonce_; }

  std::vector<uint8_t> EncodeBody() const;
  static PbeHeader DecodeBody(std::span<const uint8_t> body);

  bool operator==(const PbeHeader&) const = default;

private:
  PbeHeader(uint8_t version, KdfScheme kdf_scheme, PbeScheme pbe_scheme, KdfParameters kdf_parameters,
            const Nonce& nonce)
      : version_(version),
        kdf_scheme_(kdf_scheme),
        pbe_scheme_(pbe_scheme),
        kdf_parameters_(std::move(kdf_parameters)),
        nonce_(nonce) {}

  uint8_t version_;
  KdfScheme kdf_scheme_;
  PbeScheme pbe_scheme_;
  KdfParameters kdf_parameters_;
  Nonce nonce_;
};

// Field-by-field dumps for inspection tools. Byte fields print as hex.
std::ostream& operator<<(std::ostream& os, const Pbkdf2Sha256Parameters& parameters);
std::ostream& operator<<(std::ostream& os, const PbeHeader& header);

}  // namespace evc::format
