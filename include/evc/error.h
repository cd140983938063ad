#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace evc {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x02,
    Crypto = 0x03,
    Decode = 0x04,
    State = 0x07,
  };

  // Each domain reserves a span of codes so callers can branch on the code
  // alone. Codes inside the reserved range are stable across releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Decode:
      return 0x0400;
    case ErrorDomain::State:
      return 0x0700;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kUnexpectedEof = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kEntropyUnavailable = Make(ErrorDomain::IO, 0x02);
    } // namespace io

    // A caller that gets kIdentifierMismatch may try another decoder on the
    // same bytes. Every other decode code means the bytes are corrupt.
    namespace decode {
      inline constexpr int kIdentifierMismatch = Make(ErrorDomain::Decode, 0x01);
      inline constexpr int kUnknownCode = Make(ErrorDomain::Decode, 0x02);
      inline constexpr int kMalformedLength = Make(ErrorDomain::Decode, 0x03);
      inline constexpr int kTrailingBytes = Make(ErrorDomain::Decode, 0x04);
      inline constexpr int kKeyNotInPosition = Make(ErrorDomain::Decode, 0x05);
      inline constexpr int kChunkSequenceGap = Make(ErrorDomain::Decode, 0x06);
    } // namespace decode

    namespace crypto {
      inline constexpr int kDecryptionFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kKeyLengthMismatch = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Crypto, 0x04);
    } // namespace crypto

    namespace state {
      inline constexpr int kSequenceExhausted = Make(ErrorDomain::State, 0x01);
      // Encode side: a value does not fit its length prefix.
      inline constexpr int kFieldTooLarge = Make(ErrorDomain::State, 0x02);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context; // innermost record first
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Raised by the crypto provider when CBC padding does not verify. Never
  // escapes a key unwrap; see format::EncryptionHeader::UnwrapKey.
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };
} // namespace evc
