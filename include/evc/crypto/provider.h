#pragma once

#include <array>
#include <memory>
#include <span>
#include <vector>

#include "evc/crypto/aes_cbc.h"

namespace evc::crypto {

inline constexpr size_t kHmacSha256TagSize = 32;

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::vector<uint8_t> EncryptAESCBC(
      AesCbcVariant variant,
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
      std::span<const uint8_t> key) = 0;

  // Decrypts directly into |destination| so the recovered key never sits in
  // pageable std::vector memory. Returns the plaintext length written.
  // Throws AuthenticationFailureError on a padding failure.
  virtual size_t DecryptAESCBC(
      AesCbcVariant variant,
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
      std::span<const uint8_t> key,
      std::span<uint8_t> destination) = 0;

  virtual std::array<uint8_t, kHmacSha256TagSize> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::vector<uint8_t> EncryptAESCBC(
      AesCbcVariant variant,
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
      std::span<const uint8_t> key) override;

  size_t DecryptAESCBC(
      AesCbcVariant variant,
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
      std::span<const uint8_t> key,
      std::span<uint8_t> destination) override;

  std::array<uint8_t, kHmacSha256TagSize> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // runs the hardware detection and known-answer test once

}  // namespace evc::crypto
