#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace evc::security { template<typename T> class SecureBuffer; }

namespace evc::crypto {

enum class AesCbcVariant : uint8_t {
  kAes128,
  kAes256,
};

struct AES_CBC {
  static constexpr size_t IV_SIZE = 16;
  static constexpr size_t BLOCK_SIZE = 16;
  static constexpr size_t AES128_KEY_SIZE = 16;
  static constexpr size_t AES256_KEY_SIZE = 32;
};

constexpr size_t KeySize(AesCbcVariant variant) noexcept {
  return variant == AesCbcVariant::kAes128 ? AES_CBC::AES128_KEY_SIZE : AES_CBC::AES256_KEY_SIZE;
}

// Encrypts |plaintext| with PKCS#7 padding. Throws evc::Error on provider
// failures or a key of the wrong size.
std::vector<uint8_t> AES_CBC_Encrypt(AesCbcVariant variant,
                                     std::span<const uint8_t> plaintext,
                                     std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
                                     std::span<const uint8_t> key);

// Decrypts |ciphertext| into |dest_buffer|, which must hold at least
// ciphertext.size() + BLOCK_SIZE bytes, and returns the plaintext length. Throws
// AuthenticationFailureError when the padding does not verify.
size_t AES_CBC_Decrypt_Secure(AesCbcVariant variant,
                              std::span<const uint8_t> ciphertext,
                              std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
                              std::span<const uint8_t> key,
                              evc::security::SecureBuffer<uint8_t>& dest_buffer);

} // namespace evc::crypto
