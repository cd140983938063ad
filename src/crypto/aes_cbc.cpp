#include "evc/crypto/aes_cbc.h"

#include "evc/crypto/provider.h"
#include "evc/security/secure_buffer.h"

namespace evc::crypto {

std::vector<uint8_t> AES_CBC_Encrypt(AesCbcVariant variant,
                                     std::span<const uint8_t> plaintext,
                                     std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
                                     std::span<const uint8_t> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAESCBC(variant, plaintext, iv, key);
}

size_t AES_CBC_Decrypt_Secure(AesCbcVariant variant,
                              std::span<const uint8_t> ciphertext,
                              std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
                              std::span<const uint8_t> key,
                              evc::security::SecureBuffer<uint8_t>& dest_buffer) {
  auto provider = GetCryptoProviderShared();
  return provider->DecryptAESCBC(variant, ciphertext, iv, key, dest_buffer.AsSpan());
}

}  // namespace evc::crypto
