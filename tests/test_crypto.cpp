#include "evc/crypto/aes_cbc.h"
#include "evc/crypto/crc32.h"
#include "evc/crypto/ct.h"
#include "evc/crypto/pbkdf2.h"
#include "evc/crypto/provider.h"
#include "evc/crypto/random.h"
#include "evc/error.h"
#include "evc/security/secure_buffer.h"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "test_support.h"

namespace {

using evc::test::Bytes;
using evc::test::CaptureError;
using evc::test::FromHex;

void TestPbkdf2PublishedVectors() {
  const auto password = Bytes("password");
  const auto salt = Bytes("salt");
  std::vector<uint8_t> out(32);

  evc::crypto::PBKDF2_HMAC_SHA256(password, salt, 1, out);
  assert(out == FromHex("120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b") && "c=1");

  evc::crypto::PBKDF2_HMAC_SHA256(password, salt, 2, out);
  assert(out == FromHex("ae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43") && "c=2");

  std::vector<uint8_t> zero_iterations(32);
  evc::crypto::PBKDF2_HMAC_SHA256(password, salt, 0, zero_iterations);
  assert(zero_iterations == FromHex("120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b") &&
         "zero iterations behaves as one");
}

void TestPbkdf2MatchesOpenSSL() {
  const auto password = Bytes("passwordPASSWORDpassword");
  const auto salt = Bytes("saltSALTsaltSALTsaltSALTsaltSALTsalt");
  for (size_t length : {size_t{16}, size_t{32}, size_t{40}, size_t{64}}) {
    std::vector<uint8_t> ours(length);
    std::vector<uint8_t> reference(length);
    evc::crypto::PBKDF2_HMAC_SHA256(password, salt, 4096, ours);
    [[maybe_unused]] const int ok = PKCS5_PBKDF2_HMAC(
        reinterpret_cast<const char*>(password.data()), static_cast<int>(password.size()), salt.data(),
        static_cast<int>(salt.size()), 4096, EVP_sha256(), static_cast<int>(reference.size()), reference.data());
    assert(ok == 1);
    assert(ours == reference && "multi-block output must match OpenSSL");
  }
}

void TestHmacSha256() {
  // RFC 4231 test case 2.
  [[maybe_unused]] const auto mac =
      evc::crypto::GetCryptoProvider().HMACSHA256(Bytes("Jefe"), Bytes("what do ya want for nothing?"));
  const auto expected = FromHex("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
  assert(std::equal(mac.begin(), mac.end(), expected.begin(), expected.end()));
}

void TestAesCbcRoundTrip() {
  std::array<uint8_t, 16> iv{};
  iv.fill(0x24);
  const std::vector<uint8_t> key(32, 0x42);
  const auto plaintext = Bytes("seventeen bytes!!");

  const auto ciphertext =
      evc::crypto::AES_CBC_Encrypt(evc::crypto::AesCbcVariant::kAes256, plaintext, iv, key);
  assert(ciphertext.size() == 32 && "17 bytes pad to two blocks");

  evc::security::SecureBuffer<uint8_t> out(ciphertext.size() + evc::crypto::AES_CBC::BLOCK_SIZE);
  [[maybe_unused]] const size_t n =
      evc::crypto::AES_CBC_Decrypt_Secure(evc::crypto::AesCbcVariant::kAes256, ciphertext, iv, key, out);
  assert(n == plaintext.size() && std::equal(plaintext.begin(), plaintext.end(), out.data()));

  const auto truncated = std::vector<uint8_t>(ciphertext.begin(), ciphertext.end() - 1);
  bool auth_failed = false;
  try {
    evc::security::SecureBuffer<uint8_t> sink(truncated.size() + evc::crypto::AES_CBC::BLOCK_SIZE);
    (void)evc::crypto::AES_CBC_Decrypt_Secure(evc::crypto::AesCbcVariant::kAes256, truncated, iv, key, sink);
  } catch (const evc::AuthenticationFailureError&) {
    auth_failed = true;
  }
  assert(auth_failed && "a partial final block cannot carry valid padding");
}

void TestCipherKeySizeChecked() {
  std::array<uint8_t, 16> iv{};
  const std::vector<uint8_t> short_key(16, 0x01);
  [[maybe_unused]] auto error = CaptureError([&] {
    (void)evc::crypto::AES_CBC_Encrypt(evc::crypto::AesCbcVariant::kAes256, Bytes("x"), iv, short_key);
  });
  assert(error && error->domain == evc::ErrorDomain::Crypto &&
         error->code == evc::errors::crypto::kKeyLengthMismatch);
}

void TestCrc32() {
  const auto data = Bytes("123456789");
  assert(evc::crypto::Crc32(data) == 0xCBF43926u && "standard check value");
  assert(evc::crypto::Crc32({}) == 0 && "empty input");
  const auto head = std::span<const uint8_t>(data).first(4);
  const auto tail = std::span<const uint8_t>(data).subspan(4);
  assert(evc::crypto::Crc32(tail, evc::crypto::Crc32(head)) == 0xCBF43926u && "seeded continuation");
}

void TestSystemRandomBytes() {
  std::array<uint8_t, 32> a{};
  std::array<uint8_t, 32> b{};
  evc::crypto::SystemRandomBytes(a);
  evc::crypto::SystemRandomBytes(b);
  assert(!evc::crypto::ct::CompareEqual(a, b) && "two draws must differ");
  evc::crypto::SystemRandomBytes(std::span<uint8_t>{});
}

void TestConstantTimeCompare() {
  const std::array<uint8_t, 4> x{1, 2, 3, 4};
  std::array<uint8_t, 4> y{1, 2, 3, 4};
  assert(evc::crypto::ct::CompareEqual(x, y));
  y[3] = 5;
  assert(!evc::crypto::ct::CompareEqual(x, y));
  const std::vector<uint8_t> shorter{1, 2, 3};
  assert(!evc::crypto::ct::CompareEqual(std::span<const uint8_t>(x), std::span<const uint8_t>(shorter)));
}

}  // namespace

int main() {
  evc::crypto::EnsureCryptoProviderInitialized();
  TestPbkdf2PublishedVectors();
  TestPbkdf2MatchesOpenSSL();
  TestHmacSha256();
  TestAesCbcRoundTrip();
  TestCipherKeySizeChecked();
  TestCrc32();
  TestSystemRandomBytes();
  TestConstantTimeCompare();
  std::cout << "crypto test ok\n";
  return 0;
}
