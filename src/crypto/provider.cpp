#include "evc/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#if defined(_MSC_VER)
#include <intrin.h>
#elif defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
#include <cpuid.h>
#endif

#if defined(__linux__) && defined(__aarch64__)
#include <asm/hwcap.h>
#include <sys/auxv.h>
#endif

#include <algorithm>
#include <array>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "evc/crypto/ct.h"
#include "evc/error.h"
#include "evc/errors.h"

namespace evc::crypto {

namespace {

[[noreturn]] void ThrowCryptoError(const std::string& message,
                                   int code = evc::errors::crypto::kProviderFailure);

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;

struct HardwareCapabilities {
  bool aesni{false};
  bool sha{false};
};

struct RuntimeState {
  std::once_flag once;
  HardwareCapabilities caps{};
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

HardwareCapabilities DetectHardwareCapabilities() {
  HardwareCapabilities caps{};
#if defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86))
  int cpu_info[4] = {0};
  __cpuid(cpu_info, 1);
  caps.aesni = (cpu_info[2] & (1 << 25)) != 0;
  __cpuidex(cpu_info, 7, 0);
  caps.sha = (cpu_info[1] & (1 << 29)) != 0;
#elif defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
  unsigned int eax = 0;
  unsigned int ebx = 0;
  unsigned int ecx = 0;
  unsigned int edx = 0;
  unsigned int max_leaf = __get_cpuid_max(0, nullptr);
  if (max_leaf >= 1) {
    __cpuid(1, eax, ebx, ecx, edx);
    caps.aesni = (ecx & (1u << 25)) != 0;
  }
  if (max_leaf >= 7) {
    __cpuid_count(7, 0, eax, ebx, ecx, edx);
    caps.sha = (ebx & (1u << 29)) != 0;
  }
#elif defined(__linux__) && defined(__aarch64__)
  unsigned long hwcap = getauxval(AT_HWCAP);
#ifdef HWCAP_AES
  caps.aesni = (hwcap & HWCAP_AES) != 0;
#endif
#ifdef HWCAP_SHA2
  caps.sha = (hwcap & HWCAP_SHA2) != 0;
#endif
#endif
  return caps;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

void ThrowCryptoError(const std::string& message, int code) {
  throw evc::Error(evc::ErrorDomain::Crypto, code, message);
}

const EVP_CIPHER* SelectCipher(AesCbcVariant variant) {
  switch (variant) {
    case AesCbcVariant::kAes128:
      return EVP_aes_128_cbc();
    case AesCbcVariant::kAes256:
      return EVP_aes_256_cbc();
  }
  ThrowCryptoError("Unsupported AES-CBC variant");
}

void RequireKeySize(AesCbcVariant variant, std::span<const uint8_t> key) {
  if (key.size() != KeySize(variant)) {
    ThrowCryptoError(std::string(evc::errors::msg::kCipherKeyLengthMismatch),
                     evc::errors::crypto::kKeyLengthMismatch);
  }
}

// NIST SP 800-38A F.2.1 and F.2.5, first block, plus RFC 4231 case 2.
void RunKnownAnswerTests() {
  static constexpr std::array<uint8_t, AES_CBC::IV_SIZE> kIv{
      0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
      0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f};
  static constexpr std::array<uint8_t, 16> kPlaintext{
      0x6b, 0xc1, 0xbe, 0xe2, 0x2e, 0x40, 0x9f, 0x96,
      0xe9, 0x3d, 0x7e, 0x11, 0x73, 0x93, 0x17, 0x2a};
  static constexpr std::array<uint8_t, AES_CBC::AES128_KEY_SIZE> kKey128{
      0x2b, 0x7e, 0x15, 0x16, 0x28, 0xae, 0xd2, 0xa6,
      0xab, 0xf7, 0x15, 0x88, 0x09, 0xcf, 0x4f, 0x3c};
  static constexpr std::array<uint8_t, 16> kExpected128{
      0x76, 0x49, 0xab, 0xac, 0x81, 0x19, 0xb2, 0x46,
      0xce, 0xe9, 0x8e, 0x9b, 0x12, 0xe9, 0x19, 0x7d};
  static constexpr std::array<uint8_t, AES_CBC::AES256_KEY_SIZE> kKey256{
      0x60, 0x3d, 0xeb, 0x10, 0x15, 0xca, 0x71, 0xbe,
      0x2b, 0x73, 0xae, 0xf0, 0x85, 0x7d, 0x77, 0x81,
      0x1f, 0x35, 0x2c, 0x07, 0x3b, 0x61, 0x08, 0xd7,
      0x2d, 0x98, 0x10, 0xa3, 0x09, 0x14, 0xdf, 0xf4};
  static constexpr std::array<uint8_t, 16> kExpected256{
      0xf5, 0x8c, 0x4c, 0x04, 0xd6, 0xe5, 0xf1, 0xba,
      0x77, 0x9e, 0xab, 0xfb, 0x5f, 0x7b, 0xfb, 0xd6};
  static constexpr std::array<uint8_t, 4> kHmacKey{'J', 'e', 'f', 'e'};
  static constexpr std::array<uint8_t, 28> kHmacData{
      'w', 'h', 'a', 't', ' ', 'd', 'o', ' ', 'y', 'a', ' ', 'w', 'a', 'n',
      't', ' ', 'f', 'o', 'r', ' ', 'n', 'o', 't', 'h', 'i', 'n', 'g', '?'};
  static constexpr std::array<uint8_t, 32> kExpectedHmac{
      0x5b, 0xdc, 0xc1, 0x46, 0xbf, 0x60, 0x75, 0x4e,
      0x6a, 0x04, 0x24, 0x26, 0x08, 0x95, 0x75, 0xc7,
      0x5a, 0x00, 0x3f, 0x08, 0x9d, 0x27, 0x39, 0x83,
      0x9d, 0xec, 0x58, 0xb9, 0x64, 0xec, 0x38, 0x43};

  OpenSSLCryptoProvider provider;
  const auto check_cbc = [&](AesCbcVariant variant, std::span<const uint8_t> key,
                             const std::array<uint8_t, 16>& expected, const char* label) {
    const auto ciphertext = provider.EncryptAESCBC(variant, kPlaintext, kIv, key);
    std::array<uint8_t, 16> first_block{};
    uint32_t mask = ciphertext.size() == 2 * AES_CBC::BLOCK_SIZE ? 0u : 1u;
    std::copy_n(ciphertext.begin(), std::min(ciphertext.size(), first_block.size()), first_block.begin());
    mask |= evc::crypto::ct::CompareEqual(first_block, expected) ? 0u : 2u;

    std::array<uint8_t, 3 * AES_CBC::BLOCK_SIZE> recovered{};
    const size_t recovered_size = provider.DecryptAESCBC(variant, ciphertext, kIv, key, recovered);
    std::array<uint8_t, 16> recovered_block{};
    std::copy_n(recovered.begin(), recovered_block.size(), recovered_block.begin());
    mask |= recovered_size == kPlaintext.size() ? 0u : 4u;
    mask |= evc::crypto::ct::CompareEqual(recovered_block, kPlaintext) ? 0u : 8u;
    if (mask != 0u) {
      ThrowCryptoError(std::string(label) + " KAT mismatch", evc::errors::crypto::kSelfTestFailed);
    }
  };
  check_cbc(AesCbcVariant::kAes128, kKey128, kExpected128, "AES-128-CBC");
  check_cbc(AesCbcVariant::kAes256, kKey256, kExpected256, "AES-256-CBC");

  const auto mac = provider.HMACSHA256(kHmacKey, kHmacData);
  if (!evc::crypto::ct::CompareEqual(mac, kExpectedHmac)) {
    ThrowCryptoError("HMAC-SHA256 KAT mismatch", evc::errors::crypto::kSelfTestFailed);
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
#if defined(EVC_FIPS_MODE)
    if (EVP_default_properties_enable_fips(nullptr, 1) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_default_properties_enable_fips"));
    }
    std::clog << "[crypto] OpenSSL FIPS properties enabled" << std::endl;
#endif
    state.caps = DetectHardwareCapabilities();
    std::clog << "[crypto] AES-NI: " << (state.caps.aesni ? "yes" : "no")
              << ", SHA extensions: " << (state.caps.sha ? "yes" : "no") << std::endl;
    RunKnownAnswerTests();
    state.kat_passed = true;
    std::clog << "[crypto] AES-CBC and HMAC-SHA256 known-answer tests passed" << std::endl;
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

std::vector<uint8_t> OpenSSLCryptoProvider::EncryptAESCBC(
    AesCbcVariant variant,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
    std::span<const uint8_t> key) {
  RequireKeySize(variant, key);
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-CBC context");
  }
  if (EVP_EncryptInit_ex(ctx.get(), SelectCipher(variant), nullptr, key.data(), iv.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }

  std::vector<uint8_t> ciphertext(plaintext.size() + AES_CBC::BLOCK_SIZE);
  int len = 0;
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate"));
    }
    total = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  ciphertext.resize(static_cast<size_t>(total));
  return ciphertext;
}

size_t OpenSSLCryptoProvider::DecryptAESCBC(
    AesCbcVariant variant,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t, AES_CBC::IV_SIZE> iv,
    std::span<const uint8_t> key,
    std::span<uint8_t> destination) {
  RequireKeySize(variant, key);
  if (destination.size() < ciphertext.size() + AES_CBC::BLOCK_SIZE) {
    ThrowCryptoError("AES-CBC destination buffer too small");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-CBC context");
  }
  if (EVP_DecryptInit_ex(ctx.get(), SelectCipher(variant), nullptr, key.data(), iv.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }

  int len = 0;
  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), destination.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      throw evc::AuthenticationFailureError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate"));
    }
    total = len;
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), destination.data() + total, &final_len) <= 0) {
    throw evc::AuthenticationFailureError(
        BuildOpenSSLErrorMessage("EVP_DecryptFinal_ex (padding check failed)"));
  }
  total += final_len;
  return static_cast<size_t>(total);
}

std::array<uint8_t, kHmacSha256TagSize> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, kHmacSha256TagSize> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length");
  }
  return out;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

}  // namespace evc::crypto
