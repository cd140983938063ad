#include "evc/crypto/pbkdf2.h"

#include <algorithm>
#include <array>
#include <vector>

#include "evc/crypto/provider.h"
#include "evc/security/zeroizer.h"

namespace evc::crypto {

void PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                        std::span<const uint8_t> salt,
                        uint32_t iterations,
                        std::span<uint8_t> output) {
  iterations = std::max<uint32_t>(iterations, 1u);
  if (output.empty()) {
    return;
  }
  auto provider = GetCryptoProviderShared();

  std::vector<uint8_t> block(salt.begin(), salt.end());
  block.resize(salt.size() + 4u, 0);
  security::Zeroizer::ScopeWiper block_guard(std::span<uint8_t>(block.data(), block.size()));

  std::array<uint8_t, kHmacSha256TagSize> t{};
  std::array<uint8_t, kHmacSha256TagSize> iter{};
  security::Zeroizer::ScopeWiper t_guard(std::span<uint8_t>(t.data(), t.size()));
  security::Zeroizer::ScopeWiper iter_guard(std::span<uint8_t>(iter.data(), iter.size()));

  size_t written = 0;
  for (uint32_t block_index = 1; written < output.size(); ++block_index) {
    block[block.size() - 4] = static_cast<uint8_t>((block_index >> 24) & 0xFF);
    block[block.size() - 3] = static_cast<uint8_t>((block_index >> 16) & 0xFF);
    block[block.size() - 2] = static_cast<uint8_t>((block_index >> 8) & 0xFF);
    block[block.size() - 1] = static_cast<uint8_t>(block_index & 0xFF);

    iter = provider->HMACSHA256(password, std::span<const uint8_t>(block.data(), block.size()));
    t = iter;
    for (uint32_t i = 1; i < iterations; ++i) {
      iter = provider->HMACSHA256(password, std::span<const uint8_t>(iter.data(), iter.size()));
      for (size_t j = 0; j < t.size(); ++j) {
        t[j] ^= iter[j];
      }
    }

    const size_t take = std::min(t.size(), output.size() - written);
    std::copy_n(t.begin(), take, output.begin() + static_cast<std::ptrdiff_t>(written));
    written += take;
  }
}

}  // namespace evc::crypto
