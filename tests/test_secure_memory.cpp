#include "evc/security/secure_buffer.h"
#include "evc/security/zeroizer.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <span>
#include <utility>

#if !defined(_WIN32)
#include <sys/resource.h>
#endif

namespace {

void TestZeroizerWipe() {
  std::array<uint8_t, 32> secret{};
  secret.fill(0xAA);
  evc::security::Zeroizer::Wipe(std::span<uint8_t>(secret.data(), secret.size()));
  for ([[maybe_unused]] auto byte : secret) {
    assert(byte == 0 && "zeroizer must wipe buffers");
  }
}

void TestScopeWiper() {
  std::array<uint8_t, 16> secret{};
  {
    secret.fill(0x42);
    evc::security::Zeroizer::ScopeWiper<uint8_t> guard{std::span<uint8_t>(secret)};
    (void)guard;
  }
  for ([[maybe_unused]] auto byte : secret) {
    assert(byte == 0 && "scope wiper must zero on destruction");
  }

  std::array<uint8_t, 16> kept{};
  {
    kept.fill(0x42);
    evc::security::Zeroizer::ScopeWiper<uint8_t> guard{std::span<uint8_t>(kept)};
    guard.Release();
  }
  assert(kept[0] == 0x42 && "released wiper leaves data alone");
}

#if !defined(_WIN32)
void TestLockFailureIsBestEffort() {
  if (!evc::security::Zeroizer::MemoryLockingSupported()) {
    return;
  }

  struct rlimit original_limit {};
  if (::getrlimit(RLIMIT_MEMLOCK, &original_limit) != 0) {
    return;
  }

  struct LimitGuard {
    struct rlimit limit;
    explicit LimitGuard(struct rlimit value) : limit(value) {}
    ~LimitGuard() { ::setrlimit(RLIMIT_MEMLOCK, &limit); }
  } guard{original_limit};

  struct rlimit zero_limit = original_limit;
  zero_limit.rlim_cur = 0;
  if (::setrlimit(RLIMIT_MEMLOCK, &zero_limit) != 0) {
    return;
  }

  std::array<uint8_t, 4096> buffer{};
  auto span = std::span<uint8_t>(buffer.data(), buffer.size());
  const auto status = evc::security::Zeroizer::TryLockMemory(span);
  // Privileged runners (CAP_IPC_LOCK) lock regardless of the limit.
  assert((status == evc::security::Zeroizer::LockStatus::BestEffort ||
          status == evc::security::Zeroizer::LockStatus::Locked) &&
         "lock failure should report best-effort");
  evc::security::Zeroizer::UnlockMemory(span);
}
#else
void TestLockFailureIsBestEffort() {
  // RLIMIT_MEMLOCK controls are POSIX-specific.
}
#endif

void TestSecureBufferLifecycle() {
  evc::security::SecureBuffer<uint8_t> buf(32);
  assert(buf.size() == 32);
  for ([[maybe_unused]] auto value : buf.AsSpan()) {
    assert(value == 0 && "secure buffer must start zeroed");
  }
  for (auto& value : buf.AsSpan()) {
    value = 0x7E;
  }

  evc::security::SecureBuffer<uint8_t> moved(std::move(buf));
  assert(moved.size() == 32 && moved.data()[31] == 0x7E && "move keeps the contents");
  assert(buf.size() == 0 && buf.data() == nullptr && "moved-from buffer is empty");

  evc::security::SecureBuffer<uint8_t> empty(0);
  assert(empty.AsSpan().empty() && empty.data() == nullptr);
}

}  // namespace

int main() {
  TestZeroizerWipe();
  TestScopeWiper();
  TestLockFailureIsBestEffort();
  TestSecureBufferLifecycle();
  std::cout << "secure memory test ok\n";
  return 0;
}
