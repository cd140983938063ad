#include "evc/security/zeroizer.h"

#include <atomic>
#include <cerrno>
#include <iostream>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#if defined(_POSIX_VERSION) || defined(__APPLE__)
#include <sys/mman.h>
#endif
#endif

namespace evc::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      if (data.empty()) {
        return;
      }

#if defined(_WIN32)
      ::SecureZeroMemory(data.data(), static_cast<SIZE_T>(data.size()));
#else
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
      volatile uint8_t verification = 0;
      const volatile uint8_t* verify_ptr =
          reinterpret_cast<const volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        verification |= verify_ptr[i];
      }

      if (verification != 0) {
        std::clog << "SecureBuffer warning: zeroization verification failed.\n";
      }
    }

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    PortableZero(data);
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  bool Zeroizer::MemoryLockingSupported() noexcept {
#if defined(_WIN32)
    return true;
#elif defined(_POSIX_VERSION) || defined(__APPLE__)
    return true;
#else
    return false;
#endif
  }

  Zeroizer::LockStatus Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return LockStatus::Locked;
    }
#if defined(_WIN32)
    if (::VirtualLock(data.data(), data.size()) != 0) {
      return LockStatus::Locked;
    }
    if (::GetLastError() == ERROR_NOT_SUPPORTED) {
      return LockStatus::Unsupported;
    }
    return LockStatus::BestEffort;
#elif defined(_POSIX_VERSION) || defined(__APPLE__)
    if (::mlock(data.data(), data.size()) == 0) {
      return LockStatus::Locked;
    }
    if (errno == ENOSYS) {
      return LockStatus::Unsupported;
    }
    // EPERM or ENOMEM under a tight RLIMIT_MEMLOCK; the buffer stays usable.
    return LockStatus::BestEffort;
#else
    return LockStatus::Unsupported;
#endif
  }

  void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
#if defined(_WIN32)
    ::VirtualUnlock(data.data(), data.size());
#elif defined(_POSIX_VERSION) || defined(__APPLE__)
    ::munlock(data.data(), data.size());
#endif
  }

} // namespace evc::security
