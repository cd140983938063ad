#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace evc {
namespace detail {
// Portable byte swapping helpers.
template <class T>
[[nodiscard]] constexpr T ManualByteSwap(T value) noexcept {
  static_assert(std::is_trivially_copyable_v<T>, "ManualByteSwap requires trivially copyable types");
  auto source = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  std::array<std::uint8_t, sizeof(T)> reversed{};
  for (std::size_t i = 0; i < source.size(); ++i) {
    reversed[i] = source[source.size() - 1U - i];
  }
  return std::bit_cast<T>(reversed);
}

[[nodiscard]] constexpr std::uint16_t ByteSwap16(std::uint16_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_ushort(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap16(value);
#else
  return ManualByteSwap(value);
#endif
}

[[nodiscard]] constexpr std::uint32_t ByteSwap32(std::uint32_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_ulong(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap32(value);
#else
  return ManualByteSwap(value);
#endif
}

[[nodiscard]] constexpr std::uint64_t ByteSwap64(std::uint64_t value) noexcept {
  if (std::is_constant_evaluated()) {
    return ManualByteSwap(value);
  }
#if defined(_MSC_VER)
  return _byteswap_uint64(value);
#elif defined(__clang__) || defined(__GNUC__)
  return __builtin_bswap64(value);
#else
  return ManualByteSwap(value);
#endif
}
}  // namespace detail

inline constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

inline constexpr std::uint16_t ToLittleEndian16(std::uint16_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap16(value);
}

inline constexpr std::uint32_t ToLittleEndian32(std::uint32_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap32(value);
}

inline constexpr std::uint64_t ToLittleEndian64(std::uint64_t value) noexcept {
  return kIsLittleEndian ? value : detail::ByteSwap64(value);
}

// Record identifiers are the only big-endian quantity on disk.
inline constexpr std::uint32_t ToBigEndian32(std::uint32_t value) noexcept {
  return kIsLittleEndian ? detail::ByteSwap32(value) : value;
}

inline constexpr std::uint16_t FromLittleEndian16(std::uint16_t value) noexcept {
  return ToLittleEndian16(value);
}

inline constexpr std::uint32_t FromLittleEndian32(std::uint32_t value) noexcept {
  return ToLittleEndian32(value);
}

inline constexpr std::uint64_t FromLittleEndian64(std::uint64_t value) noexcept {
  return ToLittleEndian64(value);
}

inline constexpr std::uint32_t FromBigEndian32(std::uint32_t value) noexcept {
  return ToBigEndian32(value);
}

template <class T>
  requires std::is_trivially_copyable_v<T>
inline std::span<const std::uint8_t> AsBytesConst(const T& object) noexcept {
  const auto* data = reinterpret_cast<const std::uint8_t*>(std::addressof(object));
  return {data, sizeof(T)};
}

inline std::span<const std::uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}
}  // namespace evc
