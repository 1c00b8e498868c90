/*****************************************************************/ /**
 * @file   hash.h
 * @brief  Contains stable (cross-process) hash functions.
 * `std::hash` is not guaranteed to produce the same result across
 * processes, which makes it unsuitable for anything written to bytes.
 *
 * @author Raphael Dib Nehme
 * @date   January 2026
 *********************************************************************/
#ifndef __HG_FREEZER_VOCABULARY_HASH
#define __HG_FREEZER_VOCABULARY_HASH

#include <cstdint>
#include <string_view>

namespace freezer
{
  /// @brief Finalizer of splitmix64
  /// @param x The value to mix
  /// @return Mixed value
  constexpr uint64_t mix64(uint64_t x) noexcept
  {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
  }

  /// @brief FNV-1a over the bytes of `str`, seeded with `seed`
  /// @param str The string to hash
  /// @param seed The seed (the result of a previous call to chain)
  /// @return Stable hash of `str`
  constexpr uint64_t hash_string(
      std::string_view str, uint64_t seed = 0xcbf29ce484222325ULL) noexcept
  {
    uint64_t h = seed;
    for (char c : str)
    {
      h ^= static_cast<uint8_t>(c);
      h *= 0x100000001b3ULL;
    }
    return h;
  }

  /// @brief Combines two hashes (order dependent)
  /// @param seed The hash to combine into
  /// @param value The value to combine
  /// @return The combined hash
  constexpr uint64_t hash_combine(uint64_t seed, uint64_t value) noexcept
  {
    return mix64(seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2)));
  }
} // namespace freezer

#endif // !__HG_FREEZER_VOCABULARY_HASH
