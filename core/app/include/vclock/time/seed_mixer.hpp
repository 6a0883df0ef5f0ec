#pragma once

#include <cstdint>
#include <string_view>

namespace vclock {

// -----------------------------------------------------------------------------
// Seed derivation (version 1)
// -----------------------------------------------------------------------------
//
// @brief  Pinned, platform-independent mixing functions used to derive a
//         per-call seed for timestamp synthesis.
//
// @details
// Every value that identifies a synthesis call (clock seed, tick, actor id,
// action hint, call index) is folded into one 64-bit key with SplitMix64.
// Nothing here depends on std::hash, std::uniform_int_distribution or any
// other implementation-defined facility, so the same inputs give the same
// timestamps with every compiler and standard library.
//
// Changing any constant or the fold order changes every golden timestamp.
// Bump kSeedDerivationVersion when that happens.
//
// Thread-safety: All functions are pure; SeedMixer is immutable after
// construction; DeterministicRng is a value type owned by a single call.
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t kSeedDerivationVersion = 1;

inline constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;

// SplitMix64 finalizer (Steele, Lea, Flood 2014).
inline std::uint64_t splitmix64(std::uint64_t x) noexcept {
  x += kSplitMixIncrement;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

inline std::uint64_t mixU64(std::uint64_t a, std::uint64_t b) noexcept {
  return splitmix64(a ^ splitmix64(b));
}

// 64-bit FNV-1a over the raw bytes of the string.
inline std::uint64_t fnv1a64(std::string_view bytes) noexcept {
  std::uint64_t h = 0xcbf29ce484222325ULL;
  for (const char c : bytes) {
    h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
    h *= 0x100000001b3ULL;
  }
  return h;
}

// -----------------------------------------------------------------------------
// SeedMixer
// -----------------------------------------------------------------------------
// Root of all clock randomness. Holds the pre-mixed clock seed and folds a
// call's identity into it. Reconstructing a SeedMixer from the same seed is
// how the clock reseeds itself on reset().
// -----------------------------------------------------------------------------
class SeedMixer {
 public:
  explicit SeedMixer(std::int64_t seed) noexcept
      : root_(splitmix64(static_cast<std::uint64_t>(seed))) {}

  // Signed inputs are reinterpreted as two's-complement 64-bit values.
  std::uint64_t derive(std::int64_t tick, std::int64_t actor_id,
                       std::string_view action_hint,
                       std::uint64_t call_index) const noexcept {
    std::uint64_t x = root_;
    x = mixU64(x, static_cast<std::uint64_t>(tick));
    x = mixU64(x, static_cast<std::uint64_t>(actor_id));
    x = mixU64(x, fnv1a64(action_hint));
    x = mixU64(x, call_index);
    return splitmix64(x);
  }

 private:
  std::uint64_t root_;
};

// -----------------------------------------------------------------------------
// DeterministicRng
// -----------------------------------------------------------------------------
// Minimal SplitMix64 generator. One instance is built per synthesis call from
// the derived seed, so draws never leak between calls.
// -----------------------------------------------------------------------------
class DeterministicRng {
 public:
  explicit DeterministicRng(std::uint64_t state) noexcept : state_(state) {}

  std::uint64_t next() noexcept {
    const std::uint64_t r = splitmix64(state_);
    state_ += kSplitMixIncrement;
    return r;
  }

  // Uniform integer in [lo, hi] (inclusive). Requires lo <= hi.
  // Modulo bias is negligible for tick-sized spans.
  std::int64_t uniformInt(std::int64_t lo, std::int64_t hi) noexcept {
    const std::uint64_t span =
        static_cast<std::uint64_t>(hi) - static_cast<std::uint64_t>(lo) + 1;
    const std::uint64_t r = next();
    if (span == 0) {
      return static_cast<std::int64_t>(r);
    }
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(lo) +
                                     r % span);
  }

 private:
  std::uint64_t state_;
};

}  // namespace vclock
