#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace photosift::hash {

/*
  Fixed-width perceptual hash value.

  The upstream hasher is opaque to us; it hands over a bit vector of
  64, 128, 192 or 256 bits, serialized as big-endian hex text. Values live
  inline (no heap) so the pairwise scan can hold tens of thousands of them
  in one contiguous array.
*/
class HashValue {
 public:
  static constexpr std::size_t kWordBits = 64;
  static constexpr std::size_t kMaxWords = 4;
  static constexpr std::size_t kMaxBits  = kWordBits * kMaxWords;

  HashValue() = default;

  // words[0] holds the most significant 64 bits.
  static HashValue FromWords(const std::uint64_t* words, std::size_t word_count);

  // Accepts 16/32/48/64 hex digits, optional "0x" prefix, either case.
  static std::optional<HashValue> FromHex(std::string_view hex);

  std::string ToHex() const;

  std::size_t BitWidth() const {
    return word_count_ * kWordBits;
  }
  std::size_t WordCount() const {
    return word_count_;
  }
  std::uint64_t Word(std::size_t index) const {
    return words_[index];
  }

  bool operator==(const HashValue& other) const;
  bool operator!=(const HashValue& other) const {
    return !(*this == other);
  }

 private:
  std::array<std::uint64_t, kMaxWords> words_{};
  std::uint8_t                         word_count_ = 0;
};

/*
  Hamming distance: XOR + popcount, one machine word at a time.

  Symmetric and zero exactly for bit-identical values. Both values must have
  the same width; mixing widths is a caller bug and throws
  std::invalid_argument.
*/
unsigned HammingDistance(const HashValue& a, const HashValue& b);

// Primary + secondary signal of one photo, as handed to the grouper.
struct HashPair {
  HashValue                primary;
  std::optional<HashValue> secondary;
};

} // namespace photosift::hash
