#include "hash_codec.hpp"

#include <bit>
#include <stdexcept>

namespace photosift::hash {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

HashValue HashValue::FromWords(const std::uint64_t* words, std::size_t word_count) {
  if (word_count == 0 || word_count > kMaxWords) {
    throw std::invalid_argument("hash width must be 1.." + std::to_string(kMaxWords) + " words, got " + std::to_string(word_count));
  }

  HashValue value;
  value.word_count_ = static_cast<std::uint8_t>(word_count);
  for (std::size_t i = 0; i < word_count; ++i) {
    value.words_[i] = words[i];
  }
  return value;
}

std::optional<HashValue> HashValue::FromHex(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }

  constexpr std::size_t kDigitsPerWord = kWordBits / 4;
  if (hex.empty() || hex.size() % kDigitsPerWord != 0 || hex.size() > kMaxWords * kDigitsPerWord) {
    return std::nullopt;
  }

  std::array<std::uint64_t, kMaxWords> words{};
  const std::size_t                    word_count = hex.size() / kDigitsPerWord;
  for (std::size_t w = 0; w < word_count; ++w) {
    std::uint64_t word = 0;
    for (std::size_t d = 0; d < kDigitsPerWord; ++d) {
      const int nibble = HexNibble(hex[w * kDigitsPerWord + d]);
      if (nibble < 0) {
        return std::nullopt;
      }
      word = (word << 4) | static_cast<std::uint64_t>(nibble);
    }
    words[w] = word;
  }

  return FromWords(words.data(), word_count);
}

std::string HashValue::ToHex() const {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(word_count_ * (kWordBits / 4));
  for (std::size_t w = 0; w < word_count_; ++w) {
    for (int shift = kWordBits - 4; shift >= 0; shift -= 4) {
      out.push_back(kHex[(words_[w] >> shift) & 0x0F]);
    }
  }
  return out;
}

bool HashValue::operator==(const HashValue& other) const {
  if (word_count_ != other.word_count_) {
    return false;
  }
  for (std::size_t i = 0; i < word_count_; ++i) {
    if (words_[i] != other.words_[i]) {
      return false;
    }
  }
  return true;
}

unsigned HammingDistance(const HashValue& a, const HashValue& b) {
  if (a.WordCount() != b.WordCount()) {
    throw std::invalid_argument("hamming distance between hashes of different width: " + std::to_string(a.BitWidth()) + " vs " +
                                std::to_string(b.BitWidth()));
  }

  unsigned distance = 0;
  for (std::size_t i = 0; i < a.WordCount(); ++i) {
    distance += static_cast<unsigned>(std::popcount(a.Word(i) ^ b.Word(i)));
  }
  return distance;
}

} // namespace photosift::hash
