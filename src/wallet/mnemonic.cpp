#include <remit/crypto/hash.hpp>
#include <remit/wallet/bip39_wordlist.hpp>
#include <remit/wallet/mnemonic.hpp>

#include <algorithm>
#include <array>
#include <vector>

using namespace remit::schema;

namespace remit::wallet {

namespace {

constexpr auto kBitsPerWord = std::size_t{11};
constexpr auto kAllowedWordCounts = std::array<std::size_t, 5>{12, 15, 18, 21, 24};

bool is_space(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::vector<std::string_view> split_words(const std::string_view phrase) {
  auto words = std::vector<std::string_view>{};
  auto begin = std::size_t{0};
  while (begin < phrase.size()) {
    while (begin < phrase.size() && is_space(phrase[begin])) {
      ++begin;
    }
    auto end = begin;
    while (end < phrase.size() && !is_space(phrase[end])) {
      ++end;
    }
    if (end > begin) {
      words.push_back(phrase.substr(begin, end - begin));
    }
    begin = end;
  }
  return words;
}

}  // namespace

std::optional<uint16_t> find_bip39_word(const std::string_view word) {
  auto it = std::lower_bound(kBip39EnglishWords.begin(),
                             kBip39EnglishWords.end(), word);
  if (it == kBip39EnglishWords.end() || *it != word) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(it - kBip39EnglishWords.begin());
}

std::optional<bytes_t> decode_phrase(const std::string_view phrase,
                                     std::string& error) {
  auto words = split_words(phrase);
  if (std::find(kAllowedWordCounts.begin(), kAllowedWordCounts.end(),
                words.size()) == kAllowedWordCounts.end()) {
    error = "the secret recovery phrase must have 12, 15, 18, 21 or 24 words, "
            "got " +
            std::to_string(words.size());
    return std::nullopt;
  }

  // 11 bits per word: entropy first, then words / 3 checksum bits.
  auto bits = bytes_t((words.size() * kBitsPerWord + 7) / 8, 0);
  for (std::size_t i = 0; i < words.size(); ++i) {
    auto index = find_bip39_word(words[i]);
    if (!index) {
      crypto::cleanse(bits.data(), bits.size());
      error = "word " + std::to_string(i + 1) +
              " of the secret recovery phrase is not in the BIP-39 English "
              "wordlist";
      return std::nullopt;
    }
    for (std::size_t bit = 0; bit < kBitsPerWord; ++bit) {
      if ((*index >> (kBitsPerWord - 1 - bit)) & 1u) {
        auto position = i * kBitsPerWord + bit;
        bits[position / 8] |= static_cast<uint8_t>(0x80u >> (position % 8));
      }
    }
  }

  const auto checksum_bits = words.size() / 3;
  const auto entropy_size = (words.size() * kBitsPerWord - checksum_bits) / 8;
  auto entropy = bytes_t{bits.begin(), bits.begin() + entropy_size};
  const auto shift = 8 - checksum_bits;
  const auto checksum = static_cast<uint8_t>(bits[entropy_size] >> shift);
  crypto::cleanse(bits.data(), bits.size());

  auto hash = crypto::sha256(make_bytes_view(entropy));
  if (static_cast<uint8_t>(hash[0] >> shift) != checksum) {
    crypto::cleanse(entropy.data(), entropy.size());
    error = "the secret recovery phrase checksum does not match; check the "
            "words and their order";
    return std::nullopt;
  }
  return entropy;
}

}  // namespace remit::wallet
