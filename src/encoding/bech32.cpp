#include <remit/encoding/bech32.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace remit::encoding {

namespace {

constexpr auto kCharset = std::string_view{"qpzry9x8gf2tvdw0s3jn54khce6mua7l"};
constexpr auto kMaxLength = std::size_t{90};
constexpr auto kChecksumLength = std::size_t{6};

uint32_t polymod(const std::vector<uint8_t>& values) {
  static constexpr auto kGenerator = std::array<uint32_t, 5>{
      0x3b6a57b2u, 0x26508e6du, 0x1ea119fau, 0x3d4233ddu, 0x2a1462b3u};
  auto checksum = uint32_t{1};
  for (const auto value : values) {
    auto top = static_cast<uint8_t>(checksum >> 25u);
    checksum = ((checksum & 0x1ffffffu) << 5u) ^ value;
    for (std::size_t i = 0; i < kGenerator.size(); ++i) {
      if (((top >> i) & 1u) != 0) {
        checksum ^= kGenerator[i];
      }
    }
  }
  return checksum;
}

std::vector<uint8_t> expand_hrp(const std::string_view hrp) {
  auto out = std::vector<uint8_t>{};
  out.reserve((hrp.size() * 2) + 1);
  for (const auto c : hrp) {
    out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5u));
  }
  out.push_back(0);
  for (const auto c : hrp) {
    out.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 0x1fu));
  }
  return out;
}

std::optional<std::vector<uint8_t>> convert_bits(
    const remit::schema::bytes_view_t& input,
    const unsigned from_bits,
    const unsigned to_bits,
    const bool pad) {
  auto accumulator = uint32_t{0};
  auto bits = unsigned{0};
  const auto max_value = (uint32_t{1} << to_bits) - 1;
  auto out = std::vector<uint8_t>{};
  for (const auto value : input) {
    if ((static_cast<uint32_t>(value) >> from_bits) != 0) {
      return std::nullopt;
    }
    accumulator = (accumulator << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & max_value));
    }
  }
  if (pad) {
    if (bits > 0) {
      out.push_back(
          static_cast<uint8_t>((accumulator << (to_bits - bits)) & max_value));
    }
  } else if (bits >= from_bits ||
             ((accumulator << (to_bits - bits)) & max_value) != 0) {
    return std::nullopt;
  }
  return out;
}

bool valid_hrp(const std::string_view hrp) {
  if (hrp.empty() || hrp.size() > 83) {
    return false;
  }
  for (const auto c : hrp) {
    if (c < 33 || c > 126) {
      return false;
    }
  }
  return true;
}

char to_lower_ascii(const char c) {
  if (c >= 'A' && c <= 'Z') {
    return static_cast<char>(c - 'A' + 'a');
  }
  return c;
}

}  // namespace

std::optional<std::string> bech32_encode(
    const std::string_view hrp,
    const remit::schema::bytes_view_t& data) {
  if (!valid_hrp(hrp)) {
    return std::nullopt;
  }
  auto lower_hrp = std::string{};
  lower_hrp.reserve(hrp.size());
  for (const auto c : hrp) {
    lower_hrp.push_back(to_lower_ascii(c));
  }

  auto words = convert_bits(data, 8, 5, true);
  if (!words) {
    return std::nullopt;
  }

  auto values = expand_hrp(lower_hrp);
  values.insert(values.end(), words->begin(), words->end());
  values.insert(values.end(), kChecksumLength, 0);
  auto checksum = polymod(values) ^ 1u;

  auto out = lower_hrp;
  out.push_back('1');
  for (const auto word : *words) {
    out.push_back(kCharset[word]);
  }
  for (std::size_t i = 0; i < kChecksumLength; ++i) {
    out.push_back(kCharset[(checksum >> (5 * (5 - i))) & 0x1fu]);
  }
  return out;
}

std::optional<bech32_decoded_t> bech32_decode(const std::string_view encoded) {
  if (encoded.size() > kMaxLength) {
    return std::nullopt;
  }

  auto has_lower = false;
  auto has_upper = false;
  for (const auto c : encoded) {
    if (c < 33 || c > 126) {
      return std::nullopt;
    }
    has_lower = has_lower || (c >= 'a' && c <= 'z');
    has_upper = has_upper || (c >= 'A' && c <= 'Z');
  }
  if (has_lower && has_upper) {
    return std::nullopt;
  }

  auto separator = encoded.rfind('1');
  if (separator == std::string_view::npos || separator == 0 ||
      (separator + 1 + kChecksumLength) > encoded.size()) {
    return std::nullopt;
  }

  auto hrp = std::string{};
  hrp.reserve(separator);
  for (const auto c : encoded.substr(0, separator)) {
    hrp.push_back(to_lower_ascii(c));
  }

  auto values = std::vector<uint8_t>{};
  for (const auto c : encoded.substr(separator + 1)) {
    auto position = kCharset.find(to_lower_ascii(c));
    if (position == std::string_view::npos) {
      return std::nullopt;
    }
    values.push_back(static_cast<uint8_t>(position));
  }

  auto checked = expand_hrp(hrp);
  checked.insert(checked.end(), values.begin(), values.end());
  if (polymod(checked) != 1u) {
    return std::nullopt;
  }

  values.resize(values.size() - kChecksumLength);
  auto data = convert_bits(
      remit::schema::bytes_view_t{values.data(), values.size()}, 5, 8, false);
  if (!data) {
    return std::nullopt;
  }
  return bech32_decoded_t{.hrp = hrp, .data = *data};
}

}  // namespace remit::encoding
