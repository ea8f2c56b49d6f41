#include <remit/encoding/hex.hpp>

namespace remit::encoding {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::string encode(const remit::schema::bytes_view_t& bytes,
                   const std::string_view alphabet) {
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = alphabet[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = alphabet[bytes[i] & 0x0Fu];
  }
  return out;
}

}  // namespace

std::string to_hex(const remit::schema::bytes_view_t& bytes) {
  return encode(bytes, "0123456789abcdef");
}

std::string to_upper_hex(const remit::schema::bytes_view_t& bytes) {
  return encode(bytes, "0123456789ABCDEF");
}

std::optional<remit::schema::bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = remit::schema::bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

}  // namespace remit::encoding
