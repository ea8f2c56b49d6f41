#include <remit/crypto/hash.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <memory>

namespace remit::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

template <std::size_t N>
std::array<uint8_t, N> digest(const EVP_MD* md,
                              const remit::schema::bytes_view_t& data) {
  auto out = std::array<uint8_t, N>{};
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto length = 0u;
  if (!ctx || md == nullptr ||
      EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != N) {
    return {};
  }
  return out;
}

}  // namespace

remit::schema::hash32_t sha256(const remit::schema::bytes_view_t& data) {
  return digest<32>(EVP_sha256(), data);
}

remit::schema::hash20_t ripemd160(const remit::schema::bytes_view_t& data) {
  return digest<20>(EVP_ripemd160(), data);
}

remit::schema::hash20_t hash160(const remit::schema::bytes_view_t& data) {
  auto inner = sha256(data);
  return ripemd160(remit::schema::bytes_view_t{inner.data(), inner.size()});
}

sha512_t hmac_sha512(const remit::schema::bytes_view_t& key,
                     const remit::schema::bytes_view_t& data) {
  auto out = sha512_t{};
  auto length = 0u;
  if (HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()), data.data(),
           data.size(), out.data(), &length) == nullptr ||
      length != out.size()) {
    return {};
  }
  return out;
}

std::optional<sha512_t> pbkdf2_hmac_sha512(const std::string_view password,
                                           const std::string_view salt,
                                           const uint32_t iterations) {
  auto out = sha512_t{};
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        reinterpret_cast<const unsigned char*>(salt.data()),
                        static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha512(),
                        static_cast<int>(out.size()), out.data()) != 1) {
    return std::nullopt;
  }
  return out;
}

void cleanse(void* data, const std::size_t size) {
  OPENSSL_cleanse(data, size);
}

}  // namespace remit::crypto
