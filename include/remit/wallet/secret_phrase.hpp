#pragma once

#include <string>
#include <string_view>

namespace remit::wallet {

/// Owns a secret recovery phrase for the lifetime of one run.
///
/// The buffer is cleansed when the holder is destroyed or moved from. There is
/// deliberately no stream or fmt formatter for this type.
class secret_phrase final {
 public:
  explicit secret_phrase(std::string phrase);
  secret_phrase(const secret_phrase&) = delete;
  secret_phrase& operator=(const secret_phrase&) = delete;
  secret_phrase(secret_phrase&& other) noexcept;
  secret_phrase& operator=(secret_phrase&& other) noexcept;
  ~secret_phrase();

  std::string_view view() const { return phrase_; }
  bool empty() const { return phrase_.empty(); }

 private:
  void wipe() noexcept;

  std::string phrase_;
};

using secret_phrase_t = secret_phrase;

}  // namespace remit::wallet
