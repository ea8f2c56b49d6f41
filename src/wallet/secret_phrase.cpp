#include <remit/crypto/hash.hpp>
#include <remit/wallet/secret_phrase.hpp>

#include <utility>

namespace remit::wallet {

secret_phrase::secret_phrase(std::string phrase) : phrase_{std::move(phrase)} {}

secret_phrase::secret_phrase(secret_phrase&& other) noexcept
    : phrase_{std::move(other.phrase_)} {
  other.wipe();
}

secret_phrase& secret_phrase::operator=(secret_phrase&& other) noexcept {
  if (this != &other) {
    wipe();
    phrase_ = std::move(other.phrase_);
    other.wipe();
  }
  return *this;
}

secret_phrase::~secret_phrase() {
  wipe();
}

void secret_phrase::wipe() noexcept {
  if (!phrase_.empty()) {
    remit::crypto::cleanse(phrase_.data(), phrase_.size());
  }
  phrase_.clear();
}

}  // namespace remit::wallet
