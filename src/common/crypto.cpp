#include "crypto.hpp"
#include "logging.hpp"
#include <cstring>
#include <sodium.h>

namespace sectorcast {

static const size_t kNonceBytes = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
static const size_t kTagBytes = crypto_aead_xchacha20poly1305_ietf_ABYTES;

// Associated data binding a ciphertext to its sector coordinates.
static void sector_ad(uint8_t ad[18], uint64_t fid, uint64_t seg,
                      uint16_t sector) {
  std::memcpy(ad + 0, &fid, 8);
  std::memcpy(ad + 8, &seg, 8);
  std::memcpy(ad + 16, &sector, 2);
}

SodiumAead::SodiumAead() {
  if (sodium_init() < 0) {
    Logger::instance().log(LogLevel::ERROR, "sodium_init failed");
    return;
  }
  ready_ = true;
}

size_t SodiumAead::overhead() { return kNonceBytes + kTagBytes; }

void SodiumAead::set_key(const std::vector<uint8_t> &key) {
  if (key.empty()) {
    key_.clear();
    return;
  }
  key_.assign(crypto_aead_xchacha20poly1305_ietf_KEYBYTES, 0);
  if (key.size() == key_.size())
    key_ = key;
  else
    crypto_generichash(key_.data(), key_.size(), key.data(), key.size(),
                       nullptr, 0);
}

bool SodiumAead::encrypt(uint64_t file_id, uint64_t segment_index,
                         uint16_t sector_index, std::vector<uint8_t> &inout) {
  if (!ready_ || key_.empty())
    return false;
  uint8_t ad[18];
  sector_ad(ad, file_id, segment_index, sector_index);
  // Output is nonce || ciphertext || tag.
  std::vector<uint8_t> out(kNonceBytes + inout.size() + kTagBytes);
  randombytes_buf(out.data(), kNonceBytes);
  unsigned long long clen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_encrypt(
          out.data() + kNonceBytes, &clen, inout.data(), inout.size(), ad,
          sizeof(ad), nullptr, out.data(), key_.data()) != 0)
    return false;
  out.resize(kNonceBytes + (size_t)clen);
  inout.swap(out);
  return true;
}

bool SodiumAead::decrypt(uint64_t file_id, uint64_t segment_index,
                         uint16_t sector_index, std::vector<uint8_t> &inout) {
  if (!ready_ || key_.empty() || inout.size() < kNonceBytes + kTagBytes)
    return false;
  uint8_t ad[18];
  sector_ad(ad, file_id, segment_index, sector_index);
  std::vector<uint8_t> out(inout.size() - kNonceBytes - kTagBytes);
  unsigned long long outlen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_decrypt(
          out.data(), &outlen, nullptr, inout.data() + kNonceBytes,
          inout.size() - kNonceBytes, ad, sizeof(ad), inout.data(),
          key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

} // namespace sectorcast
