#pragma once
#include <cstdint>
#include <vector>

namespace sectorcast {

class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;
    virtual void set_key(const std::vector<uint8_t>& key) = 0;
    virtual bool encrypt(uint64_t file_id, uint64_t segment_index,
                         uint16_t sector_index, std::vector<uint8_t>& inout) = 0;
    virtual bool decrypt(uint64_t file_id, uint64_t segment_index,
                         uint16_t sector_index, std::vector<uint8_t>& inout) = 0;
};

// XChaCha20-Poly1305 with a random nonce per call, stored in front of the
// ciphertext. The sector coordinates are authenticated as associated data, so
// a sector decrypts only at the position it was encrypted for. An empty key
// disables encryption: encrypt and decrypt fail.
class SodiumAead : public CryptoProvider {
public:
    SodiumAead();
    void set_key(const std::vector<uint8_t>& key) override;
    bool encrypt(uint64_t file_id, uint64_t segment_index,
                 uint16_t sector_index, std::vector<uint8_t>& inout) override;
    bool decrypt(uint64_t file_id, uint64_t segment_index,
                 uint16_t sector_index, std::vector<uint8_t>& inout) override;
    // Bytes added to every sector.
    static size_t overhead();
private:
    std::vector<uint8_t> key_;
    bool ready_{false};
};

} // namespace sectorcast
