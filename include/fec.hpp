#pragma once
#include <cstdint>
#include <vector>

namespace sectorcast {

struct ErasurePlan {
    uint16_t min_sectors;
    uint16_t total_sectors;
    uint32_t sector_size;
};

class ErasureCoder {
public:
    virtual ~ErasureCoder() = default;
    virtual int min_sectors() const = 0;
    virtual int num_sectors() const = 0;
    virtual uint32_t sector_size() const = 0;
    // Splits data into min_sectors() zero padded sectors and appends the
    // redundant ones. Fails if data does not fit.
    virtual bool encode(const std::vector<uint8_t>& data,
                        std::vector<std::vector<uint8_t>>& sectors) const = 0;
    // Rebuilds the min_sectors() * sector_size() bytes of logical data from
    // any min_sectors() present sectors.
    virtual bool recover(const std::vector<std::vector<uint8_t>>& sectors,
                         const std::vector<bool>& present_mask,
                         std::vector<uint8_t>& data) const = 0;
};

// Systematic Reed-Solomon over GF(2^8). The first min_sectors outputs are
// the data itself, the rest are parity.
class ReedSolomon : public ErasureCoder {
public:
    explicit ReedSolomon(const ErasurePlan& plan);
    bool valid() const { return valid_; }
    int min_sectors() const override { return plan_.min_sectors; }
    int num_sectors() const override { return plan_.total_sectors; }
    uint32_t sector_size() const override { return plan_.sector_size; }
    bool encode(const std::vector<uint8_t>& data,
                std::vector<std::vector<uint8_t>>& sectors) const override;
    bool recover(const std::vector<std::vector<uint8_t>>& sectors,
                 const std::vector<bool>& present_mask,
                 std::vector<uint8_t>& data) const override;
private:
    ErasurePlan plan_;
    bool valid_{false};
    // total_sectors x min_sectors, row major
    std::vector<uint8_t> matrix_;
};

} // namespace sectorcast
