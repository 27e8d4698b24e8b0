#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <vector>
#include "upload_segment.hpp"
#include "worker.hpp"

namespace sectorcast {

// Random source shared by every dispatch round. A zero seed draws one from
// std::random_device.
class SharedRng {
public:
    explicit SharedRng(uint64_t seed);
    uint64_t next();
private:
    std::mutex mtx_;
    std::mt19937_64 gen_;
};

// Hands each free sector slot of uc to the first ready worker at or after a
// random start position. Slots with no ready worker stay free. Takes uc->mu.
// Returns the number of slots assigned.
int random_assign_sectors(const std::vector<std::shared_ptr<Worker>>& workers,
                          const std::shared_ptr<UnfinishedSegment>& uc,
                          SharedRng& rng);

} // namespace sectorcast
