#include "dispatch.hpp"

namespace sectorcast {

SharedRng::SharedRng(uint64_t seed)
    : gen_(seed ? seed : std::random_device{}()) {}

uint64_t SharedRng::next() {
  std::lock_guard<std::mutex> lk(mtx_);
  return gen_();
}

int random_assign_sectors(const std::vector<std::shared_ptr<Worker>> &workers,
                          const std::shared_ptr<UnfinishedSegment> &uc,
                          SharedRng &rng) {
  if (workers.empty())
    return 0;
  size_t n = workers.size();
  int assigned = 0;
  std::lock_guard<std::mutex> lk(uc->mu);
  for (size_t i = 0; i < uc->sector_slots.size(); i++) {
    if (uc->sector_slots[i])
      continue;
    size_t start = (size_t)((i + rng.next()) % n);
    for (size_t k = 0; k < n; k++) {
      auto &w = workers[(start + k) % n];
      if (w->try_assign(uc, (int)i)) {
        uc->sector_slots[i] = true;
        assigned++;
        break;
      }
    }
  }
  return assigned;
}

} // namespace sectorcast
