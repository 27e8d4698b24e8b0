#include "client_config.hpp"

namespace sectorcast {

bool ClientConfig::validate(std::string &err) const {
  if (repair_download_threshold < 0 || repair_download_threshold >= 1) {
    err = "repair threshold must be in [0, 1)";
    return false;
  }
  if (min_sectors == 0 || total_sectors < min_sectors ||
      total_sectors > 256) {
    err = "need 0 < min sectors <= total sectors <= 256";
    return false;
  }
  if (sector_size == 0) {
    err = "sector size must be positive";
    return false;
  }
  uint64_t per_segment = (uint64_t)sector_size * (min_sectors + total_sectors);
  if (per_segment > memory_limit) {
    err = "memory limit smaller than one segment";
    return false;
  }
  if (io_threads <= 0 || lifecycle_threads <= 0) {
    err = "thread counts must be positive";
    return false;
  }
  return true;
}

} // namespace sectorcast
