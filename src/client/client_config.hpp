#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "logging.hpp"

namespace sectorcast {

struct ClientConfig {
    uint64_t memory_limit{256ull << 20};
    // Fraction of the redundant sectors that may be missing before a segment
    // is rebuilt from the network, and the tolerance for marking it stuck.
    double repair_download_threshold{0.125};
    int io_threads{4};
    int lifecycle_threads{4};
    uint64_t seed{0};
    std::chrono::milliseconds upload_cooldown{1000};
    int max_cooldown_exponent{10};
    std::chrono::milliseconds host_timeout{10000};
    std::chrono::milliseconds repair_poll{500};
    size_t stuck_channel_capacity{16};

    // Used by the command line driver.
    std::vector<std::string> hosts;
    std::vector<uint8_t> key;
    uint16_t min_sectors{4};
    uint16_t total_sectors{12};
    uint32_t sector_size{1u << 20};
    LogLevel log_level{LogLevel::INFO};

    bool validate(std::string& err) const;
};

} // namespace sectorcast
