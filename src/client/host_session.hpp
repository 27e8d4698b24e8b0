#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>
#include "task_manager.hpp"

namespace sectorcast {

// Upload channel to one storage host holding a contract with this client.
class HostSession {
public:
    virtual ~HostSession() = default;
    virtual const std::string& host_id() const = 0;
    // False once the contract can no longer take new data.
    virtual bool good_for_upload() const = 0;
    // Blocks until the host acknowledged the sector, failed, or tm stopped.
    virtual std::error_code upload_sector(uint64_t file_id, uint64_t segment_index,
                                          uint16_t sector_index,
                                          const std::vector<uint8_t>& data,
                                          TaskManager& tm) = 0;
};

} // namespace sectorcast
