#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace sectorcast {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::vector<std::string> split_list(const std::string& s, char sep);
// Accepts a plain byte count or one with a K/M/G suffix.
bool parse_size(const std::string& s, uint64_t& out);

} // namespace sectorcast
