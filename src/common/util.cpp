#include "util.hpp"
#include <cctype>
#include <stdexcept>

namespace sectorcast {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  host = s.substr(0, pos);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p <= 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  c = (char)std::tolower((unsigned char)c);
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return {};
    out.push_back((uint8_t)((hi << 4) | lo));
  }
  return out;
}

std::vector<std::string> split_list(const std::string &s, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t pos = s.find(sep, start);
    if (pos == std::string::npos)
      pos = s.size();
    if (pos > start)
      out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

bool parse_size(const std::string &s, uint64_t &out) {
  if (s.empty())
    return false;
  uint64_t mult = 1;
  std::string num = s;
  switch (std::toupper((unsigned char)s.back())) {
  case 'K':
    mult = 1ull << 10;
    break;
  case 'M':
    mult = 1ull << 20;
    break;
  case 'G':
    mult = 1ull << 30;
    break;
  default:
    break;
  }
  if (mult != 1)
    num.pop_back();
  try {
    size_t used = 0;
    unsigned long long v = std::stoull(num, &used);
    if (used != num.size())
      return false;
    out = (uint64_t)v * mult;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace sectorcast
