#include "fec.hpp"
#include <algorithm>
#include <array>
#include <cstring>

namespace sectorcast {

namespace {

// GF(2^8) with the 0x11d polynomial, generator 2.
struct GaloisTables {
  std::array<uint8_t, 512> exp{};
  std::array<uint8_t, 256> log{};
  std::array<std::array<uint8_t, 256>, 256> mul{};

  GaloisTables() {
    unsigned x = 1;
    for (int i = 0; i < 255; i++) {
      exp[i] = (uint8_t)x;
      log[x] = (uint8_t)i;
      x <<= 1;
      if (x & 0x100)
        x ^= 0x11d;
    }
    for (int i = 255; i < 512; i++)
      exp[i] = exp[i - 255];
    for (int a = 0; a < 256; a++)
      for (int b = 0; b < 256; b++)
        mul[a][b] = (a == 0 || b == 0) ? 0 : exp[log[a] + log[b]];
  }
};

const GaloisTables &gf() {
  static const GaloisTables t;
  return t;
}

uint8_t gf_mul(uint8_t a, uint8_t b) { return gf().mul[a][b]; }

uint8_t gf_inv(uint8_t a) { return gf().exp[255 - gf().log[a]]; }

uint8_t gf_pow(uint8_t a, int n) {
  if (n == 0)
    return 1;
  if (a == 0)
    return 0;
  return gf().exp[(gf().log[a] * n) % 255];
}

// In place Gauss-Jordan inversion of an n x n matrix.
bool invert(std::vector<uint8_t> &m, size_t n) {
  std::vector<uint8_t> inv(n * n, 0);
  for (size_t i = 0; i < n; i++)
    inv[i * n + i] = 1;
  for (size_t col = 0; col < n; col++) {
    size_t pivot = col;
    while (pivot < n && m[pivot * n + col] == 0)
      pivot++;
    if (pivot == n)
      return false;
    if (pivot != col) {
      for (size_t k = 0; k < n; k++) {
        std::swap(m[pivot * n + k], m[col * n + k]);
        std::swap(inv[pivot * n + k], inv[col * n + k]);
      }
    }
    uint8_t scale = gf_inv(m[col * n + col]);
    for (size_t k = 0; k < n; k++) {
      m[col * n + k] = gf_mul(m[col * n + k], scale);
      inv[col * n + k] = gf_mul(inv[col * n + k], scale);
    }
    for (size_t row = 0; row < n; row++) {
      if (row == col || m[row * n + col] == 0)
        continue;
      uint8_t f = m[row * n + col];
      for (size_t k = 0; k < n; k++) {
        m[row * n + k] ^= gf_mul(f, m[col * n + k]);
        inv[row * n + k] ^= gf_mul(f, inv[col * n + k]);
      }
    }
  }
  m.swap(inv);
  return true;
}

// out ^= coef * in
void mul_add(uint8_t coef, const uint8_t *in, uint8_t *out, size_t len) {
  if (coef == 0)
    return;
  const auto &row = gf().mul[coef];
  for (size_t j = 0; j < len; j++)
    out[j] ^= row[in[j]];
}

} // namespace

ReedSolomon::ReedSolomon(const ErasurePlan &plan) : plan_(plan) {
  size_t k = plan_.min_sectors;
  size_t n = plan_.total_sectors;
  if (k == 0 || n < k || n > 256 || plan_.sector_size == 0)
    return;

  std::vector<uint8_t> vand(n * k);
  for (size_t r = 0; r < n; r++)
    for (size_t c = 0; c < k; c++)
      vand[r * k + c] = gf_pow((uint8_t)r, (int)c);

  std::vector<uint8_t> top(vand.begin(), vand.begin() + k * k);
  if (!invert(top, k))
    return;

  matrix_.assign(n * k, 0);
  for (size_t r = 0; r < n; r++)
    for (size_t c = 0; c < k; c++) {
      uint8_t acc = 0;
      for (size_t i = 0; i < k; i++)
        acc ^= gf_mul(vand[r * k + i], top[i * k + c]);
      matrix_[r * k + c] = acc;
    }
  valid_ = true;
}

bool ReedSolomon::encode(const std::vector<uint8_t> &data,
                         std::vector<std::vector<uint8_t>> &sectors) const {
  sectors.clear();
  if (!valid_)
    return false;
  size_t k = plan_.min_sectors;
  size_t n = plan_.total_sectors;
  size_t shard_size = plan_.sector_size;
  if (data.size() > k * shard_size)
    return false;

  sectors.resize(n, std::vector<uint8_t>(shard_size, 0));
  size_t offset = 0;
  for (size_t i = 0; i < k && offset < data.size(); i++) {
    size_t len = std::min(shard_size, data.size() - offset);
    std::memcpy(sectors[i].data(), data.data() + offset, len);
    offset += len;
  }
  for (size_t r = k; r < n; r++)
    for (size_t c = 0; c < k; c++)
      mul_add(matrix_[r * k + c], sectors[c].data(), sectors[r].data(),
              shard_size);
  return true;
}

bool ReedSolomon::recover(const std::vector<std::vector<uint8_t>> &sectors,
                          const std::vector<bool> &present_mask,
                          std::vector<uint8_t> &data) const {
  data.clear();
  if (!valid_)
    return false;
  size_t k = plan_.min_sectors;
  size_t shard_size = plan_.sector_size;
  size_t limit = std::min(sectors.size(), present_mask.size());

  std::vector<size_t> rows;
  for (size_t i = 0; i < limit && rows.size() < k; i++) {
    if (present_mask[i] && sectors[i].size() == shard_size)
      rows.push_back(i);
  }
  if (rows.size() < k)
    return false;

  std::vector<uint8_t> sub(k * k);
  for (size_t r = 0; r < k; r++)
    std::memcpy(sub.data() + r * k, matrix_.data() + rows[r] * k, k);
  if (!invert(sub, k))
    return false;

  data.assign(k * shard_size, 0);
  for (size_t c = 0; c < k; c++) {
    uint8_t *out = data.data() + c * shard_size;
    for (size_t r = 0; r < k; r++)
      mul_add(sub[c * k + r], sectors[rows[r]].data(), out, shard_size);
  }
  return true;
}

} // namespace sectorcast
