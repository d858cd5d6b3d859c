#include "gf256.h"

#include <array>
#include <stdexcept>

namespace rqharness::gf256 {

namespace {

static constexpr uint16_t POLYNOMIAL = 0x11D;

struct Tables {
  std::array<uint8_t, 512> exp{};
  std::array<uint8_t, 256> log{};
  // full 256x256 product table, makes the region operations a simple lookup
  std::array<std::array<uint8_t, 256>, 256> mul{};
  Tables() {
    uint16_t x = 1;
    for (int i = 0; i < 255; i++) {
      exp[i] = static_cast<uint8_t>(x);
      log[x] = static_cast<uint8_t>(i);
      x <<= 1;
      if (x & 0x100) x ^= POLYNOMIAL;
    }
    for (int i = 255; i < 512; i++) exp[i] = exp[i - 255];
    for (int a = 0; a < 256; a++) {
      for (int b = 0; b < 256; b++) {
        mul[a][b] = (a == 0 || b == 0) ? 0 : exp[log[a] + log[b]];
      }
    }
  }
};

const Tables &tables() {
  static const Tables t;
  return t;
}

}  // namespace

uint8_t mul(const uint8_t a, const uint8_t b) { return tables().mul[a][b]; }

uint8_t inv(const uint8_t a) {
  if (a == 0) throw std::domain_error("GF(256): 0 has no inverse");
  const auto &t = tables();
  return t.exp[255 - t.log[a]];
}

void mul_add_region(uint8_t *dst, const uint8_t *src, const uint8_t c,
                    const std::size_t len) {
  if (c == 0) return;
  if (c == 1) {
    for (std::size_t i = 0; i < len; i++) dst[i] ^= src[i];
    return;
  }
  const auto &row = tables().mul[c];
  for (std::size_t i = 0; i < len; i++) dst[i] ^= row[src[i]];
}

void mul_region(uint8_t *dst, const uint8_t c, const std::size_t len) {
  if (c == 1) return;
  const auto &row = tables().mul[c];
  for (std::size_t i = 0; i < len; i++) dst[i] = row[dst[i]];
}

}  // namespace rqharness::gf256
