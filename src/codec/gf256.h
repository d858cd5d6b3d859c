#ifndef RQHARNESS_GF256_H
#define RQHARNESS_GF256_H

#include <cstddef>
#include <cstdint>

// Arithmetic in GF(2^8) with the reduction polynomial
// x^8 + x^4 + x^3 + x^2 + 1 (0x11D). Addition is XOR.
// Tables are created once on first use.
namespace rqharness::gf256 {

uint8_t mul(uint8_t a, uint8_t b);
// multiplicative inverse, a must not be 0
uint8_t inv(uint8_t a);
// dst[i] ^= c * src[i] for i in [0,len[
void mul_add_region(uint8_t *dst, const uint8_t *src, uint8_t c,
                    std::size_t len);
// dst[i] = c * dst[i] for i in [0,len[
void mul_region(uint8_t *dst, uint8_t c, std::size_t len);

}  // namespace rqharness::gf256

#endif  // RQHARNESS_GF256_H
