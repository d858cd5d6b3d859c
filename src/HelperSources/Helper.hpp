//
// Created by consti10 on 05.12.20.
//

#ifndef RQHARNESS_HELPER_H
#define RQHARNESS_HELPER_H

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <vector>

#include "StringHelper.hpp"

// Generic helper code that does not depend on anything else other than the std
// libraries

namespace rqharness::helper {

// byte i of the deterministic payload for the seed pair (a,b).
// The multiplication is done in 64 bit such that large indices don't overflow.
static constexpr uint8_t payload_byte_at(const uint64_t i, const uint8_t a,
                                         const uint8_t b) {
  return static_cast<uint8_t>((i * static_cast<uint64_t>(a) +
                               static_cast<uint64_t>(b)) %
                              256);
}

// Deterministic payload of @param length bytes, byte[i] = (i*a + b) mod 256.
// Same arguments always give the same bytes, on every platform.
static std::vector<uint8_t> generate_payload(const std::size_t length,
                                             const uint8_t a,
                                             const uint8_t b) {
  std::vector<uint8_t> ret(length);
  for (std::size_t i = 0; i < length; i++) {
    ret[i] = payload_byte_at(i, a, b);
  }
  return ret;
}

// ceil(a/b) for positive integers
template <typename T>
static constexpr T div_ceil(const T a, const T b) {
  return (a + b - 1) / b;
}

// Big endian (network order) helpers for the wire formats
static void write_u32_be(uint8_t *dst, const uint32_t value) {
  dst[0] = static_cast<uint8_t>(value >> 24);
  dst[1] = static_cast<uint8_t>(value >> 16);
  dst[2] = static_cast<uint8_t>(value >> 8);
  dst[3] = static_cast<uint8_t>(value);
}
static uint32_t read_u32_be(const uint8_t *src) {
  return (static_cast<uint32_t>(src[0]) << 24) |
         (static_cast<uint32_t>(src[1]) << 16) |
         (static_cast<uint32_t>(src[2]) << 8) | static_cast<uint32_t>(src[3]);
}
static void append_u32_be(std::vector<uint8_t> &dst, const uint32_t value) {
  uint8_t tmp[4];
  write_u32_be(tmp, value);
  dst.insert(dst.end(), tmp, tmp + 4);
}

static bool compareVectors(const std::vector<uint8_t> &sb,
                           const std::vector<uint8_t> &rb) {
  if (sb.size() != rb.size()) {
    return false;
  }
  if (sb.empty()) return true;
  const int result = memcmp(sb.data(), rb.data(), sb.size());
  return result == 0;
}
static void assertVectorsEqual(const std::vector<uint8_t> &sb,
                               const std::vector<uint8_t> &rb) {
  assert(sb.size() == rb.size());
  assert(compareVectors(sb, rb));
}
// given an array of available indices, for each index int the range
// [0...range[, check if this index is contained in the input array. if not,
// the index is "missing" and added to the return array
static std::vector<unsigned int> findMissingIndices(
    const std::vector<unsigned int> &indicesAvailable,
    const std::size_t range) {
  std::vector<unsigned int> indicesMissing;
  for (unsigned int i = 0; i < range; i++) {
    auto found = indicesAvailable.end() !=
                 std::find(indicesAvailable.begin(), indicesAvailable.end(), i);
    if (!found) {
      indicesMissing.push_back(i);
    }
  }
  return indicesMissing;
}
}  // namespace rqharness::helper

#endif  // RQHARNESS_HELPER_H
