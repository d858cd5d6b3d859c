//
// Created by consti10 on 07.12.22.
//

#ifndef RQHARNESS_SRC_CODEC_PARTITION_HPP_
#define RQHARNESS_SRC_CODEC_PARTITION_HPP_

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "../HelperSources/Helper.hpp"

namespace rqharness::partition {

// RFC 6330 4.4.1.2: Partition[I,J] splits I items into J parts as equally as
// possible. count_large parts get size_large items, the remaining count_small
// parts size_small items. Large parts come first.
struct Partition {
  uint32_t count_large;
  uint32_t size_large;
  uint32_t count_small;
  uint32_t size_small;
};

static Partition partition(const uint32_t i, const uint32_t j) {
  if (j == 0) {
    throw std::invalid_argument("Cannot partition into 0 parts");
  }
  const uint32_t size_large = helper::div_ceil(i, j);
  const uint32_t size_small = i / j;
  const uint32_t count_large = i - size_small * j;
  const uint32_t count_small = j - count_large;
  return {count_large, size_large, count_small, size_small};
}

// Given some amount of balls, fill the minimum amount of buckets as equally
// distributed as possible with balls such that each bucket has not more than
// max_bucket_size balls
static uint32_t calc_min_n_of_blocks(const uint32_t n_symbols,
                                     const uint32_t max_block_size) {
  return helper::div_ceil(n_symbols, max_block_size);
}

// n of source symbols for each of the @param n_blocks source blocks
static std::vector<uint32_t> calculate_block_sizes(const uint32_t n_symbols,
                                                   const uint32_t n_blocks) {
  const auto p = partition(n_symbols, n_blocks);
  std::vector<uint32_t> ret;
  ret.reserve(n_blocks);
  for (uint32_t i = 0; i < p.count_large; i++) ret.push_back(p.size_large);
  for (uint32_t i = 0; i < p.count_small; i++) ret.push_back(p.size_small);
  return ret;
}

}  // namespace rqharness::partition

#endif  // RQHARNESS_SRC_CODEC_PARTITION_HPP_
