#ifndef RQHARNESS_VECTOR_SPECS_HPP
#define RQHARNESS_VECTOR_SPECS_HPP

#include <array>
#include <cstdint>

#include "PacketStrategy.h"

namespace rqharness {

// Input of the payload generator, see helper::generate_payload()
struct PayloadSpec {
  uint32_t length;
  uint8_t a;
  uint8_t b;
};

struct VectorSpec {
  const char *name;
  const char *filename;
  PayloadSpec payload;
  uint16_t symbol_size;
  PacketStrategy strategy;
};

// The named interop test vectors. Every case uses its own seed pair, such that
// no two fixtures share the same source data.
static const std::array<VectorSpec, 8> VECTOR_SPECS{{
    {"v01", "v01_small_source_only.bin", {64, 7, 13}, 16, SourceOnly{}},
    {"v02", "v02_medium_with_repair.bin", {1024, 11, 23}, 32,
     SourcePlusRepair{5}},
    {"v03", "v03_large_symbol.bin", {4096, 13, 37}, 256, SourcePlusRepair{5}},
    {"v04", "v04_loss_10pct.bin", {512, 17, 41}, 32, LossReplace{10, 2}},
    {"v05", "v05_loss_50pct.bin", {512, 19, 43}, 32, LossReplace{50, 2}},
    // 100 bytes don't fill the last symbol
    {"v06", "v06_padding_uneven.bin", {100, 23, 47}, 32, SourcePlusRepair{6}},
    // K=1
    {"v07", "v07_minimum_k.bin", {16, 29, 53}, 16, SourcePlusRepair{9}},
    {"v08", "v08_repair_only.bin", {128, 31, 59}, 32, RepairOnly{10}},
}};

}  // namespace rqharness

#endif  // RQHARNESS_VECTOR_SPECS_HPP
