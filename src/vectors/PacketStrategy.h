#ifndef RQHARNESS_PACKET_STRATEGY_H
#define RQHARNESS_PACKET_STRATEGY_H

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "../codec/Codec.h"

// Selects which of the packets a codec can produce for a source block are
// handed to the decoder, emulating different loss scenarios.
// Output order is always: kept source packets (ascending ESI), then repair
// packets (ascending ESI, starting at ESI K).
// NOTE: Nothing here checks if the selected packets are enough to decode.
// Some test vectors intentionally exercise the boundary.

namespace rqharness {

// All K source packets
struct SourceOnly {};
// All K source packets followed by n_repair repair packets
struct SourcePlusRepair {
  uint32_t n_repair;
};
// Drop the last drop_count source packets (see calculate_drop_count) and
// replace them with drop_count+overhead repair packets
struct LossReplace {
  uint32_t loss_pct;
  uint32_t overhead;
};
// n_repair repair packets, no source packets at all
struct RepairOnly {
  uint32_t n_repair;
};

using PacketStrategy =
    std::variant<SourceOnly, SourcePlusRepair, LossReplace, RepairOnly>;

// Creates count consecutive repair packets starting at start_esi
using REPAIR_PACKET_SOURCE = std::function<std::vector<EncodingPacket>(
    uint32_t start_esi, uint32_t count)>;

/**
 * n of source packets to drop for @param loss_pct percent loss of
 * @param n_source_packets. Rounds down, but always at least 1 as long as there
 * is any loss and any packet (a 10% loss of 5 packets drops 1, not 0).
 * Never more than n_source_packets.
 */
uint32_t calculate_drop_count(uint32_t n_source_packets, uint32_t loss_pct);

/**
 * Apply @param strategy to one source block.
 * @param source_packets all K source packets of the block in ESI order
 * @param repair_source creates repair packets for this block
 */
std::vector<EncodingPacket> select_packets(
    const std::vector<EncodingPacket> &source_packets,
    const REPAIR_PACKET_SOURCE &repair_source, const PacketStrategy &strategy);

// Same as above, packets are pulled from @param block
std::vector<EncodingPacket> select_packets(SourceBlockEncoder &block,
                                           const PacketStrategy &strategy);

// Apply @param strategy to every block of the object, concatenating the
// results in SBN order
std::vector<EncodingPacket> select_packets_all_blocks(
    EncodedObject &encoded, const PacketStrategy &strategy);

std::string strategy_readable(const PacketStrategy &strategy);

}  // namespace rqharness

#endif  // RQHARNESS_PACKET_STRATEGY_H
