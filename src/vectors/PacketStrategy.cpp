#include "PacketStrategy.h"

#include <fmt/format.h>

#include <algorithm>

namespace rqharness {

namespace {

// helper for std::visit with lambdas
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void append(std::vector<EncodingPacket> &dst,
            std::vector<EncodingPacket> &&src) {
  dst.insert(dst.end(), std::make_move_iterator(src.begin()),
             std::make_move_iterator(src.end()));
}

}  // namespace

uint32_t calculate_drop_count(const uint32_t n_source_packets,
                              const uint32_t loss_pct) {
  if (loss_pct == 0 || n_source_packets == 0) {
    return 0;
  }
  const uint64_t drop_count =
      static_cast<uint64_t>(n_source_packets) * loss_pct / 100;
  return static_cast<uint32_t>(std::clamp<uint64_t>(
      drop_count, 1, static_cast<uint64_t>(n_source_packets)));
}

std::vector<EncodingPacket> select_packets(
    const std::vector<EncodingPacket> &source_packets,
    const REPAIR_PACKET_SOURCE &repair_source, const PacketStrategy &strategy) {
  const auto k = static_cast<uint32_t>(source_packets.size());
  std::vector<EncodingPacket> ret;
  std::visit(
      overloaded{
          [&](const SourceOnly &) {
            ret.assign(source_packets.begin(), source_packets.end());
          },
          [&](const SourcePlusRepair &s) {
            ret.assign(source_packets.begin(), source_packets.end());
            append(ret, repair_source(k, s.n_repair));
          },
          [&](const LossReplace &s) {
            const uint32_t drop_count = calculate_drop_count(k, s.loss_pct);
            // emulate loss of the last drop_count source packets
            ret.assign(source_packets.begin(),
                       source_packets.begin() + (k - drop_count));
            append(ret, repair_source(k, drop_count + s.overhead));
          },
          [&](const RepairOnly &s) { ret = repair_source(k, s.n_repair); },
      },
      strategy);
  return ret;
}

std::vector<EncodingPacket> select_packets(SourceBlockEncoder &block,
                                           const PacketStrategy &strategy) {
  const auto source_packets = block.source_packets();
  const REPAIR_PACKET_SOURCE repair_source = [&block](uint32_t start_esi,
                                                      uint32_t count) {
    return block.repair_packets(start_esi, count);
  };
  return select_packets(source_packets, repair_source, strategy);
}

std::vector<EncodingPacket> select_packets_all_blocks(
    EncodedObject &encoded, const PacketStrategy &strategy) {
  std::vector<EncodingPacket> ret;
  for (auto &block : encoded.blocks) {
    append(ret, select_packets(*block, strategy));
  }
  return ret;
}

std::string strategy_readable(const PacketStrategy &strategy) {
  return std::visit(
      overloaded{
          [](const SourceOnly &) { return std::string("SourceOnly"); },
          [](const SourcePlusRepair &s) {
            return fmt::format("SourcePlusRepair({})", s.n_repair);
          },
          [](const LossReplace &s) {
            return fmt::format("LossReplace({}%,+{})", s.loss_pct,
                               s.overhead);
          },
          [](const RepairOnly &s) {
            return fmt::format("RepairOnly({})", s.n_repair);
          },
      },
      strategy);
}

}  // namespace rqharness
