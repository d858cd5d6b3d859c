#include "CauchyDecoder.h"

#include <algorithm>
#include <cstring>

CauchyDecoder::CauchyDecoder(const rqharness::TransmissionConfig &config)
    : m_config(config) {
  const auto layout = rqharness::calculate_block_layout(config);
  m_blocks.reserve(layout.size());
  for (const auto &block_layout : layout) {
    m_blocks.push_back(
        std::make_unique<CauchyRxBlock>(block_layout, config.symbol_size()));
  }
  m_block_done.resize(m_blocks.size(), false);
}

bool CauchyDecoder::validate_packet(
    const rqharness::EncodingPacket &packet) const {
  if (packet.source_block_number() >= m_blocks.size()) {
    return false;
  }
  if (packet.encoding_symbol_id() > rqharness::CAUCHY_MAX_ESI) {
    return false;
  }
  return packet.data().size() == m_config.symbol_size();
}

std::optional<std::vector<uint8_t>> CauchyDecoder::submit(
    const rqharness::EncodingPacket &packet) {
  if (m_result.has_value()) {
    return m_result;
  }
  stats.count_packets_total++;
  if (!validate_packet(packet)) {
    stats.count_packets_invalid++;
    return std::nullopt;
  }
  const auto sbn = packet.source_block_number();
  if (m_block_done[sbn]) {
    // block already complete, nothing to do with more symbols
    stats.count_packets_duplicate++;
    return std::nullopt;
  }
  auto &block = *m_blocks[sbn];
  if (!block.add_symbol(packet.encoding_symbol_id(), packet.data().data())) {
    stats.count_packets_duplicate++;
    return std::nullopt;
  }
  if (!block.can_be_reconstructed()) {
    return std::nullopt;
  }
  if (!block.all_source_symbols_available()) {
    const int n_recovered = block.reconstruct_missing_symbols();
    stats.count_blocks_recovered++;
    stats.count_symbols_recovered += n_recovered;
  }
  m_block_done[sbn] = true;
  m_n_blocks_done++;
  if (m_n_blocks_done < m_blocks.size()) {
    return std::nullopt;
  }
  m_result = assemble_object();
  return m_result;
}

std::vector<uint8_t> CauchyDecoder::assemble_object() const {
  const auto transfer_length = m_config.transfer_length();
  std::vector<uint8_t> ret(transfer_length);
  for (const auto &block : m_blocks) {
    const auto &layout = block->get_layout();
    const auto &symbols = block->get_source_symbols();
    // the last block contains the padding, which is not part of the object
    const uint64_t n_bytes = std::min<uint64_t>(
        symbols.size(), transfer_length - layout.byte_offset);
    memcpy(ret.data() + layout.byte_offset, symbols.data(), n_bytes);
  }
  return ret;
}
