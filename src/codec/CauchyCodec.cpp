#include "CauchyCodec.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include "../HelperSources/Helper.hpp"
#include "CauchyDecoder.h"
#include "Partition.hpp"
#include "gf256.h"

namespace rqharness {

std::vector<SourceBlockLayout> calculate_block_layout(
    const TransmissionConfig &config) {
  const uint64_t transfer_length = config.transfer_length();
  const uint16_t symbol_size = config.symbol_size();
  if (transfer_length == 0) {
    throw std::invalid_argument("Transfer length must not be 0");
  }
  if (symbol_size == 0) {
    throw std::invalid_argument("Symbol size must not be 0");
  }
  if (config.symbol_alignment() == 0 ||
      symbol_size % config.symbol_alignment() != 0) {
    throw std::invalid_argument(
        fmt::format("Symbol size {} is not a multiple of the alignment {}",
                    symbol_size, config.symbol_alignment()));
  }
  if (config.sub_blocks() != 1) {
    throw std::invalid_argument(fmt::format(
        "Only N=1 sub-blocks are supported, got {}", config.sub_blocks()));
  }
  const uint64_t n_symbols_total = helper::div_ceil<uint64_t>(
      transfer_length, static_cast<uint64_t>(symbol_size));
  const uint32_t n_blocks = config.source_blocks();
  if (n_blocks == 0 || n_blocks > n_symbols_total) {
    throw std::invalid_argument(fmt::format(
        "Cannot split {} symbols into {} source blocks", n_symbols_total,
        n_blocks));
  }
  const auto block_sizes = partition::calculate_block_sizes(
      static_cast<uint32_t>(n_symbols_total), n_blocks);
  std::vector<SourceBlockLayout> ret;
  ret.reserve(block_sizes.size());
  uint64_t offset = 0;
  for (uint32_t sbn = 0; sbn < block_sizes.size(); sbn++) {
    if (block_sizes[sbn] > CAUCHY_MAX_SYMBOLS_PER_BLOCK) {
      throw std::invalid_argument(
          fmt::format("Source block {} would have {} symbols, max is {}", sbn,
                      block_sizes[sbn], CAUCHY_MAX_SYMBOLS_PER_BLOCK));
    }
    ret.push_back({static_cast<uint8_t>(sbn), block_sizes[sbn], offset});
    offset += static_cast<uint64_t>(block_sizes[sbn]) * symbol_size;
  }
  return ret;
}

uint8_t cauchy_coefficient(const uint32_t esi,
                           const uint32_t source_symbol_idx) {
  return gf256::inv(static_cast<uint8_t>(esi ^ source_symbol_idx));
}

CauchyCodec::CauchyCodec() : CauchyCodec(Options{}) {}

CauchyCodec::CauchyCodec(Options options) : m_options(options) {
  if (m_options.max_source_symbols_per_block == 0 ||
      m_options.max_source_symbols_per_block > CAUCHY_MAX_SYMBOLS_PER_BLOCK) {
    throw std::invalid_argument(
        fmt::format("max_source_symbols_per_block must be in [1,{}]",
                    CAUCHY_MAX_SYMBOLS_PER_BLOCK));
  }
  if (m_options.symbol_alignment == 0) {
    throw std::invalid_argument("symbol_alignment must not be 0");
  }
}

std::string CauchyCodec::name() const {
  return fmt::format("GF(256) Cauchy reference codec (Kmax={}, Al={})",
                     m_options.max_source_symbols_per_block,
                     m_options.symbol_alignment);
}

TransmissionConfig CauchyCodec::create_config(
    const uint64_t transfer_length, const uint16_t symbol_size) const {
  if (transfer_length == 0) {
    throw std::invalid_argument("Cannot encode an empty object");
  }
  if (symbol_size == 0 || symbol_size % m_options.symbol_alignment != 0) {
    throw std::invalid_argument(
        fmt::format("Symbol size {} is not a multiple of the alignment {}",
                    symbol_size, m_options.symbol_alignment));
  }
  const uint64_t n_symbols_total =
      helper::div_ceil<uint64_t>(transfer_length, symbol_size);
  if (n_symbols_total > UINT32_MAX) {
    throw std::invalid_argument(fmt::format(
        "Object of {} bytes has too many symbols with T={}", transfer_length,
        symbol_size));
  }
  const uint32_t n_blocks = partition::calc_min_n_of_blocks(
      static_cast<uint32_t>(n_symbols_total),
      m_options.max_source_symbols_per_block);
  if (n_blocks > MAX_SOURCE_BLOCKS) {
    throw std::invalid_argument(fmt::format(
        "Object of {} bytes needs {} source blocks with T={}, max is {}",
        transfer_length, n_blocks, symbol_size, MAX_SOURCE_BLOCKS));
  }
  return TransmissionConfig(transfer_length, symbol_size,
                            static_cast<uint8_t>(n_blocks), 1,
                            m_options.symbol_alignment);
}

EncodedObject CauchyCodec::encode(const std::vector<uint8_t> &data,
                                  const uint16_t symbol_size) const {
  EncodedObject ret;
  ret.config = create_config(data.size(), symbol_size);
  // one copy of the object, shared by all block encoders
  auto object = std::make_shared<const std::vector<uint8_t>>(data);
  for (const auto &layout : calculate_block_layout(ret.config)) {
    ret.blocks.push_back(
        std::make_unique<CauchyBlockEncoder>(object, layout, symbol_size));
  }
  return ret;
}

std::unique_ptr<ObjectDecoder> CauchyCodec::create_decoder(
    const TransmissionConfig &config) const {
  return std::make_unique<CauchyDecoder>(config);
}

CauchyBlockEncoder::CauchyBlockEncoder(
    std::shared_ptr<const std::vector<uint8_t>> object,
    SourceBlockLayout layout, const uint16_t symbol_size)
    : m_object(std::move(object)),
      m_layout(layout),
      m_symbol_size(symbol_size) {}

void CauchyBlockEncoder::materialize_symbols_if_needed() {
  if (!m_symbols.empty()) return;
  const std::size_t block_bytes =
      static_cast<std::size_t>(m_layout.n_source_symbols) * m_symbol_size;
  // zero initialized, such that the padding of the last symbol is 0
  m_symbols.resize(block_bytes, 0);
  const std::size_t available = m_object->size() - m_layout.byte_offset;
  const std::size_t n_copy = std::min(block_bytes, available);
  memcpy(m_symbols.data(), m_object->data() + m_layout.byte_offset, n_copy);
}

std::vector<EncodingPacket> CauchyBlockEncoder::source_packets() {
  materialize_symbols_if_needed();
  std::vector<EncodingPacket> ret;
  ret.reserve(m_layout.n_source_symbols);
  for (uint32_t esi = 0; esi < m_layout.n_source_symbols; esi++) {
    const uint8_t *p = symbol_p(esi);
    ret.emplace_back(PayloadId{m_layout.source_block_number, esi},
                     std::vector<uint8_t>(p, p + m_symbol_size));
  }
  return ret;
}

std::vector<EncodingPacket> CauchyBlockEncoder::repair_packets(
    const uint32_t start_esi, const uint32_t count) {
  if (start_esi < m_layout.n_source_symbols) {
    throw std::invalid_argument(
        fmt::format("Repair ESI {} is a source symbol (K={})", start_esi,
                    m_layout.n_source_symbols));
  }
  if (count == 0) return {};
  const uint64_t last_esi = static_cast<uint64_t>(start_esi) + count - 1;
  if (last_esi > CAUCHY_MAX_ESI) {
    throw std::out_of_range(
        fmt::format("Repair ESI {} exceeds the max ESI {} of this code",
                    last_esi, CAUCHY_MAX_ESI));
  }
  materialize_symbols_if_needed();
  std::vector<EncodingPacket> ret;
  ret.reserve(count);
  for (uint32_t esi = start_esi; esi <= last_esi; esi++) {
    std::vector<uint8_t> symbol(m_symbol_size, 0);
    create_repair_symbol(esi, symbol.data());
    ret.emplace_back(PayloadId{m_layout.source_block_number, esi},
                     std::move(symbol));
  }
  return ret;
}

void CauchyBlockEncoder::create_repair_symbol(const uint32_t esi,
                                              uint8_t *out) const {
  for (uint32_t j = 0; j < m_layout.n_source_symbols; j++) {
    gf256::mul_add_region(out, symbol_p(j), cauchy_coefficient(esi, j),
                          m_symbol_size);
  }
}

}  // namespace rqharness
