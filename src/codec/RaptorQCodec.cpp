#include "RaptorQCodec.h"

#include <RaptorQ/RFC6330_v1.hpp>
#include <fmt/format.h>

#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

#include "../HelperSources/Helper.hpp"
#include "Partition.hpp"

namespace rqharness {

namespace {

namespace lib = RFC6330__v1;

using SymbolIt = std::vector<uint8_t>::iterator;
using LibEncoder = lib::Encoder<SymbolIt, SymbolIt>;
using LibDecoder = lib::Decoder<SymbolIt, SymbolIt>;

// Sub-block working memory handed to the library. Large enough that it never
// splits a source block into sub-blocks, K'max is the only limit on K.
constexpr std::size_t MAX_SUB_BLOCK_BYTES =
    static_cast<std::size_t>(RAPTORQ_MAX_SOURCE_SYMBOLS) * UINT16_MAX;

// n of source symbols of every block, same rule as the library uses
std::vector<uint32_t> calculate_raptorq_block_sizes(
    const TransmissionConfig &config) {
  if (config.transfer_length() == 0 ||
      config.transfer_length() > MAX_TRANSFER_LENGTH) {
    throw std::invalid_argument(fmt::format("Invalid transfer length {}",
                                            config.transfer_length()));
  }
  if (config.symbol_size() == 0) {
    throw std::invalid_argument("Symbol size must not be 0");
  }
  if (config.symbol_alignment() != RAPTORQ_SYMBOL_ALIGNMENT) {
    throw std::invalid_argument(
        fmt::format("Only Al={} is supported, got {}",
                    RAPTORQ_SYMBOL_ALIGNMENT, config.symbol_alignment()));
  }
  if (config.sub_blocks() != 1) {
    throw std::invalid_argument(fmt::format(
        "Only N=1 sub-blocks are supported, got {}", config.sub_blocks()));
  }
  const uint64_t n_symbols_total = helper::div_ceil<uint64_t>(
      config.transfer_length(), static_cast<uint64_t>(config.symbol_size()));
  const uint32_t n_blocks = config.source_blocks();
  if (n_blocks == 0 || n_blocks > n_symbols_total ||
      n_symbols_total >
          static_cast<uint64_t>(n_blocks) * RAPTORQ_MAX_SOURCE_SYMBOLS) {
    throw std::invalid_argument(fmt::format(
        "Cannot split {} symbols into {} source blocks", n_symbols_total,
        n_blocks));
  }
  return partition::calculate_block_sizes(
      static_cast<uint32_t>(n_symbols_total), n_blocks);
}

// The object and the library encoder working on it. Shared by all block
// encoders of one object, the intermediate symbols are computed once, when
// the first packet is requested.
class SharedEncoder {
 public:
  SharedEncoder(const std::vector<uint8_t> &data, const uint16_t symbol_size)
      : m_data(data),
        m_encoder(m_data.begin(), m_data.end(), symbol_size, symbol_size,
                  MAX_SUB_BLOCK_BYTES),
        m_symbol_size(symbol_size) {
    if (!m_encoder) {
      throw std::invalid_argument(fmt::format(
          "libRaptorQ rejected an object of {} bytes with T={}",
          m_data.size(), symbol_size));
    }
  }
  SharedEncoder(const SharedEncoder &) = delete;
  SharedEncoder &operator=(const SharedEncoder &) = delete;

  TransmissionConfig config() {
    return TransmissionConfig::from_oti(m_encoder.OTI_Common(),
                                        m_encoder.OTI_Scheme_Specific());
  }
  uint32_t n_source_symbols(const uint8_t sbn) {
    return static_cast<uint32_t>(m_encoder.symbols(sbn));
  }
  EncodingPacket create_packet(const uint8_t sbn, const uint32_t esi) {
    compute_if_needed();
    std::vector<uint8_t> symbol(m_symbol_size, 0);
    auto out = symbol.begin();
    m_encoder.encode(out, symbol.end(), esi, sbn);
    if (out != symbol.end()) {
      throw std::out_of_range(
          fmt::format("libRaptorQ cannot create ESI {} of block {}", esi, sbn));
    }
    return {PayloadId{sbn, esi}, std::move(symbol)};
  }

 private:
  void compute_if_needed() {
    if (m_computed) return;
    const auto result = m_encoder.compute(lib::Compute::COMPLETE).get();
    if (result.first != lib::Error::NONE) {
      throw std::runtime_error(fmt::format(
          "libRaptorQ failed to encode an object of {} bytes", m_data.size()));
    }
    m_computed = true;
  }
  // the library encoder only holds iterators into this
  std::vector<uint8_t> m_data;
  LibEncoder m_encoder;
  const uint16_t m_symbol_size;
  bool m_computed = false;
};

class RaptorQBlockEncoder : public SourceBlockEncoder {
 public:
  RaptorQBlockEncoder(std::shared_ptr<SharedEncoder> shared, const uint8_t sbn)
      : m_shared(std::move(shared)),
        m_sbn(sbn),
        m_n_source_symbols(m_shared->n_source_symbols(sbn)) {}
  uint8_t source_block_number() const override { return m_sbn; }
  uint32_t n_source_symbols() const override { return m_n_source_symbols; }
  std::vector<EncodingPacket> source_packets() override {
    std::vector<EncodingPacket> ret;
    ret.reserve(m_n_source_symbols);
    for (uint32_t esi = 0; esi < m_n_source_symbols; esi++) {
      ret.push_back(m_shared->create_packet(m_sbn, esi));
    }
    return ret;
  }
  std::vector<EncodingPacket> repair_packets(const uint32_t start_esi,
                                             const uint32_t count) override {
    if (start_esi < m_n_source_symbols) {
      throw std::invalid_argument(
          fmt::format("Repair ESI {} is a source symbol (K={})", start_esi,
                      m_n_source_symbols));
    }
    if (count == 0) return {};
    const uint64_t last_esi = static_cast<uint64_t>(start_esi) + count - 1;
    if (last_esi > MAX_ENCODING_SYMBOL_ID) {
      throw std::out_of_range(fmt::format(
          "Repair ESI {} exceeds the max ESI {}", last_esi,
          MAX_ENCODING_SYMBOL_ID));
    }
    std::vector<EncodingPacket> ret;
    ret.reserve(count);
    for (uint64_t esi = start_esi; esi <= last_esi; esi++) {
      ret.push_back(m_shared->create_packet(m_sbn, static_cast<uint32_t>(esi)));
    }
    return ret;
  }

 private:
  const std::shared_ptr<SharedEncoder> m_shared;
  const uint8_t m_sbn;
  const uint32_t m_n_source_symbols;
};

class RaptorQDecoder : public ObjectDecoder {
 public:
  explicit RaptorQDecoder(const TransmissionConfig &config)
      : m_config(config),
        m_block_sizes(calculate_raptorq_block_sizes(config)),
        m_symbols(m_block_sizes.size()) {}
  std::optional<std::vector<uint8_t>> submit(
      const EncodingPacket &packet) override {
    if (m_result) return m_result;
    const uint8_t sbn = packet.source_block_number();
    // not part of this object
    if (sbn >= m_symbols.size() ||
        packet.data().size() != m_config.symbol_size() ||
        packet.encoding_symbol_id() > MAX_ENCODING_SYMBOL_ID) {
      return std::nullopt;
    }
    auto &block = m_symbols[sbn];
    if (!block.emplace(packet.encoding_symbol_id(), packet.data()).second) {
      // duplicate
      return std::nullopt;
    }
    if (block.size() == m_block_sizes[sbn]) {
      m_n_blocks_ready++;
    }
    if (m_n_blocks_ready < m_block_sizes.size()) {
      return std::nullopt;
    }
    return try_decode();
  }

 private:
  std::optional<std::vector<uint8_t>> try_decode() {
    LibDecoder decoder(m_config.oti_common(), m_config.oti_scheme_specific());
    if (!decoder) {
      throw std::runtime_error(fmt::format("libRaptorQ rejected the OTI {}",
                                           m_config.to_string()));
    }
    for (std::size_t sbn = 0; sbn < m_symbols.size(); sbn++) {
      for (auto &entry : m_symbols[sbn]) {
        auto in = entry.second.begin();
        const auto err = decoder.add_symbol(in, entry.second.end(),
                                            entry.first,
                                            static_cast<uint8_t>(sbn));
        if (err != lib::Error::NONE && err != lib::Error::NOT_NEEDED) {
          return std::nullopt;
        }
      }
    }
    decoder.end_of_input(lib::Fill_With_Zeros::NO);
    const auto result = decoder.compute(lib::Compute::COMPLETE).get();
    if (result.first != lib::Error::NONE) {
      // the received symbols are linearly dependent, wait for more
      return std::nullopt;
    }
    std::vector<uint8_t> object(m_config.transfer_length());
    auto out = object.begin();
    decoder.decode_bytes(out, object.end(), 0, 0);
    if (out != object.end()) {
      return std::nullopt;
    }
    m_result = std::move(object);
    return m_result;
  }
  const TransmissionConfig m_config;
  // K of every source block
  const std::vector<uint32_t> m_block_sizes;
  // received symbols of every block, by ESI
  std::vector<std::map<uint32_t, std::vector<uint8_t>>> m_symbols;
  // n of blocks with at least K symbols
  std::size_t m_n_blocks_ready = 0;
  std::optional<std::vector<uint8_t>> m_result;
};

}  // namespace

std::string RaptorQCodec::name() const {
  return fmt::format("libRaptorQ RFC 6330 codec (K'max={}, Al={})",
                     RAPTORQ_MAX_SOURCE_SYMBOLS, RAPTORQ_SYMBOL_ALIGNMENT);
}

EncodedObject RaptorQCodec::encode(const std::vector<uint8_t> &data,
                                   const uint16_t symbol_size) const {
  if (data.empty()) {
    throw std::invalid_argument("Cannot encode an empty object");
  }
  if (symbol_size == 0) {
    throw std::invalid_argument("Symbol size must not be 0");
  }
  const uint64_t n_symbols_total =
      helper::div_ceil<uint64_t>(data.size(), symbol_size);
  if (n_symbols_total > static_cast<uint64_t>(MAX_SOURCE_BLOCKS) *
                            RAPTORQ_MAX_SOURCE_SYMBOLS) {
    throw std::invalid_argument(fmt::format(
        "Object of {} bytes needs more than {} source blocks with T={}",
        data.size(), MAX_SOURCE_BLOCKS, symbol_size));
  }
  auto shared = std::make_shared<SharedEncoder>(data, symbol_size);
  EncodedObject ret;
  ret.config = shared->config();
  // the library and the decoder side must agree on every K
  const auto block_sizes = calculate_raptorq_block_sizes(ret.config);
  for (std::size_t sbn = 0; sbn < block_sizes.size(); sbn++) {
    auto block =
        std::make_unique<RaptorQBlockEncoder>(shared, static_cast<uint8_t>(sbn));
    if (block->n_source_symbols() != block_sizes[sbn]) {
      throw std::logic_error(fmt::format(
          "libRaptorQ put {} symbols into block {}, expected {}",
          block->n_source_symbols(), sbn, block_sizes[sbn]));
    }
    ret.blocks.push_back(std::move(block));
  }
  return ret;
}

std::unique_ptr<ObjectDecoder> RaptorQCodec::create_decoder(
    const TransmissionConfig &config) const {
  return std::make_unique<RaptorQDecoder>(config);
}

}  // namespace rqharness
