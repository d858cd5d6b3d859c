#ifndef RQHARNESS_CAUCHY_CODEC_H
#define RQHARNESS_CAUCHY_CODEC_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Codec.h"

// Reference implementation of the Codec interface: a systematic Cauchy
// erasure code over GF(2^8). It is NOT RaptorQ, but it speaks the same wire
// formats (OTI, PayloadId, RFC 6330 block partitioning) and has the same
// "any K symbols of a block are enough" property, which is all the harness
// needs to be exercised end to end.
// Source ESI j carries source symbol j. Repair ESI e carries
// sum over j of C[e][j]*s_j with C[e][j] = 1/(e XOR j). Since e>=K>j, e XOR j
// is never 0 and every square sub-matrix of C is invertible.

namespace rqharness {

// ESIs are limited to [0,255] by the field size, K+R<=256
static constexpr uint32_t CAUCHY_MAX_ESI = 255;
static constexpr uint32_t CAUCHY_MAX_SYMBOLS_PER_BLOCK = CAUCHY_MAX_ESI + 1;
// max 128 source and (at least) 128 repair symbols per block
static constexpr uint32_t CAUCHY_DEFAULT_MAX_SOURCE_SYMBOLS = 128;
static constexpr uint8_t CAUCHY_DEFAULT_SYMBOL_ALIGNMENT = 4;

// Where a source block lives inside the (unpadded) object
struct SourceBlockLayout {
  uint8_t source_block_number;
  uint32_t n_source_symbols;
  // offset of the first byte of this block in the object
  uint64_t byte_offset;
};

/**
 * Splits the object described by @param config into source blocks
 * (RFC 6330 4.4.1.2). Used by both the encoder and the decoder, such that both
 * sides agree on K for every block.
 * throws std::invalid_argument if config cannot describe a valid object.
 */
std::vector<SourceBlockLayout> calculate_block_layout(
    const TransmissionConfig &config);

// C[esi][source_symbol_idx]
uint8_t cauchy_coefficient(uint32_t esi, uint32_t source_symbol_idx);

class CauchyCodec : public Codec {
 public:
  struct Options {
    // K of a source block never exceeds this value
    uint32_t max_source_symbols_per_block = CAUCHY_DEFAULT_MAX_SOURCE_SYMBOLS;
    uint8_t symbol_alignment = CAUCHY_DEFAULT_SYMBOL_ALIGNMENT;
  };
  CauchyCodec();
  explicit CauchyCodec(Options options);
  std::string name() const override;
  EncodedObject encode(const std::vector<uint8_t> &data,
                       uint16_t symbol_size) const override;
  std::unique_ptr<ObjectDecoder> create_decoder(
      const TransmissionConfig &config) const override;
  // The OTI encode() uses for an object of this size
  TransmissionConfig create_config(uint64_t transfer_length,
                                   uint16_t symbol_size) const;

 private:
  const Options m_options;
};

// Encoder for a single source block. All blocks of an object share the
// object data, the padded symbols of a block are only created once the first
// packet is requested.
class CauchyBlockEncoder : public SourceBlockEncoder {
 public:
  CauchyBlockEncoder(std::shared_ptr<const std::vector<uint8_t>> object,
                     SourceBlockLayout layout, uint16_t symbol_size);
  CauchyBlockEncoder(const CauchyBlockEncoder &other) = delete;
  uint8_t source_block_number() const override {
    return m_layout.source_block_number;
  }
  uint32_t n_source_symbols() const override {
    return m_layout.n_source_symbols;
  }
  std::vector<EncodingPacket> source_packets() override;
  std::vector<EncodingPacket> repair_packets(uint32_t start_esi,
                                             uint32_t count) override;

 private:
  void materialize_symbols_if_needed();
  // calculates the repair symbol for @param esi into @param out (T bytes)
  void create_repair_symbol(uint32_t esi, uint8_t *out) const;
  const uint8_t *symbol_p(uint32_t idx) const {
    return m_symbols.data() + static_cast<std::size_t>(idx) * m_symbol_size;
  }
  const std::shared_ptr<const std::vector<uint8_t>> m_object;
  const SourceBlockLayout m_layout;
  const uint16_t m_symbol_size;
  // K*T bytes, last symbol of the object zero padded. Empty until needed
  std::vector<uint8_t> m_symbols;
};

}  // namespace rqharness

#endif  // RQHARNESS_CAUCHY_CODEC_H
