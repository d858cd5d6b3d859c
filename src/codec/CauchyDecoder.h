#ifndef RQHARNESS_CAUCHY_DECODER_HPP
#define RQHARNESS_CAUCHY_DECODER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "CauchyCodec.h"
#include "CauchyRxBlock.h"

// Takes packets of all source blocks of one object, in any order and with
// possible duplicates, and reconstructs the object as soon as every block has
// received K distinct symbols.
// submit() runs inside timed benchmark trials, it only updates the counters
// in stats and never logs.
class CauchyDecoder : public rqharness::ObjectDecoder {
 public:
  // throws std::invalid_argument if config doesn't describe a valid object
  explicit CauchyDecoder(const rqharness::TransmissionConfig &config);
  CauchyDecoder(const CauchyDecoder &other) = delete;
  ~CauchyDecoder() override = default;
  std::optional<std::vector<uint8_t>> submit(
      const rqharness::EncodingPacket &packet) override;

 public:
  struct DecoderStats {
    uint64_t count_packets_total = 0;
    // same (SBN,ESI) seen before, or the block was already complete
    uint64_t count_packets_duplicate = 0;
    // unknown SBN, ESI out of range or wrong symbol size
    uint64_t count_packets_invalid = 0;
    // blocks where at least one source symbol had to be reconstructed
    uint64_t count_blocks_recovered = 0;
    // n of source symbols that were reconstructed from repair symbols
    uint64_t count_symbols_recovered = 0;
  };
  DecoderStats stats{};

 private:
  bool validate_packet(const rqharness::EncodingPacket &packet) const;
  std::vector<uint8_t> assemble_object() const;
  const rqharness::TransmissionConfig m_config;
  std::vector<std::unique_ptr<CauchyRxBlock>> m_blocks;
  std::vector<bool> m_block_done;
  std::size_t m_n_blocks_done = 0;
  // set once the object has been reconstructed
  std::optional<std::vector<uint8_t>> m_result = std::nullopt;
};

#endif  // RQHARNESS_CAUCHY_DECODER_HPP
