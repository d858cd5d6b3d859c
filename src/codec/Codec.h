#ifndef RQHARNESS_CODEC_H
#define RQHARNESS_CODEC_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "RQTypes.h"

// The harness never looks inside a codec. It only needs the capabilities
// below, which every RFC 6330 implementation offers in one form or another.
// NOTE: A block is formed by K source symbols (ESI [0,K[ ) and any number of
// repair symbols (ESI >= K). Each symbol has the same size T.

namespace rqharness {

// Encoder for one source block of an object
class SourceBlockEncoder {
 public:
  virtual ~SourceBlockEncoder() = default;
  virtual uint8_t source_block_number() const = 0;
  // n of source symbols (K) in this block
  virtual uint32_t n_source_symbols() const = 0;
  // all K source packets, in ESI order
  virtual std::vector<EncodingPacket> source_packets() = 0;
  /**
   * @param start_esi ESI of the first returned packet, must be >= K
   * @param count n of consecutive repair packets to create
   */
  virtual std::vector<EncodingPacket> repair_packets(uint32_t start_esi,
                                                     uint32_t count) = 0;
};

// Result of partitioning and preparing an object for encoding.
// The block encoders are owned by whoever called Codec::encode()
struct EncodedObject {
  TransmissionConfig config;
  // one encoder per source block, in SBN order
  std::vector<std::unique_ptr<SourceBlockEncoder>> blocks;
};

class ObjectDecoder {
 public:
  virtual ~ObjectDecoder() = default;
  // Feed one packet, in any order. Returns the reconstructed object (exactly
  // transfer_length bytes) as soon as enough packets have been received.
  virtual std::optional<std::vector<uint8_t>> submit(
      const EncodingPacket &packet) = 0;
};

class Codec {
 public:
  virtual ~Codec() = default;
  // human readable, used in logs and the benchmark preamble
  virtual std::string name() const = 0;
  virtual EncodedObject encode(const std::vector<uint8_t> &data,
                               uint16_t symbol_size) const = 0;
  virtual std::unique_ptr<ObjectDecoder> create_decoder(
      const TransmissionConfig &config) const = 0;
};

}  // namespace rqharness

#endif  // RQHARNESS_CODEC_H
