#ifndef RQHARNESS_RAPTORQ_CODEC_H
#define RQHARNESS_RAPTORQ_CODEC_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Codec.h"

// RFC 6330 RaptorQ, backed by libRaptorQ. This is the codec the fixtures and
// the benchmark numbers come from.
// Objects are never split into sub-blocks (N=1) and a source block holds at
// most K'max symbols, so Z = ceil(Kt / K'max). The object is handed to the
// library byte wise, therefore the symbol alignment is always 1.

namespace rqharness {

// RFC 6330 5.1.2, largest supported K'
static constexpr uint32_t RAPTORQ_MAX_SOURCE_SYMBOLS = 56403;
static constexpr uint8_t RAPTORQ_SYMBOL_ALIGNMENT = 1;

class RaptorQCodec : public Codec {
 public:
  std::string name() const override;
  EncodedObject encode(const std::vector<uint8_t> &data,
                       uint16_t symbol_size) const override;
  /**
   * The returned decoder buffers the received symbols of every block and
   * hands them to the library once each block has at least K of them. If
   * that attempt fails, every further packet triggers a new attempt.
   * throws std::invalid_argument if config cannot describe a valid object.
   */
  std::unique_ptr<ObjectDecoder> create_decoder(
      const TransmissionConfig &config) const override;
};

}  // namespace rqharness

#endif  // RQHARNESS_RAPTORQ_CODEC_H
