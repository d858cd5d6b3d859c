#ifndef RQHARNESS_RQ_TYPES_H
#define RQHARNESS_RQ_TYPES_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace rqharness {

// Highest value an ESI can take on the wire (24 bit)
static constexpr uint32_t MAX_ENCODING_SYMBOL_ID = (1u << 24) - 1;
// Highest transfer length the 40 bit F field of the OTI can hold
static constexpr uint64_t MAX_TRANSFER_LENGTH = (1ull << 40) - 1;
// Z is transmitted as 8 bit
static constexpr uint32_t MAX_SOURCE_BLOCKS = 255;

static constexpr std::size_t PAYLOAD_ID_WIRE_SIZE = 4;
static constexpr std::size_t OTI_WIRE_SIZE = 12;

/**
 * Identifies an encoding symbol. RFC 6330 3.2: 8 bit source block number
 * followed by a 24 bit encoding symbol id, big endian.
 */
struct PayloadId {
  uint8_t source_block_number = 0;
  uint32_t encoding_symbol_id = 0;

  // throws std::invalid_argument if the ESI doesn't fit into 24 bit
  std::array<uint8_t, PAYLOAD_ID_WIRE_SIZE> serialize() const;
  static PayloadId deserialize(const uint8_t *data);
  bool operator==(const PayloadId &other) const {
    return source_block_number == other.source_block_number &&
           encoding_symbol_id == other.encoding_symbol_id;
  }
  bool operator!=(const PayloadId &other) const { return !(*this == other); }
};

/**
 * Object Transmission Information (RFC 6330 3.3.2 and 3.3.3). Everything a
 * receiver needs to know about how the object was partitioned.
 * Wire format (12 bytes, big endian):
 * F (40 bit) | reserved (8 bit) | T (16 bit) | Z (8 bit) | N (16 bit) |
 * Al (8 bit)
 */
class TransmissionConfig {
 public:
  TransmissionConfig() = default;
  TransmissionConfig(uint64_t transfer_length, uint16_t symbol_size,
                     uint8_t source_blocks, uint16_t sub_blocks,
                     uint8_t symbol_alignment);
  uint64_t transfer_length() const { return m_transfer_length; }
  uint16_t symbol_size() const { return m_symbol_size; }
  uint8_t source_blocks() const { return m_source_blocks; }
  uint16_t sub_blocks() const { return m_sub_blocks; }
  uint8_t symbol_alignment() const { return m_symbol_alignment; }

  std::array<uint8_t, OTI_WIRE_SIZE> serialize() const;
  static TransmissionConfig deserialize(const uint8_t *data);
  // The same fields packed into integers, as most RFC 6330 libraries take
  // them. common: F (40 bit) | reserved (8 bit) | T (16 bit)
  // scheme specific: Z (8 bit) | N (16 bit) | Al (8 bit)
  uint64_t oti_common() const;
  uint32_t oti_scheme_specific() const;
  static TransmissionConfig from_oti(uint64_t common, uint32_t scheme_specific);
  std::string to_string() const;
  bool operator==(const TransmissionConfig &other) const;

 private:
  uint64_t m_transfer_length = 0;
  uint16_t m_symbol_size = 0;
  uint8_t m_source_blocks = 0;
  uint16_t m_sub_blocks = 0;
  uint8_t m_symbol_alignment = 0;
};

/**
 * A single source or repair symbol together with its PayloadId.
 * The wire form is the 4 byte PayloadId followed by the T symbol bytes.
 */
class EncodingPacket {
 public:
  EncodingPacket() = default;
  EncodingPacket(PayloadId payload_id, std::vector<uint8_t> data)
      : m_payload_id(payload_id), m_data(std::move(data)) {}
  const PayloadId &payload_id() const { return m_payload_id; }
  const std::vector<uint8_t> &data() const { return m_data; }
  uint8_t source_block_number() const {
    return m_payload_id.source_block_number;
  }
  uint32_t encoding_symbol_id() const { return m_payload_id.encoding_symbol_id; }

  std::vector<uint8_t> serialize() const;
  // throws std::invalid_argument if data_len is smaller than the PayloadId
  static EncodingPacket deserialize(const uint8_t *data, std::size_t data_len);
  static EncodingPacket deserialize(const std::vector<uint8_t> &data) {
    return deserialize(data.data(), data.size());
  }

 private:
  PayloadId m_payload_id{};
  std::vector<uint8_t> m_data;
};

}  // namespace rqharness

#endif  // RQHARNESS_RQ_TYPES_H
