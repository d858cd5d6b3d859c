#include "RQTypes.h"

#include <fmt/format.h>

#include <stdexcept>

#include "../HelperSources/Helper.hpp"

namespace rqharness {

std::array<uint8_t, PAYLOAD_ID_WIRE_SIZE> PayloadId::serialize() const {
  if (encoding_symbol_id > MAX_ENCODING_SYMBOL_ID) {
    throw std::invalid_argument(
        fmt::format("ESI {} does not fit into 24 bit", encoding_symbol_id));
  }
  return {source_block_number,
          static_cast<uint8_t>(encoding_symbol_id >> 16),
          static_cast<uint8_t>(encoding_symbol_id >> 8),
          static_cast<uint8_t>(encoding_symbol_id)};
}

PayloadId PayloadId::deserialize(const uint8_t *data) {
  PayloadId ret;
  ret.source_block_number = data[0];
  ret.encoding_symbol_id = (static_cast<uint32_t>(data[1]) << 16) |
                           (static_cast<uint32_t>(data[2]) << 8) |
                           static_cast<uint32_t>(data[3]);
  return ret;
}

TransmissionConfig::TransmissionConfig(const uint64_t transfer_length,
                                       const uint16_t symbol_size,
                                       const uint8_t source_blocks,
                                       const uint16_t sub_blocks,
                                       const uint8_t symbol_alignment)
    : m_transfer_length(transfer_length),
      m_symbol_size(symbol_size),
      m_source_blocks(source_blocks),
      m_sub_blocks(sub_blocks),
      m_symbol_alignment(symbol_alignment) {
  if (transfer_length > MAX_TRANSFER_LENGTH) {
    throw std::invalid_argument(fmt::format(
        "Transfer length {} does not fit into 40 bit", transfer_length));
  }
}

std::array<uint8_t, OTI_WIRE_SIZE> TransmissionConfig::serialize() const {
  std::array<uint8_t, OTI_WIRE_SIZE> ret{};
  // Common FEC OTI, the reserved byte stays 0
  const uint64_t common = oti_common();
  for (int i = 0; i < 8; i++) {
    ret[i] = static_cast<uint8_t>(common >> (56 - 8 * i));
  }
  // Scheme-Specific FEC OTI
  helper::write_u32_be(ret.data() + 8, oti_scheme_specific());
  return ret;
}

uint64_t TransmissionConfig::oti_common() const {
  return (m_transfer_length << 24) | m_symbol_size;
}

uint32_t TransmissionConfig::oti_scheme_specific() const {
  return (static_cast<uint32_t>(m_source_blocks) << 24) |
         (static_cast<uint32_t>(m_sub_blocks) << 8) | m_symbol_alignment;
}

TransmissionConfig TransmissionConfig::from_oti(
    const uint64_t common, const uint32_t scheme_specific) {
  return TransmissionConfig(common >> 24, static_cast<uint16_t>(common),
                            static_cast<uint8_t>(scheme_specific >> 24),
                            static_cast<uint16_t>(scheme_specific >> 8),
                            static_cast<uint8_t>(scheme_specific));
}

TransmissionConfig TransmissionConfig::deserialize(const uint8_t *data) {
  const uint64_t transfer_length =
      (static_cast<uint64_t>(data[0]) << 32) |
      (static_cast<uint64_t>(data[1]) << 24) |
      (static_cast<uint64_t>(data[2]) << 16) |
      (static_cast<uint64_t>(data[3]) << 8) | static_cast<uint64_t>(data[4]);
  const uint16_t symbol_size =
      static_cast<uint16_t>((data[6] << 8) | data[7]);
  const uint16_t sub_blocks = static_cast<uint16_t>((data[9] << 8) | data[10]);
  return TransmissionConfig(transfer_length, symbol_size, data[8], sub_blocks,
                            data[11]);
}

std::string TransmissionConfig::to_string() const {
  return fmt::format("F={} T={} Z={} N={} Al={}", m_transfer_length,
                     m_symbol_size, m_source_blocks, m_sub_blocks,
                     m_symbol_alignment);
}

bool TransmissionConfig::operator==(const TransmissionConfig &other) const {
  return m_transfer_length == other.m_transfer_length &&
         m_symbol_size == other.m_symbol_size &&
         m_source_blocks == other.m_source_blocks &&
         m_sub_blocks == other.m_sub_blocks &&
         m_symbol_alignment == other.m_symbol_alignment;
}

std::vector<uint8_t> EncodingPacket::serialize() const {
  const auto id = m_payload_id.serialize();
  std::vector<uint8_t> ret;
  ret.reserve(id.size() + m_data.size());
  ret.insert(ret.end(), id.begin(), id.end());
  ret.insert(ret.end(), m_data.begin(), m_data.end());
  return ret;
}

EncodingPacket EncodingPacket::deserialize(const uint8_t *data,
                                           const std::size_t data_len) {
  if (data_len < PAYLOAD_ID_WIRE_SIZE) {
    throw std::invalid_argument(
        fmt::format("Packet of {} bytes is too small", data_len));
  }
  return EncodingPacket(
      PayloadId::deserialize(data),
      std::vector<uint8_t>(data + PAYLOAD_ID_WIRE_SIZE, data + data_len));
}

}  // namespace rqharness
