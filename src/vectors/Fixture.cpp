#include "Fixture.h"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "../HelperSources/Helper.hpp"

namespace rqharness {

namespace {

// Owns the temporary file a fixture is written into. Unless commit()
// succeeded, the temporary file is closed and deleted on destruction.
class TempFixtureFile {
 public:
  explicit TempFixtureFile(std::string final_path)
      : m_final_path(std::move(final_path)),
        m_tmp_path(m_final_path + ".partial") {
    if ((m_fp = fopen(m_tmp_path.c_str(), "wb")) == nullptr) {
      throw_io_error("cannot create");
    }
  }
  TempFixtureFile(const TempFixtureFile &) = delete;
  ~TempFixtureFile() {
    if (m_fp != nullptr) {
      fclose(m_fp);
    }
    if (!m_committed) {
      std::remove(m_tmp_path.c_str());
    }
  }
  void append(const uint8_t *data, const std::size_t data_len) {
    if (data_len == 0) return;
    if (fwrite(data, 1, data_len, m_fp) != data_len) {
      throw_io_error("cannot write");
    }
  }
  // flush, close and move the temporary file to its final location
  void commit() {
    if (fflush(m_fp) != 0) {
      throw_io_error("cannot flush");
    }
    FILE *fp = m_fp;
    m_fp = nullptr;
    if (fclose(fp) != 0) {
      throw_io_error("cannot close");
    }
    if (std::rename(m_tmp_path.c_str(), m_final_path.c_str()) != 0) {
      throw_io_error("cannot rename into place");
    }
    m_committed = true;
  }

 private:
  [[noreturn]] void throw_io_error(const char *what) const {
    throw FixtureIOError(fmt::format("Fixture {}: {} ({})", m_final_path, what,
                                     strerror(errno)));
  }
  const std::string m_final_path;
  const std::string m_tmp_path;
  FILE *m_fp = nullptr;
  bool m_committed = false;
};

void validate_fixture_input(const TransmissionConfig &config,
                            const std::vector<uint8_t> &source_data,
                            const std::vector<EncodingPacket> &packets) {
  if (source_data.size() != config.transfer_length()) {
    throw FixtureError(
        fmt::format("Source data has {} bytes, but the OTI says F={}",
                    source_data.size(), config.transfer_length()));
  }
  if (source_data.size() > UINT32_MAX) {
    throw FixtureError(fmt::format(
        "Source data of {} bytes doesn't fit into the u32 length field",
        source_data.size()));
  }
  if (packets.size() > UINT32_MAX) {
    throw FixtureError("Too many packets for the u32 count field");
  }
  for (const auto &packet : packets) {
    if (packet.data().size() != config.symbol_size()) {
      throw FixtureError(fmt::format(
          "Packet SBN:{} ESI:{} has {} bytes of symbol data, expected T={}",
          packet.source_block_number(), packet.encoding_symbol_id(),
          packet.data().size(), config.symbol_size()));
    }
    if (packet.encoding_symbol_id() > MAX_ENCODING_SYMBOL_ID) {
      throw FixtureError(fmt::format("Packet ESI {} does not fit into 24 bit",
                                     packet.encoding_symbol_id()));
    }
  }
}

}  // namespace

uint64_t expected_fixture_size(const uint64_t transfer_length,
                               const uint16_t symbol_size,
                               const uint64_t packet_count) {
  return FIXTURE_HEADER_SIZE + transfer_length + 4 +
         packet_count * (PAYLOAD_ID_WIRE_SIZE + symbol_size);
}

std::vector<uint8_t> serialize_fixture(
    const TransmissionConfig &config, const std::vector<uint8_t> &source_data,
    const std::vector<EncodingPacket> &packets) {
  validate_fixture_input(config, source_data, packets);
  std::vector<uint8_t> ret;
  ret.reserve(expected_fixture_size(source_data.size(), config.symbol_size(),
                                    packets.size()));
  ret.insert(ret.end(), FIXTURE_MAGIC.begin(), FIXTURE_MAGIC.end());
  const auto oti = config.serialize();
  ret.insert(ret.end(), oti.begin(), oti.end());
  helper::append_u32_be(ret, static_cast<uint32_t>(source_data.size()));
  ret.insert(ret.end(), source_data.begin(), source_data.end());
  helper::append_u32_be(ret, static_cast<uint32_t>(packets.size()));
  for (const auto &packet : packets) {
    const auto payload_id = packet.payload_id().serialize();
    ret.insert(ret.end(), payload_id.begin(), payload_id.end());
    ret.insert(ret.end(), packet.data().begin(), packet.data().end());
  }
  return ret;
}

void write_fixture(const std::string &path, const TransmissionConfig &config,
                   const std::vector<uint8_t> &source_data,
                   const std::vector<EncodingPacket> &packets) {
  // throws FixtureError before anything touches the disk
  const auto raw = serialize_fixture(config, source_data, packets);
  TempFixtureFile file(path);
  file.append(raw.data(), raw.size());
  file.commit();
}

Fixture parse_fixture(const std::vector<uint8_t> &raw) {
  if (raw.size() < FIXTURE_HEADER_SIZE) {
    throw FixtureFormatError(
        fmt::format("Fixture of {} bytes is smaller than the header",
                    raw.size()));
  }
  if (memcmp(raw.data(), FIXTURE_MAGIC.data(), FIXTURE_MAGIC.size()) != 0) {
    throw FixtureFormatError(fmt::format(
        "Invalid magic {}", StringHelper::bytes_as_string_hex(raw.data(), 4)));
  }
  Fixture ret;
  ret.config = TransmissionConfig::deserialize(raw.data() + 4);
  const uint32_t data_len = helper::read_u32_be(raw.data() + 4 + OTI_WIRE_SIZE);
  if (data_len != ret.config.transfer_length()) {
    throw FixtureFormatError(
        fmt::format("source_data_length {} != F {}", data_len,
                    ret.config.transfer_length()));
  }
  std::size_t offset = FIXTURE_HEADER_SIZE;
  if (raw.size() - offset < static_cast<std::size_t>(data_len) + 4) {
    throw FixtureFormatError("Fixture truncated inside source data");
  }
  ret.source_data.assign(raw.begin() + offset,
                         raw.begin() + offset + data_len);
  offset += data_len;
  const uint32_t packet_count = helper::read_u32_be(raw.data() + offset);
  offset += 4;
  const std::size_t packet_size =
      PAYLOAD_ID_WIRE_SIZE + ret.config.symbol_size();
  const uint64_t expected = expected_fixture_size(
      data_len, ret.config.symbol_size(), packet_count);
  if (raw.size() != expected) {
    throw FixtureFormatError(fmt::format(
        "Fixture has {} bytes, {} packets with T={} need exactly {}",
        raw.size(), packet_count, ret.config.symbol_size(), expected));
  }
  ret.packets.reserve(packet_count);
  for (uint32_t i = 0; i < packet_count; i++) {
    ret.packets.push_back(
        EncodingPacket::deserialize(raw.data() + offset, packet_size));
    offset += packet_size;
  }
  return ret;
}

std::vector<uint8_t> read_fixture_bytes(const std::string &path) {
  FILE *fp;
  if ((fp = fopen(path.c_str(), "rb")) == nullptr) {
    throw FixtureIOError(
        fmt::format("Unable to open {}: {}", path, strerror(errno)));
  }
  std::vector<uint8_t> raw;
  std::array<uint8_t, 64 * 1024> chunk{};
  while (true) {
    const auto n = fread(chunk.data(), 1, chunk.size(), fp);
    raw.insert(raw.end(), chunk.begin(), chunk.begin() + n);
    if (n < chunk.size()) break;
  }
  const bool read_error = ferror(fp) != 0;
  fclose(fp);
  if (read_error) {
    throw FixtureIOError(fmt::format("Cannot read {}", path));
  }
  return raw;
}

Fixture read_fixture(const std::string &path) {
  return parse_fixture(read_fixture_bytes(path));
}

FixtureCheck verify_fixture(const Fixture &fixture, const Codec &codec) {
  FixtureCheck ret;
  auto decoder = codec.create_decoder(fixture.config);
  for (const auto &packet : fixture.packets) {
    ret.packets_consumed++;
    auto result = decoder->submit(packet);
    if (result.has_value()) {
      ret.reconstructed = true;
      ret.matches_source =
          helper::compareVectors(fixture.source_data, result.value());
      break;
    }
  }
  return ret;
}

}  // namespace rqharness
