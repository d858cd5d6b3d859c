#ifndef RQHARNESS_FIXTURE_H
#define RQHARNESS_FIXTURE_H

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "../codec/Codec.h"

// RQ01 binary test vector. All integers are big endian.
// [4B]  magic "RQ01"
// [12B] OTI (RFC 6330 wire format)
// [4B]  source_data_length
// [F B] source_data
// [4B]  packet_count
// packet_count times: [4B] PayloadId (8 bit SBN, 24 bit ESI) [T B] symbol

namespace rqharness {

static constexpr std::array<uint8_t, 4> FIXTURE_MAGIC{'R', 'Q', '0', '1'};
static constexpr std::size_t FIXTURE_HEADER_SIZE =
    FIXTURE_MAGIC.size() + OTI_WIRE_SIZE + 4;

// Thrown when the arguments don't describe a valid fixture
class FixtureError : public std::runtime_error {
 public:
  explicit FixtureError(const std::string &what) : std::runtime_error(what) {}
};
// Thrown when a fixture file cannot be created / written / read
class FixtureIOError : public std::runtime_error {
 public:
  explicit FixtureIOError(const std::string &what)
      : std::runtime_error(what) {}
};
// Thrown when a fixture doesn't follow the RQ01 layout
class FixtureFormatError : public std::runtime_error {
 public:
  explicit FixtureFormatError(const std::string &what)
      : std::runtime_error(what) {}
};

struct Fixture {
  TransmissionConfig config;
  std::vector<uint8_t> source_data;
  std::vector<EncodingPacket> packets;
};

// 4 + 12 + 4 + F + 4 + packet_count*(4+T)
uint64_t expected_fixture_size(uint64_t transfer_length, uint16_t symbol_size,
                               uint64_t packet_count);

// The exact bytes write_fixture() puts on disk
std::vector<uint8_t> serialize_fixture(
    const TransmissionConfig &config, const std::vector<uint8_t> &source_data,
    const std::vector<EncodingPacket> &packets);

/**
 * Write a RQ01 fixture to @param path. The data is written into a temporary
 * file next to path first, which is renamed once everything has been written
 * successfully. Therefore, either the complete fixture exists or nothing.
 * throws FixtureError if the input is inconsistent (source_data size != F,
 * packet with a symbol size != T) and FixtureIOError on any I/O failure.
 */
void write_fixture(const std::string &path, const TransmissionConfig &config,
                   const std::vector<uint8_t> &source_data,
                   const std::vector<EncodingPacket> &packets);

// throws FixtureFormatError
Fixture parse_fixture(const std::vector<uint8_t> &raw);
// The unparsed file content. throws FixtureIOError
std::vector<uint8_t> read_fixture_bytes(const std::string &path);
// throws FixtureIOError or FixtureFormatError
Fixture read_fixture(const std::string &path);

struct FixtureCheck {
  // decoder returned an object
  bool reconstructed = false;
  // and the object equals the source data stored in the fixture
  bool matches_source = false;
  // n of packets submitted until the object was reconstructed (or all of them)
  std::size_t packets_consumed = 0;
};
// Feed all packets of @param fixture, in file order, to a new decoder
FixtureCheck verify_fixture(const Fixture &fixture, const Codec &codec);

}  // namespace rqharness

#endif  // RQHARNESS_FIXTURE_H
