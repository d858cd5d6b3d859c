/*
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation; version 3.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.
 *
 *   You should have received a copy of the GNU General Public License along
 *   with this program; if not, write to the Free Software Foundation, Inc.,
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <spdlog/sinks/ostream_sink.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "../src/HelperSources/Helper.hpp"
#include "../src/bench/BenchmarkDriver.h"
#include "../src/bench/Reporter.h"
#include "../src/codec/CauchyCodec.h"
#include "../src/codec/CauchyDecoder.h"
#include "../src/codec/Partition.hpp"
#include "../src/codec/RaptorQCodec.h"
#include "../src/codec/gf256.h"
#include "../src/rqharness_spdlog.h"
#include "../src/vectors/Fixture.h"
#include "../src/vectors/PacketStrategy.h"
#include "../src/vectors/VectorGenerator.h"
#include "../src/vectors/VectorSpecs.hpp"

// Simple unit testing for the harness, the RaptorQ codec adapter and the
// Cauchy codec the harness tests run against

using namespace rqharness;

// true if @param fn throws an exception of type EXCEPTION
template <typename EXCEPTION, typename FN>
static bool throws(FN &&fn) {
  try {
    fn();
  } catch (const EXCEPTION &) {
    return true;
  }
  return false;
}

static std::vector<uint32_t> esis_of(const std::vector<EncodingPacket> &packets) {
  std::vector<uint32_t> ret;
  for (const auto &packet : packets) ret.push_back(packet.encoding_symbol_id());
  return ret;
}

namespace TestCodec {

static void test_payload() {
  assert(helper::payload_byte_at(0, 7, 13) == 13);
  assert(helper::payload_byte_at(1, 7, 13) == 20);
  assert(helper::payload_byte_at(35, 7, 13) == (35 * 7 + 13) % 256);
  // beyond 2^32: (2^32+1)*31+17 mod 256 == 31+17
  assert(helper::payload_byte_at(0x100000001ull, 31, 17) == 48);
  const auto payload = helper::generate_payload(1000, 11, 23);
  assert(payload.size() == 1000);
  for (std::size_t i = 0; i < payload.size(); i++) {
    assert(payload[i] == static_cast<uint8_t>((i * 11 + 23) % 256));
  }
  assert(helper::compareVectors(payload, helper::generate_payload(1000, 11, 23)));
  assert(!helper::compareVectors(payload, helper::generate_payload(1000, 11, 24)));
  assert(helper::generate_payload(0, 1, 2).empty());
  std::cout << "payload test passed\n";
}

static void test_wire_formats() {
  const PayloadId id{3, 0x010203};
  const auto id_bytes = id.serialize();
  assert((id_bytes == std::array<uint8_t, 4>{3, 1, 2, 3}));
  assert(PayloadId::deserialize(id_bytes.data()) == id);
  assert(throws<std::invalid_argument>(
      [] { PayloadId{0, MAX_ENCODING_SYMBOL_ID + 1}.serialize(); }));

  const TransmissionConfig config(512, 32, 1, 1, 4);
  const auto oti = config.serialize();
  const std::array<uint8_t, OTI_WIRE_SIZE> expected_oti{
      0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x20, 0x01, 0x00, 0x01, 0x04};
  assert(oti == expected_oti);
  assert(TransmissionConfig::deserialize(oti.data()) == config);
  assert(config.to_string() == "F=512 T=32 Z=1 N=1 Al=4");
  // the same 12 bytes as two big endian integers
  assert(config.oti_common() == 0x0000000200000020ull);
  assert(config.oti_scheme_specific() == 0x01000104u);
  assert(TransmissionConfig::from_oti(config.oti_common(),
                                      config.oti_scheme_specific()) == config);
  // 40 bit transfer length
  const TransmissionConfig large(0x0102030405ull, 0x1234, 7, 1, 8);
  const auto large_oti = large.serialize();
  assert(large_oti[0] == 0x01 && large_oti[4] == 0x05 && large_oti[5] == 0);
  assert(large_oti[6] == 0x12 && large_oti[7] == 0x34 && large_oti[8] == 7);
  assert(TransmissionConfig::deserialize(large_oti.data()) == large);
  assert(throws<std::invalid_argument>(
      [] { TransmissionConfig(MAX_TRANSFER_LENGTH + 1, 4, 1, 1, 4); }));

  const EncodingPacket packet(PayloadId{1, 300}, {9, 8, 7, 6});
  const auto raw = packet.serialize();
  assert((raw == std::vector<uint8_t>{1, 0, 1, 44, 9, 8, 7, 6}));
  const auto parsed = EncodingPacket::deserialize(raw);
  assert(parsed.payload_id() == packet.payload_id());
  assert(parsed.data() == packet.data());
  assert(throws<std::invalid_argument>(
      [&raw] { EncodingPacket::deserialize(raw.data(), 3); }));
  std::cout << "wire format test passed\n";
}

static void test_gf256() {
  assert(gf256::mul(2, 0x80) == 0x1D);
  assert(gf256::mul(0, 0x53) == 0);
  for (int a = 1; a < 256; a++) {
    const auto a8 = static_cast<uint8_t>(a);
    assert(gf256::mul(a8, 1) == a8);
    assert(gf256::mul(a8, gf256::inv(a8)) == 1);
    for (int b = 1; b < 256; b += 7) {
      const auto b8 = static_cast<uint8_t>(b);
      assert(gf256::mul(a8, b8) == gf256::mul(b8, a8));
      assert(gf256::mul(gf256::mul(a8, b8), gf256::inv(b8)) == a8);
      // distributivity
      const auto c8 = static_cast<uint8_t>(a ^ 0x5A);
      assert(gf256::mul(a8, b8 ^ c8) ==
             (gf256::mul(a8, b8) ^ gf256::mul(a8, c8)));
    }
  }
  assert(throws<std::domain_error>([] { gf256::inv(0); }));

  std::vector<uint8_t> dst{1, 2, 3, 4};
  const std::vector<uint8_t> src{5, 6, 7, 8};
  auto expected = dst;
  for (std::size_t i = 0; i < dst.size(); i++) {
    expected[i] ^= gf256::mul(0x37, src[i]);
  }
  gf256::mul_add_region(dst.data(), src.data(), 0x37, dst.size());
  assert(dst == expected);
  for (auto &v : expected) v = gf256::mul(0x11, v);
  gf256::mul_region(dst.data(), 0x11, dst.size());
  assert(dst == expected);
  std::cout << "gf256 test passed\n";
}

static void test_partition() {
  const auto p = partition::partition(10, 3);
  assert(p.count_large == 1 && p.size_large == 4);
  assert(p.count_small == 2 && p.size_small == 3);
  const auto even = partition::partition(256, 2);
  assert(even.count_large == 0 && even.size_small == 128);
  assert(throws<std::invalid_argument>([] { partition::partition(10, 0); }));
  assert((partition::calculate_block_sizes(313, 3) ==
          std::vector<uint32_t>{105, 104, 104}));
  assert(partition::calc_min_n_of_blocks(313, 128) == 3);

  const CauchyCodec codec{};
  const auto config = codec.create_config(16384, 64);
  assert(config.source_blocks() == 2);
  const auto layout = calculate_block_layout(config);
  assert(layout.size() == 2);
  assert(layout[0].n_source_symbols == 128 && layout[0].byte_offset == 0);
  assert(layout[1].source_block_number == 1);
  assert(layout[1].byte_offset == 128 * 64);
  // padding: 100 bytes with T=32 need 4 symbols
  assert(calculate_block_layout(codec.create_config(100, 32))[0]
             .n_source_symbols == 4);
  assert(throws<std::invalid_argument>([] {
    calculate_block_layout(TransmissionConfig(512, 32, 1, 2, 4));
  }));
  assert(throws<std::invalid_argument>([&codec] {
    codec.create_config(512, 30);
  }));
  assert(throws<std::invalid_argument>([&codec] { codec.create_config(0, 32); }));
  // 256*128*4 bytes need 256 blocks of 128 symbols, Z only has 8 bit
  assert(throws<std::invalid_argument>([&codec] {
    codec.create_config(256ull * 128 * 4, 4);
  }));
  std::cout << "partition test passed\n";
}

// Encode, select packets, optionally shuffle, decode
static void test_round_trip(const Codec &codec, const std::size_t data_size,
                            const uint16_t symbol_size,
                            const PacketStrategy &strategy,
                            const bool shuffle) {
  std::cout << "Round trip F:" << data_size << " T:" << symbol_size << " "
            << strategy_readable(strategy) << (shuffle ? " shuffled" : "")
            << "\n";
  const auto data = helper::generate_payload(data_size, 31, 17);
  auto encoded = codec.encode(data, symbol_size);
  auto packets = select_packets_all_blocks(encoded, strategy);
  if (shuffle) {
    std::mt19937 rng(1234);
    std::shuffle(packets.begin(), packets.end(), rng);
  }
  auto decoder = codec.create_decoder(encoded.config);
  std::optional<std::vector<uint8_t>> result;
  for (const auto &packet : packets) {
    result = decoder->submit(packet);
    if (result.has_value()) break;
  }
  assert(result.has_value());
  helper::assertVectorsEqual(data, result.value());
}

static void test_codec() {
  const CauchyCodec codec{};
  // K=1, repair symbols only
  {
    const auto data = helper::generate_payload(16, 29, 53);
    auto encoded = codec.encode(data, 16);
    assert(encoded.blocks.size() == 1);
    assert(encoded.blocks[0]->n_source_symbols() == 1);
    const auto repair = encoded.blocks[0]->repair_packets(1, 9);
    assert((esis_of(repair) ==
            std::vector<uint32_t>{1, 2, 3, 4, 5, 6, 7, 8, 9}));
    for (const auto &packet : repair) {
      auto decoder = codec.create_decoder(encoded.config);
      const auto result = decoder->submit(packet);
      assert(result.has_value());
      helper::assertVectorsEqual(data, result.value());
    }
  }
  // Not enough symbols, duplicates, repeated result
  {
    const auto data = helper::generate_payload(512, 17, 41);
    auto encoded = codec.encode(data, 32);
    auto &block = *encoded.blocks[0];
    assert(block.n_source_symbols() == 16);
    const auto source = block.source_packets();
    assert(esis_of(source) == esis_of(block.source_packets()));
    const auto repair = block.repair_packets(16, 4);
    CauchyDecoder decoder(encoded.config);
    for (uint32_t i = 4; i < 16; i++) {
      assert(!decoder.submit(source[i]).has_value());
      assert(!decoder.submit(source[i]).has_value());
    }
    assert(decoder.stats.count_packets_duplicate == 12);
    for (uint32_t i = 0; i < 3; i++) {
      assert(!decoder.submit(repair[i]).has_value());
    }
    // wrong symbol size, unknown SBN, both ignored
    assert(!decoder.submit(EncodingPacket(PayloadId{0, 17}, {1, 2})).has_value());
    assert(!decoder.submit(EncodingPacket(PayloadId{5, 17}, repair[0].data()))
                .has_value());
    assert(decoder.stats.count_packets_invalid == 2);
    const auto result = decoder.submit(repair[3]);
    assert(result.has_value());
    helper::assertVectorsEqual(data, result.value());
    assert(decoder.stats.count_blocks_recovered == 1);
    assert(decoder.stats.count_symbols_recovered == 4);
    const auto again = decoder.submit(source[0]);
    assert(again.has_value());
    helper::assertVectorsEqual(data, again.value());
  }
  // Invalid repair requests
  {
    auto encoded = codec.encode(helper::generate_payload(128, 1, 2), 32);
    auto &block = *encoded.blocks[0];
    assert(block.repair_packets(4, 0).empty());
    assert(throws<std::invalid_argument>([&block] { block.repair_packets(3, 1); }));
    assert(throws<std::out_of_range>([&block] { block.repair_packets(250, 10); }));
    assert(block.repair_packets(250, 6).size() == 6);
  }
  // The encoder owns a copy of the data
  {
    auto data = helper::generate_payload(64, 3, 5);
    const auto expected = data;
    auto encoded = codec.encode(data, 16);
    data.assign(data.size(), 0);
    auto decoder = codec.create_decoder(encoded.config);
    std::optional<std::vector<uint8_t>> result;
    for (const auto &packet : encoded.blocks[0]->repair_packets(4, 4)) {
      result = decoder->submit(packet);
    }
    assert(result.has_value());
    helper::assertVectorsEqual(expected, result.value());
  }
  test_round_trip(codec, 1024, 32, SourceOnly{}, false);
  test_round_trip(codec, 1024, 32, LossReplace{50, 2}, true);
  test_round_trip(codec, 100, 32, RepairOnly{4}, true);
  // 313 symbols, 3 source blocks
  test_round_trip(codec, 20000, 64, LossReplace{10, 2}, false);
  test_round_trip(codec, 20000, 64, LossReplace{50, 0}, true);
  test_round_trip(codec, 20000, 64, RepairOnly{105}, true);
  std::cout << "codec test passed\n";
}

static void test_raptorq() {
  const RaptorQCodec codec{};
  // K per block and the OTI come from the library
  {
    const auto data = helper::generate_payload(100, 23, 47);
    auto encoded = codec.encode(data, 32);
    assert(encoded.config == TransmissionConfig(100, 32, 1, 1, 1));
    assert(encoded.blocks.size() == 1);
    assert(encoded.blocks[0]->source_block_number() == 0);
    assert(encoded.blocks[0]->n_source_symbols() == 4);
    // systematic, the last symbol is zero padded
    const auto source = encoded.blocks[0]->source_packets();
    assert(source.size() == 4);
    for (uint32_t esi = 0; esi < 4; esi++) {
      assert(source[esi].encoding_symbol_id() == esi);
      assert(source[esi].data().size() == 32);
      for (std::size_t i = 0; i < 32; i++) {
        const std::size_t offset = esi * 32 + i;
        assert(source[esi].data()[i] == (offset < 100 ? data[offset] : 0));
      }
    }
  }
  // Invalid input and repair requests
  {
    assert(throws<std::invalid_argument>([&codec] { codec.encode({}, 32); }));
    assert(throws<std::invalid_argument>(
        [&codec] { codec.encode(helper::generate_payload(64, 1, 2), 0); }));
    auto encoded = codec.encode(helper::generate_payload(128, 1, 2), 32);
    auto &block = *encoded.blocks[0];
    assert(block.repair_packets(4, 0).empty());
    assert(throws<std::invalid_argument>([&block] { block.repair_packets(3, 1); }));
    assert(throws<std::out_of_range>([&block] {
      block.repair_packets(MAX_ENCODING_SYMBOL_ID, 2);
    }));
    // only configurations the encoder can produce are accepted
    assert(throws<std::invalid_argument>(
        [&codec] { codec.create_decoder(TransmissionConfig(128, 32, 1, 1, 4)); }));
    assert(throws<std::invalid_argument>(
        [&codec] { codec.create_decoder(TransmissionConfig(128, 32, 5, 1, 1)); }));
    assert(throws<std::invalid_argument>(
        [&codec] { codec.create_decoder(TransmissionConfig(128, 32, 1, 2, 1)); }));
  }
  // K=1 from repair symbols only, duplicates and foreign packets ignored
  {
    const auto data = helper::generate_payload(16, 29, 53);
    auto encoded = codec.encode(data, 16);
    assert(encoded.blocks[0]->n_source_symbols() == 1);
    const auto repair = encoded.blocks[0]->repair_packets(1, 9);
    assert((esis_of(repair) ==
            std::vector<uint32_t>{1, 2, 3, 4, 5, 6, 7, 8, 9}));
    auto decoder = codec.create_decoder(encoded.config);
    assert(!decoder->submit(EncodingPacket(PayloadId{0, 1}, {1, 2})).has_value());
    assert(!decoder->submit(EncodingPacket(PayloadId{3, 1}, repair[0].data()))
                .has_value());
    std::optional<std::vector<uint8_t>> result;
    for (const auto &packet : repair) {
      result = decoder->submit(packet);
      if (result.has_value()) break;
    }
    assert(result.has_value());
    helper::assertVectorsEqual(data, result.value());
    const auto again = decoder->submit(repair[0]);
    assert(again.has_value());
    helper::assertVectorsEqual(data, again.value());
  }
  test_round_trip(codec, 1024, 32, SourceOnly{}, false);
  test_round_trip(codec, 1024, 32, LossReplace{50, 2}, true);
  test_round_trip(codec, 100, 32, RepairOnly{6}, true);
  test_round_trip(codec, 65536, 64, LossReplace{10, 2}, true);
  std::cout << "raptorq test passed\n";
}

}  // namespace TestCodec

namespace TestVectors {

static std::string create_temp_dir() {
  const auto dir =
      std::filesystem::temp_directory_path() /
      ("rqharness_unit_test_" + std::to_string(getpid()));
  std::filesystem::create_directories(dir);
  return dir.string();
}

static void test_drop_count() {
  assert(calculate_drop_count(10, 10) == 1);
  assert(calculate_drop_count(10, 50) == 5);
  assert(calculate_drop_count(10, 0) == 0);
  assert(calculate_drop_count(0, 50) == 0);
  // always at least one if there is any loss
  assert(calculate_drop_count(5, 10) == 1);
  assert(calculate_drop_count(16, 10) == 1);
  assert(calculate_drop_count(16, 50) == 8);
  assert(calculate_drop_count(10, 100) == 10);
  assert(calculate_drop_count(10, 150) == 10);
  std::cout << "drop count test passed\n";
}

static void test_strategies() {
  std::vector<EncodingPacket> source;
  for (uint32_t i = 0; i < 10; i++) {
    source.emplace_back(PayloadId{0, i}, std::vector<uint8_t>(4, i));
  }
  std::vector<uint32_t> requested;
  const REPAIR_PACKET_SOURCE repair_source = [&requested](uint32_t start_esi,
                                                          uint32_t count) {
    requested.push_back(start_esi);
    std::vector<EncodingPacket> ret;
    for (uint32_t i = 0; i < count; i++) {
      ret.emplace_back(PayloadId{0, start_esi + i}, std::vector<uint8_t>(4));
    }
    return ret;
  };
  assert(esis_of(select_packets(source, repair_source, SourceOnly{})) ==
         esis_of(source));
  assert(requested.empty());
  assert((esis_of(select_packets(source, repair_source, SourcePlusRepair{2})) ==
          std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11}));
  assert((esis_of(select_packets(source, repair_source, LossReplace{10, 2})) ==
          std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 10, 11, 12}));
  assert((esis_of(select_packets(source, repair_source, LossReplace{50, 2})) ==
          std::vector<uint32_t>{0, 1, 2, 3, 4, 10, 11, 12, 13, 14, 15, 16}));
  assert((esis_of(select_packets(source, repair_source, RepairOnly{3})) ==
          std::vector<uint32_t>{10, 11, 12}));
  // repair ESIs always start at K
  for (const auto esi : requested) assert(esi == 10);

  assert(strategy_readable(SourceOnly{}) == "SourceOnly");
  assert(strategy_readable(SourcePlusRepair{5}) == "SourcePlusRepair(5)");
  assert(strategy_readable(LossReplace{10, 2}) == "LossReplace(10%,+2)");
  assert(strategy_readable(RepairOnly{10}) == "RepairOnly(10)");

  // multiple blocks: per block, in SBN order
  const CauchyCodec codec{};
  auto encoded = codec.encode(helper::generate_payload(20000, 1, 1), 64);
  assert(encoded.blocks.size() == 3);
  const auto packets = select_packets_all_blocks(encoded, LossReplace{10, 2});
  // blocks of 105, 104, 104 symbols, 10 dropped and 12 added each
  assert(packets.size() == 313 + 3 * 2);
  assert(packets.front().source_block_number() == 0);
  assert(packets.back().source_block_number() == 2);
  assert(packets.back().encoding_symbol_id() == 104 + 12 - 1);
  for (std::size_t i = 1; i < packets.size(); i++) {
    assert(packets[i - 1].source_block_number() <=
           packets[i].source_block_number());
  }
  std::cout << "strategy test passed\n";
}

static void test_all_vectors(const Codec &codec, const std::string &dir) {
  std::cout << "All vectors with " << codec.name() << "\n";
  const std::array<std::size_t, 8> expected_packet_counts{4,  37, 21, 18,
                                                          18, 10, 10, 10};
  for (std::size_t i = 0; i < VECTOR_SPECS.size(); i++) {
    const auto &spec = VECTOR_SPECS[i];
    std::cout << "Vector " << spec.name << "\n";
    const auto generated = generate_vector(codec, spec);
    const auto &fixture = generated.fixture;
    assert(fixture.packets.size() == expected_packet_counts[i]);
    assert(fixture.config.transfer_length() == spec.payload.length);
    assert(fixture.config.symbol_size() == spec.symbol_size);
    // Determinism
    const auto serialized = serialize_fixture(
        fixture.config, fixture.source_data, fixture.packets);
    const auto regenerated = generate_vector(codec, spec).fixture;
    assert(serialized == serialize_fixture(regenerated.config,
                                           regenerated.source_data,
                                           regenerated.packets));
    assert(serialized.size() ==
           expected_fixture_size(spec.payload.length, spec.symbol_size,
                                 fixture.packets.size()));

    const auto path = write_vector(codec, spec, dir);
    assert(read_fixture_bytes(path) == serialized);
    assert(!std::filesystem::exists(path + ".partial"));
    const auto on_disk = read_fixture(path);
    assert(on_disk.config == fixture.config);
    assert(on_disk.source_data == fixture.source_data);
    assert(on_disk.packets.size() == fixture.packets.size());
    const auto check = verify_fixture(on_disk, codec);
    assert(check.reconstructed && check.matches_source);
    assert(check_vector(codec, spec, dir).ok());
  }
  // K=1, from the fixture without its only source packet
  {
    const auto fixture = read_fixture(
        (std::filesystem::path(dir) / VECTOR_SPECS[6].filename).string());
    assert(fixture.packets.size() == 10);
    assert(fixture.packets[0].encoding_symbol_id() == 0);
    Fixture repair_only = fixture;
    repair_only.packets.erase(repair_only.packets.begin());
    const auto check = verify_fixture(repair_only, codec);
    assert(check.reconstructed && check.matches_source);
    assert(check.packets_consumed >= 1);
  }
  // v08 contains no source packet at all
  {
    const auto fixture = generate_vector(codec, VECTOR_SPECS[7]).fixture;
    for (const auto &packet : fixture.packets) {
      assert(packet.encoding_symbol_id() >= 4);
    }
  }
  std::cout << "vector test passed\n";
}

static void assert_fixture_header(const std::vector<uint8_t> &raw,
                                  const std::array<uint8_t, OTI_WIRE_SIZE> &oti,
                                  const uint32_t data_len) {
  assert(raw[0] == 'R' && raw[1] == 'Q' && raw[2] == '0' && raw[3] == '1');
  assert(std::equal(oti.begin(), oti.end(), raw.begin() + 4));
  assert(helper::read_u32_be(raw.data() + 4 + OTI_WIRE_SIZE) == data_len);
}

// Exact bytes of the RFC 6330 interop vectors
static void test_golden_vectors(const std::string &dir) {
  const RaptorQCodec codec{};
  // v01: F=64 T=16, 4 source packets
  {
    const auto &spec = VECTOR_SPECS[0];
    const auto fixture = generate_vector(codec, spec).fixture;
    const auto raw = serialize_fixture(fixture.config, fixture.source_data,
                                       fixture.packets);
    assert(raw.size() == 168);
    assert_fixture_header(raw,
                          {0x00, 0x00, 0x00, 0x00, 0x40, 0x00, 0x00, 0x10,
                           0x01, 0x00, 0x01, 0x01},
                          64);
    helper::assertVectorsEqual(helper::generate_payload(64, 7, 13),
                               fixture.source_data);
    assert(helper::read_u32_be(raw.data() + FIXTURE_HEADER_SIZE + 64) == 4);
    std::size_t offset = FIXTURE_HEADER_SIZE + 64 + 4;
    for (uint32_t esi = 0; esi < 4; esi++) {
      // PayloadId SBN=0, ESI, then the source symbol itself
      assert(helper::read_u32_be(raw.data() + offset) == esi);
      assert(std::equal(raw.begin() + offset + 4, raw.begin() + offset + 20,
                        fixture.source_data.begin() + esi * 16));
      offset += 20;
    }
    assert(offset == raw.size());
    // and the file holds exactly these bytes
    const auto path = write_vector(codec, spec, dir);
    assert(helper::compareVectors(read_fixture_bytes(path), raw));
  }
  // v07: F=16 T=16, K=1, the source packet followed by 9 repair packets
  {
    const auto &spec = VECTOR_SPECS[6];
    const auto fixture = generate_vector(codec, spec).fixture;
    const auto raw = serialize_fixture(fixture.config, fixture.source_data,
                                       fixture.packets);
    assert(raw.size() == 240);
    assert_fixture_header(raw,
                          {0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x10,
                           0x01, 0x00, 0x01, 0x01},
                          16);
    assert(helper::read_u32_be(raw.data() + FIXTURE_HEADER_SIZE + 16) == 10);
    std::size_t offset = FIXTURE_HEADER_SIZE + 16 + 4;
    for (uint32_t esi = 0; esi < 10; esi++) {
      assert(helper::read_u32_be(raw.data() + offset) == esi);
      offset += 20;
    }
    assert(std::equal(fixture.source_data.begin(), fixture.source_data.end(),
                      raw.begin() + FIXTURE_HEADER_SIZE + 16 + 4 + 4));
    const auto path = write_vector(codec, spec, dir);
    assert(helper::compareVectors(read_fixture_bytes(path), raw));
  }
  std::cout << "golden vector test passed\n";
}

static void test_fixture_errors(const std::string &dir) {
  const CauchyCodec codec{};
  const auto generated = generate_vector(codec, VECTOR_SPECS[0]).fixture;
  // write into a directory that doesn't exist
  {
    const auto path =
        (std::filesystem::path(dir) / "does_not_exist" / "v.bin").string();
    assert(throws<FixtureIOError>([&] {
      write_fixture(path, generated.config, generated.source_data,
                    generated.packets);
    }));
    assert(!std::filesystem::exists(path));
    assert(!std::filesystem::exists(path + ".partial"));
  }
  // inconsistent input
  {
    const auto path = (std::filesystem::path(dir) / "bad.bin").string();
    auto short_data = generated.source_data;
    short_data.pop_back();
    assert(throws<FixtureError>([&] {
      write_fixture(path, generated.config, short_data, generated.packets);
    }));
    auto bad_packets = generated.packets;
    bad_packets.emplace_back(PayloadId{0, 5}, std::vector<uint8_t>(3));
    assert(throws<FixtureError>([&] {
      write_fixture(path, generated.config, generated.source_data, bad_packets);
    }));
    assert(!std::filesystem::exists(path));
  }
  const auto raw = serialize_fixture(generated.config, generated.source_data,
                                     generated.packets);
  parse_fixture(raw);
  {
    auto bad_magic = raw;
    bad_magic[3] = '2';
    assert(throws<FixtureFormatError>([&] { parse_fixture(bad_magic); }));
  }
  {
    auto truncated = raw;
    truncated.pop_back();
    assert(throws<FixtureFormatError>([&] { parse_fixture(truncated); }));
    truncated.resize(10);
    assert(throws<FixtureFormatError>([&] { parse_fixture(truncated); }));
  }
  {
    auto trailing = raw;
    trailing.push_back(0);
    assert(throws<FixtureFormatError>([&] { parse_fixture(trailing); }));
  }
  {
    auto bad_length = raw;
    // source_data_length != F
    bad_length[FIXTURE_HEADER_SIZE - 1]++;
    assert(throws<FixtureFormatError>([&] { parse_fixture(bad_length); }));
  }
  assert(throws<FixtureIOError>([&] {
    read_fixture((std::filesystem::path(dir) / "missing.bin").string());
  }));
  const auto check = check_vector(codec, VECTOR_SPECS[0],
                                  (std::filesystem::path(dir) / "empty").string());
  assert(!check.ok() && !check.error.empty());
  std::cout << "fixture error test passed\n";
}

static void test() {
  const auto dir = create_temp_dir();
  test_drop_count();
  test_strategies();
  test_all_vectors(RaptorQCodec{}, dir);
  test_all_vectors(CauchyCodec{}, dir);
  test_golden_vectors(dir);
  test_fixture_errors(dir);
  std::filesystem::remove_all(dir);
}

}  // namespace TestVectors

namespace TestBenchmark {

using std::chrono::nanoseconds;

static void test_statistics() {
  assert(median({nanoseconds(5), nanoseconds(1), nanoseconds(9), nanoseconds(3),
                 nanoseconds(7)}) == nanoseconds(5));
  assert(median({nanoseconds(4), nanoseconds(1), nanoseconds(3),
                 nanoseconds(2)}) == nanoseconds(3));
  assert(median({nanoseconds(42)}) == nanoseconds(42));
  assert(throws<std::invalid_argument>([] { median({}); }));
  assert(throughput_mbps(1000, 0) == 0.0);
  assert(throughput_mbps(1000000, 1000000) == 1000.0);
  assert(throughput_mbps(1024, 1000) == 1024.0);
  const auto large = calibrate(LARGE_PAYLOAD_THRESHOLD);
  assert(large.warmup_count == 1 && large.trial_count == 5);
  const auto small = calibrate(LARGE_PAYLOAD_THRESHOLD - 1);
  assert(small.warmup_count == 3 && small.trial_count == 11);
  TrialSamples samples;
  assert(throws<std::invalid_argument>([&samples] { samples.add(nanoseconds(-1)); }));
  std::cout << "statistics test passed\n";
}

static void test_driver() {
  const RaptorQCodec codec{};
  const BenchmarkDriver driver(codec);
  const auto data =
      helper::generate_payload(65536, BENCH_PAYLOAD_A, BENCH_PAYLOAD_B);
  const TrialPlan plan{3, 11};
  const auto first = driver.bench_encode(data, 64, plan);
  const auto second = driver.bench_encode(data, 64, plan);
  assert(first.samples.getNSamples() == 11);
  assert(second.samples.getNSamples() == 11);
  const auto a = first.median.count();
  const auto b = second.median.count();
  std::cout << "encode medians " << MyTimeHelper::ReadableNS(a) << " "
            << MyTimeHelper::ReadableNS(b) << "\n";
  const bool within_3x = a <= 3 * b && b <= 3 * a;
  const bool within_1ms = std::llabs(a - b) <= 1000000;
  assert(within_3x || within_1ms);

  const auto decode = driver.bench_decode(data, 64, plan);
  assert(decode.samples.getNSamples() == 11);
  assert(decode.n_incomplete_trials == 0);

  const auto result = driver.run_case(BENCH_CASES[0]);
  assert(result.plan.trial_count == 11);
  assert(result.encode_mbps >= 0 && result.decode_mbps >= 0);
  assert(result.decode.n_incomplete_trials == 0);
  std::cout << "driver test passed\n";
}

// The decode trials only time the decoder, nothing may be logged meanwhile
static void test_decode_does_not_log(const Codec &codec) {
  std::ostringstream captured;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
  spdlog::drop("decoder");
  auto logger = std::make_shared<spdlog::logger>("decoder", sink);
  spdlog::register_logger(logger);
  rqharness::log::set_debug_enabled(true);
  logger->set_level(spdlog::level::trace);
  const BenchmarkDriver driver(codec);
  const auto data =
      helper::generate_payload(65536, BENCH_PAYLOAD_A, BENCH_PAYLOAD_B);
  const auto decode = driver.bench_decode(data, 64, TrialPlan{0, 3});
  assert(decode.samples.getNSamples() == 3);
  assert(decode.n_incomplete_trials == 0);
  logger->flush();
  assert(captured.str().empty());
  spdlog::drop("decoder");
  rqharness::log::set_debug_enabled(false);
  std::cout << "decoder logging test passed for " << codec.name() << "\n";
}

static void test_reporter() {
  const std::string header = reporter::format_header();
  assert(header.rfind("Size       | T      | Encode MB/s | Decode MB/s", 0) == 0);
  assert(header.find("-----------|--------|-------------|------------\n") !=
         std::string::npos);
  BenchResult result{};
  result.bench_case = BENCH_CASES[1];
  result.encode_mbps = 12.34;
  result.decode_mbps = 5;
  const auto row = reporter::format_row(result);
  assert(row == "1 KB       | 64     | 12.3        | 5.0         \n");
  const auto preamble = reporter::format_preamble("codec X");
  assert(preamble.find("codec X") != std::string::npos);
  assert(preamble.find("Loss: 10%, Warmup: 3 (1 for >=1MB), Iterations: 11 "
                       "(5 for >=1MB)") != std::string::npos);
  std::cout << "reporter test passed\n";
}

}  // namespace TestBenchmark

int main(int argc, char *argv[]) {
  std::cout << "Tests for rqharness\n";
  int opt;
  int test_mode = 0;

  while ((opt = getopt(argc, argv, "m:d")) != -1) {
    switch (opt) {
      case 'm':
        test_mode = atoi(optarg);
        break;
      case 'd':
        rqharness::log::set_debug_enabled(true);
        break;
      default: /* '?' */
        std::cout << "Usage: Unit tests. -m 0,1,2,3 test mode: 0==ALL, "
                     "1==codec only 2==vectors only 3==benchmark only\n";
        return 1;
    }
  }

  try {
    if (test_mode == 0 || test_mode == 1) {
      std::cout << "Testing codec" << std::endl;
      TestCodec::test_payload();
      TestCodec::test_wire_formats();
      TestCodec::test_gf256();
      TestCodec::test_partition();
      TestCodec::test_codec();
      TestCodec::test_raptorq();
    }
    if (test_mode == 0 || test_mode == 2) {
      std::cout << "Testing vectors" << std::endl;
      TestVectors::test();
    }
    if (test_mode == 0 || test_mode == 3) {
      std::cout << "Testing benchmark" << std::endl;
      TestBenchmark::test_statistics();
      TestBenchmark::test_driver();
      TestBenchmark::test_decode_does_not_log(RaptorQCodec{});
      TestBenchmark::test_decode_does_not_log(CauchyCodec{});
      TestBenchmark::test_reporter();
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << std::string(e.what());
    exit(1);
  }
  std::cout << "All Tests Passing\n";
  return 0;
}
