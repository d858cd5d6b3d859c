#include "VectorGenerator.h"

#include <filesystem>

#include "../HelperSources/Helper.hpp"
#include "../rqharness_spdlog.h"

namespace rqharness {

GeneratedVector generate_vector(const Codec &codec, const VectorSpec &spec) {
  GeneratedVector ret;
  ret.fixture.source_data = helper::generate_payload(
      spec.payload.length, spec.payload.a, spec.payload.b);
  auto encoded = codec.encode(ret.fixture.source_data, spec.symbol_size);
  ret.fixture.config = encoded.config;
  ret.n_source_symbols = encoded.blocks.at(0)->n_source_symbols();
  ret.fixture.packets = select_packets_all_blocks(encoded, spec.strategy);
  return ret;
}

std::string write_vector(const Codec &codec, const VectorSpec &spec,
                         const std::string &output_dir) {
  const auto path = (std::filesystem::path(output_dir) / spec.filename).string();
  const auto generated = generate_vector(codec, spec);
  const auto &fixture = generated.fixture;
  if (std::holds_alternative<LossReplace>(spec.strategy)) {
    const auto &loss = std::get<LossReplace>(spec.strategy);
    const auto drop_count =
        calculate_drop_count(generated.n_source_symbols, loss.loss_pct);
    log::get_default()->debug("  dropped={} repair={}", drop_count,
                              drop_count + loss.overhead);
  }
  log::get_default()->info("{}: {} K={} packets={} ({})", spec.name,
                           fixture.config.to_string(),
                           generated.n_source_symbols, fixture.packets.size(),
                           strategy_readable(spec.strategy));
  write_fixture(path, fixture.config, fixture.source_data, fixture.packets);
  return path;
}

VectorCheckResult check_vector(const Codec &codec, const VectorSpec &spec,
                               const std::string &output_dir) {
  VectorCheckResult ret;
  ret.path = (std::filesystem::path(output_dir) / spec.filename).string();
  Fixture on_disk;
  try {
    on_disk = read_fixture(ret.path);
  } catch (const FixtureIOError &e) {
    ret.error = e.what();
    return ret;
  } catch (const FixtureFormatError &e) {
    ret.error = e.what();
    return ret;
  }
  const auto check = verify_fixture(on_disk, codec);
  ret.decodes = check.reconstructed && check.matches_source;
  const auto regenerated = generate_vector(codec, spec).fixture;
  ret.identical_to_regeneration = helper::compareVectors(
      serialize_fixture(on_disk.config, on_disk.source_data, on_disk.packets),
      serialize_fixture(regenerated.config, regenerated.source_data,
                        regenerated.packets));
  log::get_default()->debug("{}: decodes={} identical={} packets consumed={}/{}",
                            spec.name, ret.decodes,
                            ret.identical_to_regeneration,
                            check.packets_consumed, on_disk.packets.size());
  return ret;
}

}  // namespace rqharness
