#include "BenchmarkDriver.h"

#include <fmt/format.h>

#include <algorithm>
#include <optional>

#include "../HelperSources/Helper.hpp"
#include "../rqharness_spdlog.h"
#include "../vectors/PacketStrategy.h"

namespace rqharness {

namespace {

// Runs @param op warmup_count times untimed, then trial_count times timed.
// The value each timed run returns is handed to @param consume once the clock
// has been stopped.
template <typename OP, typename CONSUME>
TrialSamples run_trials(const TrialPlan &plan, OP &&op, CONSUME &&consume) {
  for (int i = 0; i < plan.warmup_count; i++) {
    consume(op());
  }
  TrialSamples samples(plan.trial_count);
  for (int i = 0; i < plan.trial_count; i++) {
    const auto before = std::chrono::steady_clock::now();
    auto result = op();
    const auto delta = std::chrono::steady_clock::now() - before;
    samples.add(std::chrono::duration_cast<std::chrono::nanoseconds>(delta));
    consume(std::move(result));
  }
  return samples;
}

}  // namespace

TrialPlan calibrate(const std::size_t data_size) {
  if (data_size >= LARGE_PAYLOAD_THRESHOLD) {
    return {1, 5};
  }
  return {3, 11};
}

std::chrono::nanoseconds median(std::vector<std::chrono::nanoseconds> samples) {
  if (samples.empty()) {
    throw std::invalid_argument("Cannot calculate the median of 0 samples");
  }
  std::sort(samples.begin(), samples.end());
  return samples[samples.size() / 2];
}

double throughput_mbps(const std::size_t data_size, const uint64_t median_ns) {
  if (median_ns == 0) return 0;
  return static_cast<double>(data_size) * 1000.0 /
         static_cast<double>(median_ns);
}

BenchmarkDriver::BenchmarkDriver(const Codec &codec) : m_codec(codec) {}

OperationResult BenchmarkDriver::bench_encode(const std::vector<uint8_t> &data,
                                              const uint16_t symbol_size,
                                              const TrialPlan plan) const {
  // The expensive part of encoding may be deferred until the first packet is
  // requested, so every trial has to materialize packets itself.
  const auto encode_once = [this, &data, symbol_size]() {
    auto encoded = m_codec.encode(data, symbol_size);
    std::size_t n_packets = 0;
    for (auto &block : encoded.blocks) {
      const auto source = block->source_packets();
      const auto k = static_cast<uint32_t>(source.size());
      const auto repair = block->repair_packets(k, std::max<uint32_t>(k / 10, 1));
      n_packets += source.size() + repair.size();
    }
    return n_packets;
  };
  std::size_t n_packets_total = 0;
  OperationResult ret;
  ret.samples = run_trials(plan, encode_once, [&n_packets_total](std::size_t n) {
    n_packets_total += n;
  });
  ret.median = median(ret.samples.getSamples());
  log::get_default()->debug(
      "encode {}B T={}: {} packets, min {} max {}, samples {}", data.size(),
      symbol_size, n_packets_total, MyTimeHelper::R(ret.samples.getMin()),
      MyTimeHelper::R(ret.samples.getMax()),
      ret.samples.getAllSamplesSortedAsString());
  return ret;
}

OperationResult BenchmarkDriver::bench_decode(const std::vector<uint8_t> &data,
                                              const uint16_t symbol_size,
                                              const TrialPlan plan) const {
  // Pre-generate packets outside the timed section, shared by all trials
  std::vector<std::vector<uint8_t>> wire_packets;
  TransmissionConfig config;
  {
    auto encoded = m_codec.encode(data, symbol_size);
    config = encoded.config;
    const auto packets = select_packets_all_blocks(
        encoded, LossReplace{DECODE_LOSS_PCT, DECODE_REPAIR_OVERHEAD});
    wire_packets.reserve(packets.size());
    for (const auto &packet : packets) {
      wire_packets.push_back(packet.serialize());
    }
  }
  const auto decode_once = [this, &config, &wire_packets]() {
    auto decoder = m_codec.create_decoder(config);
    for (const auto &raw : wire_packets) {
      auto result = decoder->submit(EncodingPacket::deserialize(raw));
      if (result.has_value()) {
        return std::optional<std::size_t>(result->size());
      }
    }
    return std::optional<std::size_t>();
  };
  OperationResult ret;
  const uint64_t transfer_length = config.transfer_length();
  ret.samples = run_trials(
      plan, decode_once,
      [&ret, transfer_length](std::optional<std::size_t> decoded_size) {
        if (!decoded_size.has_value()) {
          ret.n_incomplete_trials++;
          return;
        }
        if (decoded_size.value() != transfer_length) {
          throw CorrectnessError(fmt::format(
              "Decoded {} bytes, expected transfer length {}",
              decoded_size.value(), transfer_length));
        }
      });
  ret.median = median(ret.samples.getSamples());
  if (ret.n_incomplete_trials > 0) {
    log::get_default()->warn(
        "decode {}B T={}: {} runs could not reconstruct the object from {} "
        "packets",
        data.size(), symbol_size, ret.n_incomplete_trials,
        wire_packets.size());
  }
  log::get_default()->debug(
      "decode {}B T={}: {} packets, min {} max {}, samples {}", data.size(),
      symbol_size, wire_packets.size(), MyTimeHelper::R(ret.samples.getMin()),
      MyTimeHelper::R(ret.samples.getMax()),
      ret.samples.getAllSamplesSortedAsString());
  return ret;
}

BenchResult BenchmarkDriver::run_case(const BenchCase &bench_case) const {
  const auto data = helper::generate_payload(
      bench_case.data_size, BENCH_PAYLOAD_A, BENCH_PAYLOAD_B);
  BenchResult ret;
  ret.bench_case = bench_case;
  ret.plan = calibrate(bench_case.data_size);
  ret.encode = bench_encode(data, bench_case.symbol_size, ret.plan);
  ret.decode = bench_decode(data, bench_case.symbol_size, ret.plan);
  ret.encode_mbps =
      throughput_mbps(bench_case.data_size, ret.encode.median.count());
  ret.decode_mbps =
      throughput_mbps(bench_case.data_size, ret.decode.median.count());
  return ret;
}

}  // namespace rqharness
