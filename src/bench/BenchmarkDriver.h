#ifndef RQHARNESS_BENCHMARK_DRIVER_H
#define RQHARNESS_BENCHMARK_DRIVER_H

#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "../HelperSources/TimeHelper.hpp"
#include "../codec/Codec.h"

// Measures encode / decode throughput of a codec.
// For each operation, warmup_count untimed runs remove cold start effects
// (e.g. lazy initialization inside the codec), then trial_count timed runs are
// performed and the median is reported.
// Nothing but the operation under test happens inside the timed region: no
// logging, no I/O, all setup is done before the clock starts.

namespace rqharness {

// Thrown when the codec returns an object of the wrong size
class CorrectnessError : public std::runtime_error {
 public:
  explicit CorrectnessError(const std::string &what)
      : std::runtime_error(what) {}
};

struct BenchCase {
  std::size_t data_size;
  uint16_t symbol_size;
  const char *label;
};

// Symbol size scales with the data size, such that K stays in a practical
// range
static constexpr std::array<BenchCase, 12> BENCH_CASES{{
    {256, 64, "256 B"},
    {1024, 64, "1 KB"},
    {10240, 64, "10 KB"},
    {16384, 64, "16 KB"},
    {65536, 64, "64 KB"},
    {131072, 256, "128 KB"},
    {262144, 256, "256 KB"},
    {524288, 1024, "512 KB"},
    {1048576, 1024, "1 MB"},
    {2097152, 2048, "2 MB"},
    {4194304, 2048, "4 MB"},
    {10485760, 4096, "10 MB"},
}};

// seeds for the benchmark payload, byte[i] = (i*31 + 17) mod 256
static constexpr uint8_t BENCH_PAYLOAD_A = 31;
static constexpr uint8_t BENCH_PAYLOAD_B = 17;
// Percentage of source packets dropped in the decode benchmark
static constexpr uint32_t DECODE_LOSS_PCT = 10;
// Extra repair packets on top of the dropped ones in the decode benchmark.
// Not guaranteed to be the minimum needed for every codec / K.
static constexpr uint32_t DECODE_REPAIR_OVERHEAD = 2;
// Payloads of at least this size use fewer trials
static constexpr std::size_t LARGE_PAYLOAD_THRESHOLD = 1024 * 1024;

struct TrialPlan {
  int warmup_count;
  int trial_count;
};
// >= 1 MiB: 1 warmup, 5 trials. Smaller: 3 warmup, 11 trials
TrialPlan calibrate(std::size_t data_size);

// Sort ascending, take the middle element. For an even n of samples the
// upper one of the two middle elements is returned.
// throws std::invalid_argument if samples is empty
std::chrono::nanoseconds median(std::vector<std::chrono::nanoseconds> samples);

// data_size * 1000 / median_ns, 0 if median_ns is 0
double throughput_mbps(std::size_t data_size, uint64_t median_ns);

struct OperationResult {
  std::chrono::nanoseconds median{0};
  TrialSamples samples;
  // decode only: n of runs (warmup included) that ran out of packets before
  // the object was reconstructed
  int n_incomplete_trials = 0;
};

struct BenchResult {
  BenchCase bench_case;
  TrialPlan plan;
  OperationResult encode;
  OperationResult decode;
  double encode_mbps = 0;
  double decode_mbps = 0;
};

class BenchmarkDriver {
 public:
  explicit BenchmarkDriver(const Codec &codec);
  BenchmarkDriver(const BenchmarkDriver &other) = delete;
  /**
   * Each trial: encode @param data with symbol size @param symbol_size, then
   * for every source block materialize all source packets and max(K/10,1)
   * repair packets
   */
  OperationResult bench_encode(const std::vector<uint8_t> &data,
                               uint16_t symbol_size, TrialPlan plan) const;
  /**
   * Packets (10% source loss replaced by repair packets + overhead) are created
   * once, before timing. Each trial: new decoder, feed packets until the object
   * is reconstructed.
   * throws CorrectnessError if the reconstructed object has the wrong size
   */
  OperationResult bench_decode(const std::vector<uint8_t> &data,
                               uint16_t symbol_size, TrialPlan plan) const;
  // Runs encode and decode for @param bench_case with calibrate() trials
  BenchResult run_case(const BenchCase &bench_case) const;

 private:
  const Codec &m_codec;
};

}  // namespace rqharness

#endif  // RQHARNESS_BENCHMARK_DRIVER_H
