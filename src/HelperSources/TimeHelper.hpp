//
// Created by geier on 18/01/2020.
//

#ifndef RQHARNESS_TIMEHELPER_HPP
#define RQHARNESS_TIMEHELPER_HPP

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// This file holds various classes/namespaces usefully for measuring and
// comparing latency samples

namespace MyTimeHelper {
// R stands for readable. Convert a std::chrono::duration into a readable format
// Readable format is somewhat arbitrary, in this case readable means that for
// example 1second has 'ms' resolution since for values that big ns resolution
// probably isn't needed
static std::string R(const std::chrono::steady_clock::duration &dur) {
  const auto durAbsolute = std::chrono::abs(dur);
  if (durAbsolute >= std::chrono::seconds(1)) {
    // More than one second, print as decimal with ms resolution.
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(dur).count();
    return std::to_string(static_cast<float>(ms) / 1000.0f) + "s";
  }
  if (durAbsolute >= std::chrono::milliseconds(1)) {
    // More than one millisecond, print as decimal with us resolution
    const auto us =
        std::chrono::duration_cast<std::chrono::microseconds>(dur).count();
    return std::to_string(static_cast<float>(us) / 1000.0f) + "ms";
  }
  if (durAbsolute >= std::chrono::microseconds(1)) {
    // More than one microsecond, print as decimal with ns resolution
    const auto ns =
        std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
    return std::to_string(static_cast<float>(ns) / 1000.0f) + "us";
  }
  const auto ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count();
  return std::to_string(ns) + "ns";
}
static std::string ReadableNS(uint64_t nanoseconds) {
  return R(std::chrono::nanoseconds(nanoseconds));
}
static std::string timeSamplesAsString(
    const std::vector<std::chrono::nanoseconds> &samples) {
  std::stringstream ss;
  std::size_t counter = 0;
  for (const auto &sample : samples) {
    ss << "," << MyTimeHelper::R(sample);
    counter++;
    if (counter % 10 == 0 && counter != samples.size()) {
      ss << "\n";
    }
  }
  return ss.str();
}
}  // namespace MyTimeHelper

// Stores every recorded sample (unlike an average calculator that only keeps
// min / max / sum), such that order statistics like the median can be
// calculated. Only meant for small sample sizes, e.g. benchmark trials.
class TrialSamples {
 public:
  TrialSamples() = default;
  explicit TrialSamples(std::size_t expected_n_samples) {
    m_samples.reserve(expected_n_samples);
  }
  void add(const std::chrono::nanoseconds &value) {
    if (value < std::chrono::nanoseconds(0)) {
      throw std::invalid_argument("Cannot add negative sample");
    }
    m_samples.push_back(value);
  }
  std::size_t getNSamples() const { return m_samples.size(); }
  // Sort all the samples from low to high
  std::vector<std::chrono::nanoseconds> getSamplesSorted() const {
    auto ret = m_samples;
    std::sort(ret.begin(), ret.end());
    return ret;
  }
  std::chrono::nanoseconds getMin() const {
    if (m_samples.empty()) return std::chrono::nanoseconds(0);
    return *std::min_element(m_samples.begin(), m_samples.end());
  }
  std::chrono::nanoseconds getMax() const {
    if (m_samples.empty()) return std::chrono::nanoseconds(0);
    return *std::max_element(m_samples.begin(), m_samples.end());
  }
  std::string getAllSamplesSortedAsString() const {
    return MyTimeHelper::timeSamplesAsString(getSamplesSorted());
  }
  const std::vector<std::chrono::nanoseconds> &getSamples() const {
    return m_samples;
  }

 private:
  std::vector<std::chrono::nanoseconds> m_samples;
};

#endif  // RQHARNESS_TIMEHELPER_HPP
