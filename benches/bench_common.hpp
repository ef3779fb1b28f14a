#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace raefusion::bench {

struct BenchStats {
  std::int64_t total_us = 0;
  double avg_us = 0.0;
  std::int64_t p50_us = 0;
  std::int64_t p99_us = 0;
  std::int64_t max_us = 0;
};

/// Times each iteration separately; retrieval cost is long-tailed, so the
/// percentiles matter more than the mean.
inline BenchStats run_bench(const std::string &name, const int iterations,
                            const std::function<void()> &fn) {
  std::vector<std::int64_t> samples;
  samples.reserve(static_cast<std::size_t>(std::max(iterations, 0)));
  for (int i = 0; i < iterations; ++i) {
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto end = std::chrono::steady_clock::now();
    samples.push_back(std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
  }

  BenchStats stats;
  if (!samples.empty()) {
    std::sort(samples.begin(), samples.end());
    for (const auto sample : samples) {
      stats.total_us += sample;
    }
    const auto at = [&samples](const double q) {
      const auto index = static_cast<std::size_t>(q * static_cast<double>(samples.size() - 1));
      return samples[index];
    };
    stats.avg_us = static_cast<double>(stats.total_us) / static_cast<double>(samples.size());
    stats.p50_us = at(0.50);
    stats.p99_us = at(0.99);
    stats.max_us = samples.back();
  }

  std::cout << name << ": iterations=" << iterations << " avg_us=" << stats.avg_us
            << " p50_us=" << stats.p50_us << " p99_us=" << stats.p99_us
            << " max_us=" << stats.max_us << "\n";
  return stats;
}

} // namespace raefusion::bench
